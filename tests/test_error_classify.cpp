#include <gtest/gtest.h>
#include <ssh/session.hpp>
#include <libssh2.h>

TEST(ErrorClassify, CredentialFailuresAreAuth) {
    EXPECT_EQ(classify_libssh2_error(nullptr, LIBSSH2_ERROR_AUTHENTICATION_FAILED, "auth").kind,
              SSHErrorKind::AUTH);
    EXPECT_EQ(classify_libssh2_error(nullptr, LIBSSH2_ERROR_PASSWORD_EXPIRED, "auth").kind,
              SSHErrorKind::AUTH);
    EXPECT_EQ(classify_libssh2_error(nullptr, LIBSSH2_ERROR_PUBLICKEY_UNVERIFIED, "auth").kind,
              SSHErrorKind::AUTH);
}

TEST(ErrorClassify, TimeoutsAreConnection) {
    EXPECT_EQ(classify_libssh2_error(nullptr, LIBSSH2_ERROR_TIMEOUT, "read").kind,
              SSHErrorKind::CONNECTION);
    EXPECT_EQ(classify_libssh2_error(nullptr, LIBSSH2_ERROR_SOCKET_TIMEOUT, "read").kind,
              SSHErrorKind::CONNECTION);
}

TEST(ErrorClassify, TransportFailuresAreProtocol) {
    EXPECT_EQ(classify_libssh2_error(nullptr, LIBSSH2_ERROR_SOCKET_DISCONNECT, "read").kind,
              SSHErrorKind::PROTOCOL);
    EXPECT_EQ(classify_libssh2_error(nullptr, LIBSSH2_ERROR_CHANNEL_FAILURE, "exec").kind,
              SSHErrorKind::PROTOCOL);
    EXPECT_EQ(classify_libssh2_error(nullptr, LIBSSH2_ERROR_KEX_FAILURE, "handshake").kind,
              SSHErrorKind::PROTOCOL);
}

TEST(ErrorClassify, MessageCarriesContextAndCode) {
    auto err = classify_libssh2_error(nullptr, LIBSSH2_ERROR_SOCKET_DISCONNECT, "Error reading remote stdout");
    EXPECT_NE(err.message.find("Error reading remote stdout"), std::string::npos);
    EXPECT_NE(err.message.find(std::to_string(LIBSSH2_ERROR_SOCKET_DISCONNECT)), std::string::npos);
}

TEST(AuthMethods, PasswordAndKeyboardInteractive) {
    auto both = password_auth_methods("publickey,password,keyboard-interactive");
    ASSERT_TRUE(both.is_ok());
    EXPECT_TRUE(both.value.password);
    EXPECT_TRUE(both.value.keyboard_interactive);

    auto kbd = password_auth_methods("publickey,keyboard-interactive");
    ASSERT_TRUE(kbd.is_ok());
    EXPECT_FALSE(kbd.value.password);
    EXPECT_TRUE(kbd.value.keyboard_interactive);
}

TEST(AuthMethods, NoPasswordMethodIsAuthError) {
    auto only_keys = password_auth_methods("publickey");
    ASSERT_TRUE(only_keys.is_err());
    EXPECT_EQ(only_keys.error.kind, SSHErrorKind::AUTH);
    EXPECT_NE(only_keys.error.message.find("publickey"), std::string::npos);

    // Names must match whole entries
    EXPECT_TRUE(password_auth_methods("publickey,passwordless").is_err());
}
