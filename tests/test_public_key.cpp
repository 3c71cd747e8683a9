#include <gtest/gtest.h>
#include <core/public_key.hpp>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

static const char* RSA_LINE = "ssh-rsa AAAAB3NzaC1yc2EAAAADAQABAAABAQC7 admin@laptop";

TEST(PublicKey, ParseWithComment) {
    auto k = PublicKey::parse(RSA_LINE);
    ASSERT_TRUE(k.is_ok()) << k.error;
    EXPECT_EQ(k.value.type, "ssh-rsa");
    EXPECT_EQ(k.value.blob, "AAAAB3NzaC1yc2EAAAADAQABAAABAQC7");
    EXPECT_EQ(k.value.comment, "admin@laptop");
    EXPECT_EQ(k.value.line(), RSA_LINE);
}

TEST(PublicKey, ParseWithoutComment) {
    auto k = PublicKey::parse("  ssh-ed25519 AAAAC3NzaC1lZDI1NTE5AAAAIE1pY2tleQ==\n");
    ASSERT_TRUE(k.is_ok()) << k.error;
    EXPECT_TRUE(k.value.comment.empty());
    EXPECT_EQ(k.value.line(), k.value.identity());
}

TEST(PublicKey, CommentWithSpaces) {
    auto k = PublicKey::parse("ssh-rsa AAAA my   work key");
    ASSERT_TRUE(k.is_ok());
    EXPECT_EQ(k.value.comment, "my work key");
}

TEST(PublicKey, Rejects) {
    EXPECT_TRUE(PublicKey::parse("").is_err());
    EXPECT_TRUE(PublicKey::parse("ssh-rsa").is_err());
    EXPECT_TRUE(PublicKey::parse("rsa AAAA").is_err());
    EXPECT_TRUE(PublicKey::parse("ssh-rsa AAA").is_err());
    EXPECT_TRUE(PublicKey::parse("ssh-rsa AA=A").is_err());
    EXPECT_TRUE(PublicKey::parse("ssh-rsa AA'A").is_err());
    EXPECT_TRUE(PublicKey::parse("ssh-rsa AAAA\nssh-rsa BBBB").is_err());
}

TEST(PublicKey, LoadSkipsCommentsAndBlankLines) {
    fs::path file = fs::temp_directory_path() / "sshrelay_pubkey_test.pub";
    std::ofstream(file) << "# my key\n\n" << RSA_LINE << "\n";

    auto k = PublicKey::load(file);
    fs::remove(file);
    ASSERT_TRUE(k.is_ok()) << k.error;
    EXPECT_EQ(k.value.comment, "admin@laptop");
}

TEST(PublicKey, LoadMissingFile) {
    auto k = PublicKey::load(fs::temp_directory_path() / "sshrelay_no_such_key.pub");
    ASSERT_TRUE(k.is_err());
    EXPECT_NE(k.error.find("Cannot read"), std::string::npos);
}
