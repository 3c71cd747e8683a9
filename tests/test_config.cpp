#include <gtest/gtest.h>
#include <core/config.hpp>
#include <core/constants.hpp>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

TEST(Config, EmptyYamlGivesDefaults) {
    auto c = Config::parse("");
    ASSERT_TRUE(c.is_ok()) << c.error;
    EXPECT_EQ(c.value.ssh().port, 22);
    EXPECT_EQ(c.value.ssh().timeout, SSH_CONNECT_TIMEOUT_SECS);
    EXPECT_EQ(c.value.ssh().host_key_policy, HostKeyPolicy::ACCEPT_ANY);
    EXPECT_EQ(c.value.key_install().check_command, DEFAULT_KEY_CHECK_COMMAND);
    ASSERT_EQ(c.value.key_install().targets.size(), 2u);
    EXPECT_EQ(c.value.key_install().targets[0].path, DEFAULT_KEY_TARGET_JFFS);
    EXPECT_TRUE(c.value.key_install().targets[0].required);
    EXPECT_FALSE(c.value.key_install().targets[1].required);
    EXPECT_FALSE(c.value.log().file.empty());
    EXPECT_TRUE(c.value.source().empty());
}

TEST(Config, Overrides) {
    auto c = Config::parse(
        "ssh:\n"
        "  port: 2222\n"
        "  timeout: 5\n"
        "  host_key_policy: accept-new\n"
        "  known_hosts: /tmp/kh\n"
        "log:\n"
        "  file: \"\"\n"
        "  level: debug\n"
        "key_install:\n"
        "  atomic: true\n"
        "  check_command: \"cat /tmp/store\"\n"
        "  targets:\n"
        "    - path: /etc/keys\n"
        "      required: true\n"
        "    - /tmp/keys\n");
    ASSERT_TRUE(c.is_ok()) << c.error;
    EXPECT_EQ(c.value.ssh().port, 2222);
    EXPECT_EQ(c.value.ssh().timeout, 5);
    EXPECT_EQ(c.value.ssh().host_key_policy, HostKeyPolicy::ACCEPT_NEW);
    EXPECT_EQ(c.value.ssh().known_hosts, "/tmp/kh");
    EXPECT_TRUE(c.value.log().file.empty());
    EXPECT_EQ(c.value.log().level, "debug");
    EXPECT_TRUE(c.value.key_install().atomic);
    EXPECT_EQ(c.value.key_install().check_command, "cat /tmp/store");

    const auto& targets = c.value.key_install().targets;
    ASSERT_EQ(targets.size(), 2u);
    EXPECT_EQ(targets[0].path, "/etc/keys");
    EXPECT_TRUE(targets[0].required);
    EXPECT_EQ(targets[1].path, "/tmp/keys");
    EXPECT_FALSE(targets[1].required);
}

TEST(Config, InvalidValues) {
    EXPECT_TRUE(Config::parse("ssh:\n  port: 0\n").is_err());
    EXPECT_TRUE(Config::parse("ssh:\n  timeout: 0\n").is_err());
    EXPECT_TRUE(Config::parse("ssh:\n  timeout: [5]\n").is_err());
    EXPECT_TRUE(Config::parse("ssh:\n  host_key_policy: trust-me\n").is_err());
    EXPECT_TRUE(Config::parse("log:\n  level: chatty\n").is_err());
    EXPECT_TRUE(Config::parse("key_install:\n  targets: []\n").is_err());
    EXPECT_TRUE(Config::parse("key_install:\n  targets: [relative/keys]\n").is_err());
    EXPECT_TRUE(Config::parse("- just\n- a list\n").is_err());
    EXPECT_TRUE(Config::parse("ssh: [unterminated\n").is_err());
}

TEST(Config, NonNumericValuesAreErrors) {
    auto port = Config::parse("ssh:\n  port: abc\n");
    ASSERT_TRUE(port.is_err());
    EXPECT_NE(port.error.find("ssh.port"), std::string::npos);
    EXPECT_NE(port.error.find("abc"), std::string::npos);

    EXPECT_TRUE(Config::parse("ssh:\n  timeout: 1.5\n").is_err());
    EXPECT_TRUE(Config::parse("key_install:\n  atomic: maybe\n").is_err());
    EXPECT_TRUE(Config::parse(
        "key_install:\n  targets:\n    - path: /etc/keys\n      required: sometimes\n").is_err());
}

TEST(Config, LoadFile) {
    fs::path file = fs::temp_directory_path() / "sshrelay_config_test.yaml";
    std::ofstream(file) << "ssh:\n  port: 8022\n";

    auto c = Config::load(file.string());
    fs::remove(file);
    ASSERT_TRUE(c.is_ok()) << c.error;
    EXPECT_EQ(c.value.ssh().port, 8022);
    EXPECT_EQ(c.value.source(), file);
}

TEST(Config, ExplicitFileMustExist) {
    auto c = Config::load((fs::temp_directory_path() / "sshrelay_missing.yaml").string());
    EXPECT_TRUE(c.is_err());
}
