#include <gtest/gtest.h>
#include <ssh/host_key.hpp>
#include <core/config.hpp>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

class KnownHostsFileTest : public ::testing::Test {
protected:
    fs::path test_dir;
    fs::path file;

    void SetUp() override {
        test_dir = fs::temp_directory_path() / "sshrelay_known_hosts_test";
        fs::remove_all(test_dir);
        file = test_dir / "ssh" / "known_hosts";
    }

    void TearDown() override {
        fs::remove_all(test_dir);
    }

    std::string read_back() {
        std::ifstream in(file, std::ios::binary);
        std::stringstream ss;
        ss << in.rdbuf();
        return ss.str();
    }
};

TEST_F(KnownHostsFileTest, CreatesFileAndDirectory) {
    ASSERT_TRUE(HostKeyVerifier::append_known_host(file, "router ssh-ed25519 AAAA\n").is_ok());
    EXPECT_EQ(read_back(), "router ssh-ed25519 AAAA\n");
}

TEST_F(KnownHostsFileTest, MissingTrailingNewlineIsRepaired) {
    fs::create_directories(file.parent_path());
    std::ofstream(file, std::ios::binary) << "old ssh-rsa BBBB";

    ASSERT_TRUE(HostKeyVerifier::append_known_host(file, "[router]:2222 ssh-ed25519 AAAA\n").is_ok());
    EXPECT_EQ(read_back(), "old ssh-rsa BBBB\n[router]:2222 ssh-ed25519 AAAA\n");
}

TEST_F(KnownHostsFileTest, ExistingLinesUntouched) {
    fs::create_directories(file.parent_path());
    std::ofstream(file, std::ios::binary) << "a ssh-rsa AAAA\nb ssh-rsa BBBB\n";

    ASSERT_TRUE(HostKeyVerifier::append_known_host(file, "c ssh-ed25519 CCCC").is_ok());
    EXPECT_EQ(read_back(), "a ssh-rsa AAAA\nb ssh-rsa BBBB\nc ssh-ed25519 CCCC\n");
}

TEST(HostKeyPolicy, StrictOnlyAcceptsMatch) {
    auto match = decide_host_key(HostKeyPolicy::STRICT, HostKeyMatch::MATCH);
    EXPECT_TRUE(match.accept);
    EXPECT_FALSE(match.record);

    EXPECT_FALSE(decide_host_key(HostKeyPolicy::STRICT, HostKeyMatch::NOT_FOUND).accept);
    EXPECT_FALSE(decide_host_key(HostKeyPolicy::STRICT, HostKeyMatch::MISMATCH).accept);
}

TEST(HostKeyPolicy, AcceptNewRecordsUnknownKeys) {
    auto unknown = decide_host_key(HostKeyPolicy::ACCEPT_NEW, HostKeyMatch::NOT_FOUND);
    EXPECT_TRUE(unknown.accept);
    EXPECT_TRUE(unknown.record);

    auto known = decide_host_key(HostKeyPolicy::ACCEPT_NEW, HostKeyMatch::MATCH);
    EXPECT_TRUE(known.accept);
    EXPECT_FALSE(known.record);

    // A changed key is never silently accepted
    auto changed = decide_host_key(HostKeyPolicy::ACCEPT_NEW, HostKeyMatch::MISMATCH);
    EXPECT_FALSE(changed.accept);
    EXPECT_FALSE(changed.record);
}

TEST(HostKeyPolicy, AcceptAnyNeverRecords) {
    for (auto m : {HostKeyMatch::MATCH, HostKeyMatch::MISMATCH, HostKeyMatch::NOT_FOUND}) {
        auto d = decide_host_key(HostKeyPolicy::ACCEPT_ANY, m);
        EXPECT_TRUE(d.accept);
        EXPECT_FALSE(d.record);
    }
}

TEST(HostKeyPolicy, KnownHostsName) {
    EXPECT_EQ(HostKeyVerifier::known_hosts_name("192.168.1.1", 22), "192.168.1.1");
    EXPECT_EQ(HostKeyVerifier::known_hosts_name("router.lan", 2222), "[router.lan]:2222");
}

TEST(HostKeyPolicy, NamesRoundTrip) {
    for (auto p : {HostKeyPolicy::STRICT, HostKeyPolicy::ACCEPT_NEW, HostKeyPolicy::ACCEPT_ANY}) {
        auto parsed = parse_host_key_policy(to_string(p));
        ASSERT_TRUE(parsed.is_ok());
        EXPECT_EQ(parsed.value, p);
    }
    EXPECT_TRUE(parse_host_key_policy("Strict").is_err());
}
