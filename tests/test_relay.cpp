#include <gtest/gtest.h>
#include <cli/relay.hpp>
#include <sstream>

static SSHResult make_result(int code, const std::string& out, const std::string& err) {
    SSHResult r;
    r.exit_code = code;
    r.stdout_data = out;
    r.stderr_data = err;
    return r;
}

TEST(Relay, ForwardsStreamsAndExitCode) {
    std::ostringstream out, err;
    auto outcome = SSHOutcome<SSHResult>::Ok(make_result(7, "hello\n", "oops\n"));
    EXPECT_EQ(relay_outcome(outcome, out, err), 7);
    EXPECT_EQ(out.str(), "hello\n");
    EXPECT_EQ(err.str(), "oops\n");
}

TEST(Relay, StdoutIsVerbatim) {
    std::ostringstream out, err;
    std::string binary("a\0b\r\nno newline", 15);
    auto outcome = SSHOutcome<SSHResult>::Ok(make_result(0, binary, ""));
    EXPECT_EQ(relay_outcome(outcome, out, err), 0);
    EXPECT_EQ(out.str(), binary);
    EXPECT_TRUE(err.str().empty());
}

TEST(Relay, AuthFailure) {
    std::ostringstream out, err;
    auto outcome = SSHOutcome<SSHResult>::Err(SSHErrorKind::AUTH, "password rejected");
    EXPECT_EQ(relay_outcome(outcome, out, err), 255);
    EXPECT_TRUE(out.str().empty());
    EXPECT_EQ(err.str(), "Authentication failed\n");
}

TEST(Relay, ConnectionAndProtocolFailures) {
    std::ostringstream out, err;
    auto refused = SSHOutcome<SSHResult>::Err(SSHErrorKind::CONNECTION, "connection refused");
    EXPECT_EQ(relay_outcome(refused, out, err), 255);
    EXPECT_EQ(err.str(), "Connection error: connection refused\n");

    std::ostringstream out2, err2;
    auto proto = SSHOutcome<SSHResult>::Err(SSHErrorKind::PROTOCOL, "handshake failed");
    EXPECT_EQ(relay_outcome(proto, out2, err2), 255);
    EXPECT_EQ(err2.str(), "SSH error: handshake failed\n");
}

TEST(Relay, SignalledCommand) {
    std::ostringstream out, err;
    SSHResult r = make_result(143, "partial", "");
    r.exit_signal = "TERM";
    EXPECT_EQ(relay_outcome(SSHOutcome<SSHResult>::Ok(r), out, err), 143);
    EXPECT_EQ(out.str(), "partial");
    EXPECT_EQ(err.str(), "Remote command terminated by signal TERM\n");
}

TEST(Relay, OutOfRangeExitCode) {
    std::ostringstream out, err;
    EXPECT_EQ(relay_outcome(SSHOutcome<SSHResult>::Ok(make_result(-1, "", "")), out, err), 255);
}
