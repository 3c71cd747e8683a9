#include <gtest/gtest.h>
#include <ssh/exec_channel.hpp>

TEST(ExitSignal, KnownNames) {
    EXPECT_EQ(signal_number("HUP"), 1);
    EXPECT_EQ(signal_number("KILL"), 9);
    EXPECT_EQ(signal_number("TERM"), 15);
}

TEST(ExitSignal, SigPrefixAccepted) {
    EXPECT_EQ(signal_number("SIGSEGV"), 11);
    EXPECT_EQ(signal_number("SIGPIPE"), 13);
}

TEST(ExitSignal, UnknownName) {
    EXPECT_EQ(signal_number(""), -1);
    EXPECT_EQ(signal_number("WINCH@openssh.com"), -1);
    EXPECT_EQ(signal_number("term"), -1);
}

TEST(ExitSignal, ExitCodes) {
    EXPECT_EQ(exit_code_for_signal("KILL"), 137);
    EXPECT_EQ(exit_code_for_signal("TERM"), 143);
    EXPECT_EQ(exit_code_for_signal("INT"), 130);
}

TEST(ExitSignal, UnknownSignalStaysOutOfSshFailureCode) {
    EXPECT_EQ(exit_code_for_signal("NOPE"), 128);
    EXPECT_NE(exit_code_for_signal("NOPE"), 255);
}

TEST(ExitSignal, RecordNormalExit) {
    SSHResult r;
    record_exit(r, 3, "");
    EXPECT_EQ(r.exit_code, 3);
    EXPECT_FALSE(r.signaled());
    EXPECT_TRUE(r.failed());
}

TEST(ExitSignal, RecordSignalOverridesStatus) {
    // libssh2 reports a missing exit-status as 0
    SSHResult r;
    record_exit(r, 0, "KILL");
    EXPECT_EQ(r.exit_code, 137);
    EXPECT_EQ(r.exit_signal, "KILL");
    EXPECT_TRUE(r.signaled());
    EXPECT_FALSE(r.success());
}

TEST(ExitSignal, RecordUnknownSignal) {
    SSHResult r;
    record_exit(r, 0, "XCPU@example.com");
    EXPECT_EQ(r.exit_code, 128);
    EXPECT_TRUE(r.signaled());
}
