#include <gtest/gtest.h>
#include <shellsage/exec/process.hpp>

using namespace shellsage;

TEST(Process, CapturesStreamsSeparately) {
    auto r = run_shell_capture("echo out; echo err 1>&2; exit 3");
    EXPECT_EQ(r.exit_code, 3);
    EXPECT_EQ(r.out, "out\n");
    EXPECT_EQ(r.err, "err\n");
}

TEST(Process, LargeOutputOnBothStreams) {
    auto r = run_shell_capture("i=0; while [ $i -lt 5000 ]; do echo 0123456789; echo abcdefghij 1>&2; i=$((i+1)); done");
    EXPECT_EQ(r.exit_code, 0);
    EXPECT_EQ(r.out.size(), 5000u * 11u);
    EXPECT_EQ(r.err.size(), 5000u * 11u);
}

TEST(Process, CommandNotFound) {
    auto r = run_shell_capture("shellsage-definitely-missing-cmd");
    EXPECT_EQ(r.exit_code, 127);
    EXPECT_NE(r.err.find("not found"), std::string::npos);
}

TEST(Process, SignalDeath) {
    auto r = run_shell_capture("kill -9 $$");
    EXPECT_EQ(r.exit_code, 128 + 9);
}

TEST(Process, StdinIsDevNull) {
    auto r = run_shell_capture("cat");
    EXPECT_EQ(r.exit_code, 0);
    EXPECT_TRUE(r.out.empty());
}

TEST(Process, InteractiveReturnsStatus) {
    EXPECT_EQ(run_shell_interactive("exit 4"), 4);
}

TEST(Process, FindInPath) {
    auto sh = find_in_path("sh");
    ASSERT_TRUE(sh.has_value());
    EXPECT_EQ(sh->back(), 'h');
    EXPECT_FALSE(find_in_path("shellsage-definitely-missing-cmd").has_value());
    EXPECT_FALSE(find_in_path("").has_value());
    EXPECT_TRUE(find_in_path("/bin/sh").has_value());
}
