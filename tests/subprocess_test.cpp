#include "common/subprocess.hpp"

#include <string>
#include <vector>

#include <gtest/gtest.h>

namespace cvault {

TEST(SubprocessTest, CapturesStdout) {
    ProcessResult result;
    auto ec = run_process({"echo", "hello", "world"}, result);
    ASSERT_FALSE(ec) << ec.message();
    EXPECT_EQ(result.exit_code, 0);
    EXPECT_EQ(result.out, "hello world\n");
    EXPECT_TRUE(result.err.empty());
}

TEST(SubprocessTest, CapturesStderrAndExitCode) {
    ProcessResult result;
    auto ec = run_process({"sh", "-c", "echo oops >&2; exit 3"}, result);
    ASSERT_FALSE(ec) << ec.message();
    EXPECT_EQ(result.exit_code, 3);
    EXPECT_EQ(result.err, "oops\n");
}

TEST(SubprocessTest, ArgumentsAreNotShellExpanded) {
    ProcessResult result;
    ASSERT_FALSE(run_process({"echo", "$HOME; rm -rf /"}, result));
    EXPECT_EQ(result.out, "$HOME; rm -rf /\n");
}

TEST(SubprocessTest, MissingBinaryReportsError) {
    ProcessResult result;
    auto ec = run_process({"cvault-no-such-binary-xyz"}, result);
    EXPECT_EQ(ec, std::errc::no_such_file_or_directory);
}

TEST(SubprocessTest, SignalledChildReportsSignalExitCode) {
    ProcessResult result;
    ASSERT_FALSE(run_process({"sh", "-c", "kill -9 $$"}, result));
    EXPECT_EQ(result.exit_code, 128 + 9);
}

TEST(SubprocessTest, DrainsLargeOutput) {
    ProcessResult result;
    // More than a pipe buffer on both streams at once.
    ASSERT_FALSE(run_process({"sh", "-c",
                              "head -c 200000 /dev/zero; head -c 200000 /dev/zero >&2"},
                             result));
    EXPECT_EQ(result.exit_code, 0);
    EXPECT_EQ(result.out.size(), 200000u);
    EXPECT_EQ(result.err.size(), 200000u);
}

TEST(SubprocessTest, JoinArgvRendersCommandLine) {
    EXPECT_EQ(join_argv({"docker", "stop", "--time", "30", "web1"}),
              "docker stop --time 30 web1");
}

} // namespace cvault
