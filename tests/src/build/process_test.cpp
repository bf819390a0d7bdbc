#include <veribuild/build/process.hpp>
#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <string>

namespace {

constexpr auto kShell = "/bin/sh";

veribuild::build::process_options shell(const std::string& script) {
  auto options = veribuild::build::process_options{};
  options.executable = kShell;
  options.arguments = {"-c", script};
  options.timeout = std::chrono::seconds{10};
  return options;
}

}  // namespace

TEST(process, captures_exit_code_and_both_streams) {
  if (!std::filesystem::exists(kShell)) {
    GTEST_SKIP() << "no " << kShell;
  }
  auto result = veribuild::build::run_process(
      shell("echo building; echo warning 1>&2; exit 3"));
  EXPECT_FALSE(result.launch_failed);
  EXPECT_FALSE(result.timed_out);
  EXPECT_EQ(result.exit_code, 3);
  EXPECT_FALSE(result.succeeded());
  EXPECT_NE(result.output.find("building"), std::string::npos);
  EXPECT_NE(result.output.find("warning"), std::string::npos);

  auto ok = veribuild::build::run_process(shell("true"));
  EXPECT_TRUE(ok.succeeded());
  EXPECT_EQ(ok.exit_code, 0);
}

TEST(process, honors_the_working_directory) {
  if (!std::filesystem::exists(kShell)) {
    GTEST_SKIP() << "no " << kShell;
  }
  auto options = shell("pwd");
  options.working_directory = "/";
  auto result = veribuild::build::run_process(options);
  ASSERT_TRUE(result.succeeded()) << result.error;
  EXPECT_EQ(result.output, "/\n");
}

TEST(process, deadline_kills_the_child) {
  if (!std::filesystem::exists(kShell)) {
    GTEST_SKIP() << "no " << kShell;
  }
  auto options = shell("exec sleep 30");
  options.timeout = std::chrono::milliseconds{200};
  auto started = std::chrono::steady_clock::now();
  auto result = veribuild::build::run_process(options);
  auto elapsed = std::chrono::steady_clock::now() - started;

  EXPECT_TRUE(result.timed_out);
  EXPECT_FALSE(result.succeeded());
  EXPECT_EQ(result.error, "deadline exceeded");
  EXPECT_LT(elapsed, std::chrono::seconds{10});
}

TEST(process, output_ceiling_stops_the_child) {
  if (!std::filesystem::exists(kShell)) {
    GTEST_SKIP() << "no " << kShell;
  }
  auto options = shell("exec yes veribuild");
  options.max_output_bytes = 1024;
  auto result = veribuild::build::run_process(options);
  EXPECT_TRUE(result.output_exceeded);
  EXPECT_FALSE(result.timed_out);
  EXPECT_EQ(result.output.size(), 1024u);
  EXPECT_EQ(result.error, "output ceiling exceeded");
}

TEST(process, missing_executable_is_a_launch_failure) {
  auto options = veribuild::build::process_options{};
  options.executable = "veribuild-tool-that-does-not-exist";
  auto result = veribuild::build::run_process(options);
  EXPECT_TRUE(result.launch_failed);
  EXPECT_FALSE(result.succeeded());
  EXPECT_FALSE(result.error.empty());
}

TEST(process, tail_excerpt_cuts_at_a_line_boundary) {
  EXPECT_EQ(veribuild::build::tail_excerpt("short", 64), "short");
  EXPECT_EQ(veribuild::build::tail_excerpt("first line\nsecond\nthird\n", 10),
            "third\n");
  EXPECT_EQ(veribuild::build::tail_excerpt("abcdefghij", 4), "ghij");
}
