#include <veribuild/build/container_runtime.hpp>
#include <veribuild/build/executor.hpp>
#include <veribuild/crypto/digest.hpp>
#include <veribuild/testing/common.hpp>
#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>

namespace {

// Stands in for git: `clone` creates the target directory, `checkout` fails
// for commit 0bad.
constexpr auto kFakeGit = R"SH(
for last; do :; done
case " $* " in
  *" clone "*) mkdir -p "$last" ;;
  *" checkout "*) [ "$last" = "0bad" ] && { echo "fatal: reference is not a tree" 1>&2; exit 128; } ;;
esac
exit 0)SH";

// Stands in for docker: writes target/deploy/my_program.so into the mounted
// directory. The content includes a per-build counter when
// VERIBUILD_FAKE_COUNTER names a file.
std::string fake_docker_body(const std::string& behavior) {
  return R"SH(
[ "$1" = "kill" ] && exit 0
host=""
while [ $# -gt 0 ]; do
  case "$1" in
    -v) host="${2%%:*}"; shift 2 ;;
    *) shift ;;
  esac
done
)SH" + behavior;
}

constexpr auto kDeterministicBuild = R"SH(
mkdir -p "$host/target/deploy"
printf 'ELF-program' > "$host/target/deploy/my_program.so"
echo "Finished release [optimized] target(s)"
)SH";

struct executor_fixture final {
  veribuild::testing::scoped_path root{"veribuild_executor"};
  std::filesystem::path git;
  std::filesystem::path docker;

  executor_fixture() {
    std::filesystem::create_directories(root.path);
    git = veribuild::testing::write_script(
        std::filesystem::path{root.path} / "git", kFakeGit);
  }

  void set_docker(const std::string& behavior) {
    docker = veribuild::testing::write_script(
        std::filesystem::path{root.path} / "docker", fake_docker_body(behavior));
  }

  veribuild::build::executor_options options(uint32_t runs = 1) const {
    auto options = veribuild::build::executor_options{};
    options.work_root = std::filesystem::path{root.path} / "work";
    options.git_binary = git.string();
    options.checkout_timeout = std::chrono::seconds{10};
    options.build_timeout = std::chrono::seconds{10};
    options.reproducibility_runs = runs;
    return options;
  }

  bool work_root_is_empty() const {
    auto work = std::filesystem::path{root.path} / "work";
    return !std::filesystem::exists(work) || std::filesystem::is_empty(work);
  }
};

bool have_shell() {
  return std::filesystem::exists("/bin/sh");
}

std::string expected_hash() {
  return veribuild::crypto::executable_hash(
      veribuild::schema::make_bytes_view(std::string_view{"ELF-program"}));
}

}  // namespace

TEST(executor, build_command_selects_toolchain_and_passes_args) {
  auto request = veribuild::testing::make_request("Prog111");
  EXPECT_EQ(veribuild::build::make_build_command(request),
            (std::vector<std::string>{"cargo", "build-sbf"}));

  request.bpf_flag = true;
  request.build_args = {"--features", "mainnet"};
  EXPECT_EQ(veribuild::build::make_build_command(request),
            (std::vector<std::string>{"cargo", "build-bpf", "--", "--features",
                                      "mainnet"}));
}

TEST(executor, container_arguments_isolate_the_build) {
  auto runtime = veribuild::build::container_runtime{
      "docker", veribuild::build::container_limits{.memory = "4g",
                                                   .cpus = "1",
                                                   .pids = 512,
                                                   .network = "none"}};
  auto arguments = runtime.run_arguments(
      veribuild::build::container_run_t{.image = "ellipsislabs/solana:1.18",
                                        .host_directory = "/work/run-0",
                                        .mount_path = "/build",
                                        .command = {"cargo", "build-sbf"}},
      "veribuild-test");

  auto expected = std::vector<std::string>{
      "run",           "--rm",        "--name",
      "veribuild-test", "--network",  "none",
      "--memory",      "4g",          "--memory-swap",
      "4g",            "--cpus",      "1",
      "--pids-limit",  "512",         "--security-opt",
      "no-new-privileges", "--cap-drop", "ALL",
      "-v",            "/work/run-0:/build", "-w",
      "/build",        "ellipsislabs/solana:1.18", "cargo",
      "build-sbf"};
  EXPECT_EQ(arguments, expected);
  EXPECT_EQ(runtime.docker_binary(), "docker");
}

TEST(executor, locate_executable_by_lib_name_or_single_file) {
  auto root = veribuild::testing::scoped_path{"veribuild_locate"};
  auto deploy = std::filesystem::path{root.path} / "target" / "deploy";

  auto missing = veribuild::build::locate_executable(root.path, std::nullopt);
  ASSERT_TRUE(std::holds_alternative<veribuild::schema::build_error_t>(missing));
  EXPECT_EQ(std::get<veribuild::schema::build_error_t>(missing).reason,
            veribuild::schema::failure_reason_t::executable_missing);

  std::filesystem::create_directories(deploy);
  std::ofstream{deploy / "my_program.so"} << "elf";
  std::ofstream{deploy / "my_program-keypair.json"} << "[]";

  auto single = veribuild::build::locate_executable(root.path, std::nullopt);
  ASSERT_TRUE(std::holds_alternative<std::filesystem::path>(single));
  EXPECT_EQ(std::get<std::filesystem::path>(single).filename(), "my_program.so");

  auto named = veribuild::build::locate_executable(
      root.path, std::optional<std::string>{"my-program"});
  ASSERT_TRUE(std::holds_alternative<std::filesystem::path>(named));

  std::ofstream{deploy / "other.so"} << "elf";
  auto ambiguous = veribuild::build::locate_executable(root.path, std::nullopt);
  ASSERT_TRUE(std::holds_alternative<veribuild::schema::build_error_t>(ambiguous));

  auto wrong = veribuild::build::locate_executable(
      root.path, std::optional<std::string>{"absent"});
  ASSERT_TRUE(std::holds_alternative<veribuild::schema::build_error_t>(wrong));
}

TEST(executor, hash_executable_enforces_the_size_ceiling) {
  auto root = veribuild::testing::scoped_path{"veribuild_hash_file"};
  std::filesystem::create_directories(root.path);
  auto file = std::filesystem::path{root.path} / "program.so";
  {
    auto out = std::ofstream{file, std::ios::binary};
    out << "ELF-program";
    out.write("\0\0\0\0", 4);
  }

  auto hashed = veribuild::build::hash_executable(file, 1024);
  ASSERT_TRUE(std::holds_alternative<std::string>(hashed));
  EXPECT_EQ(std::get<std::string>(hashed), expected_hash());

  auto oversized = veribuild::build::hash_executable(file, 8);
  ASSERT_TRUE(std::holds_alternative<veribuild::schema::build_error_t>(oversized));
  EXPECT_EQ(std::get<veribuild::schema::build_error_t>(oversized).reason,
            veribuild::schema::failure_reason_t::output_limit);
}

TEST(executor, builds_and_hashes_with_fake_tools) {
  if (!have_shell()) {
    GTEST_SKIP() << "no /bin/sh";
  }
  auto fixture = executor_fixture{};
  fixture.set_docker(kDeterministicBuild);
  auto runtime = veribuild::build::container_runtime{fixture.docker.string()};
  auto executor = veribuild::build::executor{runtime, fixture.options(2)};

  auto request = veribuild::testing::make_request("Prog111");
  request.commit_hash = "abc123";
  auto outcome = executor.run(request);
  ASSERT_TRUE(std::holds_alternative<veribuild::schema::build_output_t>(outcome))
      << std::get<veribuild::schema::build_error_t>(outcome).detail;
  auto& output = std::get<veribuild::schema::build_output_t>(outcome);
  EXPECT_EQ(output.executable_hash, expected_hash());
  EXPECT_EQ(output.exit_code, 0);
  EXPECT_NE(output.log_excerpt.find("Finished release"), std::string::npos);
  EXPECT_TRUE(fixture.work_root_is_empty());
}

TEST(executor, divergent_runs_are_non_deterministic) {
  if (!have_shell()) {
    GTEST_SKIP() << "no /bin/sh";
  }
  auto fixture = executor_fixture{};
  auto counter = (std::filesystem::path{fixture.root.path} / "counter").string();
  fixture.set_docker(R"SH(
n=$(cat ")SH" + counter + R"SH(" 2>/dev/null || echo 0)
n=$((n + 1))
echo "$n" > ")SH" + counter + R"SH("
mkdir -p "$host/target/deploy"
printf "build-$n" > "$host/target/deploy/my_program.so"
)SH");
  auto runtime = veribuild::build::container_runtime{fixture.docker.string()};
  auto executor = veribuild::build::executor{runtime, fixture.options(2)};

  auto outcome = executor.run(veribuild::testing::make_request("Prog111"));
  ASSERT_TRUE(std::holds_alternative<veribuild::schema::build_error_t>(outcome));
  auto& error = std::get<veribuild::schema::build_error_t>(outcome);
  EXPECT_EQ(error.reason, veribuild::schema::failure_reason_t::non_deterministic);
  EXPECT_FALSE(error.retryable);
  EXPECT_TRUE(fixture.work_root_is_empty());
}

TEST(executor, maps_tool_failures_to_reasons) {
  if (!have_shell()) {
    GTEST_SKIP() << "no /bin/sh";
  }
  auto fixture = executor_fixture{};

  struct case_t {
    std::string behavior;
    veribuild::schema::failure_reason_t reason;
    bool retryable;
  };
  auto cases = std::vector<case_t>{
      {"echo 'error[E0425]: cannot find value'; exit 101",
       veribuild::schema::failure_reason_t::toolchain_failed, false},
      {"echo 'docker: Error response from daemon'; exit 125",
       veribuild::schema::failure_reason_t::resource_exhausted, true},
      {"echo 'Finished'; exit 0",
       veribuild::schema::failure_reason_t::executable_missing, false},
  };
  for (const auto& c : cases) {
    fixture.set_docker(c.behavior);
    auto runtime = veribuild::build::container_runtime{fixture.docker.string()};
    auto executor = veribuild::build::executor{runtime, fixture.options()};
    auto outcome = executor.run(veribuild::testing::make_request("Prog111"));
    ASSERT_TRUE(std::holds_alternative<veribuild::schema::build_error_t>(outcome))
        << c.behavior;
    auto& error = std::get<veribuild::schema::build_error_t>(outcome);
    EXPECT_EQ(error.reason, c.reason) << c.behavior;
    EXPECT_EQ(error.retryable, c.retryable) << c.behavior;
  }

  fixture.set_docker("exec sleep 30");
  auto runtime = veribuild::build::container_runtime{fixture.docker.string()};
  auto options = fixture.options();
  options.build_timeout = std::chrono::milliseconds{300};
  auto executor = veribuild::build::executor{runtime, options};
  auto timed_out = executor.run(veribuild::testing::make_request("Prog111"));
  ASSERT_TRUE(std::holds_alternative<veribuild::schema::build_error_t>(timed_out));
  EXPECT_EQ(std::get<veribuild::schema::build_error_t>(timed_out).reason,
            veribuild::schema::failure_reason_t::timeout);
  EXPECT_TRUE(fixture.work_root_is_empty());
}

TEST(executor, checkout_failures_are_reported) {
  if (!have_shell()) {
    GTEST_SKIP() << "no /bin/sh";
  }
  auto fixture = executor_fixture{};
  fixture.set_docker(kDeterministicBuild);
  auto runtime = veribuild::build::container_runtime{fixture.docker.string()};

  auto executor = veribuild::build::executor{runtime, fixture.options()};
  auto request = veribuild::testing::make_request("Prog111");
  request.commit_hash = "0bad";
  auto outcome = executor.run(request);
  ASSERT_TRUE(std::holds_alternative<veribuild::schema::build_error_t>(outcome));
  auto& error = std::get<veribuild::schema::build_error_t>(outcome);
  EXPECT_EQ(error.reason, veribuild::schema::failure_reason_t::checkout_failed);
  EXPECT_NE(error.log_excerpt.find("not a tree"), std::string::npos);

  auto options = fixture.options();
  options.git_binary = "/nonexistent/git";
  auto broken = veribuild::build::executor{runtime, options};
  auto launch = broken.run(veribuild::testing::make_request("Prog111"));
  ASSERT_TRUE(std::holds_alternative<veribuild::schema::build_error_t>(launch));
  EXPECT_EQ(std::get<veribuild::schema::build_error_t>(launch).reason,
            veribuild::schema::failure_reason_t::internal_error);
  EXPECT_TRUE(std::get<veribuild::schema::build_error_t>(launch).retryable);
}
