#pragma once

#include <veribuild/build/container_runtime.hpp>
#include <veribuild/schema/build_output.hpp>
#include <veribuild/schema/build_request.hpp>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace veribuild::build {

/// Seam between the orchestrator and the build machinery; tests substitute
/// a fake.
using build_runner_t =
    std::function<veribuild::schema::build_outcome_t(
        const veribuild::schema::build_request_t&)>;

struct executor_options final {
  std::filesystem::path work_root{"/tmp/veribuild"};
  std::string git_binary{"git"};
  std::chrono::milliseconds checkout_timeout{std::chrono::minutes{10}};
  std::chrono::milliseconds build_timeout{std::chrono::minutes{30}};
  std::size_t max_log_bytes{4 << 20};
  std::size_t max_executable_bytes{16 << 20};
  uint32_t reproducibility_runs{1};
  std::size_t log_excerpt_bytes{8 << 10};
};

/// Fetches a repository at the requested commit, builds it in a throwaway
/// container and hashes the produced executable.
///
/// Every run uses its own working directory under `work_root`, removed on
/// all exit paths. With `reproducibility_runs > 1` the build is repeated in
/// fresh containers and any divergence is reported as non_deterministic.
class executor final {
 public:
  executor(container_runtime& runtime, executor_options options);

  veribuild::schema::build_outcome_t run(
      const veribuild::schema::build_request_t& request);

  const executor_options& options() const;

 private:
  std::optional<veribuild::schema::build_error_t> checkout(
      const veribuild::schema::build_request_t& request,
      const std::filesystem::path& directory);

  veribuild::schema::build_outcome_t build_once(
      const veribuild::schema::build_request_t& request,
      const std::filesystem::path& directory);

  container_runtime& runtime_;
  executor_options options_;
};

/// `cargo build-sbf|build-bpf [-- args...]` as run inside the container.
std::vector<std::string> make_build_command(
    const veribuild::schema::build_request_t& request);

/// `target/deploy/<lib_name>.so` with dashes mapped to underscores, or the
/// single `.so` in `target/deploy` when no lib name is given.
std::variant<std::filesystem::path, veribuild::schema::build_error_t>
locate_executable(const std::filesystem::path& checkout,
                  const std::optional<std::string>& lib_name);

/// Read and hash an executable, refusing files above `max_bytes`.
std::variant<std::string, veribuild::schema::build_error_t> hash_executable(
    const std::filesystem::path& path,
    std::size_t max_bytes);

}  // namespace veribuild::build
