#pragma once

#include <veribuild/build/process.hpp>
#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace veribuild::build {

/// `docker run` exits with 125 when the daemon refuses to create the
/// container (bad flags, no capacity, image pull failure).
inline constexpr auto kContainerRuntimeFailure = 125;

struct container_limits final {
  std::string memory{"8g"};
  std::string cpus{"2"};
  uint32_t pids{4096};
  std::string network{"bridge"};
};

struct container_run_t final {
  std::string image;
  std::string host_directory;
  std::string mount_path;
  std::vector<std::string> command;
  std::chrono::milliseconds timeout{std::chrono::minutes{30}};
  std::size_t max_output_bytes{1 << 20};
};

/// Isolated build containers through the docker CLI.
class container_runtime final {
 public:
  explicit container_runtime(std::string docker_binary = "docker",
                             container_limits limits = {});

  /// Run one throwaway container. On timeout or output overflow the
  /// container itself is killed, not only the CLI client.
  process_result run(const container_run_t& run);

  /// `docker run` argument vector for a container named `name`.
  std::vector<std::string> run_arguments(const container_run_t& run,
                                         std::string_view name) const;

  bool kill(std::string_view name);

  const std::string& docker_binary() const;

 private:
  std::string docker_binary_;
  container_limits limits_;
};

}  // namespace veribuild::build
