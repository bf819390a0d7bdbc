#pragma once

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace veribuild::build {

struct process_options final {
  /// Absolute/relative path, or a bare name looked up on PATH.
  std::string executable;
  std::vector<std::string> arguments;
  std::optional<std::string> working_directory;
  std::chrono::milliseconds timeout{std::chrono::minutes{30}};
  /// Combined stdout and stderr ceiling; the child is killed past it.
  std::size_t max_output_bytes{1 << 20};
};

struct process_result final {
  int exit_code{-1};
  /// Interleaved stdout and stderr, truncated at the ceiling.
  std::string output;
  bool timed_out{};
  bool output_exceeded{};
  bool launch_failed{};
  std::string error;

  bool succeeded() const {
    return !launch_failed && !timed_out && !output_exceeded && exit_code == 0;
  }
};

/// Run a child process to completion or until its deadline or output
/// ceiling, whichever comes first. Never throws for child failures.
process_result run_process(const process_options& options);

/// Last `max_bytes` of `output`, cut at a line boundary when possible.
std::string tail_excerpt(const std::string& output, std::size_t max_bytes);

}  // namespace veribuild::build
