#pragma once

#include <veribuild/cache/cache.hpp>
#include <veribuild/schema/build_request.hpp>
#include <veribuild/schema/primitives.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <memory>
#include <string>
#include <string_view>
#include <system_error>

namespace veribuild::testing {

inline std::string make_db_path(const std::string_view prefix) {
  static auto counter = std::atomic<uint64_t>{};
  const auto now =
      std::chrono::high_resolution_clock::now().time_since_epoch().count();
  const auto path = std::filesystem::temp_directory_path() /
                    (std::string{prefix} + "_" +
                     std::to_string(static_cast<unsigned long long>(now)) +
                     "_" + std::to_string(counter++));
  return path.string();
}

inline void remove_path(const std::string& path) {
  auto error = std::error_code{};
  std::filesystem::remove_all(path, error);
}

/// Removes a temporary file or directory tree on scope exit. Declare it
/// before anything that keeps the path open.
struct scoped_path final {
  std::string path;

  explicit scoped_path(const std::string_view prefix)
      : path{make_db_path(prefix)} {}
  scoped_path(const scoped_path&) = delete;
  scoped_path& operator=(const scoped_path&) = delete;
  ~scoped_path() {
    remove_path(path);
    remove_path(path + "-wal");
    remove_path(path + "-shm");
  }
};

/// Hand-driven clock for expiry tests.
struct manual_clock final {
  std::shared_ptr<std::atomic<int64_t>> milliseconds =
      std::make_shared<std::atomic<int64_t>>(1'700'000'000'000);

  void advance(const std::chrono::milliseconds step) {
    *milliseconds += step.count();
  }

  veribuild::cache::clock_fn_t as_clock() const {
    return [counter = milliseconds]() {
      return std::chrono::system_clock::time_point{
          std::chrono::milliseconds{counter->load()}};
    };
  }
};

/// 64 hex characters built from one repeated digit.
inline std::string make_hash(const char digit) {
  return std::string(64, digit);
}

/// Write an executable `/bin/sh` script standing in for an external tool.
inline std::string write_script(const std::filesystem::path& path,
                                const std::string_view body) {
  {
    auto file = std::ofstream{path, std::ios::trunc};
    file << "#!/bin/sh\n" << body << "\n";
  }
  std::filesystem::permissions(path,
                               std::filesystem::perms::owner_all |
                                   std::filesystem::perms::group_read |
                                   std::filesystem::perms::group_exec,
                               std::filesystem::perm_options::replace);
  return path.string();
}

inline veribuild::schema::build_request_t make_request(
    const std::string_view program_id,
    const std::string_view repository = "https://github.com/example/program") {
  return veribuild::schema::build_request_t{
      .program_id = std::string{program_id},
      .repository = std::string{repository},
      .commit_hash = std::nullopt,
      .lib_name = std::nullopt,
      .base_image = "ellipsislabs/solana:latest",
      .mount_path = "/build",
      .build_args = {},
      .bpf_flag = false,
      .created_at = 1'700'000'000'000};
}

}  // namespace veribuild::testing
