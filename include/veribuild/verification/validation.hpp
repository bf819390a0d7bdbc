#pragma once

#include <veribuild/schema/build_request.hpp>
#include <veribuild/schema/build_submission.hpp>
#include <veribuild/schema/pipeline_error.hpp>
#include <veribuild/schema/primitives.hpp>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace veribuild::verification {

inline constexpr auto kMaxProgramIdLength = std::size_t{44};
inline constexpr auto kMaxBuildArgs = std::size_t{32};
inline constexpr auto kMaxBuildArgLength = std::size_t{256};
inline constexpr auto kMaxLibNameLength = std::size_t{64};

struct submission_defaults final {
  std::string base_image{"ellipsislabs/solana:latest"};
  std::string mount_path{"/build"};
};

bool is_valid_program_id(std::string_view program_id);
bool is_valid_commit_hash(std::string_view commit_hash);
bool is_valid_lib_name(std::string_view lib_name);
bool is_valid_image_reference(std::string_view image);
bool is_valid_mount_path(std::string_view mount_path);
bool is_valid_build_arg(std::string_view argument);

/// Accepted repository URL in canonical form; a bare `host.tld/path` gains
/// an `https://` scheme. nullopt for local paths, option-like strings and
/// unsupported schemes.
std::optional<std::string> normalize_repository(std::string_view repository);

/// Turn raw intake parameters into a build request, filling defaults.
/// Validation has no side effects; the first violation is reported.
std::variant<veribuild::schema::build_request_t,
             veribuild::schema::pipeline_error_t>
validate_submission(const veribuild::schema::build_submission_t& submission,
                    const submission_defaults& defaults,
                    veribuild::schema::timestamp_milliseconds_t now);

}  // namespace veribuild::verification
