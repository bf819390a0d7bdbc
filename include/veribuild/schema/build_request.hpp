#pragma once
#include <veribuild/schema/primitives.hpp>
#include <optional>
#include <string>
#include <vector>

namespace veribuild::schema {

template <uint16_t Version>
struct build_request;

/// One attempt to reproduce a deployed program. Unique per program_id;
/// created_at is set on first insert and never rewritten.
template <>
struct build_request<1> final {
  program_id_t program_id;
  std::string repository;
  std::optional<std::string> commit_hash;
  std::optional<std::string> lib_name;
  std::string base_image;
  std::string mount_path;
  std::vector<std::string> build_args;
  bool bpf_flag{};
  timestamp_milliseconds_t created_at{};
};

using build_request_t = build_request<1>;

/// True when two requests would run the same build (created_at ignored).
inline bool same_build_parameters(const build_request_t& lhs,
                                  const build_request_t& rhs) {
  return lhs.program_id == rhs.program_id &&
         lhs.repository == rhs.repository &&
         lhs.commit_hash == rhs.commit_hash && lhs.lib_name == rhs.lib_name &&
         lhs.base_image == rhs.base_image &&
         lhs.mount_path == rhs.mount_path &&
         lhs.build_args == rhs.build_args && lhs.bpf_flag == rhs.bpf_flag;
}

}  // namespace veribuild::schema
