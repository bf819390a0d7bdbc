#pragma once
#include <optional>
#include <string>
#include <vector>

// Schema type: build submission.
// Raw intake parameters as a caller sends them, before validation fills in
// defaults and turns them into a build_request_t.
namespace veribuild::schema {

template <uint16_t Version>
struct build_submission;

template <>
struct build_submission<1> final {
  std::string program_id;
  std::string repository;
  std::optional<std::string> commit_hash;
  std::optional<std::string> lib_name;
  std::optional<std::string> base_image;
  std::optional<std::string> mount_path;
  std::vector<std::string> cargo_args;
  bool bpf_flag{};
};

using build_submission_t = build_submission<1>;

}  // namespace veribuild::schema
