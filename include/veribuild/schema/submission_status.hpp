#pragma once

#include <veribuild/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

namespace veribuild::schema {

enum class submission_status_t : uint8_t {
  cached = 0,
  in_progress = 1,
  accepted = 2,
  failed = 3
};

inline constexpr auto kSubmissionStatusNames =
    enum_names_t<submission_status_t, 4>{
        std::pair<std::string_view, submission_status_t>{
            "cached", submission_status_t::cached},
        std::pair<std::string_view, submission_status_t>{
            "in_progress", submission_status_t::in_progress},
        std::pair<std::string_view, submission_status_t>{
            "accepted", submission_status_t::accepted},
        std::pair<std::string_view, submission_status_t>{
            "failed", submission_status_t::failed}};

template <>
inline std::optional<submission_status_t> try_from_string<submission_status_t>(
    const std::string_view value) {
  return lookup_enum(value, kSubmissionStatusNames);
}

inline constexpr std::string_view to_string(const submission_status_t value) {
  return lookup_name(value, kSubmissionStatusNames);
}

}  // namespace veribuild::schema
