#pragma once

#include <veribuild/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Last-known outcome of the most recent job, persisted on the request row.
namespace veribuild::schema {

enum class job_status_t : uint8_t {
  pending = 0,
  building = 1,
  verified = 2,
  not_verified = 3,
  failed = 4
};

inline constexpr auto kJobStatusNames = enum_names_t<job_status_t, 5>{
    std::pair<std::string_view, job_status_t>{"pending",
                                              job_status_t::pending},
    std::pair<std::string_view, job_status_t>{"building",
                                              job_status_t::building},
    std::pair<std::string_view, job_status_t>{"verified",
                                              job_status_t::verified},
    std::pair<std::string_view, job_status_t>{"not_verified",
                                              job_status_t::not_verified},
    std::pair<std::string_view, job_status_t>{"failed", job_status_t::failed}};

template <>
inline std::optional<job_status_t> try_from_string<job_status_t>(
    const std::string_view value) {
  return lookup_enum(value, kJobStatusNames);
}

inline constexpr std::string_view to_string(const job_status_t value) {
  return lookup_name(value, kJobStatusNames);
}

/// Terminal statuses are the ones a waiter can stop polling on.
inline constexpr bool is_terminal(const job_status_t value) {
  return value == job_status_t::verified ||
         value == job_status_t::not_verified || value == job_status_t::failed;
}

}  // namespace veribuild::schema
