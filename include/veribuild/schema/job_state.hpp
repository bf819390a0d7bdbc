#pragma once

#include <veribuild/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// In-flight phase of a job, held only in the coordination cache.
namespace veribuild::schema {

enum class job_state_t : uint8_t { queued = 0, building = 1, verifying = 2 };

inline constexpr auto kJobStateNames = enum_names_t<job_state_t, 3>{
    std::pair<std::string_view, job_state_t>{"queued", job_state_t::queued},
    std::pair<std::string_view, job_state_t>{"building",
                                             job_state_t::building},
    std::pair<std::string_view, job_state_t>{"verifying",
                                             job_state_t::verifying}};

template <>
inline std::optional<job_state_t> try_from_string<job_state_t>(
    const std::string_view value) {
  return lookup_enum(value, kJobStateNames);
}

inline constexpr std::string_view to_string(const job_state_t value) {
  return lookup_name(value, kJobStateNames);
}

}  // namespace veribuild::schema
