#pragma once

#include <veribuild/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Named errors a caller can receive. `none` accompanies every successful
// status; `duplicate_in_progress` is informative, not a failure.
namespace veribuild::schema {

enum class error_code_t : uint32_t {
  none = 0,
  validation_error = 1,
  duplicate_in_progress = 2,
  build_error = 3,
  chain_lookup_not_found = 4,
  chain_lookup_unreachable = 5,
  persistence_error = 6,
  rate_limited = 7,
};

inline constexpr auto kErrorCodeNames = enum_names_t<error_code_t, 8>{
    std::pair<std::string_view, error_code_t>{"none", error_code_t::none},
    std::pair<std::string_view, error_code_t>{"validation_error",
                                              error_code_t::validation_error},
    std::pair<std::string_view, error_code_t>{
        "duplicate_in_progress", error_code_t::duplicate_in_progress},
    std::pair<std::string_view, error_code_t>{"build_error",
                                              error_code_t::build_error},
    std::pair<std::string_view, error_code_t>{
        "chain_lookup_not_found", error_code_t::chain_lookup_not_found},
    std::pair<std::string_view, error_code_t>{
        "chain_lookup_unreachable", error_code_t::chain_lookup_unreachable},
    std::pair<std::string_view, error_code_t>{"persistence_error",
                                              error_code_t::persistence_error},
    std::pair<std::string_view, error_code_t>{"rate_limited",
                                              error_code_t::rate_limited}};

template <>
inline std::optional<error_code_t> try_from_string<error_code_t>(
    const std::string_view value) {
  return lookup_enum(value, kErrorCodeNames);
}

inline constexpr std::string_view to_string(const error_code_t value) {
  return lookup_name(value, kErrorCodeNames);
}

}  // namespace veribuild::schema
