#pragma once

#include <veribuild/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Why a job ended without a comparable executable hash.
namespace veribuild::schema {

enum class failure_reason_t : uint8_t {
  checkout_failed = 1,
  toolchain_failed = 2,
  timeout = 3,
  output_limit = 4,
  executable_missing = 5,
  resource_exhausted = 6,
  non_deterministic = 7,
  program_not_found = 8,
  chain_unreachable = 9,
  internal_error = 10,
};

inline constexpr auto kFailureReasonNames = enum_names_t<failure_reason_t, 10>{
    std::pair<std::string_view, failure_reason_t>{
        "checkout_failed", failure_reason_t::checkout_failed},
    std::pair<std::string_view, failure_reason_t>{
        "toolchain_failed", failure_reason_t::toolchain_failed},
    std::pair<std::string_view, failure_reason_t>{"timeout",
                                                  failure_reason_t::timeout},
    std::pair<std::string_view, failure_reason_t>{
        "output_limit", failure_reason_t::output_limit},
    std::pair<std::string_view, failure_reason_t>{
        "executable_missing", failure_reason_t::executable_missing},
    std::pair<std::string_view, failure_reason_t>{
        "resource_exhausted", failure_reason_t::resource_exhausted},
    std::pair<std::string_view, failure_reason_t>{
        "non_deterministic", failure_reason_t::non_deterministic},
    std::pair<std::string_view, failure_reason_t>{
        "program_not_found", failure_reason_t::program_not_found},
    std::pair<std::string_view, failure_reason_t>{
        "chain_unreachable", failure_reason_t::chain_unreachable},
    std::pair<std::string_view, failure_reason_t>{
        "internal_error", failure_reason_t::internal_error}};

template <>
inline std::optional<failure_reason_t> try_from_string<failure_reason_t>(
    const std::string_view value) {
  return lookup_enum(value, kFailureReasonNames);
}

inline constexpr std::string_view to_string(const failure_reason_t value) {
  return lookup_name(value, kFailureReasonNames);
}

}  // namespace veribuild::schema
