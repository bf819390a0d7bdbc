#pragma once

#include <veribuild/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

namespace veribuild::schema {

enum class verification_reason_t : uint8_t {
  matched = 0,
  hash_mismatch = 1,
  non_deterministic_build = 2
};

inline constexpr auto kVerificationReasonNames =
    enum_names_t<verification_reason_t, 3>{
        std::pair<std::string_view, verification_reason_t>{
            "matched", verification_reason_t::matched},
        std::pair<std::string_view, verification_reason_t>{
            "hash_mismatch", verification_reason_t::hash_mismatch},
        std::pair<std::string_view, verification_reason_t>{
            "non_deterministic_build",
            verification_reason_t::non_deterministic_build}};

template <>
inline std::optional<verification_reason_t>
try_from_string<verification_reason_t>(const std::string_view value) {
  return lookup_enum(value, kVerificationReasonNames);
}

inline constexpr std::string_view to_string(
    const verification_reason_t value) {
  return lookup_name(value, kVerificationReasonNames);
}

}  // namespace veribuild::schema
