#pragma once
#include <array>
#include <chrono>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace veribuild::schema {

using bytes_t = std::vector<uint8_t>;
using bytes_view_t = std::span<const uint8_t>;
using digest_t = std::array<uint8_t, 32>;
using program_id_t = std::string;
using job_token_t = std::string;
using timestamp_milliseconds_t = uint64_t;
using duration_milliseconds_t = uint64_t;

bytes_t make_bytes(const std::string_view& bytes);
bytes_view_t make_bytes_view(const bytes_t& bytes);
bytes_view_t make_bytes_view(const std::string_view& bytes);

/// Lowercase hex without prefix.
std::string to_hex(const bytes_view_t& bytes);
std::optional<bytes_t> try_from_hex(std::string_view hex);

/// Lowercase a 32-byte hex digest and drop an optional `0x` prefix; nullopt
/// when the input is not exactly 64 hex characters.
std::optional<std::string> try_normalize_digest(std::string_view digest);

/// Milliseconds since the Unix epoch on the system clock.
timestamp_milliseconds_t now_milliseconds();
timestamp_milliseconds_t to_milliseconds(
    std::chrono::system_clock::time_point time_point);

/// Random 128-bit identifier rendered as a UUID string.
std::string make_token();

}  // namespace veribuild::schema
