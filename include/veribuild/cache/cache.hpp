#pragma once
#include <veribuild/schema/primitives.hpp>
#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace veribuild::cache {

enum class cache_status : uint8_t {
  ok = 0,
  unavailable = 1,  // backend closed, failing or contended past retries
};

/// Stored value plus its absolute expiry. Expired entries read as absent.
struct cache_entry final {
  std::string value;
  veribuild::schema::timestamp_milliseconds_t expires_at{};
};

/// Outcome of a mutator: leave the key untouched, write the entry back, or
/// delete the key.
enum class cache_write : uint8_t { keep, store, erase };

/// Read-modify-write callback run while the key is locked. `entry` is empty
/// when the key is absent or expired.
using cache_mutator_t =
    std::function<cache_write(std::optional<cache_entry>& entry,
                              veribuild::schema::timestamp_milliseconds_t now)>;

using clock_fn_t = std::function<std::chrono::system_clock::time_point()>;

namespace detail {

/// Entries are stored as an 8-byte big-endian expiry followed by the value.
/// An expiry of zero never expires.
std::string encode_entry(const cache_entry& entry);
std::optional<cache_entry> decode_entry(std::string_view raw);

inline bool is_live(const cache_entry& entry,
                    veribuild::schema::timestamp_milliseconds_t now) {
  return entry.expires_at == 0 || entry.expires_at > now;
}

}  // namespace detail

/// Shared, expiring key-value cache used for coordination state. Not a
/// system of record.
template <typename Library>
struct cache {
  /// Atomically apply mutator to key.
  cache_status update(std::string_view key, const cache_mutator_t& mutator);

  /// Read a live entry. The status keeps an unreachable backend apart from
  /// a missing key.
  std::pair<cache_status, std::optional<cache_entry>> get(
      std::string_view key) const;

  /// Delete every expired entry; returns how many were removed.
  std::size_t purge_expired();
};

template <typename Library>
cache<Library> make_cache(const std::string_view& path, clock_fn_t clock);

}  // namespace veribuild::cache
