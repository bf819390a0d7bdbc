#pragma once
#include <hiredis/hiredis.h>
#include <veribuild/cache/cache.hpp>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace veribuild::cache {

struct redis_address final {
  std::string host;
  uint16_t port{6379};
};

/// `redis://host[:port]` or `host[:port]`. Empty for anything else.
std::optional<redis_address> parse_redis_address(std::string_view url);

struct redis_cache_tag {};

/// One connection to a Redis server shared by every instance of the
/// service. Commands are serialized on the connection; a broken connection
/// reports `unavailable` and is re-established on the next call.
template <>
struct cache<redis_cache_tag> final {
  struct connection final {
    std::mutex mutex;
    std::unique_ptr<redisContext, decltype(&redisFree)> context{nullptr,
                                                                &redisFree};
  };

  redis_address address;
  std::chrono::milliseconds timeout{std::chrono::seconds{2}};
  std::unique_ptr<connection> link;
  clock_fn_t clock;

  cache_status update(std::string_view key, const cache_mutator_t& mutator);
  std::pair<cache_status, std::optional<cache_entry>> get(
      std::string_view key) const;

  /// Redis expires keys itself; nothing to purge.
  std::size_t purge_expired();

  veribuild::schema::timestamp_milliseconds_t now() const;
};

template <>
cache<redis_cache_tag> make_cache<redis_cache_tag>(const std::string_view& url,
                                                   clock_fn_t clock);

using redis_cache_t = cache<redis_cache_tag>;

}  // namespace veribuild::cache
