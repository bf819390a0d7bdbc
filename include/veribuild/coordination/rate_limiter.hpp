#pragma once

#include <veribuild/cache/cache_ref.hpp>
#include <veribuild/schema/primitives.hpp>
#include <cstdint>
#include <string>
#include <string_view>

namespace veribuild::coordination {

struct rate_limit_t final {
  uint32_t requests{1};
  veribuild::schema::duration_milliseconds_t window{30000};
};

/// Fixed-window request counter per client, kept in the coordination cache
/// under `rate|<scope>|<client>`. Rejections leave the counter untouched.
class rate_limiter final {
 public:
  rate_limiter(veribuild::cache::cache_ref cache,
               std::string scope,
               rate_limit_t limit);

  /// Count one request from `client`; false when its window is exhausted.
  /// An unavailable cache admits the request.
  bool allow(std::string_view client);

  const rate_limit_t& limit() const;

 private:
  veribuild::cache::cache_ref cache_;
  std::string scope_;
  rate_limit_t limit_;
};

/// `ipv4:10.0.0.1:5555` or `ipv6:[::1]:5555` to the address without port.
std::string client_key_from_peer(std::string_view peer);

}  // namespace veribuild::coordination
