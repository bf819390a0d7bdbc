#include <spdlog/spdlog.h>
#include <veribuild/coordination/rate_limiter.hpp>

#include <charconv>

namespace veribuild::coordination {

rate_limiter::rate_limiter(veribuild::cache::cache_ref cache,
                           std::string scope,
                           rate_limit_t limit)
    : cache_{cache}, scope_{std::move(scope)}, limit_{limit} {}

const rate_limit_t& rate_limiter::limit() const {
  return limit_;
}

bool rate_limiter::allow(std::string_view client) {
  if (limit_.requests == 0) {
    return false;
  }
  auto key = std::string{"rate|"};
  key.append(scope_);
  key.push_back('|');
  key.append(client);

  auto allowed = false;
  auto status = cache_.update(
      key, [&](std::optional<veribuild::cache::cache_entry>& entry,
               veribuild::schema::timestamp_milliseconds_t now) {
        if (!entry) {
          entry = veribuild::cache::cache_entry{
              .value = "1", .expires_at = now + limit_.window};
          allowed = true;
          return veribuild::cache::cache_write::store;
        }
        auto count = uint32_t{};
        const auto* begin = entry->value.data();
        const auto* end = begin + entry->value.size();
        auto [ptr, ec] = std::from_chars(begin, end, count);
        if (ec != std::errc{} || ptr != end) {
          // Unreadable counter: restart the window.
          entry->value = "1";
          entry->expires_at = now + limit_.window;
          allowed = true;
          return veribuild::cache::cache_write::store;
        }
        if (count >= limit_.requests) {
          return veribuild::cache::cache_write::keep;
        }
        entry->value = std::to_string(count + 1);
        allowed = true;
        return veribuild::cache::cache_write::store;
      });

  if (status == veribuild::cache::cache_status::unavailable) {
    spdlog::warn("Rate limiter cache unavailable; admitting {} request from {}",
                 scope_, client);
    return true;
  }
  if (!allowed) {
    spdlog::debug("Rate limited {} request from {}", scope_, client);
  }
  return allowed;
}

std::string client_key_from_peer(std::string_view peer) {
  auto scheme = peer.find(':');
  if (scheme != std::string_view::npos &&
      (peer.substr(0, scheme) == "ipv4" || peer.substr(0, scheme) == "ipv6" ||
       peer.substr(0, scheme) == "unix")) {
    peer.remove_prefix(scheme + 1);
  }
  if (!peer.empty() && peer.front() == '[') {
    auto close = peer.find(']');
    if (close != std::string_view::npos) {
      return std::string{peer.substr(1, close - 1)};
    }
  }
  auto port = peer.rfind(':');
  if (port != std::string_view::npos && peer.find(':') == port) {
    return std::string{peer.substr(0, port)};
  }
  return std::string{peer};
}

}  // namespace veribuild::coordination
