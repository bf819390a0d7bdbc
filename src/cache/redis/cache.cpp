#include <spdlog/spdlog.h>
#include <sys/time.h>
#include <veribuild/cache/redis/cache.hpp>
#include <veribuild/common/critical.hpp>

#include <charconv>
#include <initializer_list>
#include <vector>

namespace veribuild::cache {

namespace {

constexpr auto kMaxAttempts = 3;
constexpr auto kScheme = std::string_view{"redis://"};

struct reply_deleter final {
  void operator()(redisReply* reply) const {
    if (reply != nullptr) {
      freeReplyObject(reply);
    }
  }
};

using reply_t = std::unique_ptr<redisReply, reply_deleter>;

reply_t command(redisContext* context,
                std::initializer_list<std::string_view> arguments) {
  auto argv = std::vector<const char*>{};
  auto lengths = std::vector<std::size_t>{};
  for (const auto& argument : arguments) {
    argv.push_back(argument.data());
    lengths.push_back(argument.size());
  }
  return reply_t{static_cast<redisReply*>(redisCommandArgv(
      context, static_cast<int>(argv.size()), argv.data(), lengths.data()))};
}

bool is_status(const reply_t& reply) {
  return reply && reply->type == REDIS_REPLY_STATUS;
}

std::string describe(redisContext* context, const reply_t& reply) {
  if (reply && reply->type == REDIS_REPLY_ERROR) {
    return std::string{reply->str, reply->len};
  }
  if (context != nullptr && context->err != 0) {
    return context->errstr;
  }
  return "unexpected reply";
}

timeval to_timeval(std::chrono::milliseconds timeout) {
  auto value = timeval{};
  value.tv_sec = static_cast<decltype(value.tv_sec)>(timeout.count() / 1000);
  value.tv_usec =
      static_cast<decltype(value.tv_usec)>((timeout.count() % 1000) * 1000);
  return value;
}

bool ensure_connected(cache<redis_cache_tag>::connection& link,
                      const redis_address& address,
                      std::chrono::milliseconds timeout) {
  if (link.context && link.context->err == 0) {
    return true;
  }
  auto limit = to_timeval(timeout);
  link.context.reset(
      redisConnectWithTimeout(address.host.c_str(), address.port, limit));
  if (!link.context || link.context->err != 0) {
    spdlog::warn("Redis connection to {}:{} failed: {}", address.host,
                 address.port,
                 link.context ? link.context->errstr : "cannot allocate");
    link.context.reset();
    return false;
  }
  if (redisSetTimeout(link.context.get(), limit) != REDIS_OK) {
    spdlog::warn("Could not set the Redis command timeout: {}",
                 link.context->errstr);
  }
  return true;
}

// Dropping the connection also discards any WATCH or MULTI state on the
// server; the next call reconnects.
cache_status fail(cache<redis_cache_tag>::connection& link,
                  std::string_view operation,
                  std::string_view key,
                  const reply_t& reply) {
  spdlog::error("Redis {} of '{}' failed: {}", operation, key,
                describe(link.context.get(), reply));
  link.context.reset();
  return cache_status::unavailable;
}

}  // namespace

std::optional<redis_address> parse_redis_address(std::string_view url) {
  if (url.starts_with(kScheme)) {
    url.remove_prefix(kScheme.size());
  }
  if (url.empty() || url.find_first_of("/@ ") != std::string_view::npos) {
    return std::nullopt;
  }
  auto address = redis_address{};
  auto colon = url.rfind(':');
  if (colon == std::string_view::npos) {
    address.host = std::string{url};
    return address;
  }
  auto port_text = url.substr(colon + 1);
  auto port = uint32_t{};
  auto [end, error] = std::from_chars(
      port_text.data(), port_text.data() + port_text.size(), port);
  if (colon == 0 || port_text.empty() || error != std::errc{} ||
      end != port_text.data() + port_text.size() || port == 0 ||
      port > 65535) {
    return std::nullopt;
  }
  address.host = std::string{url.substr(0, colon)};
  address.port = static_cast<uint16_t>(port);
  return address;
}

veribuild::schema::timestamp_milliseconds_t cache<redis_cache_tag>::now()
    const {
  return veribuild::schema::to_milliseconds(
      clock ? clock() : std::chrono::system_clock::now());
}

cache_status cache<redis_cache_tag>::update(std::string_view key,
                                            const cache_mutator_t& mutator) {
  if (!link) {
    return cache_status::unavailable;
  }
  auto lock = std::scoped_lock{link->mutex};

  for (auto attempt = 0; attempt < kMaxAttempts; ++attempt) {
    if (!ensure_connected(*link, address, timeout)) {
      return cache_status::unavailable;
    }
    auto* context = link->context.get();

    auto watched = command(context, {"WATCH", key});
    if (!is_status(watched)) {
      return fail(*link, "watch", key, watched);
    }
    auto stored = command(context, {"GET", key});
    if (!stored || (stored->type != REDIS_REPLY_STRING &&
                    stored->type != REDIS_REPLY_NIL)) {
      return fail(*link, "read", key, stored);
    }

    auto current = now();
    auto entry = std::optional<cache_entry>{};
    if (stored->type == REDIS_REPLY_STRING) {
      entry = detail::decode_entry(std::string_view{stored->str, stored->len});
    }
    if (entry && !detail::is_live(*entry, current)) {
      entry.reset();
    }

    auto write = mutator(entry, current);
    if (write == cache_write::keep) {
      auto unwatched = command(context, {"UNWATCH"});
      if (!is_status(unwatched)) {
        return fail(*link, "unwatch", key, unwatched);
      }
      return cache_status::ok;
    }

    auto started = command(context, {"MULTI"});
    if (!is_status(started)) {
      return fail(*link, "transaction", key, started);
    }
    auto queued = reply_t{};
    if (write == cache_write::store && entry) {
      auto raw = detail::encode_entry(*entry);
      if (entry->expires_at == 0) {
        queued = command(context, {"SET", key, raw});
      } else {
        auto remaining = std::to_string(
            entry->expires_at > current ? entry->expires_at - current : 1);
        queued = command(context, {"SET", key, raw, "PX", remaining});
      }
    } else {
      queued = command(context, {"DEL", key});
    }
    if (!is_status(queued)) {
      return fail(*link, "write", key, queued);
    }

    auto committed = command(context, {"EXEC"});
    if (!committed) {
      return fail(*link, "commit", key, committed);
    }
    if (committed->type == REDIS_REPLY_NIL) {
      // Another client wrote the key after WATCH.
      continue;
    }
    if (committed->type != REDIS_REPLY_ARRAY) {
      return fail(*link, "commit", key, committed);
    }
    return cache_status::ok;
  }

  spdlog::warn("Cache key '{}' stayed contended after {} attempts", key,
               kMaxAttempts);
  return cache_status::unavailable;
}

std::pair<cache_status, std::optional<cache_entry>>
cache<redis_cache_tag>::get(std::string_view key) const {
  if (!link) {
    return {cache_status::unavailable, std::nullopt};
  }
  auto lock = std::scoped_lock{link->mutex};
  if (!ensure_connected(*link, address, timeout)) {
    return {cache_status::unavailable, std::nullopt};
  }
  auto stored = command(link->context.get(), {"GET", key});
  if (!stored || (stored->type != REDIS_REPLY_STRING &&
                  stored->type != REDIS_REPLY_NIL)) {
    return {fail(*link, "read", key, stored), std::nullopt};
  }
  if (stored->type == REDIS_REPLY_NIL) {
    return {cache_status::ok, std::nullopt};
  }
  auto entry =
      detail::decode_entry(std::string_view{stored->str, stored->len});
  if (!entry || !detail::is_live(*entry, now())) {
    return {cache_status::ok, std::nullopt};
  }
  return {cache_status::ok, std::move(entry)};
}

std::size_t cache<redis_cache_tag>::purge_expired() {
  return 0;
}

template <>
cache<redis_cache_tag> make_cache<redis_cache_tag>(const std::string_view& url,
                                                   clock_fn_t clock) {
  auto address = parse_redis_address(url);
  if (!address) {
    veribuild::common::critical("Invalid Redis address '{}'", url);
  }

  auto store = cache<redis_cache_tag>{};
  store.address = std::move(*address);
  store.clock = std::move(clock);
  store.link = std::make_unique<cache<redis_cache_tag>::connection>();

  {
    auto lock = std::scoped_lock{store.link->mutex};
    if (!ensure_connected(*store.link, store.address, store.timeout)) {
      veribuild::common::critical("Failed to open coordination cache at {}",
                                  url);
    }
    auto pong = command(store.link->context.get(), {"PING"});
    if (!is_status(pong)) {
      veribuild::common::critical("Redis at {} did not answer PING: {}", url,
                                  describe(store.link->context.get(), pong));
    }
  }
  spdlog::info("Connected coordination cache to redis {}:{}",
               store.address.host, store.address.port);
  return store;
}

}  // namespace veribuild::cache
