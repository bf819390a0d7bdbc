#include <boost/endian/conversion.hpp>
#include <veribuild/cache/cache.hpp>

#include <cstring>

namespace veribuild::cache {

namespace {

constexpr auto kExpiryBytes = sizeof(uint64_t);

}  // namespace

namespace detail {

std::string encode_entry(const cache_entry& entry) {
  auto expiry = boost::endian::native_to_big(entry.expires_at);
  auto raw = std::string(kExpiryBytes, '\0');
  std::memcpy(raw.data(), &expiry, kExpiryBytes);
  raw.append(entry.value);
  return raw;
}

std::optional<cache_entry> decode_entry(std::string_view raw) {
  if (raw.size() < kExpiryBytes) {
    return std::nullopt;
  }
  auto expiry = uint64_t{};
  std::memcpy(&expiry, raw.data(), kExpiryBytes);
  raw.remove_prefix(kExpiryBytes);
  return cache_entry{.value = std::string{raw},
                     .expires_at = boost::endian::big_to_native(expiry)};
}

}  // namespace detail

}  // namespace veribuild::cache
