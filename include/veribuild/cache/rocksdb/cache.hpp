#pragma once
#include <rocksdb/db.h>
#include <rocksdb/utilities/transaction.h>
#include <rocksdb/utilities/transaction_db.h>
#include <veribuild/cache/cache.hpp>
#include <memory>
#include <string>
#include <string_view>

namespace veribuild::cache {

struct rocksdb_cache_tag {};

template <>
struct cache<rocksdb_cache_tag> final {
  std::unique_ptr<ROCKSDB_NAMESPACE::TransactionDB> database;
  clock_fn_t clock;

  cache_status update(std::string_view key, const cache_mutator_t& mutator);
  std::pair<cache_status, std::optional<cache_entry>> get(
      std::string_view key) const;
  std::size_t purge_expired();

  veribuild::schema::timestamp_milliseconds_t now() const;
};

template <>
cache<rocksdb_cache_tag> make_cache<rocksdb_cache_tag>(
    const std::string_view& path,
    clock_fn_t clock);

using rocksdb_cache_t = cache<rocksdb_cache_tag>;

}  // namespace veribuild::cache
