#include <spdlog/spdlog.h>
#include <veribuild/cache/rocksdb/cache.hpp>
#include <veribuild/common/critical.hpp>

#include <vector>

namespace veribuild::cache {

namespace {

constexpr auto kMaxAttempts = 3;

bool is_contended(const ROCKSDB_NAMESPACE::Status& status) {
  return status.IsBusy() || status.IsTimedOut() || status.IsTryAgain();
}

}  // namespace

veribuild::schema::timestamp_milliseconds_t cache<rocksdb_cache_tag>::now()
    const {
  return veribuild::schema::to_milliseconds(
      clock ? clock() : std::chrono::system_clock::now());
}

cache_status cache<rocksdb_cache_tag>::update(std::string_view key,
                                              const cache_mutator_t& mutator) {
  if (!database) {
    return cache_status::unavailable;
  }
  auto key_slice = ROCKSDB_NAMESPACE::Slice{key.data(), key.size()};

  for (auto attempt = 0; attempt < kMaxAttempts; ++attempt) {
    auto transaction = std::unique_ptr<ROCKSDB_NAMESPACE::Transaction>{
        database->BeginTransaction(ROCKSDB_NAMESPACE::WriteOptions{})};
    auto raw = std::string{};
    auto status = transaction->GetForUpdate(ROCKSDB_NAMESPACE::ReadOptions{},
                                            key_slice, &raw);
    if (is_contended(status)) {
      continue;
    }
    if (!status.ok() && !status.IsNotFound()) {
      spdlog::error("Cache read of '{}' failed: {}", key, status.ToString());
      return cache_status::unavailable;
    }

    auto current = now();
    auto entry = status.ok() ? detail::decode_entry(raw) : std::nullopt;
    if (entry && !detail::is_live(*entry, current)) {
      entry.reset();
    }

    auto write = mutator(entry, current);
    if (write == cache_write::keep) {
      auto rollback = transaction->Rollback();
      if (!rollback.ok()) {
        spdlog::warn("Cache rollback of '{}' failed: {}", key,
                     rollback.ToString());
      }
      return cache_status::ok;
    }

    if (write == cache_write::store && entry) {
      status = transaction->Put(key_slice, detail::encode_entry(*entry));
    } else {
      status = transaction->Delete(key_slice);
    }
    if (status.ok()) {
      status = transaction->Commit();
    }
    if (is_contended(status)) {
      continue;
    }
    if (!status.ok()) {
      spdlog::error("Cache write of '{}' failed: {}", key, status.ToString());
      return cache_status::unavailable;
    }
    return cache_status::ok;
  }

  spdlog::warn("Cache key '{}' stayed contended after {} attempts", key,
               kMaxAttempts);
  return cache_status::unavailable;
}

std::pair<cache_status, std::optional<cache_entry>>
cache<rocksdb_cache_tag>::get(std::string_view key) const {
  if (!database) {
    return {cache_status::unavailable, std::nullopt};
  }
  auto raw = std::string{};
  auto status = database->Get(ROCKSDB_NAMESPACE::ReadOptions{},
                              ROCKSDB_NAMESPACE::Slice{key.data(), key.size()},
                              &raw);
  if (status.IsNotFound()) {
    return {cache_status::ok, std::nullopt};
  }
  if (!status.ok()) {
    spdlog::error("Cache read of '{}' failed: {}", key, status.ToString());
    return {cache_status::unavailable, std::nullopt};
  }
  auto entry = detail::decode_entry(raw);
  if (!entry || !detail::is_live(*entry, now())) {
    return {cache_status::ok, std::nullopt};
  }
  return {cache_status::ok, std::move(entry)};
}

std::size_t cache<rocksdb_cache_tag>::purge_expired() {
  if (!database) {
    return 0;
  }
  auto current = now();
  auto expired = std::vector<std::string>{};
  auto iterator = std::unique_ptr<ROCKSDB_NAMESPACE::Iterator>{
      database->NewIterator(ROCKSDB_NAMESPACE::ReadOptions{})};
  for (iterator->SeekToFirst(); iterator->Valid(); iterator->Next()) {
    auto entry = detail::decode_entry(std::string_view{
        iterator->value().data(), iterator->value().size()});
    if (!entry || !detail::is_live(*entry, current)) {
      expired.push_back(iterator->key().ToString());
    }
  }

  // Re-checked under the key lock: a writer may have refreshed it since.
  auto removed = std::size_t{};
  for (const auto& key : expired) {
    auto erased = false;
    auto status = update(key, [&](std::optional<cache_entry>& entry, auto) {
      if (entry) {
        return cache_write::keep;
      }
      erased = true;
      return cache_write::erase;
    });
    if (status == cache_status::ok && erased) {
      ++removed;
    }
  }
  return removed;
}

template <>
cache<rocksdb_cache_tag> make_cache<rocksdb_cache_tag>(
    const std::string_view& path,
    clock_fn_t clock) {
  auto store = cache<rocksdb_cache_tag>{};
  store.clock = std::move(clock);

  auto options = ROCKSDB_NAMESPACE::Options{};
  options.create_if_missing = true;
  options.IncreaseParallelism();
  options.OptimizeLevelStyleCompaction();

  ROCKSDB_NAMESPACE::TransactionDB* database{nullptr};
  auto status = ROCKSDB_NAMESPACE::TransactionDB::Open(
      options, ROCKSDB_NAMESPACE::TransactionDBOptions{}, std::string{path},
      &database);
  if (!status.ok()) {
    veribuild::common::critical("Failed to open coordination cache at {}: {}",
                                path, status.ToString());
  }
  spdlog::info("Opened coordination cache at {}", path);
  store.database.reset(database);

  return store;
}

}  // namespace veribuild::cache
