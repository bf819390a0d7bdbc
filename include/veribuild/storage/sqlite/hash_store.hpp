#pragma once
#include <sqlite3.h>
#include <veribuild/storage/hash_store.hpp>
#include <memory>
#include <mutex>
#include <string_view>

namespace veribuild::storage {

namespace detail {

struct sqlite_closer final {
  void operator()(sqlite3* database) const { sqlite3_close_v2(database); }
};

inline constexpr auto kHashStoreSchema = std::string_view{R"SQL(
CREATE TABLE IF NOT EXISTS build_requests (
  program_id    TEXT PRIMARY KEY NOT NULL,
  repository    TEXT NOT NULL,
  commit_hash   TEXT,
  lib_name      TEXT,
  base_image    TEXT NOT NULL,
  mount_path    TEXT NOT NULL,
  bpf_flag      INTEGER NOT NULL DEFAULT 0,
  created_at    INTEGER NOT NULL,
  status        TEXT NOT NULL DEFAULT 'pending',
  status_reason TEXT,
  status_detail TEXT NOT NULL DEFAULT '',
  active_job    TEXT,
  updated_at    INTEGER NOT NULL
);
CREATE TABLE IF NOT EXISTS build_request_args (
  program_id TEXT NOT NULL
    REFERENCES build_requests (program_id) ON DELETE CASCADE,
  position   INTEGER NOT NULL,
  value      TEXT NOT NULL,
  PRIMARY KEY (program_id, position)
);
CREATE TABLE IF NOT EXISTS verification_results (
  program_id      TEXT PRIMARY KEY NOT NULL
    REFERENCES build_requests (program_id),
  is_verified     INTEGER NOT NULL,
  on_chain_hash   TEXT NOT NULL,
  executable_hash TEXT NOT NULL,
  reason          TEXT NOT NULL,
  verified_at     INTEGER NOT NULL
);
)SQL"};

}  // namespace detail

struct sqlite_storage_tag {};

template <>
struct hash_store<sqlite_storage_tag> final {
  std::unique_ptr<sqlite3, detail::sqlite_closer> database;
  // One connection is shared by every thread; transactions must not
  // interleave on it.
  mutable std::mutex mutex;

  void upsert_build_request(const veribuild::schema::build_request_t& request);
  void begin_job(std::string_view program_id,
                 std::string_view job_token,
                 veribuild::schema::timestamp_milliseconds_t now);
  void record_verification(const veribuild::schema::verification_result_t& result,
                           std::string_view job_token);
  void record_failure(std::string_view program_id,
                      std::string_view job_token,
                      veribuild::schema::failure_reason_t reason,
                      std::string_view detail,
                      veribuild::schema::timestamp_milliseconds_t now);
  std::optional<veribuild::schema::build_request_t> find_build_request(
      std::string_view program_id) const;
  std::optional<veribuild::schema::verification_result_t> find_verification(
      std::string_view program_id) const;
  std::optional<veribuild::schema::program_status_t> find_status(
      std::string_view program_id) const;
  std::vector<veribuild::schema::build_request_t> list_build_requests() const;
};

template <>
hash_store<sqlite_storage_tag> make_hash_store<sqlite_storage_tag>(
    const std::string_view& path);

using sqlite_hash_store_t = hash_store<sqlite_storage_tag>;

}  // namespace veribuild::storage
