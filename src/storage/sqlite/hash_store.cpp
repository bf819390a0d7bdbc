#include <spdlog/spdlog.h>
#include <veribuild/storage/sqlite/hash_store.hpp>

#include <string>
#include <utility>

namespace veribuild::storage {

namespace {

using statement_ptr =
    std::unique_ptr<sqlite3_stmt, decltype(&sqlite3_finalize)>;

constexpr auto kBusyTimeoutMilliseconds = 5000;

persistence_error::kind classify(int code) {
  switch (code & 0xFF) {
    case SQLITE_CONSTRAINT:
      return persistence_error::kind::constraint;
    default:
      return persistence_error::kind::unavailable;
  }
}

[[noreturn]] void throw_sqlite_error(sqlite3* database,
                        int code,
                        const std::string_view operation) {
  auto message = std::string{operation};
  message += " failed: ";
  message += database != nullptr ? sqlite3_errmsg(database) : sqlite3_errstr(code);
  throw persistence_error{classify(code), message};
}

void execute(sqlite3* database, const char* sql) {
  char* error = nullptr;
  auto code = sqlite3_exec(database, sql, nullptr, nullptr, &error);
  if (code != SQLITE_OK) {
    auto message = std::string{"sqlite exec failed: "} +
                   (error != nullptr ? error : sqlite3_errstr(code));
    sqlite3_free(error);
    throw persistence_error{classify(code), message};
  }
}

statement_ptr prepare(sqlite3* database, const std::string_view sql) {
  sqlite3_stmt* statement = nullptr;
  auto code = sqlite3_prepare_v2(database, sql.data(),
                                 static_cast<int>(sql.size()), &statement,
                                 nullptr);
  if (code != SQLITE_OK) {
    throw_sqlite_error(database, code, "prepare");
  }
  return statement_ptr{statement, sqlite3_finalize};
}

void bind_text(sqlite3_stmt* statement, int index, const std::string_view value) {
  sqlite3_bind_text(statement, index, value.data(),
                    static_cast<int>(value.size()), SQLITE_TRANSIENT);
}

void bind_optional_text(sqlite3_stmt* statement,
                        int index,
                        const std::optional<std::string>& value) {
  if (value) {
    bind_text(statement, index, *value);
  } else {
    sqlite3_bind_null(statement, index);
  }
}

void bind_int64(sqlite3_stmt* statement, int index, uint64_t value) {
  sqlite3_bind_int64(statement, index, static_cast<sqlite3_int64>(value));
}

void step_done(sqlite3* database,
               sqlite3_stmt* statement,
               const std::string_view operation) {
  auto code = sqlite3_step(statement);
  if (code != SQLITE_DONE) {
    throw_sqlite_error(database, code, operation);
  }
}

/// Returns false once the statement has no more rows.
bool step_row(sqlite3* database,
              sqlite3_stmt* statement,
              const std::string_view operation) {
  auto code = sqlite3_step(statement);
  if (code == SQLITE_ROW) {
    return true;
  }
  if (code != SQLITE_DONE) {
    throw_sqlite_error(database, code, operation);
  }
  return false;
}

std::string column_text(sqlite3_stmt* statement, int column) {
  auto* text = sqlite3_column_text(statement, column);
  if (text == nullptr) {
    return {};
  }
  return std::string{reinterpret_cast<const char*>(text),
                     static_cast<size_t>(sqlite3_column_bytes(statement, column))};
}

std::optional<std::string> column_optional_text(sqlite3_stmt* statement,
                                                int column) {
  if (sqlite3_column_type(statement, column) == SQLITE_NULL) {
    return std::nullopt;
  }
  return column_text(statement, column);
}

uint64_t column_uint64(sqlite3_stmt* statement, int column) {
  return static_cast<uint64_t>(sqlite3_column_int64(statement, column));
}

/// BEGIN ... COMMIT, rolled back unless commit() ran. Writers take the
/// database lock up front with BEGIN IMMEDIATE.
class transaction final {
 public:
  explicit transaction(sqlite3* database, const char* begin = "BEGIN IMMEDIATE")
      : database_(database) {
    execute(database_, begin);
  }

  transaction(const transaction&) = delete;
  transaction& operator=(const transaction&) = delete;

  ~transaction() {
    if (!committed_) {
      auto code = sqlite3_exec(database_, "ROLLBACK", nullptr, nullptr, nullptr);
      if (code != SQLITE_OK) {
        spdlog::error("Hash store rollback failed: {}", sqlite3_errstr(code));
      }
    }
  }

  void commit() {
    execute(database_, "COMMIT");
    committed_ = true;
  }

 private:
  sqlite3* database_;
  bool committed_{false};
};

constexpr auto kSelectRequest = std::string_view{R"SQL(
  SELECT program_id, repository, commit_hash, lib_name, base_image,
         mount_path, bpf_flag, created_at
    FROM build_requests
)SQL"};

veribuild::schema::build_request_t read_request(sqlite3_stmt* statement) {
  auto request = veribuild::schema::build_request_t{};
  request.program_id = column_text(statement, 0);
  request.repository = column_text(statement, 1);
  request.commit_hash = column_optional_text(statement, 2);
  request.lib_name = column_optional_text(statement, 3);
  request.base_image = column_text(statement, 4);
  request.mount_path = column_text(statement, 5);
  request.bpf_flag = sqlite3_column_int(statement, 6) != 0;
  request.created_at = column_uint64(statement, 7);
  return request;
}

std::vector<std::string> load_build_args(sqlite3* database,
                                         const std::string_view program_id) {
  auto statement = prepare(database, R"SQL(
    SELECT value FROM build_request_args
     WHERE program_id = ? ORDER BY position
  )SQL");
  bind_text(statement.get(), 1, program_id);
  auto args = std::vector<std::string>{};
  while (step_row(database, statement.get(), "load build args")) {
    args.push_back(column_text(statement.get(), 0));
  }
  return args;
}

std::optional<veribuild::schema::build_request_t> load_request(
    sqlite3* database,
    const std::string_view program_id) {
  auto statement = prepare(database, std::string{kSelectRequest} +
                                         " WHERE program_id = ?");
  bind_text(statement.get(), 1, program_id);
  if (!step_row(database, statement.get(), "find build request")) {
    return std::nullopt;
  }
  auto request = read_request(statement.get());
  request.build_args = load_build_args(database, program_id);
  return request;
}

std::optional<veribuild::schema::verification_result_t> load_verification(
    sqlite3* database,
    const std::string_view program_id) {
  auto statement = prepare(database, R"SQL(
    SELECT program_id, is_verified, on_chain_hash, executable_hash, reason,
           verified_at
      FROM verification_results WHERE program_id = ?
  )SQL");
  bind_text(statement.get(), 1, program_id);
  if (!step_row(database, statement.get(), "find verification")) {
    return std::nullopt;
  }
  auto result = veribuild::schema::verification_result_t{};
  result.program_id = column_text(statement.get(), 0);
  result.is_verified = sqlite3_column_int(statement.get(), 1) != 0;
  result.on_chain_hash = column_text(statement.get(), 2);
  result.executable_hash = column_text(statement.get(), 3);
  auto reason = column_text(statement.get(), 4);
  result.reason = veribuild::schema::try_from_string<
                      veribuild::schema::verification_reason_t>(reason)
                      .value_or(result.is_verified
                                    ? veribuild::schema::verification_reason_t::matched
                                    : veribuild::schema::verification_reason_t::
                                          hash_mismatch);
  result.verified_at = column_uint64(statement.get(), 5);
  return result;
}

/// Close the active job; false when job_token does not own the row.
bool close_job(sqlite3* database,
               const std::string_view program_id,
               const std::string_view job_token,
               const veribuild::schema::job_status_t status,
               const std::optional<veribuild::schema::failure_reason_t> reason,
               const std::string_view detail,
               const veribuild::schema::timestamp_milliseconds_t now) {
  auto statement = prepare(database, R"SQL(
    UPDATE build_requests
       SET status = ?, status_reason = ?, status_detail = ?,
           active_job = NULL, updated_at = ?
     WHERE program_id = ? AND active_job = ?
  )SQL");
  bind_text(statement.get(), 1, veribuild::schema::to_string(status));
  if (reason) {
    bind_text(statement.get(), 2, veribuild::schema::to_string(*reason));
  } else {
    sqlite3_bind_null(statement.get(), 2);
  }
  bind_text(statement.get(), 3, detail);
  bind_int64(statement.get(), 4, now);
  bind_text(statement.get(), 5, program_id);
  bind_text(statement.get(), 6, job_token);
  step_done(database, statement.get(), "close job");
  return sqlite3_changes(database) == 1;
}

}  // namespace

void hash_store<sqlite_storage_tag>::upsert_build_request(
    const veribuild::schema::build_request_t& request) {
  auto lock = std::scoped_lock{mutex};
  auto* db = database.get();
  auto scope = transaction{db};

  auto statement = prepare(db, R"SQL(
    INSERT INTO build_requests
      (program_id, repository, commit_hash, lib_name, base_image, mount_path,
       bpf_flag, created_at, updated_at)
    VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?)
    ON CONFLICT (program_id) DO UPDATE SET
      repository = excluded.repository,
      commit_hash = excluded.commit_hash,
      lib_name = excluded.lib_name,
      base_image = excluded.base_image,
      mount_path = excluded.mount_path,
      bpf_flag = excluded.bpf_flag,
      updated_at = excluded.updated_at
  )SQL");
  auto i = 1;
  bind_text(statement.get(), i++, request.program_id);
  bind_text(statement.get(), i++, request.repository);
  bind_optional_text(statement.get(), i++, request.commit_hash);
  bind_optional_text(statement.get(), i++, request.lib_name);
  bind_text(statement.get(), i++, request.base_image);
  bind_text(statement.get(), i++, request.mount_path);
  sqlite3_bind_int(statement.get(), i++, request.bpf_flag ? 1 : 0);
  bind_int64(statement.get(), i++, request.created_at);
  bind_int64(statement.get(), i++, request.created_at);
  step_done(db, statement.get(), "upsert build request");

  auto clear = prepare(db, "DELETE FROM build_request_args WHERE program_id = ?");
  bind_text(clear.get(), 1, request.program_id);
  step_done(db, clear.get(), "clear build args");

  auto insert = prepare(db, R"SQL(
    INSERT INTO build_request_args (program_id, position, value)
    VALUES (?, ?, ?)
  )SQL");
  for (size_t position = 0; position < request.build_args.size(); ++position) {
    sqlite3_reset(insert.get());
    bind_text(insert.get(), 1, request.program_id);
    bind_int64(insert.get(), 2, position);
    bind_text(insert.get(), 3, request.build_args[position]);
    step_done(db, insert.get(), "insert build arg");
  }

  scope.commit();
}

void hash_store<sqlite_storage_tag>::begin_job(
    std::string_view program_id,
    std::string_view job_token,
    veribuild::schema::timestamp_milliseconds_t now) {
  auto lock = std::scoped_lock{mutex};
  auto* db = database.get();
  auto statement = prepare(db, R"SQL(
    UPDATE build_requests
       SET status = 'building', status_reason = NULL, status_detail = '',
           active_job = ?, updated_at = ?
     WHERE program_id = ?
  )SQL");
  bind_text(statement.get(), 1, job_token);
  bind_int64(statement.get(), 2, now);
  bind_text(statement.get(), 3, program_id);
  step_done(db, statement.get(), "begin job");
  if (sqlite3_changes(db) != 1) {
    throw persistence_error{persistence_error::kind::constraint,
                            "begin job: no build request for " +
                                std::string{program_id}};
  }
}

void hash_store<sqlite_storage_tag>::record_verification(
    const veribuild::schema::verification_result_t& result,
    std::string_view job_token) {
  auto lock = std::scoped_lock{mutex};
  auto* db = database.get();
  auto scope = transaction{db};

  auto non_deterministic =
      result.reason ==
      veribuild::schema::verification_reason_t::non_deterministic_build;
  auto status = result.is_verified ? veribuild::schema::job_status_t::verified
                                   : veribuild::schema::job_status_t::not_verified;
  auto reason =
      non_deterministic
          ? std::optional{veribuild::schema::failure_reason_t::non_deterministic}
          : std::nullopt;
  if (!close_job(db, result.program_id, job_token, status, reason,
                 veribuild::schema::to_string(result.reason),
                 result.verified_at)) {
    throw persistence_error{persistence_error::kind::conflict,
                            "record verification: job " +
                                std::string{job_token} +
                                " no longer owns " + result.program_id};
  }

  auto statement = prepare(db, R"SQL(
    INSERT INTO verification_results
      (program_id, is_verified, on_chain_hash, executable_hash, reason,
       verified_at)
    VALUES (?, ?, ?, ?, ?, ?)
    ON CONFLICT (program_id) DO UPDATE SET
      is_verified = excluded.is_verified,
      on_chain_hash = excluded.on_chain_hash,
      executable_hash = excluded.executable_hash,
      reason = excluded.reason,
      verified_at = excluded.verified_at
  )SQL");
  bind_text(statement.get(), 1, result.program_id);
  sqlite3_bind_int(statement.get(), 2, result.is_verified ? 1 : 0);
  bind_text(statement.get(), 3, result.on_chain_hash);
  bind_text(statement.get(), 4, result.executable_hash);
  bind_text(statement.get(), 5, veribuild::schema::to_string(result.reason));
  bind_int64(statement.get(), 6, result.verified_at);
  step_done(db, statement.get(), "record verification");

  scope.commit();
}

void hash_store<sqlite_storage_tag>::record_failure(
    std::string_view program_id,
    std::string_view job_token,
    veribuild::schema::failure_reason_t reason,
    std::string_view detail,
    veribuild::schema::timestamp_milliseconds_t now) {
  auto lock = std::scoped_lock{mutex};
  auto* db = database.get();
  if (!close_job(db, program_id, job_token,
                 veribuild::schema::job_status_t::failed, reason, detail,
                 now)) {
    throw persistence_error{persistence_error::kind::conflict,
                            "record failure: job " + std::string{job_token} +
                                " no longer owns " + std::string{program_id}};
  }
}

std::optional<veribuild::schema::build_request_t>
hash_store<sqlite_storage_tag>::find_build_request(
    std::string_view program_id) const {
  auto lock = std::scoped_lock{mutex};
  return load_request(database.get(), program_id);
}

std::optional<veribuild::schema::verification_result_t>
hash_store<sqlite_storage_tag>::find_verification(
    std::string_view program_id) const {
  auto lock = std::scoped_lock{mutex};
  return load_verification(database.get(), program_id);
}

std::optional<veribuild::schema::program_status_t>
hash_store<sqlite_storage_tag>::find_status(std::string_view program_id) const {
  auto lock = std::scoped_lock{mutex};
  auto* db = database.get();
  // Request, status and result come from one snapshot.
  auto snapshot = transaction{db, "BEGIN"};

  auto request = load_request(db, program_id);
  if (!request) {
    return std::nullopt;
  }

  auto statement = prepare(db, R"SQL(
    SELECT status, status_reason, status_detail, active_job, updated_at
      FROM build_requests WHERE program_id = ?
  )SQL");
  bind_text(statement.get(), 1, program_id);
  if (!step_row(db, statement.get(), "find status")) {
    return std::nullopt;
  }

  auto status = veribuild::schema::program_status_t{};
  status.request = std::move(*request);
  status.status = veribuild::schema::try_from_string<
                      veribuild::schema::job_status_t>(
                      column_text(statement.get(), 0))
                      .value_or(veribuild::schema::job_status_t::pending);
  if (auto reason = column_optional_text(statement.get(), 1)) {
    status.reason = veribuild::schema::try_from_string<
        veribuild::schema::failure_reason_t>(*reason);
  }
  status.detail = column_text(statement.get(), 2);
  status.active_job = column_optional_text(statement.get(), 3);
  status.updated_at = column_uint64(statement.get(), 4);
  status.result = load_verification(db, program_id);
  snapshot.commit();
  return status;
}

std::vector<veribuild::schema::build_request_t>
hash_store<sqlite_storage_tag>::list_build_requests() const {
  auto lock = std::scoped_lock{mutex};
  auto* db = database.get();
  auto statement =
      prepare(db, std::string{kSelectRequest} + " ORDER BY program_id");
  auto requests = std::vector<veribuild::schema::build_request_t>{};
  while (step_row(db, statement.get(), "list build requests")) {
    requests.push_back(read_request(statement.get()));
  }
  for (auto& request : requests) {
    request.build_args = load_build_args(db, request.program_id);
  }
  return requests;
}

template <>
hash_store<sqlite_storage_tag> make_hash_store<sqlite_storage_tag>(
    const std::string_view& path) {
  sqlite3* raw = nullptr;
  auto code = sqlite3_open_v2(
      std::string{path}.c_str(), &raw,
      SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX,
      nullptr);
  auto handle = std::unique_ptr<sqlite3, detail::sqlite_closer>{raw};
  if (code != SQLITE_OK) {
    throw_sqlite_error(raw, code, "open " + std::string{path});
  }

  sqlite3_busy_timeout(handle.get(), kBusyTimeoutMilliseconds);
  execute(handle.get(), "PRAGMA foreign_keys = ON");
  execute(handle.get(), "PRAGMA journal_mode = WAL");
  execute(handle.get(), std::string{detail::kHashStoreSchema}.c_str());
  spdlog::info("Opened hash store at {}", path);

  return hash_store<sqlite_storage_tag>{.database = std::move(handle)};
}

}  // namespace veribuild::storage
