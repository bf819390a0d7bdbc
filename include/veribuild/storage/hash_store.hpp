#pragma once
#include <veribuild/schema/build_request.hpp>
#include <veribuild/schema/failure_reason.hpp>
#include <veribuild/schema/primitives.hpp>
#include <veribuild/schema/program_status.hpp>
#include <veribuild/schema/verification_result.hpp>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace veribuild::storage {

/// Raised by the hash store for every failed read or write. Callers fail
/// closed: nothing is partially written when this propagates.
class persistence_error final : public std::runtime_error {
 public:
  enum class kind : uint8_t {
    unavailable = 1,  // store cannot be reached or is busy past the timeout
    conflict = 2,     // job token no longer owns the row
    constraint = 3,   // uniqueness or foreign-key violation
  };

  persistence_error(kind error_kind, const std::string& message)
      : std::runtime_error(message), kind_(error_kind) {}

  kind error_kind() const noexcept { return kind_; }

 private:
  kind kind_;
};

/// Durable ledger of build requests and verification outcomes.
template <typename Library>
struct hash_store {
  /// Insert the request, or update its build parameters in place. The
  /// original created_at is preserved on update.
  void upsert_build_request(const veribuild::schema::build_request_t& request);

  /// Mark a job as building and record the token allowed to finish it.
  void begin_job(std::string_view program_id,
                 std::string_view job_token,
                 veribuild::schema::timestamp_milliseconds_t now);

  /// Write or replace the result and close the job, atomically. Throws
  /// persistence_error(conflict) when job_token no longer owns the row.
  void record_verification(const veribuild::schema::verification_result_t& result,
                           std::string_view job_token);

  /// Close the job as failed with a reason; same ownership rule as above.
  void record_failure(std::string_view program_id,
                      std::string_view job_token,
                      veribuild::schema::failure_reason_t reason,
                      std::string_view detail,
                      veribuild::schema::timestamp_milliseconds_t now);

  std::optional<veribuild::schema::build_request_t> find_build_request(
      std::string_view program_id) const;

  std::optional<veribuild::schema::verification_result_t> find_verification(
      std::string_view program_id) const;

  /// Request, last-known job status and current result in one read.
  std::optional<veribuild::schema::program_status_t> find_status(
      std::string_view program_id) const;

  /// Every known request ordered by program id.
  std::vector<veribuild::schema::build_request_t> list_build_requests() const;
};

/// Open (creating when missing) a hash store at the given location.
template <typename Library>
hash_store<Library> make_hash_store(const std::string_view& path);

}  // namespace veribuild::storage
