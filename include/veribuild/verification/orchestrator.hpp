#pragma once

#include <boost/asio/thread_pool.hpp>
#include <veribuild/build/executor.hpp>
#include <veribuild/coordination/single_flight.hpp>
#include <veribuild/schema/build_submission.hpp>
#include <veribuild/schema/pipeline_error.hpp>
#include <veribuild/schema/program_status.hpp>
#include <veribuild/schema/submission_result.hpp>
#include <veribuild/storage/sqlite/hash_store.hpp>
#include <veribuild/verification/validation.hpp>
#include <veribuild/verification/verifier.hpp>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <variant>

namespace veribuild::verification {

enum class submit_mode_t : uint8_t {
  detached = 0,  // return once the job is queued
  wait = 1,      // block up to the wait timeout for the outcome
};

struct orchestrator_options final {
  submission_defaults defaults;
  std::chrono::milliseconds wait_timeout{std::chrono::seconds{120}};
  std::chrono::milliseconds poll_interval{std::chrono::seconds{1}};
  uint32_t max_concurrent_builds{2};
};

using status_outcome_t =
    std::variant<std::optional<veribuild::schema::program_status_t>,
                 veribuild::schema::pipeline_error_t>;

/// Admits build submissions and drives them through build, verification
/// and persistence.
///
/// At most one job runs per program (single-flight through the
/// coordination cache, kept alive while the job runs). Jobs run on a
/// bounded pool; `submit` never blocks on a build beyond the wait timeout.
/// The deployed hash is read before anything else, so chain errors reach
/// the caller synchronously. A result is served from the store while the
/// build parameters and the deployed hash are unchanged.
class orchestrator final {
 public:
  orchestrator(veribuild::storage::sqlite_hash_store_t& store,
               veribuild::coordination::single_flight& locks,
               verifier& verifier,
               veribuild::build::build_runner_t runner,
               orchestrator_options options);
  ~orchestrator();

  orchestrator(const orchestrator&) = delete;
  orchestrator& operator=(const orchestrator&) = delete;

  veribuild::schema::submission_result_t submit(
      const veribuild::schema::build_submission_t& submission,
      submit_mode_t mode);

  /// Stored request, result and last-known status plus the in-flight phase
  /// from the cache. Empty optional for an unknown program.
  status_outcome_t status(std::string_view program_id) const;

  /// Block until every dispatched job has finished.
  void drain();

  const orchestrator_options& options() const;

 private:
  struct pending_job;
  struct in_flight_job final {
    veribuild::schema::job_token_t token;
    std::shared_future<veribuild::schema::submission_result_t> outcome;
  };

  std::optional<veribuild::schema::submission_result_t> try_cached(
      const veribuild::schema::build_request_t& request,
      const std::string& on_chain);

  veribuild::schema::submission_result_t dispatch(
      veribuild::schema::build_request_t request,
      veribuild::coordination::lease lease,
      submit_mode_t mode);

  void execute(pending_job& job);

  /// Restart the TTL of every lock this instance holds, every third of the
  /// TTL, until shutdown.
  void keep_leases_alive();

  veribuild::schema::submission_result_t run_job(
      const veribuild::schema::build_request_t& request,
      veribuild::coordination::lease& lease);

  veribuild::schema::submission_result_t wait_for_holder(
      std::string_view program_id);

  veribuild::schema::submission_result_t from_stored_status(
      std::string_view program_id) const;

  void record_failure(std::string_view program_id,
                      std::string_view job_token,
                      veribuild::schema::failure_reason_t reason,
                      std::string_view detail);

  veribuild::storage::sqlite_hash_store_t& store_;
  veribuild::coordination::single_flight& locks_;
  verifier& verifier_;
  veribuild::build::build_runner_t runner_;
  orchestrator_options options_;

  mutable std::mutex mutex_;
  std::condition_variable idle_;
  std::map<veribuild::schema::program_id_t, in_flight_job> in_flight_;
  std::size_t active_jobs_{};
  boost::asio::thread_pool pool_;
  bool stopping_{false};
  std::condition_variable wake_;
  std::thread heartbeat_;
};

/// Caller-facing message for a stored verdict.
std::string_view describe_result(
    const veribuild::schema::verification_result_t& result);

}  // namespace veribuild::verification
