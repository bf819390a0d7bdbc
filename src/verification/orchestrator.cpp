#include <boost/asio/post.hpp>
#include <spdlog/spdlog.h>
#include <veribuild/verification/orchestrator.hpp>

#include <algorithm>
#include <thread>
#include <utility>
#include <vector>

namespace veribuild::verification {

namespace {

veribuild::schema::submission_result_t make_failure(
    const veribuild::schema::pipeline_error_t& error) {
  return veribuild::schema::submission_result_t{
      .status = veribuild::schema::submission_status_t::failed,
      .error = error.code,
      .reason = error.reason,
      .message = error.message,
      .result = std::nullopt};
}

veribuild::schema::submission_result_t make_in_progress(
    veribuild::schema::error_code_t error,
    std::string message) {
  return veribuild::schema::submission_result_t{
      .status = veribuild::schema::submission_status_t::in_progress,
      .error = error,
      .reason = std::nullopt,
      .message = std::move(message),
      .result = std::nullopt};
}

veribuild::schema::submission_result_t make_verdict(
    veribuild::schema::submission_status_t status,
    veribuild::schema::verification_result_t result) {
  auto verdict = veribuild::schema::submission_result_t{};
  verdict.status = status;
  verdict.message = std::string{describe_result(result)};
  if (result.reason ==
      veribuild::schema::verification_reason_t::non_deterministic_build) {
    verdict.reason = veribuild::schema::failure_reason_t::non_deterministic;
  }
  verdict.result = std::move(result);
  return verdict;
}

}  // namespace

std::string_view describe_result(
    const veribuild::schema::verification_result_t& result) {
  if (result.is_verified) {
    return "On chain program verified";
  }
  if (result.reason ==
      veribuild::schema::verification_reason_t::non_deterministic_build) {
    return "On chain program not verified: build is not reproducible";
  }
  return "On chain program not verified";
}

struct orchestrator::pending_job final {
  veribuild::schema::build_request_t request;
  veribuild::coordination::lease lease;
  std::promise<veribuild::schema::submission_result_t> promise;
};

orchestrator::orchestrator(veribuild::storage::sqlite_hash_store_t& store,
                           veribuild::coordination::single_flight& locks,
                           verifier& verifier,
                           veribuild::build::build_runner_t runner,
                           orchestrator_options options)
    : store_{store},
      locks_{locks},
      verifier_{verifier},
      runner_{std::move(runner)},
      options_{std::move(options)},
      pool_{std::max<uint32_t>(options_.max_concurrent_builds, 1)} {
  heartbeat_ = std::thread{[this]() { keep_leases_alive(); }};
}

orchestrator::~orchestrator() {
  drain();
  {
    auto lock = std::scoped_lock{mutex_};
    stopping_ = true;
  }
  wake_.notify_all();
  heartbeat_.join();
  pool_.join();
}

void orchestrator::keep_leases_alive() {
  auto interval = std::chrono::milliseconds{
      std::max<veribuild::schema::duration_milliseconds_t>(locks_.ttl() / 3,
                                                           10)};
  auto lock = std::unique_lock{mutex_};
  while (!wake_.wait_for(lock, interval, [this]() { return stopping_; })) {
    auto owned = std::vector<
        std::pair<veribuild::schema::program_id_t, veribuild::schema::job_token_t>>{};
    for (const auto& [program_id, job] : in_flight_) {
      owned.emplace_back(program_id, job.token);
    }
    lock.unlock();
    // Refresh is owner-only, so a job that finished meanwhile is untouched.
    for (const auto& [program_id, token] : owned) {
      if (!locks_.refresh(program_id, token)) {
        spdlog::debug("Could not extend lock of {} for job {}", program_id,
                      token);
      }
    }
    lock.lock();
  }
}

const orchestrator_options& orchestrator::options() const {
  return options_;
}

veribuild::schema::submission_result_t orchestrator::submit(
    const veribuild::schema::build_submission_t& submission,
    submit_mode_t mode) {
  auto validated = validate_submission(submission, options_.defaults,
                                       veribuild::schema::now_milliseconds());
  if (auto* error =
          std::get_if<veribuild::schema::pipeline_error_t>(&validated)) {
    spdlog::debug("Rejected submission for '{}': {}", submission.program_id,
                  error->message);
    return make_failure(*error);
  }
  auto request =
      std::get<veribuild::schema::build_request_t>(std::move(validated));

  auto deployed = verifier_.on_chain_hash(request.program_id);
  if (auto* error = std::get_if<veribuild::schema::pipeline_error_t>(&deployed)) {
    spdlog::info("Rejected submission for '{}': {}", request.program_id,
                 error->message);
    return make_failure(*error);
  }

  auto cached = std::optional<veribuild::schema::submission_result_t>{};
  try {
    cached = try_cached(request, std::get<std::string>(deployed));
  } catch (const veribuild::storage::persistence_error& e) {
    spdlog::error("Hash store read for {} failed: {}", request.program_id,
                  e.what());
    return make_failure(to_pipeline_error(e));
  }
  if (cached) {
    return *cached;
  }

  auto acquired = locks_.try_acquire(request.program_id);
  if (acquired.status == veribuild::coordination::acquire_status::held) {
    if (mode == submit_mode_t::detached) {
      return make_in_progress(
          veribuild::schema::error_code_t::duplicate_in_progress,
          "verification already in progress (" +
              std::string{veribuild::schema::to_string(acquired.holder->state)} +
              ")");
    }
    return wait_for_holder(request.program_id);
  }

  return dispatch(std::move(request), std::move(acquired.owned), mode);
}

std::optional<veribuild::schema::submission_result_t> orchestrator::try_cached(
    const veribuild::schema::build_request_t& request,
    const std::string& on_chain) {
  auto stored = store_.find_status(request.program_id);
  if (!stored || !stored->result) {
    return std::nullopt;
  }
  if (stored->status != veribuild::schema::job_status_t::verified &&
      stored->status != veribuild::schema::job_status_t::not_verified) {
    // The last job after this result failed or never finished; the result
    // may belong to earlier parameters.
    return std::nullopt;
  }
  if (!veribuild::schema::same_build_parameters(stored->request, request)) {
    return std::nullopt;
  }

  if (on_chain != stored->result->on_chain_hash) {
    spdlog::info("{}: deployed hash changed from {} to {}; rebuilding",
                 request.program_id, stored->result->on_chain_hash, on_chain);
    return std::nullopt;
  }
  return make_verdict(veribuild::schema::submission_status_t::cached,
                      std::move(*stored->result));
}

veribuild::schema::submission_result_t orchestrator::dispatch(
    veribuild::schema::build_request_t request,
    veribuild::coordination::lease lease,
    submit_mode_t mode) {
  try {
    store_.upsert_build_request(request);
    store_.begin_job(request.program_id, lease.token(),
                     veribuild::schema::now_milliseconds());
  } catch (const veribuild::storage::persistence_error& e) {
    spdlog::error("Could not register job for {}: {}", request.program_id,
                  e.what());
    return make_failure(to_pipeline_error(e));
  }

  auto job = std::make_shared<pending_job>();
  job->request = std::move(request);
  job->lease = std::move(lease);
  auto outcome = job->promise.get_future().share();
  auto program_id = job->request.program_id;

  {
    auto lock = std::scoped_lock{mutex_};
    in_flight_[program_id] =
        in_flight_job{.token = job->lease.token(), .outcome = outcome};
    ++active_jobs_;
  }
  spdlog::info("Queued build of {} from {} (job {})", program_id,
               job->request.repository, job->lease.token());
  boost::asio::post(pool_, [this, job]() { execute(*job); });

  if (mode == submit_mode_t::detached) {
    return veribuild::schema::submission_result_t{
        .status = veribuild::schema::submission_status_t::accepted,
        .error = veribuild::schema::error_code_t::none,
        .reason = std::nullopt,
        .message = "Build verification started",
        .result = std::nullopt};
  }
  if (outcome.wait_for(options_.wait_timeout) == std::future_status::ready) {
    return outcome.get();
  }
  return make_in_progress(veribuild::schema::error_code_t::none,
                          "verification still in progress");
}

void orchestrator::execute(pending_job& job) {
  auto result = veribuild::schema::submission_result_t{};
  try {
    result = run_job(job.request, job.lease);
  } catch (const std::exception& e) {
    spdlog::error("Job {} for {} failed: {}", job.lease.token(),
                  job.request.program_id, e.what());
    record_failure(job.request.program_id, job.lease.token(),
                   veribuild::schema::failure_reason_t::internal_error,
                   e.what());
    result = veribuild::schema::submission_result_t{
        .status = veribuild::schema::submission_status_t::failed,
        .error = veribuild::schema::error_code_t::build_error,
        .reason = veribuild::schema::failure_reason_t::internal_error,
        .message = e.what(),
        .result = std::nullopt};
  }

  auto token = job.lease.token();
  job.lease.release();
  {
    auto lock = std::scoped_lock{mutex_};
    auto found = in_flight_.find(job.request.program_id);
    if (found != in_flight_.end() && found->second.token == token) {
      in_flight_.erase(found);
    }
  }
  job.promise.set_value(std::move(result));
  {
    auto lock = std::scoped_lock{mutex_};
    --active_jobs_;
  }
  idle_.notify_all();
}

veribuild::schema::submission_result_t orchestrator::run_job(
    const veribuild::schema::build_request_t& request,
    veribuild::coordination::lease& lease) {
  // Also restarts the TTL; the heartbeat keeps it alive from here on.
  lease.set_state(veribuild::schema::job_state_t::building);
  auto outcome = runner_(request);

  if (auto* failure = std::get_if<veribuild::schema::build_error_t>(&outcome)) {
    spdlog::warn("Build of {} failed ({}): {}", request.program_id,
                 veribuild::schema::to_string(failure->reason),
                 failure->detail);
    if (failure->reason ==
        veribuild::schema::failure_reason_t::non_deterministic) {
      auto recorded = verifier_.record_non_deterministic(
          request.program_id, failure->detail, lease.token());
      if (auto* error =
              std::get_if<veribuild::schema::pipeline_error_t>(&recorded)) {
        if (error->code != veribuild::schema::error_code_t::persistence_error) {
          record_failure(request.program_id, lease.token(),
                         error->reason.value_or(
                             veribuild::schema::failure_reason_t::internal_error),
                         error->message);
        }
        return make_failure(*error);
      }
      return make_verdict(
          veribuild::schema::submission_status_t::accepted,
          std::get<veribuild::schema::verification_result_t>(
              std::move(recorded)));
    }

    record_failure(request.program_id, lease.token(), failure->reason,
                   failure->detail);
    return veribuild::schema::submission_result_t{
        .status = veribuild::schema::submission_status_t::failed,
        .error = veribuild::schema::error_code_t::build_error,
        .reason = failure->reason,
        .message = failure->detail,
        .result = std::nullopt};
  }

  const auto& output = std::get<veribuild::schema::build_output_t>(outcome);
  lease.set_state(veribuild::schema::job_state_t::verifying);
  auto verdict =
      verifier_.verify(request.program_id, output.executable_hash, lease.token());
  if (auto* error = std::get_if<veribuild::schema::pipeline_error_t>(&verdict)) {
    if (error->code != veribuild::schema::error_code_t::persistence_error) {
      record_failure(request.program_id, lease.token(),
                     error->reason.value_or(
                         veribuild::schema::failure_reason_t::internal_error),
                     error->message);
    }
    return make_failure(*error);
  }
  return make_verdict(
      veribuild::schema::submission_status_t::accepted,
      std::get<veribuild::schema::verification_result_t>(std::move(verdict)));
}

veribuild::schema::submission_result_t orchestrator::wait_for_holder(
    std::string_view program_id) {
  auto deadline = std::chrono::steady_clock::now() + options_.wait_timeout;

  auto local = std::optional<
      std::shared_future<veribuild::schema::submission_result_t>>{};
  {
    auto lock = std::scoped_lock{mutex_};
    auto found = in_flight_.find(std::string{program_id});
    if (found != in_flight_.end()) {
      local = found->second.outcome;
    }
  }
  if (local) {
    if (local->wait_until(deadline) == std::future_status::ready) {
      return local->get();
    }
    return make_in_progress(
        veribuild::schema::error_code_t::duplicate_in_progress,
        "verification still in progress");
  }

  // Held by another instance: follow the lock until it is released.
  while (std::chrono::steady_clock::now() < deadline) {
    auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now());
    std::this_thread::sleep_for(std::min(options_.poll_interval, remaining));
    if (locks_.is_free(program_id)) {
      return from_stored_status(program_id);
    }
  }
  return make_in_progress(veribuild::schema::error_code_t::duplicate_in_progress,
                          "verification still in progress");
}

veribuild::schema::submission_result_t orchestrator::from_stored_status(
    std::string_view program_id) const {
  auto stored = std::optional<veribuild::schema::program_status_t>{};
  try {
    stored = store_.find_status(program_id);
  } catch (const veribuild::storage::persistence_error& e) {
    return make_failure(to_pipeline_error(e));
  }
  if (!stored) {
    return make_in_progress(
        veribuild::schema::error_code_t::duplicate_in_progress,
        "verification state unknown");
  }
  if (!veribuild::schema::is_terminal(stored->status)) {
    return make_in_progress(
        veribuild::schema::error_code_t::duplicate_in_progress,
        "verification still in progress");
  }
  if (stored->status == veribuild::schema::job_status_t::failed) {
    return veribuild::schema::submission_result_t{
        .status = veribuild::schema::submission_status_t::failed,
        .error = veribuild::schema::error_code_t::build_error,
        .reason = stored->reason,
        .message = stored->detail,
        .result = std::nullopt};
  }
  if (stored->result) {
    return make_verdict(veribuild::schema::submission_status_t::accepted,
                        std::move(*stored->result));
  }
  return make_in_progress(veribuild::schema::error_code_t::duplicate_in_progress,
                          "verification still in progress");
}

status_outcome_t orchestrator::status(std::string_view program_id) const {
  auto stored = std::optional<veribuild::schema::program_status_t>{};
  try {
    stored = store_.find_status(program_id);
  } catch (const veribuild::storage::persistence_error& e) {
    return to_pipeline_error(e);
  }
  if (stored) {
    if (auto holder = locks_.holder(program_id)) {
      stored->in_flight = holder->state;
    }
  }
  return stored;
}

void orchestrator::drain() {
  auto lock = std::unique_lock{mutex_};
  idle_.wait(lock, [this]() { return active_jobs_ == 0; });
}

void orchestrator::record_failure(std::string_view program_id,
                                  std::string_view job_token,
                                  veribuild::schema::failure_reason_t reason,
                                  std::string_view detail) {
  try {
    store_.record_failure(program_id, job_token, reason, detail,
                          veribuild::schema::now_milliseconds());
  } catch (const veribuild::storage::persistence_error& e) {
    spdlog::error("Could not record {} failure for {}: {}",
                  veribuild::schema::to_string(reason), program_id, e.what());
  }
}

}  // namespace veribuild::verification
