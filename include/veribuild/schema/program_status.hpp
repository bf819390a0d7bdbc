#pragma once
#include <veribuild/schema/build_request.hpp>
#include <veribuild/schema/failure_reason.hpp>
#include <veribuild/schema/job_state.hpp>
#include <veribuild/schema/job_status.hpp>
#include <veribuild/schema/verification_result.hpp>
#include <optional>
#include <string>

namespace veribuild::schema {

template <uint16_t Version>
struct program_status;

/// Everything known about one program: durable request, last outcome and
/// the in-flight phase if a job currently holds the lock.
template <>
struct program_status<1> final {
  build_request_t request;
  job_status_t status{job_status_t::pending};
  std::optional<failure_reason_t> reason;
  std::string detail;
  std::optional<job_token_t> active_job;
  timestamp_milliseconds_t updated_at{};
  std::optional<verification_result_t> result;
  std::optional<job_state_t> in_flight;
};

using program_status_t = program_status<1>;

}  // namespace veribuild::schema
