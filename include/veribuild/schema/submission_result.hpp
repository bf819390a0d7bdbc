#pragma once
#include <veribuild/schema/error_code.hpp>
#include <veribuild/schema/failure_reason.hpp>
#include <veribuild/schema/submission_status.hpp>
#include <veribuild/schema/verification_result.hpp>
#include <optional>
#include <string>

namespace veribuild::schema {

template <uint16_t Version>
struct submission_result;

template <>
struct submission_result<1> final {
  submission_status_t status{submission_status_t::failed};
  error_code_t error{error_code_t::none};
  std::optional<failure_reason_t> reason;
  std::string message;
  std::optional<verification_result_t> result;
};

using submission_result_t = submission_result<1>;

}  // namespace veribuild::schema
