#pragma once
#include <veribuild/schema/error_code.hpp>
#include <veribuild/schema/failure_reason.hpp>
#include <optional>
#include <string>

namespace veribuild::schema {

struct pipeline_error_t final {
  error_code_t code{error_code_t::none};
  std::optional<failure_reason_t> reason;
  bool retryable{};
  std::string message;
};

}  // namespace veribuild::schema
