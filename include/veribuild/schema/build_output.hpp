#pragma once
#include <veribuild/schema/failure_reason.hpp>
#include <string>
#include <variant>

namespace veribuild::schema {

/// Successful build: content hash of the produced executable.
struct build_output_t final {
  std::string executable_hash;
  int exit_code{};
  std::string log_excerpt;
};

/// Failed build. `retryable` marks host-side trouble (capacity, runtime
/// unavailable) as opposed to a failure of the target program.
struct build_error_t final {
  failure_reason_t reason{failure_reason_t::toolchain_failed};
  bool retryable{};
  std::string detail;
  std::string log_excerpt;
};

using build_outcome_t = std::variant<build_output_t, build_error_t>;

}  // namespace veribuild::schema
