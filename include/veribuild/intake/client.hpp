#pragma once

#include <grpcpp/grpcpp.h>
#include <veribuild/v1/intake.grpc.pb.h>
#include <veribuild/schema/build_submission.hpp>
#include <veribuild/schema/submission_result.hpp>
#include <chrono>
#include <memory>
#include <optional>

namespace veribuild::intake {

/// Blocking intake client, used by the crawler to submit the same way an
/// external caller does.
class client final {
 public:
  client(std::shared_ptr<grpc::Channel> channel,
         std::chrono::milliseconds deadline);

  /// nullopt when the call failed in transport. RESOURCE_EXHAUSTED comes
  /// back as a failed result with the rate_limited error.
  std::optional<veribuild::schema::submission_result_t> verify(
      const veribuild::schema::build_submission_t& submission,
      bool wait);

 private:
  std::unique_ptr<veribuild::v1::Intake::Stub> stub_;
  std::chrono::milliseconds deadline_;
};

}  // namespace veribuild::intake
