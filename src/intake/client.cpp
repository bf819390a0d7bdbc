#include <spdlog/spdlog.h>
#include <veribuild/intake/client.hpp>
#include <veribuild/intake/convert.hpp>

namespace veribuild::intake {

client::client(std::shared_ptr<grpc::Channel> channel,
               std::chrono::milliseconds deadline)
    : stub_{veribuild::v1::Intake::NewStub(channel)}, deadline_{deadline} {}

std::optional<veribuild::schema::submission_result_t> client::verify(
    const veribuild::schema::build_submission_t& submission,
    bool wait) {
  auto context = grpc::ClientContext{};
  context.set_deadline(std::chrono::system_clock::now() + deadline_);
  auto request = to_request(submission, wait);
  auto response = veribuild::v1::VerifyResponse{};

  auto status = stub_->Verify(&context, request, &response);
  if (status.error_code() == grpc::StatusCode::RESOURCE_EXHAUSTED) {
    auto limited = veribuild::schema::submission_result_t{};
    limited.status = veribuild::schema::submission_status_t::failed;
    limited.error = veribuild::schema::error_code_t::rate_limited;
    limited.message = status.error_message();
    return limited;
  }
  if (!status.ok()) {
    spdlog::warn("Verify {} failed in transport ({}): {}",
                 submission.program_id, static_cast<int>(status.error_code()),
                 status.error_message());
    return std::nullopt;
  }
  return from_response(response);
}

}  // namespace veribuild::intake
