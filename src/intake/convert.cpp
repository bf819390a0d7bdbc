#include <veribuild/intake/convert.hpp>

namespace veribuild::intake {

namespace {

template <typename Setter>
void set_optional(const std::optional<std::string>& value, Setter&& setter) {
  if (value) {
    setter(*value);
  }
}

struct parameter_doc final {
  std::string_view name;
  std::string_view description;
  bool required;
};

constexpr parameter_doc kVerifyParameters[] = {
    {"program_id", "Program ID of the program on mainnet", true},
    {"repository", "Git repository URL", true},
    {"commit_hash",
     "(Optional) Commit hash of the repository. If not specified, the latest "
     "commit will be used.",
     false},
    {"lib_name",
     "(Optional) If the repository contains multiple programs, the library "
     "name of the program to build and verify.",
     false},
    {"bpf_flag",
     "(Optional) Build with cargo build-bpf instead of cargo build-sbf, as "
     "older Anchor programs require.",
     false},
    {"base_image", "(Optional) Base docker image used to build the program.",
     false},
    {"mount_path", "(Optional) Mount path for the repository.", false},
    {"cargo_args",
     "(Optional) Arguments passed to the cargo build command after '--'.",
     false},
    {"wait",
     "(Optional) Wait for the outcome up to the server's wait timeout instead "
     "of returning once the build is queued.",
     false},
};

}  // namespace

veribuild::schema::build_submission_t to_submission(
    const veribuild::v1::VerifyRequest& request) {
  auto submission = veribuild::schema::build_submission_t{};
  submission.program_id = request.program_id();
  submission.repository = request.repository();
  if (request.has_commit_hash()) {
    submission.commit_hash = request.commit_hash();
  }
  if (request.has_lib_name()) {
    submission.lib_name = request.lib_name();
  }
  if (request.has_base_image()) {
    submission.base_image = request.base_image();
  }
  if (request.has_mount_path()) {
    submission.mount_path = request.mount_path();
  }
  submission.cargo_args.assign(request.cargo_args().begin(),
                               request.cargo_args().end());
  submission.bpf_flag = request.bpf_flag();
  return submission;
}

veribuild::v1::VerifyRequest to_request(
    const veribuild::schema::build_submission_t& submission,
    bool wait) {
  auto request = veribuild::v1::VerifyRequest{};
  request.set_program_id(submission.program_id);
  request.set_repository(submission.repository);
  set_optional(submission.commit_hash,
               [&](const auto& value) { request.set_commit_hash(value); });
  set_optional(submission.lib_name,
               [&](const auto& value) { request.set_lib_name(value); });
  set_optional(submission.base_image,
               [&](const auto& value) { request.set_base_image(value); });
  set_optional(submission.mount_path,
               [&](const auto& value) { request.set_mount_path(value); });
  for (const auto& argument : submission.cargo_args) {
    request.add_cargo_args(argument);
  }
  request.set_bpf_flag(submission.bpf_flag);
  request.set_wait(wait);
  return request;
}

std::string make_repo_url(std::string_view repository,
                          const std::optional<std::string>& commit_hash) {
  auto url = std::string{repository};
  if (commit_hash) {
    url += "/commit/" + *commit_hash;
  }
  return url;
}

veribuild::v1::SubmissionStatus to_proto(
    veribuild::schema::submission_status_t status) {
  switch (status) {
    case veribuild::schema::submission_status_t::cached:
      return veribuild::v1::SUBMISSION_STATUS_CACHED;
    case veribuild::schema::submission_status_t::in_progress:
      return veribuild::v1::SUBMISSION_STATUS_IN_PROGRESS;
    case veribuild::schema::submission_status_t::accepted:
      return veribuild::v1::SUBMISSION_STATUS_ACCEPTED;
    case veribuild::schema::submission_status_t::failed:
      return veribuild::v1::SUBMISSION_STATUS_FAILED;
  }
  return veribuild::v1::SUBMISSION_STATUS_UNSPECIFIED;
}

std::optional<veribuild::schema::submission_status_t> from_proto(
    veribuild::v1::SubmissionStatus status) {
  switch (status) {
    case veribuild::v1::SUBMISSION_STATUS_CACHED:
      return veribuild::schema::submission_status_t::cached;
    case veribuild::v1::SUBMISSION_STATUS_IN_PROGRESS:
      return veribuild::schema::submission_status_t::in_progress;
    case veribuild::v1::SUBMISSION_STATUS_ACCEPTED:
      return veribuild::schema::submission_status_t::accepted;
    case veribuild::v1::SUBMISSION_STATUS_FAILED:
      return veribuild::schema::submission_status_t::failed;
    default:
      return std::nullopt;
  }
}

void populate_result(const veribuild::schema::verification_result_t& source,
                     std::string_view repo_url,
                     veribuild::v1::VerificationResult* destination) {
  destination->set_program_id(source.program_id);
  destination->set_is_verified(source.is_verified);
  destination->set_on_chain_hash(source.on_chain_hash);
  destination->set_executable_hash(source.executable_hash);
  destination->set_reason(std::string{veribuild::schema::to_string(source.reason)});
  destination->set_verified_at_ms(source.verified_at);
  destination->set_repo_url(std::string{repo_url});
}

void populate_response(const veribuild::schema::submission_result_t& source,
                       std::string_view repo_url,
                       veribuild::v1::VerifyResponse* destination) {
  destination->set_status(to_proto(source.status));
  destination->set_error(std::string{veribuild::schema::to_string(source.error)});
  if (source.reason) {
    destination->set_reason(
        std::string{veribuild::schema::to_string(*source.reason)});
  }
  destination->set_message(source.message);
  if (source.result) {
    populate_result(*source.result, repo_url, destination->mutable_result());
  }
}

void populate_status(const veribuild::schema::program_status_t& source,
                     veribuild::v1::StatusResponse* destination) {
  destination->set_found(true);
  destination->set_error(std::string{
      veribuild::schema::to_string(veribuild::schema::error_code_t::none)});

  auto* request = destination->mutable_request();
  request->set_program_id(source.request.program_id);
  request->set_repository(source.request.repository);
  set_optional(source.request.commit_hash,
               [&](const auto& value) { request->set_commit_hash(value); });
  set_optional(source.request.lib_name,
               [&](const auto& value) { request->set_lib_name(value); });
  request->set_base_image(source.request.base_image);
  request->set_mount_path(source.request.mount_path);
  for (const auto& argument : source.request.build_args) {
    request->add_cargo_args(argument);
  }
  request->set_bpf_flag(source.request.bpf_flag);
  request->set_created_at_ms(source.request.created_at);

  destination->set_status(std::string{veribuild::schema::to_string(source.status)});
  if (source.reason) {
    destination->set_reason(
        std::string{veribuild::schema::to_string(*source.reason)});
  }
  destination->set_detail(source.detail);
  destination->set_updated_at_ms(source.updated_at);
  if (source.result) {
    populate_result(*source.result,
                    make_repo_url(source.request.repository,
                                  source.request.commit_hash),
                    destination->mutable_result());
  }
  if (source.in_flight) {
    destination->set_in_flight(
        std::string{veribuild::schema::to_string(*source.in_flight)});
  }
}

void populate_index(veribuild::v1::IndexResponse* destination) {
  auto* endpoint = destination->add_endpoints();
  endpoint->set_method("veribuild.v1.Intake/Verify");
  endpoint->set_description("Verify a program");
  for (const auto& doc : kVerifyParameters) {
    auto* parameter = endpoint->add_parameters();
    parameter->set_name(std::string{doc.name});
    parameter->set_description(std::string{doc.description});
    parameter->set_required(doc.required);
  }

  auto* status = destination->add_endpoints();
  status->set_method("veribuild.v1.Intake/Status");
  status->set_description("Stored request, last outcome and in-flight phase");
  auto* program_id = status->add_parameters();
  program_id->set_name("program_id");
  program_id->set_description("Program ID of the program on mainnet");
  program_id->set_required(true);
}

veribuild::schema::submission_result_t from_response(
    const veribuild::v1::VerifyResponse& response) {
  auto result = veribuild::schema::submission_result_t{};
  result.status = from_proto(response.status())
                      .value_or(veribuild::schema::submission_status_t::failed);
  result.error = veribuild::schema::try_from_string<
                     veribuild::schema::error_code_t>(response.error())
                     .value_or(veribuild::schema::error_code_t::none);
  if (!response.reason().empty()) {
    result.reason = veribuild::schema::try_from_string<
        veribuild::schema::failure_reason_t>(response.reason());
  }
  result.message = response.message();
  if (response.has_result()) {
    const auto& wire = response.result();
    auto verdict = veribuild::schema::verification_result_t{};
    verdict.program_id = wire.program_id();
    verdict.is_verified = wire.is_verified();
    verdict.on_chain_hash = wire.on_chain_hash();
    verdict.executable_hash = wire.executable_hash();
    verdict.reason = veribuild::schema::try_from_string<
                         veribuild::schema::verification_reason_t>(wire.reason())
                         .value_or(veribuild::schema::verification_reason_t::
                                       hash_mismatch);
    verdict.verified_at = wire.verified_at_ms();
    result.result = std::move(verdict);
  }
  return result;
}

}  // namespace veribuild::intake
