#pragma once

#include <veribuild/v1/intake.pb.h>
#include <veribuild/schema/build_submission.hpp>
#include <veribuild/schema/program_status.hpp>
#include <veribuild/schema/submission_result.hpp>
#include <optional>
#include <string>
#include <string_view>

// Mapping between wire messages and schema types.
namespace veribuild::intake {

veribuild::schema::build_submission_t to_submission(
    const veribuild::v1::VerifyRequest& request);

veribuild::v1::VerifyRequest to_request(
    const veribuild::schema::build_submission_t& submission,
    bool wait);

/// `<repository>/commit/<hash>` for pinned builds, the repository otherwise.
std::string make_repo_url(std::string_view repository,
                          const std::optional<std::string>& commit_hash);

veribuild::v1::SubmissionStatus to_proto(
    veribuild::schema::submission_status_t status);

std::optional<veribuild::schema::submission_status_t> from_proto(
    veribuild::v1::SubmissionStatus status);

void populate_result(const veribuild::schema::verification_result_t& source,
                     std::string_view repo_url,
                     veribuild::v1::VerificationResult* destination);

void populate_response(const veribuild::schema::submission_result_t& source,
                       std::string_view repo_url,
                       veribuild::v1::VerifyResponse* destination);

void populate_status(const veribuild::schema::program_status_t& source,
                     veribuild::v1::StatusResponse* destination);

void populate_index(veribuild::v1::IndexResponse* destination);

/// Client-side decoding; unknown names fall back to conservative values.
veribuild::schema::submission_result_t from_response(
    const veribuild::v1::VerifyResponse& response);

}  // namespace veribuild::intake
