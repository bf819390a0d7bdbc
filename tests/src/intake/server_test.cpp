#include <grpcpp/grpcpp.h>
#include <veribuild/intake/client.hpp>
#include <veribuild/intake/convert.hpp>
#include <veribuild/intake/server.hpp>
#include <veribuild/testing/pipeline_harness.hpp>
#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <set>
#include <string>

namespace {

/// Intake server on an in-process channel over the fake pipeline.
struct intake_fixture final {
  explicit intake_fixture(
      veribuild::coordination::rate_limit_t submit_limit =
          veribuild::coordination::rate_limit_t{.requests = 100,
                                                .window = 60'000},
      std::set<std::string> exempt = {})
      : submit_limiter{pipeline.cache, "submit", submit_limit},
        query_limiter{pipeline.cache, "query",
                      veribuild::coordination::rate_limit_t{.requests = 100,
                                                            .window = 60'000}},
        listener{pipeline.orchestrator, submit_limiter, query_limiter,
                 veribuild::intake::listener_options{
                     .waiter_threads = 4, .exempt_clients = std::move(exempt)}} {
    auto builder = grpc::ServerBuilder{};
    builder.RegisterService(&listener);
    server = builder.BuildAndStart();
    channel = server->InProcessChannel(grpc::ChannelArguments{});
    stub = veribuild::v1::Intake::NewStub(channel);
  }

  ~intake_fixture() {
    server->Shutdown(std::chrono::system_clock::now() + std::chrono::seconds{5});
    listener.join();
  }

  grpc::Status verify(const veribuild::v1::VerifyRequest& request,
                      veribuild::v1::VerifyResponse& response) {
    auto context = grpc::ClientContext{};
    context.set_deadline(std::chrono::system_clock::now() +
                         std::chrono::seconds{30});
    return stub->Verify(&context, request, &response);
  }

  grpc::Status status(const std::string& program_id,
                      veribuild::v1::StatusResponse& response) {
    auto context = grpc::ClientContext{};
    auto request = veribuild::v1::StatusRequest{};
    request.set_program_id(program_id);
    return stub->Status(&context, request, &response);
  }

  veribuild::testing::pipeline pipeline;
  veribuild::coordination::rate_limiter submit_limiter;
  veribuild::coordination::rate_limiter query_limiter;
  veribuild::intake::listener listener;
  std::unique_ptr<grpc::Server> server;
  std::shared_ptr<grpc::Channel> channel;
  std::unique_ptr<veribuild::v1::Intake::Stub> stub;
};

veribuild::v1::VerifyRequest make_verify_request(const std::string& program_id,
                                                 const bool wait) {
  return veribuild::intake::to_request(
      veribuild::testing::make_submission(program_id), wait);
}

}  // namespace

TEST(intake_server, verify_waits_for_the_verdict) {
  auto fixture = intake_fixture{};
  fixture.pipeline.chain.set_hash("Prog111", veribuild::testing::make_hash('1'));
  fixture.pipeline.runner.set_hash("Prog111", veribuild::testing::make_hash('1'));

  auto request = make_verify_request("Prog111", true);
  request.set_commit_hash("abc123");
  auto response = veribuild::v1::VerifyResponse{};
  auto status = fixture.verify(request, response);
  ASSERT_TRUE(status.ok()) << status.error_message();
  EXPECT_EQ(response.status(), veribuild::v1::SUBMISSION_STATUS_ACCEPTED);
  EXPECT_EQ(response.error(), "none");
  EXPECT_EQ(response.message(), "On chain program verified");
  ASSERT_TRUE(response.has_result());
  EXPECT_TRUE(response.result().is_verified());
  EXPECT_EQ(response.result().reason(), "matched");
  EXPECT_EQ(response.result().repo_url(),
            "https://github.com/example/program/commit/abc123");

  auto again = veribuild::v1::VerifyResponse{};
  ASSERT_TRUE(fixture.verify(request, again).ok());
  EXPECT_EQ(again.status(), veribuild::v1::SUBMISSION_STATUS_CACHED);
}

TEST(intake_server, errors_are_named_in_an_ok_response) {
  auto fixture = intake_fixture{};
  auto request = make_verify_request("Prog111", true);
  request.set_repository("file:///etc");
  auto response = veribuild::v1::VerifyResponse{};
  auto status = fixture.verify(request, response);
  ASSERT_TRUE(status.ok());
  EXPECT_EQ(response.status(), veribuild::v1::SUBMISSION_STATUS_FAILED);
  EXPECT_EQ(response.error(), "validation_error");
  EXPECT_FALSE(response.has_result());
}

TEST(intake_server, status_reports_stored_and_unknown_programs) {
  auto fixture = intake_fixture{};
  fixture.pipeline.chain.set_hash("Prog111", veribuild::testing::make_hash('1'));
  fixture.pipeline.runner.set_hash("Prog111", veribuild::testing::make_hash('2'));
  auto verify_response = veribuild::v1::VerifyResponse{};
  ASSERT_TRUE(
      fixture.verify(make_verify_request("Prog111", true), verify_response).ok());

  auto response = veribuild::v1::StatusResponse{};
  ASSERT_TRUE(fixture.status("Prog111", response).ok());
  EXPECT_TRUE(response.found());
  EXPECT_EQ(response.status(), "not_verified");
  EXPECT_EQ(response.message(), "On chain program not verified");
  EXPECT_EQ(response.request().repository(), "https://github.com/example/program");
  EXPECT_EQ(response.request().base_image(), "ellipsislabs/solana:latest");
  ASSERT_TRUE(response.has_result());
  EXPECT_EQ(response.result().executable_hash(),
            veribuild::testing::make_hash('2'));
  EXPECT_FALSE(response.has_in_flight());

  auto unknown = veribuild::v1::StatusResponse{};
  ASSERT_TRUE(fixture.status("Prog999", unknown).ok());
  EXPECT_FALSE(unknown.found());
  EXPECT_EQ(unknown.message(), "no build request for Prog999");
}

TEST(intake_server, index_documents_the_endpoints) {
  auto fixture = intake_fixture{};
  auto context = grpc::ClientContext{};
  auto response = veribuild::v1::IndexResponse{};
  ASSERT_TRUE(
      fixture.stub->Index(&context, veribuild::v1::IndexRequest{}, &response).ok());
  ASSERT_EQ(response.endpoints_size(), 2);
  EXPECT_EQ(response.endpoints(0).method(), "veribuild.v1.Intake/Verify");
  auto required = std::set<std::string>{};
  for (const auto& parameter : response.endpoints(0).parameters()) {
    if (parameter.required()) {
      required.insert(parameter.name());
    }
  }
  EXPECT_EQ(required, (std::set<std::string>{"program_id", "repository"}));
  EXPECT_EQ(response.endpoints(1).method(), "veribuild.v1.Intake/Status");
}

TEST(intake_server, submissions_beyond_the_limit_are_rejected) {
  auto fixture = intake_fixture{
      veribuild::coordination::rate_limit_t{.requests = 1, .window = 60'000}};
  fixture.pipeline.chain.set_hash("Prog111", veribuild::testing::make_hash('1'));
  fixture.pipeline.runner.set_hash("Prog111", veribuild::testing::make_hash('1'));

  auto response = veribuild::v1::VerifyResponse{};
  ASSERT_TRUE(fixture.verify(make_verify_request("Prog111", true), response).ok());

  auto limited = veribuild::v1::VerifyResponse{};
  auto status = fixture.verify(make_verify_request("Prog111", true), limited);
  EXPECT_EQ(status.error_code(), grpc::StatusCode::RESOURCE_EXHAUSTED);

  // The client maps the rejection to a failed result rather than a transport
  // error.
  auto client = veribuild::intake::client{fixture.channel, std::chrono::seconds{30}};
  auto result = client.verify(veribuild::testing::make_submission("Prog111"), false);
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->status, veribuild::schema::submission_status_t::failed);
  EXPECT_EQ(result->error, veribuild::schema::error_code_t::rate_limited);

  // Queries are counted in their own scope.
  auto query = veribuild::v1::StatusResponse{};
  EXPECT_TRUE(fixture.status("Prog111", query).ok());
}

TEST(intake_server, client_decodes_verdicts) {
  auto fixture = intake_fixture{};
  fixture.pipeline.chain.set_hash("Prog111", veribuild::testing::make_hash('1'));
  fixture.pipeline.runner.set_hash("Prog111", veribuild::testing::make_hash('1'));

  auto client = veribuild::intake::client{fixture.channel, std::chrono::seconds{30}};
  auto result = client.verify(veribuild::testing::make_submission("Prog111"), true);
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->status, veribuild::schema::submission_status_t::accepted);
  ASSERT_TRUE(result->result.has_value());
  EXPECT_TRUE(result->result->is_verified);
  EXPECT_EQ(result->result->on_chain_hash, veribuild::testing::make_hash('1'));
}
