#include <boost/asio/post.hpp>
#include <spdlog/spdlog.h>
#include <veribuild/intake/convert.hpp>
#include <veribuild/intake/server.hpp>

#include <algorithm>

using namespace veribuild::intake;

namespace {

grpc::ServerUnaryReactor* finish_ok(grpc::CallbackServerContext* context) {
  auto* reactor = context->DefaultReactor();
  reactor->Finish(grpc::Status::OK);
  return reactor;
}

grpc::ServerUnaryReactor* finish_rate_limited(
    grpc::CallbackServerContext* context,
    const veribuild::coordination::rate_limiter& limiter) {
  auto* reactor = context->DefaultReactor();
  reactor->Finish(grpc::Status{
      grpc::StatusCode::RESOURCE_EXHAUSTED,
      "rate limited: at most " + std::to_string(limiter.limit().requests) +
          " requests per " + std::to_string(limiter.limit().window) + " ms"});
  return reactor;
}

}  // namespace

listener::listener(veribuild::verification::orchestrator& orchestrator,
                   veribuild::coordination::rate_limiter& submit_limiter,
                   veribuild::coordination::rate_limiter& query_limiter,
                   listener_options options)
    : orchestrator_{orchestrator},
      submit_limiter_{submit_limiter},
      query_limiter_{query_limiter},
      options_{std::move(options)},
      waiters_{std::max<std::size_t>(options_.waiter_threads, 1)} {}

listener::~listener() {
  join();
}

void listener::join() {
  waiters_.join();
}

bool listener::admit(veribuild::coordination::rate_limiter& limiter,
                     const std::string& client) const {
  if (options_.exempt_clients.contains(client)) {
    return true;
  }
  return limiter.allow(client);
}

grpc::ServerUnaryReactor* listener::Verify(
    grpc::CallbackServerContext* context,
    const veribuild::v1::VerifyRequest* request,
    veribuild::v1::VerifyResponse* response) {
  auto client = veribuild::coordination::client_key_from_peer(context->peer());
  if (!admit(submit_limiter_, client)) {
    return finish_rate_limited(context, submit_limiter_);
  }

  auto* reactor = context->DefaultReactor();
  auto submission = to_submission(*request);
  auto mode = request->wait() ? veribuild::verification::submit_mode_t::wait
                              : veribuild::verification::submit_mode_t::detached;
  spdlog::debug("Verify {} from {} ({})", submission.program_id, client,
                request->wait() ? "wait" : "detached");

  boost::asio::post(waiters_, [this, reactor, response, mode,
                               submission = std::move(submission)]() {
    auto result = orchestrator_.submit(submission, mode);
    populate_response(result,
                      make_repo_url(submission.repository,
                                    submission.commit_hash),
                      response);
    reactor->Finish(grpc::Status::OK);
  });
  return reactor;
}

grpc::ServerUnaryReactor* listener::Status(
    grpc::CallbackServerContext* context,
    const veribuild::v1::StatusRequest* request,
    veribuild::v1::StatusResponse* response) {
  auto client = veribuild::coordination::client_key_from_peer(context->peer());
  if (!admit(query_limiter_, client)) {
    return finish_rate_limited(context, query_limiter_);
  }

  auto outcome = orchestrator_.status(request->program_id());
  if (auto* error = std::get_if<veribuild::schema::pipeline_error_t>(&outcome)) {
    response->set_found(false);
    response->set_error(std::string{veribuild::schema::to_string(error->code)});
    response->set_message(error->message);
    return finish_ok(context);
  }

  const auto& status =
      std::get<std::optional<veribuild::schema::program_status_t>>(outcome);
  if (!status) {
    response->set_found(false);
    response->set_error(std::string{
        veribuild::schema::to_string(veribuild::schema::error_code_t::none)});
    response->set_message("no build request for " + request->program_id());
    return finish_ok(context);
  }
  populate_status(*status, response);
  response->set_message(
      status->result
          ? std::string{veribuild::verification::describe_result(
                *status->result)}
          : std::string{veribuild::schema::to_string(status->status)});
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::Index(
    grpc::CallbackServerContext* context,
    const veribuild::v1::IndexRequest*,
    veribuild::v1::IndexResponse* response) {
  populate_index(response);
  return finish_ok(context);
}
