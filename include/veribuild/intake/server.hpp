#pragma once

#include <boost/asio/thread_pool.hpp>
#include <veribuild/v1/intake.grpc.pb.h>
#include <veribuild/coordination/rate_limiter.hpp>
#include <veribuild/verification/orchestrator.hpp>
#include <cstddef>
#include <set>
#include <string>

namespace veribuild::intake {

struct listener_options final {
  /// Threads serving Verify calls; a waiting call occupies one for up to
  /// the orchestrator's wait timeout.
  std::size_t waiter_threads{16};
  /// Client addresses the rate limiters do not apply to (the crawler).
  std::set<std::string> exempt_clients;
};

/// Callback listener for the public intake API.
///
/// Verify runs on a dedicated waiter pool so gRPC callback threads never
/// block on chain lookups or builds; Status and Index answer inline.
/// Rate-limited calls fail with RESOURCE_EXHAUSTED. Every other outcome,
/// errors included, is an OK status with the error named in the body.
struct listener final : public veribuild::v1::Intake::CallbackService {
  listener(veribuild::verification::orchestrator& orchestrator,
           veribuild::coordination::rate_limiter& submit_limiter,
           veribuild::coordination::rate_limiter& query_limiter,
           listener_options options);
  ~listener() override;

  grpc::ServerUnaryReactor* Verify(
      grpc::CallbackServerContext* context,
      const veribuild::v1::VerifyRequest* request,
      veribuild::v1::VerifyResponse* response) override final;

  grpc::ServerUnaryReactor* Status(
      grpc::CallbackServerContext* context,
      const veribuild::v1::StatusRequest* request,
      veribuild::v1::StatusResponse* response) override final;

  grpc::ServerUnaryReactor* Index(
      grpc::CallbackServerContext* context,
      const veribuild::v1::IndexRequest* request,
      veribuild::v1::IndexResponse* response) override final;

  /// Wait for queued Verify calls; call after the server stopped accepting.
  void join();

 private:
  bool admit(veribuild::coordination::rate_limiter& limiter,
             const std::string& client) const;

  veribuild::verification::orchestrator& orchestrator_;
  veribuild::coordination::rate_limiter& submit_limiter_;
  veribuild::coordination::rate_limiter& query_limiter_;
  listener_options options_;
  boost::asio::thread_pool waiters_;
};

}  // namespace veribuild::intake
