#include <csignal>
#include <grpcpp/ext/proto_server_reflection_plugin.h>
#include <grpcpp/grpcpp.h>
#include <grpcpp/health_check_service_interface.h>
#include <spdlog/spdlog.h>
#include <boost/program_options.hpp>
#include <veribuild/build/container_runtime.hpp>
#include <veribuild/build/executor.hpp>
#include <veribuild/cache/cache_ref.hpp>
#include <veribuild/cache/rocksdb/cache.hpp>
#ifdef VERIBUILD_WITH_REDIS
#include <veribuild/cache/redis/cache.hpp>
#endif
#include <veribuild/chain/chain_state.hpp>
#include <veribuild/common/critical.hpp>
#include <veribuild/common/logging.hpp>
#include <veribuild/coordination/rate_limiter.hpp>
#include <veribuild/coordination/single_flight.hpp>
#include <veribuild/intake/server.hpp>
#include <veribuild/storage/sqlite/hash_store.hpp>
#include <veribuild/verification/orchestrator.hpp>
#include <veribuild/verification/verifier.hpp>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <fstream>
#include <iostream>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace po = boost::program_options;

namespace {

// Lock TTL headroom over the longest job the timeouts allow.
constexpr auto kLockMargin = std::chrono::minutes{15};

// Every run clones and checks out (each bounded by the checkout timeout)
// and then builds; the deployed hash is read once more before the verdict.
std::chrono::milliseconds max_job_duration(uint32_t runs,
                                           std::chrono::milliseconds checkout,
                                           std::chrono::milliseconds build,
                                           std::chrono::milliseconds chain) {
  return std::max<uint32_t>(runs, 1) * (2 * checkout + build) + chain;
}

std::atomic<bool>& shutdown_requested() {
  static std::atomic<bool> requested{};
  return requested;
}

void signal_handler(int) {
  shutdown_requested() = true;
}

}  // namespace

int main(int argc, char* argv[]) {
  std::signal(SIGINT, signal_handler);
  std::signal(SIGTERM, signal_handler);

  auto config_file = std::string{};
  auto grpc_address = std::string{};
  auto database_path = std::string{};
  auto cache_path = std::string{};
  auto cache_url = std::string{};
  auto work_root = std::string{};
  auto docker_binary = std::string{};
  auto git_binary = std::string{};
  auto solana_verify_binary = std::string{};
  auto rpc_url = std::string{};
  auto default_base_image = std::string{};
  auto default_mount_path = std::string{};
  auto build_timeout_seconds = uint64_t{};
  auto checkout_timeout_seconds = uint64_t{};
  auto chain_timeout_seconds = uint64_t{};
  auto wait_timeout_seconds = uint64_t{};
  auto poll_interval_ms = uint64_t{};
  auto max_concurrent_builds = uint32_t{};
  auto waiter_threads = std::size_t{};
  auto build_memory = std::string{};
  auto build_cpus = std::string{};
  auto build_pids = uint32_t{};
  auto build_network = std::string{};
  auto max_log_bytes = std::size_t{};
  auto max_executable_bytes = std::size_t{};
  auto reproducibility_runs = uint32_t{};
  auto submit_limit = uint32_t{};
  auto submit_window_ms = uint64_t{};
  auto query_limit = uint32_t{};
  auto query_window_ms = uint64_t{};
  auto exempt_clients = std::vector<std::string>{};
  auto log_file = std::string{};

  auto description = po::options_description{"veribuild"};
  description.add_options()("help,h", "Show the help message")(
      "config,c", po::value<std::string>(&config_file),
      "INI file with any of the options below; the command line wins")(
      "grpc-address,g",
      po::value<std::string>(&grpc_address)->default_value("0.0.0.0:50051"),
      "IP:Port for the intake gRPC server")(
      "database", po::value<std::string>(&database_path)
                      ->default_value("veribuild.sqlite3"),
      "SQLite hash store file")(
      "cache-path",
      po::value<std::string>(&cache_path)->default_value("veribuild-cache"),
      "RocksDB coordination cache directory (single host)")(
      "cache-url", po::value<std::string>(&cache_url)->default_value(""),
      "redis://host:port of a coordination cache shared by every instance; "
      "replaces --cache-path")(
      "work-root",
      po::value<std::string>(&work_root)->default_value("/tmp/veribuild"),
      "Parent directory of per-job working directories")(
      "docker", po::value<std::string>(&docker_binary)->default_value("docker"),
      "Container runtime CLI")(
      "git", po::value<std::string>(&git_binary)->default_value("git"),
      "git binary used for checkouts")(
      "solana-verify",
      po::value<std::string>(&solana_verify_binary)
          ->default_value("solana-verify"),
      "solana-verify binary used for on-chain hash lookups")(
      "rpc-url",
      po::value<std::string>(&rpc_url)->default_value(
          "https://api.mainnet-beta.solana.com"),
      "Chain RPC endpoint")(
      "chain-timeout-seconds",
      po::value<uint64_t>(&chain_timeout_seconds)->default_value(60),
      "Wall-clock limit of one on-chain hash lookup")(
      "default-base-image",
      po::value<std::string>(&default_base_image)
          ->default_value("ellipsislabs/solana:latest"),
      "Build image when a submission names none")(
      "default-mount-path",
      po::value<std::string>(&default_mount_path)->default_value("/build"),
      "Container mount path when a submission names none")(
      "build-timeout-seconds",
      po::value<uint64_t>(&build_timeout_seconds)->default_value(1800),
      "Wall-clock limit of one build container")(
      "checkout-timeout-seconds",
      po::value<uint64_t>(&checkout_timeout_seconds)->default_value(600),
      "Wall-clock limit of clone plus checkout")(
      "wait-timeout-seconds",
      po::value<uint64_t>(&wait_timeout_seconds)->default_value(120),
      "How long a waiting Verify call blocks; below the build timeout")(
      "poll-interval-ms",
      po::value<uint64_t>(&poll_interval_ms)->default_value(1000),
      "Poll interval while waiting on a job owned by another instance")(
      "max-concurrent-builds",
      po::value<uint32_t>(&max_concurrent_builds)->default_value(2),
      "Size of the build worker pool")(
      "waiter-threads",
      po::value<std::size_t>(&waiter_threads)->default_value(16),
      "Threads serving Verify calls")(
      "build-memory",
      po::value<std::string>(&build_memory)->default_value("8g"),
      "Memory limit of a build container")(
      "build-cpus", po::value<std::string>(&build_cpus)->default_value("2"),
      "CPU limit of a build container")(
      "build-pids", po::value<uint32_t>(&build_pids)->default_value(4096),
      "Process limit of a build container")(
      "build-network",
      po::value<std::string>(&build_network)->default_value("bridge"),
      "Docker network of build containers")(
      "max-log-bytes",
      po::value<std::size_t>(&max_log_bytes)->default_value(4 << 20),
      "Build output ceiling")(
      "max-executable-bytes",
      po::value<std::size_t>(&max_executable_bytes)->default_value(16 << 20),
      "Largest executable that is hashed")(
      "reproducibility-runs",
      po::value<uint32_t>(&reproducibility_runs)->default_value(1),
      "Builds per job; more than one detects non-deterministic builds")(
      "submit-limit", po::value<uint32_t>(&submit_limit)->default_value(1),
      "Verify calls per client per window")(
      "submit-window-ms",
      po::value<uint64_t>(&submit_window_ms)->default_value(30000),
      "Verify rate-limit window")(
      "query-limit", po::value<uint32_t>(&query_limit)->default_value(100),
      "Status calls per client per window")(
      "query-window-ms",
      po::value<uint64_t>(&query_window_ms)->default_value(1000),
      "Status rate-limit window")(
      "rate-limit-exempt",
      po::value<std::vector<std::string>>(&exempt_clients)->composing(),
      "Client address exempt from rate limits (repeatable)")(
      "log-file", po::value<std::string>(&log_file)->default_value(""),
      "Also log to this file")("verbose,v", "Enable verbose output");

  auto vm = po::variables_map{};
  try {
    po::store(po::parse_command_line(argc, argv, description), vm);
    if (vm.contains("config")) {
      auto config_path = vm["config"].as<std::string>();
      auto config = std::ifstream{config_path};
      if (!config) {
        std::cerr << "cannot open config file " << config_path << std::endl;
        return 1;
      }
      po::store(po::parse_config_file(config, description), vm);
    }
    po::notify(vm);
  } catch (const po::error& e) {
    std::cerr << e.what() << "\n" << description << std::endl;
    return 1;
  }

  if (vm.contains("help")) {
    std::cout << description << std::endl;
    return 0;
  }

  veribuild::common::configure_logging("veribuild", log_file,
                                       vm.contains("verbose"));

  if (wait_timeout_seconds >= build_timeout_seconds) {
    veribuild::common::critical(
        "wait-timeout-seconds ({}) must be below build-timeout-seconds ({})",
        wait_timeout_seconds, build_timeout_seconds);
  }

  auto store = veribuild::storage::make_hash_store<
      veribuild::storage::sqlite_storage_tag>(database_path);
  auto rocksdb_cache = veribuild::cache::rocksdb_cache_t{};
#ifdef VERIBUILD_WITH_REDIS
  auto redis_cache = veribuild::cache::redis_cache_t{};
#endif
  auto cache = std::optional<veribuild::cache::cache_ref>{};
  if (!cache_url.empty()) {
#ifdef VERIBUILD_WITH_REDIS
    redis_cache = veribuild::cache::make_cache<veribuild::cache::redis_cache_tag>(
        cache_url, veribuild::cache::clock_fn_t{});
    cache.emplace(redis_cache);
#else
    veribuild::common::critical(
        "--cache-url {} needs a build with Redis support", cache_url);
#endif
  } else {
    rocksdb_cache =
        veribuild::cache::make_cache<veribuild::cache::rocksdb_cache_tag>(
            cache_path, veribuild::cache::clock_fn_t{});
    auto purged = rocksdb_cache.purge_expired();
    if (purged > 0) {
      spdlog::info("Purged {} expired coordination entries", purged);
    }
    cache.emplace(rocksdb_cache);
  }

  auto build_timeout = std::chrono::seconds{build_timeout_seconds};
  auto checkout_timeout = std::chrono::seconds{checkout_timeout_seconds};
  auto chain_timeout = std::chrono::seconds{chain_timeout_seconds};
  auto lock_ttl = max_job_duration(reproducibility_runs, checkout_timeout,
                                   build_timeout, chain_timeout) +
                  kLockMargin;
  spdlog::debug("Program locks expire after {} ms without a refresh",
                lock_ttl.count());
  auto locks = veribuild::coordination::single_flight{
      *cache, static_cast<uint64_t>(lock_ttl.count())};
  auto submit_limiter = veribuild::coordination::rate_limiter{
      *cache, "submit",
      veribuild::coordination::rate_limit_t{.requests = submit_limit,
                                            .window = submit_window_ms}};
  auto query_limiter = veribuild::coordination::rate_limiter{
      *cache, "query",
      veribuild::coordination::rate_limit_t{.requests = query_limit,
                                            .window = query_window_ms}};

  auto runtime = veribuild::build::container_runtime{
      docker_binary,
      veribuild::build::container_limits{.memory = build_memory,
                                         .cpus = build_cpus,
                                         .pids = build_pids,
                                         .network = build_network}};
  auto builder = veribuild::build::executor{
      runtime,
      veribuild::build::executor_options{
          .work_root = work_root,
          .git_binary = git_binary,
          .checkout_timeout = checkout_timeout,
          .build_timeout = build_timeout,
          .max_log_bytes = max_log_bytes,
          .max_executable_bytes = max_executable_bytes,
          .reproducibility_runs = reproducibility_runs}};
  auto chain = veribuild::chain::make_cli_chain_state(
      veribuild::chain::cli_chain_state_options{
          .solana_verify_binary = solana_verify_binary,
          .rpc_url = rpc_url,
          .timeout = chain_timeout});
  auto verifier = veribuild::verification::verifier{chain, store};
  auto orchestrator = veribuild::verification::orchestrator{
      store, locks, verifier,
      [&builder](const veribuild::schema::build_request_t& request) {
        return builder.run(request);
      },
      veribuild::verification::orchestrator_options{
          .defaults = {.base_image = default_base_image,
                       .mount_path = default_mount_path},
          .wait_timeout = std::chrono::seconds{wait_timeout_seconds},
          .poll_interval = std::chrono::milliseconds{poll_interval_ms},
          .max_concurrent_builds = max_concurrent_builds}};

  grpc::EnableDefaultHealthCheckService(true);
  grpc::reflection::InitProtoReflectionServerBuilderPlugin();

  auto grpc_listener = veribuild::intake::listener{
      orchestrator, submit_limiter, query_limiter,
      veribuild::intake::listener_options{
          .waiter_threads = waiter_threads,
          .exempt_clients = {exempt_clients.begin(), exempt_clients.end()}}};
  auto grpc_builder = grpc::ServerBuilder();
  grpc_builder.AddListeningPort(grpc_address,
                                grpc::InsecureServerCredentials());
  grpc_builder.RegisterService(&grpc_listener);
  auto grpc_server = std::unique_ptr<grpc::Server>(grpc_builder.BuildAndStart());
  if (!grpc_server) {
    veribuild::common::critical("Failed to listen on {}", grpc_address);
  }
  spdlog::info("Intake listening on {} ({} build workers)", grpc_address,
               max_concurrent_builds);

  auto threads = std::vector<std::thread>{};
  threads.emplace_back([&] { grpc_server->Wait(); });
  threads.emplace_back([&] {
    grpc_server->GetHealthCheckService()->SetServingStatus(true);
    while (!shutdown_requested()) {
      std::this_thread::sleep_for(std::chrono::seconds(1));
    }
    spdlog::info("Shutting down");
    grpc_server->GetHealthCheckService()->SetServingStatus(false);
    grpc_server->Shutdown(std::chrono::system_clock::now() +
                          std::chrono::seconds{5});
  });

  for (auto& t : threads) {
    t.join();
  }

  grpc_listener.join();
  orchestrator.drain();
  spdlog::shutdown();
  return 0;
}
