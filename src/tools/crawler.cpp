#include <csignal>
#include <grpcpp/grpcpp.h>
#include <spdlog/spdlog.h>
#include <boost/program_options.hpp>
#include <veribuild/common/logging.hpp>
#include <veribuild/crawler/crawler.hpp>
#include <veribuild/intake/client.hpp>
#include <veribuild/storage/sqlite/hash_store.hpp>

#include <atomic>
#include <chrono>
#include <fstream>
#include <iostream>
#include <string>

namespace po = boost::program_options;

namespace {

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
  auto intake_address = std::string{};
  auto database_path = std::string{};
  auto watchlist_path = std::string{};
  auto interval_seconds = uint64_t{};
  auto deadline_seconds = uint64_t{};
  auto backoff_threshold = uint32_t{};
  auto max_backoff_runs = uint32_t{};
  auto log_file = std::string{};

  auto description = po::options_description{"veribuild-crawler"};
  description.add_options()("help,h", "Show the help message")(
      "config,c", po::value<std::string>(&config_file),
      "INI file with any of the options below; the command line wins")(
      "intake,i",
      po::value<std::string>(&intake_address)->default_value("127.0.0.1:50051"),
      "IP:Port of the intake gRPC server")(
      "database", po::value<std::string>(&database_path)
                      ->default_value("veribuild.sqlite3"),
      "SQLite hash store file to enumerate known programs from")(
      "watchlist", po::value<std::string>(&watchlist_path),
      "File of newly observed programs: program_id repository [commit "
      "[lib_name]] per line")(
      "interval-seconds",
      po::value<uint64_t>(&interval_seconds)->default_value(600),
      "Pause between passes")(
      "deadline-seconds",
      po::value<uint64_t>(&deadline_seconds)->default_value(120),
      "Per-call deadline for Verify")(
      "backoff-threshold",
      po::value<uint32_t>(&backoff_threshold)->default_value(3),
      "Consecutive in_progress outcomes before a program is backed off")(
      "max-backoff-runs",
      po::value<uint32_t>(&max_backoff_runs)->default_value(32),
      "Most passes a backed-off program is skipped")(
      "once", "Run a single pass and exit")(
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

  veribuild::common::configure_logging("crawler", log_file,
                                       vm.contains("verbose"));

  auto store = veribuild::storage::make_hash_store<
      veribuild::storage::sqlite_storage_tag>(database_path);
  auto intake = veribuild::intake::client{
      grpc::CreateChannel(intake_address, grpc::InsecureChannelCredentials()),
      std::chrono::seconds{deadline_seconds}};

  auto candidates = [&]() {
    auto known = std::vector<veribuild::schema::build_submission_t>{};
    try {
      for (const auto& request : store.list_build_requests()) {
        known.push_back(veribuild::crawler::to_submission(request));
      }
    } catch (const veribuild::storage::persistence_error& e) {
      spdlog::error("Cannot enumerate known programs: {}", e.what());
    }
    auto observed = watchlist_path.empty()
                        ? std::vector<veribuild::schema::build_submission_t>{}
                        : veribuild::crawler::load_watchlist(watchlist_path);
    return veribuild::crawler::merge_candidates(std::move(known), observed);
  };
  auto submit = [&](const veribuild::schema::build_submission_t& submission) {
    return intake.verify(submission, false);
  };

  auto crawler = veribuild::crawler::crawler{
      candidates, submit,
      veribuild::crawler::crawler_options{
          .backoff_threshold = backoff_threshold,
          .max_backoff_runs = max_backoff_runs,
          .pass_interval = std::chrono::seconds{interval_seconds}}};

  if (vm.contains("once")) {
    auto report = crawler.run_once();
    spdlog::shutdown();
    return report.unreachable == 0 ? 0 : 2;
  }

  spdlog::info("Crawling {} every {} s", intake_address, interval_seconds);
  crawler.run(shutdown_requested());
  spdlog::shutdown();
  return 0;
}
