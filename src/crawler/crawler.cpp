#include <spdlog/spdlog.h>
#include <veribuild/crawler/crawler.hpp>

#include <algorithm>
#include <fstream>
#include <set>
#include <sstream>
#include <thread>

namespace veribuild::crawler {

crawler::crawler(candidate_source_t candidates,
                 submit_fn_t submit,
                 crawler_options options)
    : candidates_{std::move(candidates)},
      submit_{std::move(submit)},
      options_{options} {}

uint32_t crawler::skip_remaining(const std::string& program_id) const {
  auto found = backoff_.find(program_id);
  return found == backoff_.end() ? 0 : found->second.skip_remaining;
}

void crawler::record_outcome(const std::string& program_id, bool in_progress) {
  if (!in_progress) {
    backoff_.erase(program_id);
    return;
  }
  auto& state = backoff_[program_id];
  ++state.consecutive_in_progress;
  if (state.consecutive_in_progress < options_.backoff_threshold) {
    return;
  }
  auto exponent = std::min<uint32_t>(
      state.consecutive_in_progress - options_.backoff_threshold, 31);
  state.skip_remaining = std::min<uint32_t>(uint32_t{1} << exponent,
                                            options_.max_backoff_runs);
  spdlog::info("{} stayed in progress {} times; skipping {} passes",
               program_id, state.consecutive_in_progress,
               state.skip_remaining);
}

crawl_report crawler::run_once() {
  auto report = crawl_report{};
  auto candidates = candidates_();
  report.candidates = candidates.size();

  for (const auto& candidate : candidates) {
    auto found = backoff_.find(candidate.program_id);
    if (found != backoff_.end() && found->second.skip_remaining > 0) {
      --found->second.skip_remaining;
      ++report.skipped;
      continue;
    }

    auto outcome = submit_(candidate);
    if (!outcome) {
      ++report.unreachable;
      spdlog::warn("Intake unreachable while submitting {}",
                   candidate.program_id);
      continue;
    }

    switch (outcome->status) {
      case veribuild::schema::submission_status_t::cached:
        ++report.cached;
        break;
      case veribuild::schema::submission_status_t::accepted:
        ++report.accepted;
        break;
      case veribuild::schema::submission_status_t::in_progress:
        ++report.in_progress;
        break;
      case veribuild::schema::submission_status_t::failed:
        ++report.failed;
        spdlog::warn("Submission of {} failed ({}): {}", candidate.program_id,
                     veribuild::schema::to_string(outcome->error),
                     outcome->message);
        break;
    }
    record_outcome(candidate.program_id,
                   outcome->status ==
                       veribuild::schema::submission_status_t::in_progress);
  }

  spdlog::info(
      "Crawl pass: {} candidates, {} cached, {} accepted, {} in progress, {} "
      "failed, {} unreachable, {} skipped",
      report.candidates, report.cached, report.accepted, report.in_progress,
      report.failed, report.unreachable, report.skipped);
  return report;
}

void crawler::run(const std::atomic<bool>& stop) {
  constexpr auto kStopCheck = std::chrono::milliseconds{200};
  while (!stop.load()) {
    run_once();
    auto next = std::chrono::steady_clock::now() + options_.pass_interval;
    while (!stop.load() && std::chrono::steady_clock::now() < next) {
      std::this_thread::sleep_for(kStopCheck);
    }
  }
}

veribuild::schema::build_submission_t to_submission(
    const veribuild::schema::build_request_t& request) {
  return veribuild::schema::build_submission_t{
      .program_id = request.program_id,
      .repository = request.repository,
      .commit_hash = request.commit_hash,
      .lib_name = request.lib_name,
      .base_image = request.base_image,
      .mount_path = request.mount_path,
      .cargo_args = request.build_args,
      .bpf_flag = request.bpf_flag};
}

std::vector<veribuild::schema::build_submission_t> parse_watchlist(
    std::istream& input) {
  auto submissions = std::vector<veribuild::schema::build_submission_t>{};
  auto line = std::string{};
  auto number = 0;
  while (std::getline(input, line)) {
    ++number;
    auto comment = line.find('#');
    if (comment != std::string::npos) {
      line.erase(comment);
    }
    auto fields = std::vector<std::string>{};
    auto stream = std::istringstream{line};
    for (auto field = std::string{}; stream >> field;) {
      fields.push_back(std::move(field));
    }
    if (fields.empty()) {
      continue;
    }
    if (fields.size() < 2 || fields.size() > 4) {
      spdlog::warn("Watchlist line {}: expected 'program_id repository "
                   "[commit_hash [lib_name]]'",
                   number);
      continue;
    }
    auto submission = veribuild::schema::build_submission_t{};
    submission.program_id = std::move(fields[0]);
    submission.repository = std::move(fields[1]);
    if (fields.size() > 2) {
      submission.commit_hash = std::move(fields[2]);
    }
    if (fields.size() > 3) {
      submission.lib_name = std::move(fields[3]);
    }
    submissions.push_back(std::move(submission));
  }
  return submissions;
}

std::vector<veribuild::schema::build_submission_t> load_watchlist(
    const std::filesystem::path& path) {
  auto file = std::ifstream{path};
  if (!file) {
    spdlog::warn("Cannot open watchlist {}", path.string());
    return {};
  }
  return parse_watchlist(file);
}

std::vector<veribuild::schema::build_submission_t> merge_candidates(
    std::vector<veribuild::schema::build_submission_t> primary,
    const std::vector<veribuild::schema::build_submission_t>& secondary) {
  auto seen = std::set<std::string>{};
  auto merged = std::vector<veribuild::schema::build_submission_t>{};
  merged.reserve(primary.size() + secondary.size());
  for (auto& candidate : primary) {
    if (seen.insert(candidate.program_id).second) {
      merged.push_back(std::move(candidate));
    }
  }
  for (const auto& candidate : secondary) {
    if (seen.insert(candidate.program_id).second) {
      merged.push_back(candidate);
    }
  }
  return merged;
}

}  // namespace veribuild::crawler
