#pragma once

#include <veribuild/schema/build_request.hpp>
#include <veribuild/schema/build_submission.hpp>
#include <veribuild/schema/submission_result.hpp>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <istream>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace veribuild::crawler {

/// Everything worth (re-)checking on this pass.
using candidate_source_t =
    std::function<std::vector<veribuild::schema::build_submission_t>()>;

/// Submit through the public intake. nullopt when the intake could not be
/// reached at all.
using submit_fn_t = std::function<
    std::optional<veribuild::schema::submission_result_t>(
        const veribuild::schema::build_submission_t&)>;

struct crawler_options final {
  /// Consecutive in_progress outcomes before a program is backed off.
  uint32_t backoff_threshold{3};
  /// Upper bound on the number of passes a program is skipped.
  uint32_t max_backoff_runs{32};
  std::chrono::milliseconds pass_interval{std::chrono::minutes{10}};
};

struct crawl_report final {
  std::size_t candidates{};
  std::size_t cached{};
  std::size_t accepted{};
  std::size_t in_progress{};
  std::size_t failed{};
  std::size_t unreachable{};
  std::size_t skipped{};
};

/// Periodically re-submits known programs and newly observed ones so
/// deployed changes are detected without manual submissions.
class crawler final {
 public:
  crawler(candidate_source_t candidates,
          submit_fn_t submit,
          crawler_options options);

  /// One pass over every candidate. A failed submission never aborts it.
  crawl_report run_once();

  /// Pass after pass until `stop` is set.
  void run(const std::atomic<bool>& stop);

  /// Passes `program_id` will still be skipped for.
  uint32_t skip_remaining(const std::string& program_id) const;

 private:
  struct backoff_state final {
    uint32_t consecutive_in_progress{};
    uint32_t skip_remaining{};
  };

  void record_outcome(const std::string& program_id, bool in_progress);

  candidate_source_t candidates_;
  submit_fn_t submit_;
  crawler_options options_;
  std::map<std::string, backoff_state> backoff_;
};

/// Re-submission parameters for a stored request.
veribuild::schema::build_submission_t to_submission(
    const veribuild::schema::build_request_t& request);

/// `program_id repository [commit_hash [lib_name]]` per line; blank lines
/// and `#` comments are ignored, malformed lines are logged and skipped.
std::vector<veribuild::schema::build_submission_t> parse_watchlist(
    std::istream& input);

std::vector<veribuild::schema::build_submission_t> load_watchlist(
    const std::filesystem::path& path);

/// Concatenate sources keeping the first occurrence of each program id.
std::vector<veribuild::schema::build_submission_t> merge_candidates(
    std::vector<veribuild::schema::build_submission_t> primary,
    const std::vector<veribuild::schema::build_submission_t>& secondary);

}  // namespace veribuild::crawler
