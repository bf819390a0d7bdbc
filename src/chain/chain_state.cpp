#include <spdlog/spdlog.h>
#include <veribuild/build/process.hpp>
#include <veribuild/chain/chain_state.hpp>

#include <array>

namespace veribuild::chain {

namespace {

constexpr auto kMaxToolOutput = std::size_t{64 * 1024};

constexpr auto kNotFoundMarkers = std::array<std::string_view, 3>{
    "AccountNotFound", "not found", "Could not find"};

std::string_view trim(std::string_view value) {
  constexpr auto kWhitespace = std::string_view{" \t\r\n"};
  auto begin = value.find_first_not_of(kWhitespace);
  if (begin == std::string_view::npos) {
    return {};
  }
  auto end = value.find_last_not_of(kWhitespace);
  return value.substr(begin, end - begin + 1);
}

std::string_view last_line(std::string_view output) {
  output = trim(output);
  auto newline = output.rfind('\n');
  if (newline == std::string_view::npos) {
    return output;
  }
  return trim(output.substr(newline + 1));
}

bool mentions_missing_account(std::string_view output) {
  for (auto marker : kNotFoundMarkers) {
    if (output.find(marker) != std::string_view::npos) {
      return true;
    }
  }
  return false;
}

}  // namespace

chain_lookup_result parse_program_hash_output(int exit_code,
                                              std::string_view output) {
  if (exit_code == 0) {
    if (auto hash = veribuild::schema::try_normalize_digest(last_line(output))) {
      return *hash;
    }
  }
  if (mentions_missing_account(output)) {
    return lookup_failure{.error = lookup_error_t::not_found,
                          .message = std::string{last_line(output)}};
  }
  auto message = std::string{last_line(output)};
  if (message.empty()) {
    message = "exit code " + std::to_string(exit_code);
  }
  return lookup_failure{.error = lookup_error_t::unreachable,
                        .message = std::move(message)};
}

chain_lookup_t make_cli_chain_state(cli_chain_state_options options) {
  return [options = std::move(options)](
             std::string_view program_id) -> chain_lookup_result {
    auto result = veribuild::build::run_process(veribuild::build::process_options{
        .executable = options.solana_verify_binary,
        .arguments = {"get-program-hash", "-u", options.rpc_url,
                      std::string{program_id}},
        .working_directory = std::nullopt,
        .timeout = options.timeout,
        .max_output_bytes = kMaxToolOutput});
    if (result.launch_failed || result.timed_out || result.output_exceeded) {
      spdlog::warn("Chain lookup for {} failed: {}", program_id, result.error);
      return lookup_failure{.error = lookup_error_t::unreachable,
                            .message = result.error};
    }
    auto parsed = parse_program_hash_output(result.exit_code, result.output);
    if (auto* failure = std::get_if<lookup_failure>(&parsed)) {
      spdlog::debug("Chain lookup for {}: {}", program_id, failure->message);
    }
    return parsed;
  };
}

}  // namespace veribuild::chain
