#pragma once

#include <veribuild/schema/primitives.hpp>
#include <chrono>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <variant>

namespace veribuild::chain {

enum class lookup_error_t : uint8_t {
  not_found = 1,    // no such program; terminal
  unreachable = 2,  // RPC or tooling failure; retryable
};

struct lookup_failure final {
  lookup_error_t error{lookup_error_t::unreachable};
  std::string message;
};

/// Deployed content hash (lowercase hex) or why it could not be read.
using chain_lookup_result = std::variant<std::string, lookup_failure>;

/// Read-only chain-state collaborator. Must be safe to call from several
/// threads at once.
using chain_lookup_t =
    std::function<chain_lookup_result(std::string_view program_id)>;

struct cli_chain_state_options final {
  std::string solana_verify_binary{"solana-verify"};
  std::string rpc_url{"https://api.mainnet-beta.solana.com"};
  std::chrono::milliseconds timeout{std::chrono::seconds{60}};
};

/// Chain lookup through `solana-verify get-program-hash`, which applies the
/// same trailing-zero trimming and SHA-256 as the build side.
chain_lookup_t make_cli_chain_state(cli_chain_state_options options);

/// Interpret the tool's output: the hash is the last non-empty line.
chain_lookup_result parse_program_hash_output(int exit_code,
                                              std::string_view output);

}  // namespace veribuild::chain
