#pragma once

#include <veribuild/chain/chain_state.hpp>
#include <veribuild/schema/pipeline_error.hpp>
#include <veribuild/schema/verification_result.hpp>
#include <veribuild/storage/sqlite/hash_store.hpp>
#include <string>
#include <string_view>
#include <variant>

namespace veribuild::verification {

using verify_outcome_t = std::variant<veribuild::schema::verification_result_t,
                                      veribuild::schema::pipeline_error_t>;

/// Compares a built executable hash with the deployed one and persists the
/// verdict together with the job status.
class verifier final {
 public:
  verifier(veribuild::chain::chain_lookup_t chain,
           veribuild::storage::sqlite_hash_store_t& store);

  /// Deployed hash, or chain_lookup_not_found / chain_lookup_unreachable.
  std::variant<std::string, veribuild::schema::pipeline_error_t> on_chain_hash(
      std::string_view program_id) const;

  /// Look up the deployed hash, compare by exact equality and write the
  /// result. Chain errors are returned without writing a result.
  verify_outcome_t verify(std::string_view program_id,
                          std::string_view executable_hash,
                          std::string_view job_token);

  /// Persist a not-verified result for a build whose runs disagreed. Like
  /// `verify`, a chain error is returned and nothing is written.
  verify_outcome_t record_non_deterministic(std::string_view program_id,
                                            std::string_view detail,
                                            std::string_view job_token);

 private:
  verify_outcome_t persist(veribuild::schema::verification_result_t result,
                           std::string_view job_token);

  veribuild::chain::chain_lookup_t chain_;
  veribuild::storage::sqlite_hash_store_t& store_;
};

veribuild::schema::pipeline_error_t to_pipeline_error(
    const veribuild::chain::lookup_failure& failure);

veribuild::schema::pipeline_error_t to_pipeline_error(
    const veribuild::storage::persistence_error& error);

}  // namespace veribuild::verification
