#include <spdlog/spdlog.h>
#include <veribuild/verification/verifier.hpp>

namespace veribuild::verification {

veribuild::schema::pipeline_error_t to_pipeline_error(
    const veribuild::chain::lookup_failure& failure) {
  if (failure.error == veribuild::chain::lookup_error_t::not_found) {
    return veribuild::schema::pipeline_error_t{
        .code = veribuild::schema::error_code_t::chain_lookup_not_found,
        .reason = veribuild::schema::failure_reason_t::program_not_found,
        .retryable = false,
        .message = "program not found on chain: " + failure.message};
  }
  return veribuild::schema::pipeline_error_t{
      .code = veribuild::schema::error_code_t::chain_lookup_unreachable,
      .reason = veribuild::schema::failure_reason_t::chain_unreachable,
      .retryable = true,
      .message = "chain state unreachable: " + failure.message};
}

veribuild::schema::pipeline_error_t to_pipeline_error(
    const veribuild::storage::persistence_error& error) {
  return veribuild::schema::pipeline_error_t{
      .code = veribuild::schema::error_code_t::persistence_error,
      .reason = std::nullopt,
      .retryable = error.error_kind() ==
                   veribuild::storage::persistence_error::kind::unavailable,
      .message = error.what()};
}

verifier::verifier(veribuild::chain::chain_lookup_t chain,
                   veribuild::storage::sqlite_hash_store_t& store)
    : chain_{std::move(chain)}, store_{store} {}

std::variant<std::string, veribuild::schema::pipeline_error_t>
verifier::on_chain_hash(std::string_view program_id) const {
  auto lookup = chain_(program_id);
  if (auto* failure = std::get_if<veribuild::chain::lookup_failure>(&lookup)) {
    return to_pipeline_error(*failure);
  }
  return std::get<std::string>(std::move(lookup));
}

verify_outcome_t verifier::verify(std::string_view program_id,
                                  std::string_view executable_hash,
                                  std::string_view job_token) {
  auto deployed = on_chain_hash(program_id);
  if (auto* error = std::get_if<veribuild::schema::pipeline_error_t>(&deployed)) {
    return *error;
  }
  auto on_chain = std::get<std::string>(std::move(deployed));
  auto matched = on_chain == executable_hash;

  spdlog::info("{}: executable {} on-chain {} -> {}", program_id,
               executable_hash, on_chain, matched ? "verified" : "mismatch");

  return persist(
      veribuild::schema::verification_result_t{
          .program_id = std::string{program_id},
          .is_verified = matched,
          .on_chain_hash = std::move(on_chain),
          .executable_hash = std::string{executable_hash},
          .reason = matched
                        ? veribuild::schema::verification_reason_t::matched
                        : veribuild::schema::verification_reason_t::hash_mismatch,
          .verified_at = veribuild::schema::now_milliseconds()},
      job_token);
}

verify_outcome_t verifier::record_non_deterministic(
    std::string_view program_id,
    std::string_view detail,
    std::string_view job_token) {
  auto deployed = on_chain_hash(program_id);
  if (auto* error = std::get_if<veribuild::schema::pipeline_error_t>(&deployed)) {
    return *error;
  }
  auto on_chain = std::get<std::string>(std::move(deployed));
  spdlog::warn("{}: build is not reproducible ({})", program_id, detail);

  return persist(
      veribuild::schema::verification_result_t{
          .program_id = std::string{program_id},
          .is_verified = false,
          .on_chain_hash = std::move(on_chain),
          .executable_hash = {},
          .reason =
              veribuild::schema::verification_reason_t::non_deterministic_build,
          .verified_at = veribuild::schema::now_milliseconds()},
      job_token);
}

verify_outcome_t verifier::persist(
    veribuild::schema::verification_result_t result,
    std::string_view job_token) {
  try {
    store_.record_verification(result, job_token);
  } catch (const veribuild::storage::persistence_error& e) {
    spdlog::error("Failed to record result for {}: {}", result.program_id,
                  e.what());
    return to_pipeline_error(e);
  }
  return result;
}

}  // namespace veribuild::verification
