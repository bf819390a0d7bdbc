#pragma once
#include <veribuild/schema/primitives.hpp>
#include <veribuild/schema/verification_reason.hpp>
#include <string>

namespace veribuild::schema {

template <uint16_t Version>
struct verification_result;

template <>
struct verification_result<1> final {
  program_id_t program_id;
  bool is_verified{};
  std::string on_chain_hash;
  std::string executable_hash;
  verification_reason_t reason{verification_reason_t::hash_mismatch};
  timestamp_milliseconds_t verified_at{};
};

using verification_result_t = verification_result<1>;

}  // namespace veribuild::schema
