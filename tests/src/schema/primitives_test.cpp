#include <veribuild/schema/error_code.hpp>
#include <veribuild/schema/failure_reason.hpp>
#include <veribuild/schema/job_state.hpp>
#include <veribuild/schema/job_status.hpp>
#include <veribuild/schema/primitives.hpp>
#include <veribuild/schema/submission_status.hpp>
#include <veribuild/schema/verification_reason.hpp>
#include <veribuild/testing/common.hpp>
#include <gtest/gtest.h>

#include <set>
#include <string>

TEST(schema_types, hex_encodes_lowercase_and_decodes_any_case) {
  auto bytes = veribuild::schema::bytes_t{0x00, 0xAB, 0x7f, 0xff};
  EXPECT_EQ(veribuild::schema::to_hex(veribuild::schema::make_bytes_view(bytes)),
            "00ab7fff");

  auto decoded = veribuild::schema::try_from_hex("0x00AB7fFF");
  ASSERT_TRUE(decoded.has_value());
  EXPECT_EQ(*decoded, bytes);

  EXPECT_FALSE(veribuild::schema::try_from_hex("abc").has_value());
  EXPECT_FALSE(veribuild::schema::try_from_hex("zz").has_value());
}

TEST(schema_types, normalize_digest_requires_thirty_two_bytes) {
  auto upper = std::string(64, 'A');
  auto normalized = veribuild::schema::try_normalize_digest("0x" + upper);
  ASSERT_TRUE(normalized.has_value());
  EXPECT_EQ(*normalized, std::string(64, 'a'));

  EXPECT_FALSE(
      veribuild::schema::try_normalize_digest(std::string(62, 'a')).has_value());
  EXPECT_FALSE(
      veribuild::schema::try_normalize_digest(std::string(66, 'a')).has_value());
  EXPECT_FALSE(
      veribuild::schema::try_normalize_digest(std::string(64, 'g')).has_value());
}

TEST(schema_types, tokens_are_unique_uuids) {
  auto seen = std::set<std::string>{};
  for (auto i = 0; i < 64; ++i) {
    auto token = veribuild::schema::make_token();
    EXPECT_EQ(token.size(), 36u);
    EXPECT_TRUE(seen.insert(token).second);
  }
}

TEST(schema_types, milliseconds_follow_the_system_clock) {
  auto point = std::chrono::system_clock::time_point{
      std::chrono::milliseconds{1'700'000'000'123}};
  EXPECT_EQ(veribuild::schema::to_milliseconds(point), 1'700'000'000'123u);
  EXPECT_GT(veribuild::schema::now_milliseconds(), 1'700'000'000'000u);
}

TEST(schema_types, enum_names_round_trip_through_their_tables) {
  for (const auto& [name, value] : veribuild::schema::kJobStatusNames) {
    EXPECT_EQ(veribuild::schema::to_string(value), name);
    EXPECT_EQ(veribuild::schema::try_from_string<
                  veribuild::schema::job_status_t>(name),
              value);
  }
  for (const auto& [name, value] : veribuild::schema::kFailureReasonNames) {
    EXPECT_EQ(veribuild::schema::try_from_string<
                  veribuild::schema::failure_reason_t>(name),
              value);
  }
  EXPECT_EQ(veribuild::schema::to_string(
                veribuild::schema::error_code_t::duplicate_in_progress),
            "duplicate_in_progress");
  EXPECT_EQ(veribuild::schema::to_string(
                veribuild::schema::verification_reason_t::non_deterministic_build),
            "non_deterministic_build");
  EXPECT_EQ(veribuild::schema::to_string(
                veribuild::schema::submission_status_t::in_progress),
            "in_progress");
  EXPECT_EQ(veribuild::schema::to_string(veribuild::schema::job_state_t::verifying),
            "verifying");
  EXPECT_FALSE(veribuild::schema::try_from_string<
                   veribuild::schema::job_status_t>("done")
                   .has_value());
}

TEST(schema_types, terminal_job_statuses) {
  EXPECT_FALSE(veribuild::schema::is_terminal(veribuild::schema::job_status_t::pending));
  EXPECT_FALSE(veribuild::schema::is_terminal(veribuild::schema::job_status_t::building));
  EXPECT_TRUE(veribuild::schema::is_terminal(veribuild::schema::job_status_t::verified));
  EXPECT_TRUE(veribuild::schema::is_terminal(veribuild::schema::job_status_t::not_verified));
  EXPECT_TRUE(veribuild::schema::is_terminal(veribuild::schema::job_status_t::failed));
}

TEST(schema_types, same_build_parameters_ignores_created_at) {
  auto lhs = veribuild::testing::make_request("Prog111");
  auto rhs = lhs;
  rhs.created_at += 5000;
  EXPECT_TRUE(veribuild::schema::same_build_parameters(lhs, rhs));

  rhs.build_args.push_back("--features=mainnet");
  EXPECT_FALSE(veribuild::schema::same_build_parameters(lhs, rhs));

  rhs = lhs;
  rhs.commit_hash = "abcdef";
  EXPECT_FALSE(veribuild::schema::same_build_parameters(lhs, rhs));
}
