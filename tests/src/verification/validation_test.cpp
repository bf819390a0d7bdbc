#include <veribuild/verification/validation.hpp>
#include <veribuild/testing/pipeline_harness.hpp>
#include <gtest/gtest.h>

#include <string>

namespace {

using veribuild::verification::validate_submission;

std::optional<veribuild::schema::pipeline_error_t> rejection(
    const veribuild::schema::build_submission_t& submission) {
  auto validated = validate_submission(
      submission, veribuild::verification::submission_defaults{}, 1);
  if (auto* error = std::get_if<veribuild::schema::pipeline_error_t>(&validated)) {
    return *error;
  }
  return std::nullopt;
}

}  // namespace

TEST(validation, defaults_fill_image_and_mount_path) {
  auto submission = veribuild::testing::make_submission(
      "4Nd1mBQtrMJVYVfKf2PJy9NZUZdTAsp7D4xWLs4gDB4T",
      "github.com/example/program");
  submission.commit_hash = "a1b2c3d";
  submission.lib_name = "my-program";
  submission.cargo_args = {"--features", "mainnet"};

  auto validated = validate_submission(
      submission,
      veribuild::verification::submission_defaults{.base_image = "custom:1",
                                                   .mount_path = "/src"},
      1'700'000'000'000);
  ASSERT_TRUE(std::holds_alternative<veribuild::schema::build_request_t>(validated));
  auto& request = std::get<veribuild::schema::build_request_t>(validated);
  EXPECT_EQ(request.repository, "https://github.com/example/program");
  EXPECT_EQ(request.base_image, "custom:1");
  EXPECT_EQ(request.mount_path, "/src");
  EXPECT_EQ(request.commit_hash, std::optional<std::string>{"a1b2c3d"});
  EXPECT_EQ(request.build_args,
            (std::vector<std::string>{"--features", "mainnet"}));
  EXPECT_EQ(request.created_at, 1'700'000'000'000u);

  submission.base_image = "ellipsislabs/solana:1.18.26";
  submission.mount_path = "/workspace/program";
  auto explicit_values = validate_submission(
      submission, veribuild::verification::submission_defaults{}, 1);
  auto& overridden = std::get<veribuild::schema::build_request_t>(explicit_values);
  EXPECT_EQ(overridden.base_image, "ellipsislabs/solana:1.18.26");
  EXPECT_EQ(overridden.mount_path, "/workspace/program");
}

TEST(validation, rejects_malformed_identifiers) {
  // 0, O, I and l are outside the base58 alphabet.
  EXPECT_TRUE(rejection(veribuild::testing::make_submission("Prog0")));
  EXPECT_TRUE(rejection(veribuild::testing::make_submission("")));
  EXPECT_TRUE(rejection(veribuild::testing::make_submission(std::string(45, 'A'))));
  EXPECT_FALSE(rejection(veribuild::testing::make_submission(std::string(44, 'A'))));

  auto submission = veribuild::testing::make_submission("Prog111");
  submission.commit_hash = "xyz";
  auto error = rejection(submission);
  ASSERT_TRUE(error.has_value());
  EXPECT_EQ(error->code, veribuild::schema::error_code_t::validation_error);
  EXPECT_FALSE(error->retryable);

  submission.commit_hash = "abc";
  EXPECT_TRUE(rejection(submission));
  submission.commit_hash.reset();
  submission.lib_name = "../evil";
  EXPECT_TRUE(rejection(submission));
}

TEST(validation, repositories_must_be_remote_urls) {
  using veribuild::verification::normalize_repository;
  EXPECT_EQ(normalize_repository("https://github.com/a/b"),
            std::optional<std::string>{"https://github.com/a/b"});
  EXPECT_EQ(normalize_repository("ssh://git@github.com/a/b.git"),
            std::optional<std::string>{"ssh://git@github.com/a/b.git"});
  EXPECT_EQ(normalize_repository("gitlab.com/a/b"),
            std::optional<std::string>{"https://gitlab.com/a/b"});

  EXPECT_FALSE(normalize_repository("file:///etc").has_value());
  EXPECT_FALSE(normalize_repository("/home/user/repo").has_value());
  EXPECT_FALSE(normalize_repository("--upload-pack=touch").has_value());
  EXPECT_FALSE(normalize_repository("https://").has_value());
  EXPECT_FALSE(normalize_repository("https://host/a b").has_value());
  EXPECT_FALSE(normalize_repository("localhost/a").has_value());
  EXPECT_FALSE(normalize_repository("").has_value());
}

TEST(validation, container_parameters_are_checked) {
  EXPECT_TRUE(veribuild::verification::is_valid_image_reference(
      "registry.example.com:5000/team/solana@sha256:abc"));
  EXPECT_FALSE(veribuild::verification::is_valid_image_reference("-v"));
  EXPECT_FALSE(veribuild::verification::is_valid_image_reference("img name"));

  EXPECT_TRUE(veribuild::verification::is_valid_mount_path("/build"));
  EXPECT_FALSE(veribuild::verification::is_valid_mount_path("build"));
  EXPECT_FALSE(veribuild::verification::is_valid_mount_path("/build/../etc"));
  EXPECT_FALSE(veribuild::verification::is_valid_mount_path("/a:/b"));

  auto submission = veribuild::testing::make_submission("Prog111");
  submission.cargo_args = std::vector<std::string>(
      veribuild::verification::kMaxBuildArgs + 1, "--locked");
  EXPECT_TRUE(rejection(submission));
  submission.cargo_args = {"--features\nmainnet"};
  EXPECT_TRUE(rejection(submission));
  submission.cargo_args = {"--features", "a b"};
  EXPECT_FALSE(rejection(submission));
}
