#include <veribuild/verification/validation.hpp>

#include <algorithm>
#include <array>

namespace veribuild::verification {

namespace {

constexpr auto kBase58Alphabet = std::string_view{
    "123456789ABCDEFGHJKLMNPQRSTUVWXYZabcdefghijkmnopqrstuvwxyz"};

constexpr auto kUrlSchemes = std::array<std::string_view, 4>{
    "https://", "http://", "ssh://", "git://"};

bool is_control(char c) {
  auto byte = static_cast<unsigned char>(c);
  return byte < 0x20 || byte == 0x7f;
}

bool is_space_or_control(char c) {
  return c == ' ' || is_control(c);
}

bool is_alnum(char c) {
  return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
         (c >= '0' && c <= '9');
}

bool is_hex(char c) {
  return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f') ||
         (c >= 'A' && c <= 'F');
}

bool has_dotdot_component(std::string_view path) {
  while (!path.empty()) {
    auto slash = path.find('/');
    auto component = path.substr(0, slash);
    if (component == "..") {
      return true;
    }
    if (slash == std::string_view::npos) {
      break;
    }
    path.remove_prefix(slash + 1);
  }
  return false;
}

veribuild::schema::pipeline_error_t invalid(std::string message) {
  return veribuild::schema::pipeline_error_t{
      .code = veribuild::schema::error_code_t::validation_error,
      .reason = std::nullopt,
      .retryable = false,
      .message = std::move(message)};
}

}  // namespace

bool is_valid_program_id(std::string_view program_id) {
  if (program_id.empty() || program_id.size() > kMaxProgramIdLength) {
    return false;
  }
  return std::all_of(program_id.begin(), program_id.end(), [](char c) {
    return kBase58Alphabet.find(c) != std::string_view::npos;
  });
}

bool is_valid_commit_hash(std::string_view commit_hash) {
  if (commit_hash.size() < 4 || commit_hash.size() > 64) {
    return false;
  }
  return std::all_of(commit_hash.begin(), commit_hash.end(), is_hex);
}

bool is_valid_lib_name(std::string_view lib_name) {
  if (lib_name.empty() || lib_name.size() > kMaxLibNameLength) {
    return false;
  }
  return std::all_of(lib_name.begin(), lib_name.end(), [](char c) {
    return is_alnum(c) || c == '_' || c == '-';
  });
}

bool is_valid_image_reference(std::string_view image) {
  if (image.empty() || image.size() > 255 || image.front() == '-') {
    return false;
  }
  return std::all_of(image.begin(), image.end(), [](char c) {
    return is_alnum(c) || c == '.' || c == '_' || c == '-' || c == '/' ||
           c == ':' || c == '@';
  });
}

bool is_valid_mount_path(std::string_view mount_path) {
  if (mount_path.empty() || mount_path.front() != '/' ||
      mount_path.size() > 255) {
    return false;
  }
  if (std::any_of(mount_path.begin(), mount_path.end(), is_space_or_control) ||
      mount_path.find(':') != std::string_view::npos) {
    return false;
  }
  return !has_dotdot_component(mount_path);
}

bool is_valid_build_arg(std::string_view argument) {
  if (argument.empty() || argument.size() > kMaxBuildArgLength) {
    return false;
  }
  return std::none_of(argument.begin(), argument.end(), is_control);
}

std::optional<std::string> normalize_repository(std::string_view repository) {
  if (repository.empty() || repository.size() > 2048 ||
      repository.front() == '-') {
    return std::nullopt;
  }
  if (std::any_of(repository.begin(), repository.end(), is_space_or_control)) {
    return std::nullopt;
  }

  for (auto scheme : kUrlSchemes) {
    if (repository.starts_with(scheme)) {
      if (repository.size() == scheme.size()) {
        return std::nullopt;
      }
      return std::string{repository};
    }
  }
  if (repository.find("://") != std::string_view::npos) {
    // file:// and anything else git would treat as a transport.
    return std::nullopt;
  }

  // Bare `host.tld/owner/repo`.
  auto slash = repository.find('/');
  if (slash == std::string_view::npos || slash == 0 ||
      slash + 1 == repository.size()) {
    return std::nullopt;
  }
  auto host = repository.substr(0, slash);
  if (host.find('.') == std::string_view::npos || host.front() == '.' ||
      host.find(':') != std::string_view::npos) {
    return std::nullopt;
  }
  return "https://" + std::string{repository};
}

std::variant<veribuild::schema::build_request_t,
             veribuild::schema::pipeline_error_t>
validate_submission(const veribuild::schema::build_submission_t& submission,
                    const submission_defaults& defaults,
                    veribuild::schema::timestamp_milliseconds_t now) {
  if (!is_valid_program_id(submission.program_id)) {
    return invalid("program_id must be 1-44 base58 characters");
  }
  auto repository = normalize_repository(submission.repository);
  if (!repository) {
    return invalid("repository must be an http(s), ssh or git URL");
  }
  if (submission.commit_hash &&
      !is_valid_commit_hash(*submission.commit_hash)) {
    return invalid("commit_hash must be 4-64 hexadecimal characters");
  }
  if (submission.lib_name && !is_valid_lib_name(*submission.lib_name)) {
    return invalid("lib_name may only contain letters, digits, '_' and '-'");
  }

  auto base_image = submission.base_image.value_or(defaults.base_image);
  if (!is_valid_image_reference(base_image)) {
    return invalid("base_image is not a valid image reference");
  }
  auto mount_path = submission.mount_path.value_or(defaults.mount_path);
  if (!is_valid_mount_path(mount_path)) {
    return invalid("mount_path must be an absolute path without '..'");
  }

  if (submission.cargo_args.size() > kMaxBuildArgs) {
    return invalid("at most " + std::to_string(kMaxBuildArgs) +
                   " cargo_args are accepted");
  }
  for (const auto& argument : submission.cargo_args) {
    if (!is_valid_build_arg(argument)) {
      return invalid("cargo_args entries must be 1-" +
                     std::to_string(kMaxBuildArgLength) +
                     " bytes without control characters");
    }
  }

  return veribuild::schema::build_request_t{
      .program_id = submission.program_id,
      .repository = std::move(*repository),
      .commit_hash = submission.commit_hash,
      .lib_name = submission.lib_name,
      .base_image = std::move(base_image),
      .mount_path = std::move(mount_path),
      .build_args = submission.cargo_args,
      .bpf_flag = submission.bpf_flag,
      .created_at = now};
}

}  // namespace veribuild::verification
