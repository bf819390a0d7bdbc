#include <spdlog/spdlog.h>
#include <unistd.h>
#include <veribuild/build/executor.hpp>
#include <veribuild/crypto/digest.hpp>
#include <veribuild/schema/primitives.hpp>

#include <algorithm>
#include <fstream>
#include <iterator>
#include <system_error>

namespace veribuild::build {

namespace {

/// Removes a job's working directory when the job ends, however it ends.
struct scoped_directory final {
  std::filesystem::path path;

  explicit scoped_directory(std::filesystem::path directory)
      : path{std::move(directory)} {}
  scoped_directory(const scoped_directory&) = delete;
  scoped_directory& operator=(const scoped_directory&) = delete;

  ~scoped_directory() {
    auto error = std::error_code{};
    std::filesystem::remove_all(path, error);
    if (error) {
      spdlog::warn("Failed to remove working directory {}: {}", path.string(),
                   error.message());
    }
  }
};

veribuild::schema::build_error_t make_error(
    veribuild::schema::failure_reason_t reason,
    std::string detail,
    std::string log_excerpt = {},
    bool retryable = false) {
  return veribuild::schema::build_error_t{.reason = reason,
                                          .retryable = retryable,
                                          .detail = std::move(detail),
                                          .log_excerpt = std::move(log_excerpt)};
}

std::string describe_exit(const process_result& result) {
  if (!result.error.empty()) {
    return result.error;
  }
  return "exit code " + std::to_string(result.exit_code);
}

}  // namespace

executor::executor(container_runtime& runtime, executor_options options)
    : runtime_{runtime}, options_{std::move(options)} {}

const executor_options& executor::options() const {
  return options_;
}

veribuild::schema::build_outcome_t executor::run(
    const veribuild::schema::build_request_t& request) {
  auto job_directory = scoped_directory{
      options_.work_root / (std::to_string(::getpid()) + "-" +
                            veribuild::schema::make_token())};
  auto error = std::error_code{};
  std::filesystem::create_directories(job_directory.path, error);
  if (error) {
    return make_error(veribuild::schema::failure_reason_t::internal_error,
                      "cannot create working directory " +
                          job_directory.path.string() + ": " + error.message(),
                      {}, true);
  }

  auto runs = std::max<uint32_t>(options_.reproducibility_runs, 1);
  auto first = std::optional<veribuild::schema::build_output_t>{};
  for (auto run = uint32_t{}; run < runs; ++run) {
    // Each run gets a fresh checkout so no artifact of a previous run can
    // leak into the next.
    auto source = job_directory.path / ("run-" + std::to_string(run));
    if (auto failure = checkout(request, source)) {
      return *failure;
    }

    spdlog::info("Building {} (run {}/{})", request.program_id, run + 1, runs);
    auto outcome = build_once(request, source);
    if (auto* failure = std::get_if<veribuild::schema::build_error_t>(&outcome)) {
      return *failure;
    }
    auto& output = std::get<veribuild::schema::build_output_t>(outcome);
    if (!first) {
      first = std::move(output);
      continue;
    }
    if (output.executable_hash != first->executable_hash) {
      return make_error(
          veribuild::schema::failure_reason_t::non_deterministic,
          "run 1 produced " + first->executable_hash + ", run " +
              std::to_string(run + 1) + " produced " + output.executable_hash,
          output.log_excerpt);
    }
  }
  return *first;
}

std::optional<veribuild::schema::build_error_t> executor::checkout(
    const veribuild::schema::build_request_t& request,
    const std::filesystem::path& directory) {
  auto git = [&](std::vector<std::string> arguments) {
    return run_process(process_options{
        .executable = options_.git_binary,
        .arguments = std::move(arguments),
        .working_directory = std::nullopt,
        .timeout = options_.checkout_timeout,
        .max_output_bytes = options_.max_log_bytes});
  };
  auto failed = [&](const process_result& result, std::string step)
      -> veribuild::schema::build_error_t {
    if (result.launch_failed) {
      return make_error(veribuild::schema::failure_reason_t::internal_error,
                        step + ": " + result.error, {}, true);
    }
    return make_error(veribuild::schema::failure_reason_t::checkout_failed,
                      step + ": " + describe_exit(result),
                      tail_excerpt(result.output, options_.log_excerpt_bytes));
  };

  // Repository hooks never run on the build host.
  auto clone = git({"-c", "core.hooksPath=/dev/null", "clone", "--quiet", "--",
                    request.repository, directory.string()});
  if (!clone.succeeded()) {
    return failed(clone, "clone " + request.repository);
  }

  if (request.commit_hash) {
    auto pin = git({"-C", directory.string(), "-c", "core.hooksPath=/dev/null",
                    "checkout", "--quiet", "--detach", *request.commit_hash});
    if (!pin.succeeded()) {
      return failed(pin, "checkout " + *request.commit_hash);
    }
  }
  return std::nullopt;
}

veribuild::schema::build_outcome_t executor::build_once(
    const veribuild::schema::build_request_t& request,
    const std::filesystem::path& directory) {
  auto result = runtime_.run(container_run_t{
      .image = request.base_image,
      .host_directory = std::filesystem::absolute(directory).string(),
      .mount_path = request.mount_path,
      .command = make_build_command(request),
      .timeout = options_.build_timeout,
      .max_output_bytes = options_.max_log_bytes});
  auto excerpt = tail_excerpt(result.output, options_.log_excerpt_bytes);

  if (result.launch_failed) {
    return make_error(veribuild::schema::failure_reason_t::resource_exhausted,
                      "container runtime unavailable: " + result.error,
                      excerpt, true);
  }
  if (result.timed_out) {
    return make_error(veribuild::schema::failure_reason_t::timeout,
                      "build exceeded " +
                          std::to_string(options_.build_timeout.count()) +
                          " ms",
                      excerpt);
  }
  if (result.output_exceeded) {
    return make_error(veribuild::schema::failure_reason_t::output_limit,
                      "build log exceeded " +
                          std::to_string(options_.max_log_bytes) + " bytes",
                      excerpt);
  }
  if (result.exit_code == kContainerRuntimeFailure) {
    return make_error(veribuild::schema::failure_reason_t::resource_exhausted,
                      "container could not be created", excerpt, true);
  }
  if (result.exit_code != 0) {
    return make_error(veribuild::schema::failure_reason_t::toolchain_failed,
                      "build " + describe_exit(result), excerpt);
  }

  auto located = locate_executable(directory, request.lib_name);
  if (auto* failure = std::get_if<veribuild::schema::build_error_t>(&located)) {
    failure->log_excerpt = excerpt;
    return *failure;
  }
  auto hashed = hash_executable(std::get<std::filesystem::path>(located),
                                options_.max_executable_bytes);
  if (auto* failure = std::get_if<veribuild::schema::build_error_t>(&hashed)) {
    failure->log_excerpt = excerpt;
    return *failure;
  }

  return veribuild::schema::build_output_t{
      .executable_hash = std::get<std::string>(std::move(hashed)),
      .exit_code = result.exit_code,
      .log_excerpt = std::move(excerpt)};
}

std::vector<std::string> make_build_command(
    const veribuild::schema::build_request_t& request) {
  auto command = std::vector<std::string>{
      "cargo", request.bpf_flag ? "build-bpf" : "build-sbf"};
  if (!request.build_args.empty()) {
    command.emplace_back("--");
    command.insert(command.end(), request.build_args.begin(),
                   request.build_args.end());
  }
  return command;
}

std::variant<std::filesystem::path, veribuild::schema::build_error_t>
locate_executable(const std::filesystem::path& checkout,
                  const std::optional<std::string>& lib_name) {
  auto deploy = checkout / "target" / "deploy";
  auto error = std::error_code{};

  if (lib_name) {
    auto file_name = *lib_name;
    std::replace(file_name.begin(), file_name.end(), '-', '_');
    auto path = deploy / (file_name + ".so");
    if (!std::filesystem::is_regular_file(path, error)) {
      return make_error(veribuild::schema::failure_reason_t::executable_missing,
                        "no " + file_name + ".so in target/deploy");
    }
    return path;
  }

  auto found = std::vector<std::filesystem::path>{};
  auto iterator = std::filesystem::directory_iterator{deploy, error};
  if (error) {
    return make_error(veribuild::schema::failure_reason_t::executable_missing,
                      "target/deploy was not produced");
  }
  for (const auto& entry : iterator) {
    if (entry.path().extension() == ".so" && entry.is_regular_file(error)) {
      found.push_back(entry.path());
    }
  }
  if (found.size() != 1) {
    return make_error(
        veribuild::schema::failure_reason_t::executable_missing,
        found.empty()
            ? std::string{"no .so in target/deploy"}
            : std::to_string(found.size()) +
                  " executables in target/deploy; set lib_name to choose one");
  }
  return found.front();
}

std::variant<std::string, veribuild::schema::build_error_t> hash_executable(
    const std::filesystem::path& path,
    std::size_t max_bytes) {
  auto error = std::error_code{};
  auto size = std::filesystem::file_size(path, error);
  if (error) {
    return make_error(veribuild::schema::failure_reason_t::executable_missing,
                      "cannot stat " + path.filename().string() + ": " +
                          error.message());
  }
  if (size > max_bytes) {
    return make_error(veribuild::schema::failure_reason_t::output_limit,
                      path.filename().string() + " is " +
                          std::to_string(size) + " bytes, above the " +
                          std::to_string(max_bytes) + " byte ceiling");
  }

  auto file = std::ifstream{path, std::ios::binary};
  if (!file) {
    return make_error(veribuild::schema::failure_reason_t::executable_missing,
                      "cannot read " + path.filename().string());
  }
  auto bytes = veribuild::schema::bytes_t(std::istreambuf_iterator<char>{file},
                                          std::istreambuf_iterator<char>{});
  return veribuild::crypto::executable_hash(
      veribuild::schema::bytes_view_t{bytes.data(), bytes.size()});
}

}  // namespace veribuild::build
