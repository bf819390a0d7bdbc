#include <spdlog/spdlog.h>
#include <veribuild/build/container_runtime.hpp>
#include <veribuild/schema/primitives.hpp>

namespace veribuild::build {

container_runtime::container_runtime(std::string docker_binary,
                                     container_limits limits)
    : docker_binary_{std::move(docker_binary)}, limits_{std::move(limits)} {}

const std::string& container_runtime::docker_binary() const {
  return docker_binary_;
}

std::vector<std::string> container_runtime::run_arguments(
    const container_run_t& run,
    std::string_view name) const {
  auto arguments = std::vector<std::string>{
      "run",
      "--rm",
      "--name",
      std::string{name},
      "--network",
      limits_.network,
      "--memory",
      limits_.memory,
      "--memory-swap",
      limits_.memory,
      "--cpus",
      limits_.cpus,
      "--pids-limit",
      std::to_string(limits_.pids),
      "--security-opt",
      "no-new-privileges",
      "--cap-drop",
      "ALL",
      "-v",
      run.host_directory + ":" + run.mount_path,
      "-w",
      run.mount_path,
      run.image};
  arguments.insert(arguments.end(), run.command.begin(), run.command.end());
  return arguments;
}

process_result container_runtime::run(const container_run_t& run) {
  auto name = "veribuild-" + veribuild::schema::make_token();
  spdlog::debug("Starting container {} from {}", name, run.image);

  auto result = run_process(process_options{
      .executable = docker_binary_,
      .arguments = run_arguments(run, name),
      .working_directory = std::nullopt,
      .timeout = run.timeout,
      .max_output_bytes = run.max_output_bytes});

  if (result.timed_out || result.output_exceeded) {
    if (!kill(name)) {
      spdlog::warn("Container {} may still be running", name);
    }
  }
  return result;
}

bool container_runtime::kill(std::string_view name) {
  auto result = run_process(
      process_options{.executable = docker_binary_,
                      .arguments = {"kill", std::string{name}},
                      .working_directory = std::nullopt,
                      .timeout = std::chrono::seconds{30},
                      .max_output_bytes = 64 * 1024});
  if (!result.succeeded()) {
    spdlog::debug("docker kill {} exited {}: {}", name, result.exit_code,
                  result.error.empty() ? result.output : result.error);
    return false;
  }
  return true;
}

}  // namespace veribuild::build
