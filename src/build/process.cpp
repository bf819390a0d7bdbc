#include <boost/asio/buffer.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/filesystem/path.hpp>
#include <boost/process/args.hpp>
#include <boost/process/async_pipe.hpp>
#include <boost/process/child.hpp>
#include <boost/process/io.hpp>
#include <boost/process/search_path.hpp>
#include <boost/process/start_dir.hpp>
#include <spdlog/spdlog.h>
#include <veribuild/build/process.hpp>

#include <array>
#include <functional>
#include <system_error>

namespace bp = boost::process;

namespace veribuild::build {

namespace {

constexpr auto kReadChunk = std::size_t{4096};

using read_buffer_t = std::array<char, kReadChunk>;

boost::filesystem::path resolve_executable(const std::string& executable) {
  if (executable.find('/') != std::string::npos) {
    return boost::filesystem::path{executable};
  }
  return bp::search_path(executable);
}

}  // namespace

process_result run_process(const process_options& options) {
  auto result = process_result{};

  auto executable = resolve_executable(options.executable);
  if (executable.empty()) {
    result.launch_failed = true;
    result.error = "executable not found: " + options.executable;
    return result;
  }

  auto io = boost::asio::io_context{};
  auto out_pipe = bp::async_pipe{io};
  auto err_pipe = bp::async_pipe{io};
  auto launch_error = std::error_code{};
  auto child = bp::child{executable,
                         bp::args(options.arguments),
                         bp::std_in < bp::null,
                         bp::std_out > out_pipe,
                         bp::std_err > err_pipe,
                         bp::start_dir(options.working_directory.value_or(".")),
                         launch_error};
  if (launch_error) {
    result.launch_failed = true;
    result.error = launch_error.message();
    return result;
  }

  auto append = [&](const char* data, std::size_t size) {
    auto room = options.max_output_bytes - result.output.size();
    if (size > room) {
      result.output.append(data, room);
      result.output_exceeded = true;
      io.stop();
      return;
    }
    result.output.append(data, size);
  };

  auto out_buffer = read_buffer_t{};
  auto err_buffer = read_buffer_t{};
  std::function<void(bp::async_pipe&, read_buffer_t&)> pump;
  pump = [&](bp::async_pipe& pipe, read_buffer_t& buffer) {
    pipe.async_read_some(
        boost::asio::buffer(buffer),
        [&](const boost::system::error_code& error, std::size_t size) {
          if (size > 0) {
            append(buffer.data(), size);
          }
          if (!error && !result.output_exceeded) {
            pump(pipe, buffer);
          }
        });
  };
  pump(out_pipe, out_buffer);
  pump(err_pipe, err_buffer);

  auto deadline = std::chrono::steady_clock::now() + options.timeout;
  io.run_until(deadline);
  if (!io.stopped()) {
    result.timed_out = true;
  }

  if (!result.timed_out && !result.output_exceeded) {
    // Output is closed; the child may still be exiting.
    auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now());
    auto wait_error = std::error_code{};
    if (remaining.count() <= 0 || !child.wait_for(remaining, wait_error)) {
      result.timed_out = true;
    } else if (wait_error) {
      result.error = wait_error.message();
    } else {
      result.exit_code = child.exit_code();
    }
  }

  if (result.timed_out || result.output_exceeded) {
    auto kill_error = std::error_code{};
    child.terminate(kill_error);
    if (kill_error) {
      spdlog::warn("Failed to kill {}: {}", options.executable,
                   kill_error.message());
    }
    result.error = result.timed_out ? "deadline exceeded"
                                    : "output ceiling exceeded";
  }

  return result;
}

std::string tail_excerpt(const std::string& output, std::size_t max_bytes) {
  if (output.size() <= max_bytes) {
    return output;
  }
  auto start = output.size() - max_bytes;
  auto newline = output.find('\n', start);
  if (newline != std::string::npos && newline + 1 < output.size()) {
    start = newline + 1;
  }
  return output.substr(start);
}

}  // namespace veribuild::build
