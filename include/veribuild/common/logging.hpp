#pragma once

#include <string>

namespace veribuild::common {

/// Install the process-wide async logger: colored stdout plus an append-only
/// file sink. `verbose` lowers the level to debug.
void configure_logging(const std::string& logger_name,
                       const std::string& log_file,
                       bool verbose);

}  // namespace veribuild::common
