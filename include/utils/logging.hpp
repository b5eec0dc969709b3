#pragma once

#include "config/config.hpp"

namespace settle {

// Console (colour) and rotating file sinks from LoggingConfig; installs the
// result as spdlog's default logger named after the executable.
void setup_logging(const LoggingConfig& config, const std::string& name = "settled");

} // namespace settle
