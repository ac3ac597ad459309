#pragma once

#include "config.hpp"

#include <memory>
#include <string>
#include <spdlog/spdlog.h>

namespace sentinel {

// Returns the logger registered under name, creating a colour console logger
// on first use.
std::shared_ptr<spdlog::logger> make_logger(const std::string& name);

// Applies level and optional rotating file sink to every logger created
// afterwards and to those already registered. Throws ConfigError when the
// log file cannot be opened.
void configure_logging(const LoggingConfig& config);

} // namespace sentinel
