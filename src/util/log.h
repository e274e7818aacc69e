#pragma once

/// @file log.h
/// @brief Shared spdlog logger for the library.

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace masterprint {

/// @brief Returns the library logger ("masterprint", colored stderr sink).
/// @details Created on first use. Thread-safe.
std::shared_ptr<spdlog::logger> logger();

/// @brief Sets the library log level.
/// @param level "trace", "debug", "info", "warn", "error", "critical" or "off"
void set_log_level(const std::string& level);

}  // namespace masterprint
