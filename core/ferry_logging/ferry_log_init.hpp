// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef FERRY_LOG_INIT_HPP
#define FERRY_LOG_INIT_HPP

#include <optional>
#include <string>

#include "ferry_console_sink.hpp"
#include "ferry_file_sink.hpp"
#include "ferry_log_severity.hpp"

namespace ferry {
namespace logging {

/**
 * Logging configuration shared by every ferry binary and test.
 */
struct LoggingConfig {
  bool console_enabled = true;
  bool console_colors = true;
  severity_level console_level = severity_level::info;

  bool file_enabled = false;
  FileSinkConfig file_config;
  severity_level file_level = severity_level::debug;
};

/**
 * Parse "debug", "info", "warn"/"warning", "error" or "fatal" (case-insensitive).
 *
 * @return The level, or std::nullopt if the string is not a level name
 */
std::optional<severity_level> parse_severity_level(const std::string& level_str);

/**
 * Apply environment variable overrides in place.
 *
 *   FERRY_LOG_LEVEL           - both sinks
 *   FERRY_LOG_CONSOLE_LEVEL   - console sink
 *   FERRY_LOG_FILE_LEVEL      - file sink
 *   FERRY_LOG_FILE_DIR        - log directory
 *   FERRY_LOG_FORMAT          - "json" or "text"
 *   FERRY_LOG_FILE_ENABLED    - "true"/"false"
 *   FERRY_LOG_CONSOLE_ENABLED - "true"/"false"
 *
 * Unparseable values are ignored.
 */
void apply_env_overrides(LoggingConfig& config);

/**
 * Install the configured sinks. Calling it again before shutdown_logging() is a no-op.
 */
void init_logging(const LoggingConfig& config);

/**
 * Console at INFO with colors, no file sink.
 */
void init_logging_default();

/**
 * Stop the async sink threads, drain them and detach every sink.
 */
void shutdown_logging();

void flush_logging();

/**
 * Shut down and re-initialize with config plus environment overrides.
 */
void reconfigure_logging(const LoggingConfig& config);

bool is_logging_initialized();

}  // namespace logging
}  // namespace ferry

#endif  // FERRY_LOG_INIT_HPP
