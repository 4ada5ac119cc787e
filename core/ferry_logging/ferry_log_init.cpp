// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "ferry_log_init.hpp"

#include <boost/log/core.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <mutex>

#include "ferry_log_macros.hpp"

namespace ferry {
namespace logging {

namespace {

// Sinks installed by init_logging(); guarded by mutex.
struct InstalledSinks {
  std::mutex mutex;
  boost::shared_ptr<async_console_sink_t> console;
  boost::shared_ptr<async_file_sink_t> file;
  bool initialized = false;
};

InstalledSinks& installed() {
  static InstalledSinks sinks;
  return sinks;
}

// Removes an async sink from the core, then drains its queue.
template <typename Sink>
void detach(boost::shared_ptr<Sink>& sink) {
  if (!sink) {
    return;
  }
  boost::log::core::get()->remove_sink(sink);
  sink->stop();
  sink->flush();
  sink.reset();
}

std::string to_lower(const std::string& s) {
  std::string result = s;
  std::transform(result.begin(), result.end(), result.begin(), [](unsigned char c) {
    return std::tolower(c);
  });
  return result;
}

std::optional<std::string> get_env(const char* name) {
  const char* value = std::getenv(name);
  if (value && value[0] != '\0') {
    return std::string(value);
  }
  return std::nullopt;
}

bool parse_bool(const std::string& s, bool default_value) {
  std::string lower = to_lower(s);
  if (lower == "true" || lower == "1" || lower == "yes" || lower == "on") {
    return true;
  }
  if (lower == "false" || lower == "0" || lower == "no" || lower == "off") {
    return false;
  }
  return default_value;
}

void override_level(const char* env_name, severity_level& target) {
  if (auto level_str = get_env(env_name)) {
    if (auto level = parse_severity_level(*level_str)) {
      target = *level;
    }
  }
}

}  // namespace

std::optional<severity_level> parse_severity_level(const std::string& level_str) {
  std::string lower = to_lower(level_str);
  if (lower == "debug") {
    return severity_level::debug;
  } else if (lower == "info") {
    return severity_level::info;
  } else if (lower == "warn" || lower == "warning") {
    return severity_level::warn;
  } else if (lower == "error") {
    return severity_level::error;
  } else if (lower == "fatal") {
    return severity_level::fatal;
  }
  return std::nullopt;
}

void apply_env_overrides(LoggingConfig& config) {
  override_level("FERRY_LOG_LEVEL", config.console_level);
  override_level("FERRY_LOG_LEVEL", config.file_level);
  override_level("FERRY_LOG_CONSOLE_LEVEL", config.console_level);
  override_level("FERRY_LOG_FILE_LEVEL", config.file_level);

  if (auto enabled = get_env("FERRY_LOG_CONSOLE_ENABLED")) {
    config.console_enabled = parse_bool(*enabled, config.console_enabled);
  }
  if (auto enabled = get_env("FERRY_LOG_FILE_ENABLED")) {
    config.file_enabled = parse_bool(*enabled, config.file_enabled);
  }
  if (auto dir = get_env("FERRY_LOG_FILE_DIR")) {
    config.file_config.directory = *dir;
  }
  if (auto format = get_env("FERRY_LOG_FORMAT")) {
    config.file_config.format_json = (to_lower(*format) == "json");
  }
}

logger_type& get_logger() {
  static logger_type instance;
  return instance;
}

void init_logging(const LoggingConfig& config) {
  InstalledSinks& sinks = installed();
  std::lock_guard<std::mutex> lock(sinks.mutex);
  if (sinks.initialized) {
    return;
  }

  boost::log::add_common_attributes();
  auto core = boost::log::core::get();
  if (config.console_enabled) {
    sinks.console = create_console_sink(config.console_level, config.console_colors);
    core->add_sink(sinks.console);
  }
  if (config.file_enabled) {
    sinks.file = create_file_sink(config.file_config, config.file_level);
    core->add_sink(sinks.file);
  }
  sinks.initialized = true;
}

void init_logging_default() {
  init_logging(LoggingConfig{});
}

void shutdown_logging() {
  InstalledSinks& sinks = installed();
  std::lock_guard<std::mutex> lock(sinks.mutex);
  detach(sinks.console);
  detach(sinks.file);
  sinks.initialized = false;
}

void flush_logging() {
  InstalledSinks& sinks = installed();
  std::lock_guard<std::mutex> lock(sinks.mutex);
  if (sinks.console) {
    sinks.console->flush();
  }
  if (sinks.file) {
    sinks.file->flush();
  }
}

void reconfigure_logging(const LoggingConfig& config) {
  LoggingConfig effective = config;
  apply_env_overrides(effective);
  shutdown_logging();
  init_logging(effective);
}

bool is_logging_initialized() {
  InstalledSinks& sinks = installed();
  std::lock_guard<std::mutex> lock(sinks.mutex);
  return sinks.initialized;
}

}  // namespace logging
}  // namespace ferry
