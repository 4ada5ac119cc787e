// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef FERRY_LOG_SEVERITY_HPP
#define FERRY_LOG_SEVERITY_HPP

#include <boost/log/expressions/keyword.hpp>

#include <ostream>

namespace ferry {
namespace logging {

/**
 * Severity levels for ferry logging.
 * FATAL is reserved for conditions after which the process cannot continue.
 */
enum class severity_level { debug = 0, info = 1, warn = 2, error = 3, fatal = 4 };

inline const char* severity_name(severity_level level) {
  switch (level) {
    case severity_level::debug:
      return "DEBUG";
    case severity_level::info:
      return "INFO";
    case severity_level::warn:
      return "WARN";
    case severity_level::error:
      return "ERROR";
    case severity_level::fatal:
      return "FATAL";
  }
  return nullptr;
}

inline std::ostream& operator<<(std::ostream& strm, severity_level level) {
  if (const char* name = severity_name(level)) {
    strm << name;
  } else {
    strm << static_cast<int>(level);
  }
  return strm;
}

BOOST_LOG_ATTRIBUTE_KEYWORD(severity, "Severity", severity_level)

}  // namespace logging
}  // namespace ferry

#endif  // FERRY_LOG_SEVERITY_HPP
