// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef FERRY_LOG_MACROS_HPP
#define FERRY_LOG_MACROS_HPP

#include <boost/log/attributes/constant.hpp>
#include <boost/log/attributes/scoped_attribute.hpp>
#include <boost/log/sources/record_ostream.hpp>
#include <boost/log/sources/severity_logger.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <sstream>
#include <string>

#include "ferry_log_severity.hpp"

namespace ferry {
namespace logging {

typedef boost::log::sources::severity_logger_mt<severity_level> logger_type;

/**
 * Process-wide logger. Defined in ferry_log_init.cpp.
 */
logger_type& get_logger();

/**
 * Key-value field for structured log lines.
 * Usage: FERRY_LOG_INFO("part sealed" << kv("index", 3) << kv("bytes", size));
 */
template <typename T>
inline std::string kv(const char* name, const T& value) {
  std::ostringstream oss;
  oss << " " << name << "=" << value;
  return oss.str();
}

template <>
inline std::string kv(const char* name, const std::string& value) {
  std::ostringstream oss;
  oss << " " << name << "=\"" << value << "\"";
  return oss.str();
}

inline std::string kv(const char* name, const char* value) {
  std::ostringstream oss;
  oss << " " << name << "=\"" << value << "\"";
  return oss.str();
}

/**
 * Per call-site gate for the _THROTTLE macros.
 */
class LogThrottle {
public:
  bool allow(double interval_sec) {
    auto now = std::chrono::steady_clock::now();
    std::lock_guard<std::mutex> lock(mutex_);
    if (logged_once_ && now - last_ < std::chrono::duration<double>(interval_sec)) {
      return false;
    }
    logged_once_ = true;
    last_ = now;
    return true;
  }

private:
  std::mutex mutex_;
  std::chrono::steady_clock::time_point last_{};
  bool logged_once_ = false;
};

}  // namespace logging
}  // namespace ferry

// Each translation unit sets its own component name before including this header:
//   #define FERRY_LOG_COMPONENT "disk_stager"
//   #include <ferry_log_macros.hpp>
#ifndef FERRY_LOG_COMPONENT
#define FERRY_LOG_COMPONENT "ferry"
#endif

#ifdef NDEBUG
#define FERRY_LOG_ENABLE_DEBUG 0
#else
#define FERRY_LOG_ENABLE_DEBUG 1
#endif

#define FERRY_LOG_SEV_(level, msg)                                                          \
  do {                                                                                      \
    BOOST_LOG_SEV(::ferry::logging::get_logger(), ::ferry::logging::severity_level::level) \
      << "[" << FERRY_LOG_COMPONENT << "] " << msg;                                         \
  } while (0)

#define FERRY_LOG_DEBUG(msg)         \
  do {                               \
    if (FERRY_LOG_ENABLE_DEBUG) {    \
      FERRY_LOG_SEV_(debug, msg);    \
    }                                \
  } while (0)
#define FERRY_LOG_INFO(msg) FERRY_LOG_SEV_(info, msg)
#define FERRY_LOG_WARN(msg) FERRY_LOG_SEV_(warn, msg)
#define FERRY_LOG_ERROR(msg) FERRY_LOG_SEV_(error, msg)
#define FERRY_LOG_FATAL(msg) FERRY_LOG_SEV_(fatal, msg)

// Attaches the upload identity to every record emitted on this thread until scope exit.
// At most one per scope.
#define FERRY_LOG_SCOPED_CONTEXT(upload_id_val, object_key_val)                            \
  BOOST_LOG_UNUSED_VARIABLE(                                                               \
    ::boost::log::scoped_attribute, _ferry_log_upload_id_sentry,                           \
    = ::boost::log::add_scoped_thread_attribute(                                           \
      "UploadID", ::boost::log::attributes::constant<std::string>(upload_id_val)           \
    )                                                                                      \
  );                                                                                       \
  BOOST_LOG_UNUSED_VARIABLE(                                                               \
    ::boost::log::scoped_attribute, _ferry_log_object_key_sentry,                          \
    = ::boost::log::add_scoped_thread_attribute(                                           \
      "ObjectKey", ::boost::log::attributes::constant<std::string>(object_key_val)         \
    )                                                                                      \
  )

// Logs the 1st, (n+1)th, (2n+1)th ... occurrence at a call site.
#define FERRY_LOG_EVERY_N_(macro, n, msg)                        \
  do {                                                           \
    static std::atomic<uint64_t> _ferry_log_counter{0};          \
    if ((_ferry_log_counter.fetch_add(1) % (n)) == 0) {          \
      macro(msg);                                                \
    }                                                            \
  } while (0)

#define FERRY_LOG_DEBUG_EVERY_N(n, msg) FERRY_LOG_EVERY_N_(FERRY_LOG_DEBUG, n, msg)
#define FERRY_LOG_INFO_EVERY_N(n, msg) FERRY_LOG_EVERY_N_(FERRY_LOG_INFO, n, msg)
#define FERRY_LOG_WARN_EVERY_N(n, msg) FERRY_LOG_EVERY_N_(FERRY_LOG_WARN, n, msg)
#define FERRY_LOG_ERROR_EVERY_N(n, msg) FERRY_LOG_EVERY_N_(FERRY_LOG_ERROR, n, msg)

// Logs at most once per interval_sec seconds at a call site.
#define FERRY_LOG_THROTTLE_(macro, interval_sec, msg)              \
  do {                                                             \
    static ::ferry::logging::LogThrottle _ferry_log_throttle;      \
    if (_ferry_log_throttle.allow(interval_sec)) {                 \
      macro(msg);                                                  \
    }                                                              \
  } while (0)

#define FERRY_LOG_DEBUG_THROTTLE(interval_sec, msg) \
  FERRY_LOG_THROTTLE_(FERRY_LOG_DEBUG, interval_sec, msg)
#define FERRY_LOG_INFO_THROTTLE(interval_sec, msg) \
  FERRY_LOG_THROTTLE_(FERRY_LOG_INFO, interval_sec, msg)
#define FERRY_LOG_WARN_THROTTLE(interval_sec, msg) \
  FERRY_LOG_THROTTLE_(FERRY_LOG_WARN, interval_sec, msg)
#define FERRY_LOG_ERROR_THROTTLE(interval_sec, msg) \
  FERRY_LOG_THROTTLE_(FERRY_LOG_ERROR, interval_sec, msg)

#endif  // FERRY_LOG_MACROS_HPP
