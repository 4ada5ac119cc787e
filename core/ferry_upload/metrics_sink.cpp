// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "metrics_sink.hpp"

#define FERRY_LOG_COMPONENT "metrics"
#include <ferry_log_macros.hpp>

namespace ferry {
namespace upload {

using logging::kv;

void LoggingMetricsSink::observeRequestDuration(const std::string& operation, double ms) {
  FERRY_LOG_DEBUG_THROTTLE(
    1.0, "request duration" << kv("operation", operation) << kv("ms", ms)
  );
}

void LoggingMetricsSink::observeDiskWriteDuration(double ms) {
  FERRY_LOG_DEBUG_THROTTLE(1.0, "disk write duration" << kv("ms", ms));
}

void LoggingMetricsSink::setUploadSemaphoreDemand(int64_t demand) {
  FERRY_LOG_DEBUG_THROTTLE(1.0, "upload semaphore demand" << kv("demand", demand));
}

void LoggingMetricsSink::setUploadSemaphoreLimit(int64_t limit) {
  FERRY_LOG_INFO("upload semaphore limit" << kv("limit", limit));
}

}  // namespace upload
}  // namespace ferry
