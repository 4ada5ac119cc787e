// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef FERRY_METRICS_SINK_HPP
#define FERRY_METRICS_SINK_HPP

#include <chrono>
#include <cstdint>
#include <string>

namespace ferry {
namespace upload {

// Operation labels passed to observeRequestDuration()
namespace ops {
constexpr const char* kCreateMultipartUpload = "create_multipart_upload";
constexpr const char* kUploadPart = "upload_part";
constexpr const char* kUploadPartCopy = "upload_part_copy";
constexpr const char* kCompleteMultipartUpload = "complete_multipart_upload";
constexpr const char* kAbortMultipartUpload = "abort_multipart_upload";
constexpr const char* kPutObject = "put_object";
constexpr const char* kGetObject = "get_object";
constexpr const char* kHeadObject = "head_object";
constexpr const char* kDeleteObject = "delete_object";
constexpr const char* kDeleteObjects = "delete_objects";
}  // namespace ops

/**
 * Observability collaborator owned by the hosting process
 *
 * Called concurrently from the producer and worker threads.
 */
class MetricsSink {
public:
  virtual ~MetricsSink() = default;

  virtual void observeRequestDuration(const std::string& operation, double ms) = 0;
  virtual void observeDiskWriteDuration(double ms) = 0;
  virtual void setUploadSemaphoreDemand(int64_t demand) = 0;
  virtual void setUploadSemaphoreLimit(int64_t limit) = 0;
};

/**
 * Discards everything
 */
class NullMetricsSink : public MetricsSink {
public:
  void observeRequestDuration(const std::string&, double) override {}
  void observeDiskWriteDuration(double) override {}
  void setUploadSemaphoreDemand(int64_t) override {}
  void setUploadSemaphoreLimit(int64_t) override {}
};

/**
 * Reports observations as throttled debug log lines
 */
class LoggingMetricsSink : public MetricsSink {
public:
  void observeRequestDuration(const std::string& operation, double ms) override;
  void observeDiskWriteDuration(double ms) override;
  void setUploadSemaphoreDemand(int64_t demand) override;
  void setUploadSemaphoreLimit(int64_t limit) override;
};

/**
 * Milliseconds elapsed since `start`
 */
inline double elapsedMs(std::chrono::steady_clock::time_point start) {
  return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start)
    .count();
}

}  // namespace upload
}  // namespace ferry

#endif  // FERRY_METRICS_SINK_HPP
