// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef FERRY_MULTIPART_UPLOAD_HPP
#define FERRY_MULTIPART_UPLOAD_HPP

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "chunker.hpp"
#include "disk_stager.hpp"
#include "metrics_sink.hpp"
#include "object_backend.hpp"
#include "part_uploader.hpp"
#include "retry_policy.hpp"
#include "session_manager.hpp"
#include "size_policy.hpp"
#include "upload_semaphore.hpp"

namespace ferry {
namespace upload {

/**
 * Per-upload settings, taken from StoreConfig by MultipartStore
 */
struct UploadOptions {
  SizePolicy size_policy;
  size_t max_buffered_parts = 20;
  std::string temporary_directory;
  bool disable_content_hashes = false;
  RetryConfig retry;
};

/**
 * Write path of one object: chunk, spool, upload parts, finalize
 *
 * The caller (one producer thread) feeds bytes with write() and ends the
 * stream with finish(). Sealed parts are uploaded in the background by up to
 * max_buffered_parts worker threads, each part upload holding a permit of the
 * shared UploadSemaphore. Any fatal error aborts the backend session once and
 * surfaces as UploadError on the next producer call.
 *
 * cancel() may be called from any thread.
 */
class MultipartUpload {
public:
  /**
   * @param id Upload identifier, used for log context
   * @param object_key Destination key
   * @param declared_length Total length if known up front
   * @throws UploadError(SizeLimitExceeded) if declared_length cannot be stored,
   *         UploadError(StagingIOError) if the spool directory is unusable
   */
  MultipartUpload(
    ObjectBackend& backend, std::shared_ptr<UploadSemaphore> semaphore, MetricsSink& metrics,
    std::string id, std::string object_key, ObjectMetadata metadata,
    const UploadOptions& options, std::optional<uint64_t> declared_length = std::nullopt
  );

  // Cancels the upload unless it already finished
  ~MultipartUpload();

  // Non-copyable, non-movable
  MultipartUpload(const MultipartUpload&) = delete;
  MultipartUpload& operator=(const MultipartUpload&) = delete;
  MultipartUpload(MultipartUpload&&) = delete;
  MultipartUpload& operator=(MultipartUpload&&) = delete;

  /**
   * Append bytes to the object. May block while the staging buffer is full.
   *
   * @throws UploadError with the kind of the failure that ended the upload
   */
  void write(const char* data, size_t size);
  void write(const std::string& data) {
    write(data.data(), data.size());
  }

  /**
   * End of stream: wait for all parts and complete the object
   *
   * @return SessionState::Completed
   * @throws UploadError if the upload was aborted, with the kind of the first fatal error
   */
  SessionState finish();

  /**
   * Stop the upload, abort the backend session and delete all spool files
   * before returning. No-op on a finished upload.
   *
   * @return The terminal session state
   */
  SessionState cancel();

  SessionState state() const {
    return session_.state();
  }

  std::optional<SessionFailure> failure() const {
    return session_.failure();
  }

  uint64_t bytesWritten() const {
    return chunker_.bytesWritten();
  }

  const std::string& id() const {
    return id_;
  }

  const std::string& objectKey() const {
    return session_.objectKey();
  }

  const SessionManager& session() const {
    return session_;
  }

  const DiskStager& stager() const {
    return stager_;
  }

  size_t workerCount() const;

private:
  void onPartSealed(const StagedPart& part);
  void workerLoop();
  void processPart(const StagedPart& part);
  bool waitBeforeRetry(std::chrono::milliseconds delay);
  void onFatal();
  void shutdown();
  void throwFailure();
  void handleProducerError(const UploadError& e);

  const std::string id_;
  std::shared_ptr<UploadSemaphore> semaphore_;
  SessionManager session_;
  DiskStager stager_;
  PartUploader uploader_;
  Chunker chunker_;

  std::atomic<bool> canceled_{false};
  std::mutex cancel_mutex_;
  std::condition_variable cancel_cv_;

  mutable std::mutex lifecycle_mutex_;
  std::vector<std::thread> workers_;
  bool finished_ = false;
};

}  // namespace upload
}  // namespace ferry

#endif  // FERRY_MULTIPART_UPLOAD_HPP
