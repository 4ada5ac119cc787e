// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef FERRY_SESSION_MANAGER_HPP
#define FERRY_SESSION_MANAGER_HPP

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "metrics_sink.hpp"
#include "object_backend.hpp"
#include "retry_policy.hpp"
#include "upload_errors.hpp"

namespace ferry {
namespace upload {

enum class PartState { Pending, Staged, Uploading, Uploaded, Failed };

enum class SessionState { Open, Completing, Completed, Aborting, Aborted };

const char* partStateToString(PartState state);
const char* sessionStateToString(SessionState state);

inline bool isTerminal(SessionState state) {
  return state == SessionState::Completed || state == SessionState::Aborted;
}

struct PartRecord {
  uint32_t index = 0;
  uint64_t offset = 0;
  uint64_t size = 0;
  PartState state = PartState::Pending;
  std::string etag;
  std::string checksum_sha256;
  int attempts = 0;  // upload attempts started
};

/**
 * What a worker should do after a failed part upload
 */
struct FailureDecision {
  bool retry = false;
  std::chrono::milliseconds delay{0};
};

/**
 * First fatal error of a session
 */
struct SessionFailure {
  ErrorKind kind;
  std::string message;
};

/**
 * Map a failed backend result to Transient or Permanent using the S3 error
 * code table and the backend's own retryable flag
 */
ErrorKind classifyBackendFailure(const BackendResult& result);

/**
 * Owns the backend multipart-upload lifecycle of one object
 *
 * Part records are keyed by index, so completion order does not matter.
 * complete() and abort() issue at most one backend call each over the
 * lifetime of the session and return the same terminal state when repeated.
 *
 * Thread-safe.
 */
class SessionManager {
public:
  SessionManager(
    ObjectBackend& backend, MetricsSink& metrics, std::string object_key,
    ObjectMetadata metadata, const RetryConfig& retry_config = {}
  );

  // Non-copyable, non-movable
  SessionManager(const SessionManager&) = delete;
  SessionManager& operator=(const SessionManager&) = delete;
  SessionManager(SessionManager&&) = delete;
  SessionManager& operator=(SessionManager&&) = delete;

  /**
   * Create the backend multipart upload with the sanitized metadata.
   * Transient failures are retried with backoff. No-op once a backend session exists.
   *
   * @throws UploadError(BackendTransientError|BackendPermanentError) when creation fails,
   *         UploadError(SessionCanceled) if the session already ended
   */
  void open();

  /**
   * Register a sealed part as Staged
   */
  void addPart(uint32_t index, uint64_t offset, uint64_t size);

  /**
   * Staged (or Pending after a retry) -> Uploading; counts an attempt
   */
  void markUploading(uint32_t index);

  void markUploaded(
    uint32_t index, const std::string& etag, const std::string& checksum_sha256 = ""
  );

  /**
   * Pending -> Staged when a retried part is queued again
   */
  void markStaged(uint32_t index);

  /**
   * Mark a part Failed and decide whether it gets another attempt.
   *
   * Transient errors are retried while the retry budget lasts; the part goes
   * back to Pending. Anything else records a fatal error.
   */
  FailureDecision recordFailure(uint32_t index, ErrorKind kind, const std::string& message);

  /**
   * Record a fatal condition raised outside a part upload. The first one wins.
   */
  void fail(ErrorKind kind, const std::string& message);

  /**
   * Complete the backend upload with all parts in index order.
   * A failed complete call aborts the session.
   *
   * @return Completed or Aborted
   * @throws std::logic_error if a part is not Uploaded
   */
  SessionState complete();

  /**
   * Abort the session. Calls the backend only if a backend session exists.
   * Concurrent callers wait for the first one to finish.
   *
   * @return Aborted, or Completed if the session had already completed
   */
  SessionState abort();

  SessionState state() const;
  std::optional<SessionFailure> failure() const;
  std::vector<PartRecord> parts() const;
  size_t countParts(PartState state) const;
  uint64_t totalBytesSealed() const;
  std::string uploadId() const;

  const std::string& objectKey() const {
    return object_key_;
  }

private:
  PartRecord& partLocked(uint32_t index);
  void failLocked(ErrorKind kind, const std::string& message);
  SessionState abortFromLocked(std::unique_lock<std::mutex>& lock);
  SessionState waitTerminalLocked(std::unique_lock<std::mutex>& lock);

  ObjectBackend& backend_;
  MetricsSink& metrics_;
  const std::string object_key_;
  const ObjectMetadata metadata_;
  RetryPolicy retry_;

  mutable std::mutex mutex_;
  std::condition_variable state_cv_;
  SessionState state_ = SessionState::Open;
  std::string upload_id_;
  std::map<uint32_t, PartRecord> parts_;
  uint64_t total_bytes_sealed_ = 0;
  std::optional<SessionFailure> failure_;
};

}  // namespace upload
}  // namespace ferry

#endif  // FERRY_SESSION_MANAGER_HPP
