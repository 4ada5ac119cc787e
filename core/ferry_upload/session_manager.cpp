// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "session_manager.hpp"

#include <stdexcept>
#include <thread>
#include <utility>

#include "header_sanitizer.hpp"

#define FERRY_LOG_COMPONENT "session_manager"
#include <ferry_log_macros.hpp>

namespace ferry {
namespace upload {

using logging::kv;

const char* partStateToString(PartState state) {
  switch (state) {
    case PartState::Pending:
      return "Pending";
    case PartState::Staged:
      return "Staged";
    case PartState::Uploading:
      return "Uploading";
    case PartState::Uploaded:
      return "Uploaded";
    case PartState::Failed:
      return "Failed";
  }
  return "Unknown";
}

const char* sessionStateToString(SessionState state) {
  switch (state) {
    case SessionState::Open:
      return "Open";
    case SessionState::Completing:
      return "Completing";
    case SessionState::Completed:
      return "Completed";
    case SessionState::Aborting:
      return "Aborting";
    case SessionState::Aborted:
      return "Aborted";
  }
  return "Unknown";
}

ErrorKind classifyBackendFailure(const BackendResult& result) {
  if (result.is_retryable || isTransientErrorCode(result.error_code)) {
    return ErrorKind::BackendTransientError;
  }
  return ErrorKind::BackendPermanentError;
}

namespace {

std::string describeFailure(const char* operation, const BackendResult& result) {
  std::string msg = std::string(operation) + " failed: " + result.error_message;
  if (!result.error_code.empty()) {
    msg += " (code: " + result.error_code + ")";
  }
  return msg;
}

}  // namespace

SessionManager::SessionManager(
  ObjectBackend& backend, MetricsSink& metrics, std::string object_key, ObjectMetadata metadata,
  const RetryConfig& retry_config
)
    : backend_(backend)
    , metrics_(metrics)
    , object_key_(std::move(object_key))
    , metadata_(std::move(metadata))
    , retry_(retry_config) {}

void SessionManager::open() {
  std::unique_lock<std::mutex> lock(mutex_);
  if (!upload_id_.empty()) {
    return;
  }
  if (state_ != SessionState::Open) {
    throw UploadError(ErrorKind::SessionCanceled, "session for " + object_key_ + " has ended");
  }
  const ObjectMetadata metadata = sanitizeMetadata(metadata_);

  for (int attempt = 0;; ++attempt) {
    lock.unlock();
    auto start = std::chrono::steady_clock::now();
    BackendResult result = backend_.createMultipartUpload(object_key_, metadata);
    metrics_.observeRequestDuration(ops::kCreateMultipartUpload, elapsedMs(start));
    lock.lock();

    if (result.success && !result.upload_id.empty()) {
      if (state_ != SessionState::Open) {
        // Aborted while the request was in flight; the new backend session is ours to drop.
        lock.unlock();
        BackendResult aborted = backend_.abortMultipartUpload(object_key_, result.upload_id);
        if (!aborted.success) {
          FERRY_LOG_ERROR("abort of late multipart upload failed"
                          << kv("key", object_key_) << kv("upload_id", result.upload_id)
                          << kv("error", aborted.error_message));
        }
        throw UploadError(ErrorKind::SessionCanceled, "session for " + object_key_ + " has ended");
      }
      upload_id_ = result.upload_id;
      FERRY_LOG_INFO("multipart upload created" << kv("key", object_key_)
                                                << kv("upload_id", upload_id_));
      return;
    }
    if (result.success) {
      result = BackendResult::Failure("backend returned no upload id", "MissingUploadId");
    }

    ErrorKind kind = classifyBackendFailure(result);
    auto delay = retry_.nextDelay(attempt);
    if (kind == ErrorKind::BackendTransientError && delay && state_ == SessionState::Open) {
      FERRY_LOG_WARN("create multipart upload failed, retrying"
                     << kv("key", object_key_) << kv("attempt", attempt + 1)
                     << kv("delay_ms", delay->count()) << kv("error", result.error_message));
      lock.unlock();
      std::this_thread::sleep_for(*delay);
      lock.lock();
      continue;
    }

    std::string msg = describeFailure("create multipart upload", result);
    failLocked(kind, msg);
    FERRY_LOG_ERROR(msg << kv("key", object_key_));
    throw UploadError(kind, msg);
  }
}

PartRecord& SessionManager::partLocked(uint32_t index) {
  auto it = parts_.find(index);
  if (it == parts_.end()) {
    throw std::logic_error("unknown part index " + std::to_string(index));
  }
  return it->second;
}

void SessionManager::addPart(uint32_t index, uint64_t offset, uint64_t size) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (index != parts_.size()) {
    throw std::logic_error(
      "part " + std::to_string(index) + " sealed out of order, expected " +
      std::to_string(parts_.size())
    );
  }
  PartRecord record;
  record.index = index;
  record.offset = offset;
  record.size = size;
  record.state = PartState::Staged;
  parts_.emplace(index, record);
  total_bytes_sealed_ += size;
}

void SessionManager::markUploading(uint32_t index) {
  std::lock_guard<std::mutex> lock(mutex_);
  PartRecord& part = partLocked(index);
  part.state = PartState::Uploading;
  ++part.attempts;
}

void SessionManager::markUploaded(
  uint32_t index, const std::string& etag, const std::string& checksum_sha256
) {
  std::lock_guard<std::mutex> lock(mutex_);
  PartRecord& part = partLocked(index);
  part.state = PartState::Uploaded;
  part.etag = etag;
  part.checksum_sha256 = checksum_sha256;
}

void SessionManager::markStaged(uint32_t index) {
  std::lock_guard<std::mutex> lock(mutex_);
  partLocked(index).state = PartState::Staged;
}

FailureDecision SessionManager::recordFailure(
  uint32_t index, ErrorKind kind, const std::string& message
) {
  std::lock_guard<std::mutex> lock(mutex_);
  PartRecord& part = partLocked(index);
  part.state = PartState::Failed;

  FailureDecision decision;
  auto delay = retry_.nextDelay(part.attempts - 1);
  if (kind == ErrorKind::BackendTransientError && state_ == SessionState::Open && !failure_ &&
      delay) {
    part.state = PartState::Pending;
    decision.retry = true;
    decision.delay = *delay;
    FERRY_LOG_WARN("part upload failed, will retry"
                   << kv("part", index + 1) << kv("attempt", part.attempts)
                   << kv("delay_ms", decision.delay.count()) << kv("error", message));
    return decision;
  }

  std::string msg = "part " + std::to_string(index + 1) + " failed after " +
                    std::to_string(part.attempts) + " attempt(s): " + message;
  failLocked(kind, msg);
  FERRY_LOG_ERROR(msg << kv("key", object_key_));
  return decision;
}

void SessionManager::fail(ErrorKind kind, const std::string& message) {
  std::lock_guard<std::mutex> lock(mutex_);
  failLocked(kind, message);
}

void SessionManager::failLocked(ErrorKind kind, const std::string& message) {
  if (!failure_) {
    failure_ = SessionFailure{kind, message};
  }
}

SessionState SessionManager::complete() {
  std::unique_lock<std::mutex> lock(mutex_);
  if (isTerminal(state_)) {
    return state_;
  }
  if (state_ != SessionState::Open) {
    return waitTerminalLocked(lock);
  }
  if (failure_) {
    return abortFromLocked(lock);
  }

  if (upload_id_.empty() || parts_.empty()) {
    throw std::logic_error("complete called on " + object_key_ + " without sealed parts");
  }
  CompleteMultipartUploadRequest request;
  request.key = object_key_;
  request.upload_id = upload_id_;
  for (const auto& [index, part] : parts_) {
    if (part.state != PartState::Uploaded) {
      throw std::logic_error(
        "complete called while part " + std::to_string(index + 1) + " is " +
        partStateToString(part.state)
      );
    }
    request.parts.push_back({static_cast<int>(index) + 1, part.etag, part.checksum_sha256});
  }
  state_ = SessionState::Completing;

  lock.unlock();
  auto start = std::chrono::steady_clock::now();
  BackendResult result = backend_.completeMultipartUpload(request);
  metrics_.observeRequestDuration(ops::kCompleteMultipartUpload, elapsedMs(start));
  lock.lock();

  if (result.success) {
    state_ = SessionState::Completed;
    FERRY_LOG_INFO("multipart upload completed"
                   << kv("key", object_key_) << kv("parts", parts_.size())
                   << kv("bytes", total_bytes_sealed_));
    lock.unlock();
    state_cv_.notify_all();
    return SessionState::Completed;
  }

  std::string msg = describeFailure("complete multipart upload", result);
  failLocked(classifyBackendFailure(result), msg);
  FERRY_LOG_ERROR(msg << kv("key", object_key_));
  return abortFromLocked(lock);
}

SessionState SessionManager::abort() {
  std::unique_lock<std::mutex> lock(mutex_);
  return abortFromLocked(lock);
}

SessionState SessionManager::abortFromLocked(std::unique_lock<std::mutex>& lock) {
  if (isTerminal(state_)) {
    return state_;
  }
  if (state_ == SessionState::Aborting) {
    return waitTerminalLocked(lock);
  }
  if (state_ == SessionState::Completing && !failure_) {
    // A complete call owned by another thread is in flight.
    return waitTerminalLocked(lock);
  }

  state_ = SessionState::Aborting;
  failLocked(ErrorKind::SessionCanceled, "upload canceled");
  const std::string upload_id = upload_id_;

  lock.unlock();
  if (!upload_id.empty()) {
    auto start = std::chrono::steady_clock::now();
    BackendResult result = backend_.abortMultipartUpload(object_key_, upload_id);
    metrics_.observeRequestDuration(ops::kAbortMultipartUpload, elapsedMs(start));
    if (!result.success) {
      FERRY_LOG_ERROR(describeFailure("abort multipart upload", result)
                      << kv("key", object_key_) << kv("upload_id", upload_id));
    }
  }
  lock.lock();

  state_ = SessionState::Aborted;
  FERRY_LOG_INFO("multipart upload aborted"
                 << kv("key", object_key_) << kv("reason", failure_->message));
  lock.unlock();
  state_cv_.notify_all();
  lock.lock();
  return SessionState::Aborted;
}

SessionState SessionManager::waitTerminalLocked(std::unique_lock<std::mutex>& lock) {
  state_cv_.wait(lock, [this] {
    return isTerminal(state_);
  });
  return state_;
}

SessionState SessionManager::state() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return state_;
}

std::optional<SessionFailure> SessionManager::failure() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return failure_;
}

std::vector<PartRecord> SessionManager::parts() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<PartRecord> result;
  result.reserve(parts_.size());
  for (const auto& [index, part] : parts_) {
    result.push_back(part);
  }
  return result;
}

size_t SessionManager::countParts(PartState state) const {
  std::lock_guard<std::mutex> lock(mutex_);
  size_t count = 0;
  for (const auto& [index, part] : parts_) {
    if (part.state == state) {
      ++count;
    }
  }
  return count;
}

uint64_t SessionManager::totalBytesSealed() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return total_bytes_sealed_;
}

std::string SessionManager::uploadId() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return upload_id_;
}

}  // namespace upload
}  // namespace ferry
