// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "multipart_upload.hpp"

#include <stdexcept>
#include <utility>

#define FERRY_LOG_COMPONENT "multipart_upload"
#include <ferry_log_macros.hpp>

namespace ferry {
namespace upload {

using logging::kv;

namespace {

const SizePolicy& checkedPolicy(const SizePolicy& policy) {
  std::string error_msg;
  if (!SizePolicy::validate(policy, error_msg)) {
    throw UploadError(ErrorKind::InvalidConfiguration, error_msg);
  }
  return policy;
}

}  // namespace

MultipartUpload::MultipartUpload(
  ObjectBackend& backend, std::shared_ptr<UploadSemaphore> semaphore, MetricsSink& metrics,
  std::string id, std::string object_key, ObjectMetadata metadata, const UploadOptions& options,
  std::optional<uint64_t> declared_length
)
    : id_(std::move(id))
    , semaphore_(std::move(semaphore))
    , session_(backend, metrics, std::move(object_key), std::move(metadata), options.retry)
    , stager_(options.temporary_directory, options.max_buffered_parts, metrics)
    , uploader_(
        backend, *semaphore_, metrics, session_, stager_, options.disable_content_hashes
      )
    , chunker_(checkedPolicy(options.size_policy), stager_, declared_length) {
  stager_.setSealCallback([this](const StagedPart& part) {
    onPartSealed(part);
  });
  FERRY_LOG_DEBUG("upload created" << kv("id", id_) << kv("key", session_.objectKey())
                                   << kv("part_size", chunker_.currentTargetSize()));
}

MultipartUpload::~MultipartUpload() {
  try {
    cancel();
  } catch (const std::exception& e) {
    FERRY_LOG_ERROR("failed to cancel upload on destruction" << kv("id", id_)
                                                             << kv("error", e.what()));
  }
}

void MultipartUpload::write(const char* data, size_t size) {
  FERRY_LOG_SCOPED_CONTEXT(id_, session_.objectKey());
  {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (finished_ && session_.state() == SessionState::Completed) {
      throw std::logic_error("write on finished upload " + id_);
    }
  }
  if (session_.failure()) {
    shutdown();
    throwFailure();
  }

  try {
    chunker_.write(data, size);
  } catch (const UploadError& e) {
    handleProducerError(e);
  }
}

SessionState MultipartUpload::finish() {
  FERRY_LOG_SCOPED_CONTEXT(id_, session_.objectKey());
  {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (finished_ && session_.state() == SessionState::Completed) {
      return SessionState::Completed;
    }
  }
  if (session_.failure()) {
    shutdown();
    throwFailure();
  }

  try {
    chunker_.finish();
  } catch (const UploadError& e) {
    handleProducerError(e);
  }

  // Workers drain the remaining parts and exit.
  stager_.close();
  std::vector<std::thread> workers;
  {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    workers.swap(workers_);
  }
  for (auto& worker : workers) {
    worker.join();
  }

  if (session_.failure()) {
    shutdown();
    throwFailure();
  }

  SessionState state = session_.complete();
  stager_.releaseAll();
  {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    finished_ = true;
  }
  if (state != SessionState::Completed) {
    throwFailure();
  }

  FERRY_LOG_INFO("upload finished" << kv("bytes", chunker_.bytesWritten())
                                   << kv("parts", chunker_.partsSealed()));
  return state;
}

SessionState MultipartUpload::cancel() {
  {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (finished_) {
      return session_.state();
    }
  }
  session_.fail(ErrorKind::SessionCanceled, "upload canceled");
  shutdown();
  return session_.state();
}

size_t MultipartUpload::workerCount() const {
  std::lock_guard<std::mutex> lock(lifecycle_mutex_);
  return workers_.size();
}

void MultipartUpload::onPartSealed(const StagedPart& part) {
  session_.open();
  session_.addPart(part.index, part.offset, part.size);

  std::lock_guard<std::mutex> lock(lifecycle_mutex_);
  // One worker per staging slot.
  if (!canceled_ && workers_.size() < stager_.maxBufferedParts()) {
    workers_.emplace_back(&MultipartUpload::workerLoop, this);
  }
}

void MultipartUpload::workerLoop() {
  FERRY_LOG_SCOPED_CONTEXT(id_, session_.objectKey());
  try {
    while (auto part = stager_.next()) {
      processPart(*part);
    }
  } catch (const UploadError& e) {
    session_.fail(e.kind(), e.message());
    onFatal();
  } catch (const std::exception& e) {
    FERRY_LOG_ERROR("upload worker failed" << kv("error", e.what()));
    session_.fail(ErrorKind::BackendPermanentError, e.what());
    onFatal();
  }
}

void MultipartUpload::processPart(const StagedPart& part) {
  for (;;) {
    PartOutcome outcome = uploader_.upload(part, canceled_);
    switch (outcome.status) {
      case PartOutcome::Status::Uploaded:
      case PartOutcome::Status::Canceled:
        return;
      case PartOutcome::Status::Failed:
        if (outcome.decision.retry) {
          if (!waitBeforeRetry(outcome.decision.delay)) {
            return;
          }
          session_.markStaged(part.index);
          continue;
        }
        onFatal();
        return;
    }
  }
}

bool MultipartUpload::waitBeforeRetry(std::chrono::milliseconds delay) {
  std::unique_lock<std::mutex> lock(cancel_mutex_);
  return !cancel_cv_.wait_for(lock, delay, [this] {
    return canceled_.load();
  });
}

void MultipartUpload::onFatal() {
  {
    std::lock_guard<std::mutex> lock(cancel_mutex_);
    canceled_ = true;
  }
  cancel_cv_.notify_all();
  semaphore_->wakeWaiters();
  stager_.cancel();
  session_.abort();
}

void MultipartUpload::shutdown() {
  onFatal();

  std::vector<std::thread> workers;
  {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    workers.swap(workers_);
  }
  for (auto& worker : workers) {
    worker.join();
  }

  stager_.releaseAll();
  std::lock_guard<std::mutex> lock(lifecycle_mutex_);
  finished_ = true;
}

void MultipartUpload::handleProducerError(const UploadError& e) {
  session_.fail(e.kind(), e.message());
  shutdown();
  throwFailure();
}

void MultipartUpload::throwFailure() {
  auto failure = session_.failure();
  if (failure) {
    throw UploadError(failure->kind, failure->message);
  }
  throw UploadError(ErrorKind::SessionCanceled, "upload " + id_ + " has ended");
}

}  // namespace upload
}  // namespace ferry
