// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "multipart_store.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>

#include "config_parser.hpp"
#include "session_manager.hpp"

#define FERRY_LOG_COMPONENT "multipart_store"
#include <ferry_log_macros.hpp>

namespace ferry {
namespace upload {

using logging::kv;

namespace {

std::string withPrefix(const std::string& prefix, const std::string& name) {
  if (prefix.empty()) {
    return name;
  }
  return prefix + "/" + name;
}

}  // namespace

MultipartStore::MultipartStore(
  const StoreConfig& config, ObjectBackend& backend, MetricsSink& metrics
)
    : config_(config)
    , backend_(backend)
    , metrics_(metrics) {
  std::string error_msg;
  if (!ConfigParser::validate(config_, error_msg)) {
    throw UploadError(ErrorKind::InvalidConfiguration, error_msg);
  }
  semaphore_ = std::make_shared<UploadSemaphore>(config_.concurrent_part_uploads, metrics_);
}

void MultipartStore::setConcurrentPartUploads(size_t limit) {
  auto semaphore = std::make_shared<UploadSemaphore>(limit, metrics_);
  std::lock_guard<std::mutex> lock(mutex_);
  semaphore_ = std::move(semaphore);
  config_.concurrent_part_uploads = semaphore_->limit();
}

std::shared_ptr<UploadSemaphore> MultipartStore::semaphore() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return semaphore_;
}

UploadOptions MultipartStore::uploadOptions() const {
  UploadOptions options;
  options.size_policy = config_.size_policy;
  options.max_buffered_parts = config_.max_buffered_parts;
  options.temporary_directory = config_.temporary_directory;
  options.disable_content_hashes = config_.disable_content_hashes;
  options.retry = config_.retry;
  return options;
}

std::string MultipartStore::objectKey(const std::string& id) const {
  return withPrefix(config_.object_prefix, id);
}

std::string MultipartStore::metadataKey(const std::string& id) const {
  const std::string& prefix = config_.metadata_object_prefix.empty()
                                ? config_.object_prefix
                                : config_.metadata_object_prefix;
  return withPrefix(prefix, id + ".info");
}

std::unique_ptr<MultipartUpload> MultipartStore::newUpload(
  const std::string& id, const ObjectMetadata& metadata, std::optional<uint64_t> length
) {
  auto upload = std::make_unique<MultipartUpload>(
    backend_, semaphore(), metrics_, id, objectKey(id), metadata, uploadOptions(), length
  );
  FERRY_LOG_INFO("new upload" << kv("id", id) << kv("key", upload->objectKey())
                              << kv("length", length ? std::to_string(*length) : "unknown"));
  return upload;
}

void MultipartStore::concatenate(
  const std::string& destination_id, const std::vector<std::string>& source_ids,
  const ObjectMetadata& metadata
) {
  const SizePolicy& policy = config_.size_policy;
  const std::string destination_key = objectKey(destination_id);
  FERRY_LOG_SCOPED_CONTEXT(destination_id, destination_key);

  if (source_ids.empty()) {
    throw std::invalid_argument("concatenate needs at least one source");
  }
  if (source_ids.size() > policy.max_part_count) {
    throw UploadError(
      ErrorKind::SizeLimitExceeded, std::to_string(source_ids.size()) +
                                      " sources exceed max_part_count " +
                                      std::to_string(policy.max_part_count)
    );
  }

  // Part sizes come from the sources themselves.
  std::vector<uint64_t> sizes;
  uint64_t total = 0;
  for (size_t i = 0; i < source_ids.size(); ++i) {
    const std::string key = objectKey(source_ids[i]);
    auto start = std::chrono::steady_clock::now();
    BackendResult head = backend_.headObject(key);
    metrics_.observeRequestDuration(ops::kHeadObject, elapsedMs(start));
    if (!head.success) {
      throw UploadError(
        classifyBackendFailure(head), "head " + key + " failed: " + head.error_message
      );
    }
    uint64_t size = head.content_length;
    bool last = i + 1 == source_ids.size();
    if ((!last && size < policy.min_part_size) || size > policy.max_part_size) {
      throw UploadError(
        ErrorKind::SizeLimitExceeded, "source " + key + " of " + std::to_string(size) +
                                        " bytes cannot be used as part " + std::to_string(i + 1)
      );
    }
    total += size;
    if (total > policy.max_object_size) {
      throw UploadError(
        ErrorKind::SizeLimitExceeded, "concatenation exceeds max_object_size " +
                                        std::to_string(policy.max_object_size)
      );
    }
    sizes.push_back(size);
  }

  auto semaphore = this->semaphore();
  SessionManager session(backend_, metrics_, destination_key, metadata, config_.retry);
  session.open();
  uint64_t offset = 0;
  for (size_t i = 0; i < sizes.size(); ++i) {
    session.addPart(static_cast<uint32_t>(i), offset, sizes[i]);
    offset += sizes[i];
  }

  std::atomic<bool> canceled{false};
  auto stop = [&] {
    canceled = true;
    semaphore->wakeWaiters();
  };
  auto copy_part = [&](uint32_t index) {
    for (;;) {
      auto permit = semaphore->acquire(canceled);
      if (!permit) {
        return;
      }
      session.markUploading(index);

      UploadPartCopyRequest request;
      request.key = destination_key;
      request.upload_id = session.uploadId();
      request.part_number = static_cast<int>(index) + 1;
      request.source_key = objectKey(source_ids[index]);

      auto start = std::chrono::steady_clock::now();
      BackendResult result = backend_.uploadPartCopy(request);
      metrics_.observeRequestDuration(ops::kUploadPartCopy, elapsedMs(start));

      if (result.success) {
        session.markUploaded(index, result.etag, result.checksum_sha256);
        return;
      }
      FailureDecision decision = session.recordFailure(
        index, classifyBackendFailure(result), "upload part copy: " + result.error_message
      );
      permit->release();
      if (!decision.retry) {
        stop();
        return;
      }
      std::this_thread::sleep_for(decision.delay);
      if (canceled) {
        return;
      }
      session.markStaged(index);
    }
  };

  // Copiers pull source indices until none are left.
  std::atomic<size_t> next_index{0};
  auto copier = [&] {
    try {
      for (size_t i = next_index++; i < sizes.size() && !canceled; i = next_index++) {
        copy_part(static_cast<uint32_t>(i));
      }
    } catch (const std::exception& e) {
      session.fail(ErrorKind::BackendPermanentError, e.what());
      stop();
    }
  };

  size_t copier_count = std::min(
    {sizes.size(), semaphore->limit(), std::max<size_t>(config_.max_buffered_parts, 1)}
  );
  std::vector<std::thread> copiers;
  try {
    copiers.reserve(copier_count);
    for (size_t i = 0; i < copier_count; ++i) {
      copiers.emplace_back(copier);
    }
  } catch (const std::exception& e) {
    FERRY_LOG_ERROR("cannot start copy workers" << kv("started", copiers.size())
                                                << kv("error", e.what()));
    session.fail(
      ErrorKind::BackendPermanentError, std::string("cannot start copy workers: ") + e.what()
    );
    stop();
  }
  for (auto& copier_thread : copiers) {
    copier_thread.join();
  }

  auto failure = session.failure();
  if (failure) {
    session.abort();
    throw UploadError(failure->kind, failure->message);
  }
  if (session.complete() != SessionState::Completed) {
    failure = session.failure();
    throw UploadError(
      failure ? failure->kind : ErrorKind::BackendPermanentError,
      failure ? failure->message : "complete multipart upload failed"
    );
  }
  FERRY_LOG_INFO("concatenated" << kv("sources", source_ids.size()) << kv("bytes", total));
}

void MultipartStore::terminate(const std::vector<std::string>& ids) {
  if (ids.empty()) {
    return;
  }
  std::vector<std::string> keys;
  keys.reserve(ids.size() * 2);
  for (const auto& id : ids) {
    keys.push_back(objectKey(id));
    keys.push_back(metadataKey(id));
  }

  auto start = std::chrono::steady_clock::now();
  BackendResult result = backend_.deleteObjects(keys);
  metrics_.observeRequestDuration(ops::kDeleteObjects, elapsedMs(start));
  if (!result.success) {
    std::string msg = "delete failed for " + std::to_string(result.failed_keys.size()) +
                      " object(s): " + result.error_message;
    FERRY_LOG_ERROR(msg);
    throw UploadError(classifyBackendFailure(result), msg);
  }
  FERRY_LOG_INFO("terminated uploads" << kv("count", ids.size()));
}

}  // namespace upload
}  // namespace ferry
