// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef FERRY_MULTIPART_STORE_HPP
#define FERRY_MULTIPART_STORE_HPP

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "metrics_sink.hpp"
#include "multipart_upload.hpp"
#include "object_backend.hpp"
#include "store_config.hpp"
#include "upload_semaphore.hpp"

namespace ferry {
namespace upload {

/**
 * Entry point of the write path for one bucket
 *
 * Owns the upload semaphore shared by all uploads it creates. The backend and
 * the metrics sink belong to the caller and must outlive the store and every
 * upload created from it.
 *
 * Example:
 *   S3Backend backend(config.s3);
 *   LoggingMetricsSink metrics;
 *   MultipartStore store(config, backend, metrics);
 *   auto upload = store.newUpload("a1b2", {{"filename", "video.mp4"}});
 *   upload->write(buffer, n);
 *   upload->finish();
 */
class MultipartStore {
public:
  /**
   * @throws UploadError(InvalidConfiguration) if the config does not validate
   */
  MultipartStore(const StoreConfig& config, ObjectBackend& backend, MetricsSink& metrics);

  // Non-copyable, non-movable
  MultipartStore(const MultipartStore&) = delete;
  MultipartStore& operator=(const MultipartStore&) = delete;
  MultipartStore(MultipartStore&&) = delete;
  MultipartStore& operator=(MultipartStore&&) = delete;

  /**
   * Replace the upload semaphore. Uploads created afterwards use the new
   * limit; running uploads keep the semaphore they started with.
   */
  void setConcurrentPartUploads(size_t limit);

  /**
   * Start writing the object for upload `id`
   *
   * @param length Total length if known, used to size parts
   * @throws UploadError(SizeLimitExceeded) if length exceeds the size policy
   */
  std::unique_ptr<MultipartUpload> newUpload(
    const std::string& id, const ObjectMetadata& metadata,
    std::optional<uint64_t> length = std::nullopt
  );

  /**
   * Build `destination_id` server-side from finished objects, one part per
   * source in the given order. Every source except the last must be at
   * least min_part_size.
   *
   * @throws UploadError on invalid sources or backend failure; the destination
   *         session is aborted
   */
  void concatenate(
    const std::string& destination_id, const std::vector<std::string>& source_ids,
    const ObjectMetadata& metadata
  );

  /**
   * Delete the objects and .info objects of finished uploads
   *
   * @throws UploadError if any object could not be deleted
   */
  void terminate(const std::vector<std::string>& ids);

  std::string objectKey(const std::string& id) const;
  std::string metadataKey(const std::string& id) const;

  std::shared_ptr<UploadSemaphore> semaphore() const;

  const StoreConfig& config() const {
    return config_;
  }

private:
  UploadOptions uploadOptions() const;

  StoreConfig config_;
  ObjectBackend& backend_;
  MetricsSink& metrics_;

  mutable std::mutex mutex_;
  std::shared_ptr<UploadSemaphore> semaphore_;
};

}  // namespace upload
}  // namespace ferry

#endif  // FERRY_MULTIPART_STORE_HPP
