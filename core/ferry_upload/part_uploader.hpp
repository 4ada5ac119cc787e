// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef FERRY_PART_UPLOADER_HPP
#define FERRY_PART_UPLOADER_HPP

#include <atomic>
#include <string>

#include "disk_stager.hpp"
#include "metrics_sink.hpp"
#include "object_backend.hpp"
#include "session_manager.hpp"
#include "upload_semaphore.hpp"

namespace ferry {
namespace upload {

/**
 * Outcome of one upload attempt of one part
 */
struct PartOutcome {
  enum class Status { Uploaded, Failed, Canceled };

  Status status = Status::Canceled;
  std::string etag;
  ErrorKind error_kind = ErrorKind::SessionCanceled;
  std::string error_message;
  FailureDecision decision;  // set when status == Failed
};

/**
 * Uploads staged parts of one multipart upload
 *
 * Each attempt holds an UploadSemaphore permit for the duration of the backend
 * call. Success stores the ETag and releases the spool file; failures are
 * classified and reported to the SessionManager, which decides on retries.
 */
class PartUploader {
public:
  PartUploader(
    ObjectBackend& backend, UploadSemaphore& semaphore, MetricsSink& metrics,
    SessionManager& session, DiskStager& stager, bool disable_content_hashes
  );

  /**
   * One attempt to upload `part`
   *
   * @param canceled Abandons the wait for a permit when set
   */
  PartOutcome upload(const StagedPart& part, const std::atomic<bool>& canceled);

private:
  PartOutcome fail(const StagedPart& part, ErrorKind kind, const std::string& message);

  ObjectBackend& backend_;
  UploadSemaphore& semaphore_;
  MetricsSink& metrics_;
  SessionManager& session_;
  DiskStager& stager_;
  bool disable_content_hashes_;
};

}  // namespace upload
}  // namespace ferry

#endif  // FERRY_PART_UPLOADER_HPP
