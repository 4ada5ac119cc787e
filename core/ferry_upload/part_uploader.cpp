// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "part_uploader.hpp"

#include <chrono>

#include "content_hash.hpp"

#define FERRY_LOG_COMPONENT "part_uploader"
#include <ferry_log_macros.hpp>

namespace ferry {
namespace upload {

using logging::kv;

PartUploader::PartUploader(
  ObjectBackend& backend, UploadSemaphore& semaphore, MetricsSink& metrics,
  SessionManager& session, DiskStager& stager, bool disable_content_hashes
)
    : backend_(backend)
    , semaphore_(semaphore)
    , metrics_(metrics)
    , session_(session)
    , stager_(stager)
    , disable_content_hashes_(disable_content_hashes) {}

PartOutcome PartUploader::upload(const StagedPart& part, const std::atomic<bool>& canceled) {
  auto permit = semaphore_.acquire(canceled);
  if (!permit) {
    return PartOutcome{};
  }
  session_.markUploading(part.index);

  UploadPartRequest request;
  request.key = session_.objectKey();
  request.upload_id = session_.uploadId();
  request.part_number = static_cast<int>(part.index) + 1;
  request.content_length = part.size;
  try {
    request.body = stager_.openForRead(part);
  } catch (const UploadError& e) {
    return fail(part, e.kind(), e.message());
  }

  if (!disable_content_hashes_) {
    PartDigests digests;
    if (!computePartDigests(*request.body, digests)) {
      return fail(
        part, ErrorKind::StagingIOError, "cannot hash spool file " + part.path.string()
      );
    }
    request.content_md5 = digests.md5_base64;
    request.checksum_sha256 = digests.sha256_base64;
  }

  auto start = std::chrono::steady_clock::now();
  BackendResult result = backend_.uploadPart(request);
  metrics_.observeRequestDuration(ops::kUploadPart, elapsedMs(start));

  // The permit is held until the part has left the Uploading state; on the
  // failure paths it is released when fail() has returned.
  if (!result.success) {
    std::string msg = "upload part: " + result.error_message;
    if (!result.error_code.empty()) {
      msg += " (code: " + result.error_code + ")";
    }
    return fail(part, classifyBackendFailure(result), msg);
  }

  session_.markUploaded(
    part.index, result.etag,
    result.checksum_sha256.empty() ? request.checksum_sha256 : result.checksum_sha256
  );
  permit->release();
  stager_.release(part.index);
  FERRY_LOG_DEBUG("part uploaded" << kv("part", request.part_number) << kv("bytes", part.size)
                                  << kv("etag", result.etag));

  PartOutcome outcome;
  outcome.status = PartOutcome::Status::Uploaded;
  outcome.etag = result.etag;
  return outcome;
}

PartOutcome PartUploader::fail(
  const StagedPart& part, ErrorKind kind, const std::string& message
) {
  PartOutcome outcome;
  outcome.status = PartOutcome::Status::Failed;
  outcome.error_kind = kind;
  outcome.error_message = message;
  outcome.decision = session_.recordFailure(part.index, kind, message);
  return outcome;
}

}  // namespace upload
}  // namespace ferry
