// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef FERRY_OBJECT_BACKEND_HPP
#define FERRY_OBJECT_BACKEND_HPP

#include <cstdint>
#include <iostream>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace ferry {
namespace upload {

using ObjectMetadata = std::map<std::string, std::string>;

/**
 * Result of a backend call
 *
 * Only the payload fields relevant to the operation are filled in.
 */
struct BackendResult {
  bool success = false;
  std::string etag;                      // put, upload-part, upload-part-copy, complete
  std::string checksum_sha256;           // upload-part, upload-part-copy, when returned
  std::string upload_id;                 // create-multipart-upload
  std::string body;                      // get
  uint64_t content_length = 0;           // get, head
  ObjectMetadata metadata;               // get, head
  std::vector<std::string> failed_keys;  // batch delete
  std::string error_message;
  std::string error_code;                // S3 error code for classification
  bool is_retryable = false;             // backend's own transient hint

  static BackendResult Success() {
    BackendResult result;
    result.success = true;
    return result;
  }

  static BackendResult Failure(
    const std::string& message, const std::string& code = "", bool retryable = false
  ) {
    BackendResult result;
    result.error_message = message;
    result.error_code = code;
    result.is_retryable = retryable;
    return result;
  }
};

struct UploadPartRequest {
  std::string key;
  std::string upload_id;
  int part_number = 0;  // 1-based
  std::shared_ptr<std::iostream> body;
  uint64_t content_length = 0;
  std::string content_md5;     // base64, empty when hashes are disabled
  std::string checksum_sha256;  // base64, empty when hashes are disabled
};

struct UploadPartCopyRequest {
  std::string key;
  std::string upload_id;
  int part_number = 0;  // 1-based
  std::string source_key;
};

struct CompletedPart {
  int part_number = 0;
  std::string etag;
  std::string checksum_sha256;  // required when the upload declared SHA-256 checksums
};

struct CompleteMultipartUploadRequest {
  std::string key;
  std::string upload_id;
  std::vector<CompletedPart> parts;  // ascending part_number
};

/**
 * Object-storage operations used by the write path
 *
 * Implementations must be safe to call from several worker threads at once.
 * Failures are reported through BackendResult, never by throwing.
 */
class ObjectBackend {
public:
  virtual ~ObjectBackend() = default;

  virtual BackendResult putObject(
    const std::string& key, const std::shared_ptr<std::iostream>& body, uint64_t content_length,
    const ObjectMetadata& metadata
  ) = 0;
  virtual BackendResult getObject(const std::string& key) = 0;
  virtual BackendResult headObject(const std::string& key) = 0;
  virtual BackendResult deleteObject(const std::string& key) = 0;

  /**
   * Delete several objects in one request. Keys that could not be deleted are
   * listed in failed_keys; success is false if any key failed.
   */
  virtual BackendResult deleteObjects(const std::vector<std::string>& keys) = 0;

  virtual BackendResult createMultipartUpload(
    const std::string& key, const ObjectMetadata& metadata
  ) = 0;
  virtual BackendResult uploadPart(const UploadPartRequest& request) = 0;
  virtual BackendResult uploadPartCopy(const UploadPartCopyRequest& request) = 0;
  virtual BackendResult completeMultipartUpload(const CompleteMultipartUploadRequest& request) = 0;
  virtual BackendResult abortMultipartUpload(
    const std::string& key, const std::string& upload_id
  ) = 0;
};

}  // namespace upload
}  // namespace ferry

#endif  // FERRY_OBJECT_BACKEND_HPP
