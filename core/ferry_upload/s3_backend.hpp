// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef FERRY_S3_BACKEND_HPP
#define FERRY_S3_BACKEND_HPP

#include <memory>
#include <string>
#include <vector>

#include "object_backend.hpp"

namespace ferry {
namespace upload {

/**
 * S3 connection options
 */
struct S3Config {
  std::string endpoint_url;  // e.g., "https://play.min.io"; empty for AWS S3
  std::string bucket;
  std::string region = "us-east-1";
  bool use_ssl = true;
  bool verify_ssl = true;

  // If empty, read from AWS_ACCESS_KEY_ID and AWS_SECRET_ACCESS_KEY
  std::string access_key;
  std::string secret_key;

  int connect_timeout_ms = 10000;
  int request_timeout_ms = 300000;  // a 5 GiB part on a slow link

  // Part retries are handled by SessionManager; keep the SDK's own retries off by default.
  int max_sdk_retries = 0;

  // Declare SHA-256 part checksums when creating a multipart upload. Parts
  // must then carry one, so this is off when content hashes are disabled.
  bool checksum_sha256 = true;
};

/**
 * ObjectBackend over the AWS SDK for C++
 *
 * Works with AWS S3 and S3-compatible stores (MinIO, Ceph RGW, OSS). Custom
 * endpoints use path-style addressing.
 */
class S3Backend : public ObjectBackend {
public:
  explicit S3Backend(const S3Config& config);
  ~S3Backend() override;

  // Non-copyable, non-movable
  S3Backend(const S3Backend&) = delete;
  S3Backend& operator=(const S3Backend&) = delete;
  S3Backend(S3Backend&&) = delete;
  S3Backend& operator=(S3Backend&&) = delete;

  BackendResult putObject(
    const std::string& key, const std::shared_ptr<std::iostream>& body, uint64_t content_length,
    const ObjectMetadata& metadata
  ) override;
  BackendResult getObject(const std::string& key) override;
  BackendResult headObject(const std::string& key) override;
  BackendResult deleteObject(const std::string& key) override;
  BackendResult deleteObjects(const std::vector<std::string>& keys) override;
  BackendResult createMultipartUpload(
    const std::string& key, const ObjectMetadata& metadata
  ) override;
  BackendResult uploadPart(const UploadPartRequest& request) override;
  BackendResult uploadPartCopy(const UploadPartCopyRequest& request) override;
  BackendResult completeMultipartUpload(const CompleteMultipartUploadRequest& request) override;
  BackendResult abortMultipartUpload(
    const std::string& key, const std::string& upload_id
  ) override;

  /**
   * @return true if the S3 error code denotes a transient failure
   */
  static bool isRetryableError(const std::string& error_code);

  /**
   * Remove the surrounding double quotes S3 puts around ETags
   */
  static std::string normalizeETag(const std::string& etag);

  const std::string& bucket() const;
  const std::string& endpoint() const;

private:
  class Impl;
  std::unique_ptr<Impl> impl_;
};

}  // namespace upload
}  // namespace ferry

#endif  // FERRY_S3_BACKEND_HPP
