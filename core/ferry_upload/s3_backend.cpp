// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "s3_backend.hpp"

#include <aws/core/Aws.h>
#include <aws/core/auth/AWSCredentials.h>
#include <aws/core/client/DefaultRetryStrategy.h>
#include <aws/s3/S3Client.h>
#include <aws/s3/S3Errors.h>
#include <aws/s3/model/ChecksumAlgorithm.h>
#include <aws/s3/model/AbortMultipartUploadRequest.h>
#include <aws/s3/model/CompleteMultipartUploadRequest.h>
#include <aws/s3/model/CompletedMultipartUpload.h>
#include <aws/s3/model/CompletedPart.h>
#include <aws/s3/model/CreateMultipartUploadRequest.h>
#include <aws/s3/model/Delete.h>
#include <aws/s3/model/DeleteObjectRequest.h>
#include <aws/s3/model/DeleteObjectsRequest.h>
#include <aws/s3/model/GetObjectRequest.h>
#include <aws/s3/model/HeadObjectRequest.h>
#include <aws/s3/model/ObjectIdentifier.h>
#include <aws/s3/model/PutObjectRequest.h>
#include <aws/s3/model/UploadPartCopyRequest.h>
#include <aws/s3/model/UploadPartRequest.h>

#include <algorithm>
#include <cstdlib>
#include <mutex>
#include <sstream>

#include "retry_policy.hpp"

#define FERRY_LOG_COMPONENT "s3_backend"
#include <ferry_log_macros.hpp>

namespace ferry {
namespace upload {

using logging::kv;

// =============================================================================
// AWS SDK Lifecycle Management
// =============================================================================
// Aws::InitAPI/ShutdownAPI must bracket every SDK object in the process.
// Backends share one reference-counted initialization.
// =============================================================================

class AwsSdkManager {
public:
  static AwsSdkManager& instance() {
    static AwsSdkManager instance;
    return instance;
  }

  void addRef() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!initialized_) {
      options_.loggingOptions.logLevel = Aws::Utils::Logging::LogLevel::Off;
      Aws::InitAPI(options_);
      initialized_ = true;
    }
    ++ref_count_;
  }

  void release() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (ref_count_ > 0 && --ref_count_ == 0 && initialized_) {
      Aws::ShutdownAPI(options_);
      initialized_ = false;
    }
  }

private:
  AwsSdkManager() = default;
  ~AwsSdkManager() = default;

  std::mutex mutex_;
  bool initialized_ = false;
  int ref_count_ = 0;
  Aws::SDKOptions options_;
};

namespace {

// S3 rejects DeleteObjects requests with more keys than this.
constexpr size_t kMaxKeysPerDelete = 1000;

template <typename Outcome>
BackendResult failureFrom(const char* operation, const std::string& key, const Outcome& outcome) {
  const auto& error = outcome.GetError();
  std::string code = error.GetExceptionName();
  if (code.empty()) {
    if (error.GetResponseCode() == Aws::Http::HttpResponseCode::NOT_FOUND) {
      code = "NoSuchKey";
    } else {
      code = "HttpStatus" + std::to_string(static_cast<int>(error.GetResponseCode()));
    }
  }
  std::string message = error.GetMessage();
  if (message.empty()) {
    message = std::string(operation) + " failed";
  }
  bool retryable = isTransientErrorCode(code) || error.ShouldRetry();

  FERRY_LOG_DEBUG(operation << " failed" << kv("key", key) << kv("code", code)
                            << kv("retryable", retryable) << kv("error", message));
  return BackendResult::Failure(message, code, retryable);
}

Aws::Map<Aws::String, Aws::String> toAwsMetadata(const ObjectMetadata& metadata) {
  Aws::Map<Aws::String, Aws::String> aws_metadata;
  for (const auto& [key, value] : metadata) {
    aws_metadata[key] = value;
  }
  return aws_metadata;
}

ObjectMetadata fromAwsMetadata(const Aws::Map<Aws::String, Aws::String>& aws_metadata) {
  ObjectMetadata metadata;
  for (const auto& [key, value] : aws_metadata) {
    metadata[key] = value;
  }
  return metadata;
}

}  // namespace

// =============================================================================
// S3Backend Implementation
// =============================================================================

class S3Backend::Impl {
public:
  S3Config config;
  std::shared_ptr<Aws::S3::S3Client> client;

  Impl() {
    AwsSdkManager::instance().addRef();
  }

  ~Impl() {
    // The client must be gone before release() may shut the SDK down.
    client.reset();
    AwsSdkManager::instance().release();
  }

  void initClient() {
    Aws::Client::ClientConfiguration client_config;
    client_config.region = config.region;

    if (!config.endpoint_url.empty()) {
      std::string endpoint = config.endpoint_url;
      if (endpoint.back() == '/') {
        endpoint.pop_back();
      }
      client_config.endpointOverride = endpoint;
    }

    client_config.verifySSL = config.verify_ssl;
    client_config.scheme = config.use_ssl ? Aws::Http::Scheme::HTTPS : Aws::Http::Scheme::HTTP;
    client_config.connectTimeoutMs = config.connect_timeout_ms;
    client_config.requestTimeoutMs = config.request_timeout_ms;
    client_config.retryStrategy =
      Aws::MakeShared<Aws::Client::DefaultRetryStrategy>("FerryS3Backend", config.max_sdk_retries);

    Aws::Auth::AWSCredentials credentials(config.access_key, config.secret_key);

    // Path-style addressing (virtual addressing off) for custom endpoints such as MinIO.
    bool use_virtual_addressing = config.endpoint_url.empty();

    client = std::make_shared<Aws::S3::S3Client>(
      credentials, client_config, Aws::Client::AWSAuthV4Signer::PayloadSigningPolicy::Never,
      use_virtual_addressing
    );
  }
};

S3Backend::S3Backend(const S3Config& config)
    : impl_(std::make_unique<Impl>()) {
  impl_->config = config;

  if (impl_->config.access_key.empty()) {
    if (const char* key = std::getenv("AWS_ACCESS_KEY_ID")) {
      impl_->config.access_key = key;
    }
  }
  if (impl_->config.secret_key.empty()) {
    if (const char* key = std::getenv("AWS_SECRET_ACCESS_KEY")) {
      impl_->config.secret_key = key;
    }
  }

  impl_->initClient();
  FERRY_LOG_INFO("S3 backend ready" << kv("bucket", impl_->config.bucket)
                                    << kv("endpoint", impl_->config.endpoint_url)
                                    << kv("region", impl_->config.region));
}

S3Backend::~S3Backend() = default;

BackendResult S3Backend::putObject(
  const std::string& key, const std::shared_ptr<std::iostream>& body, uint64_t content_length,
  const ObjectMetadata& metadata
) {
  Aws::S3::Model::PutObjectRequest request;
  request.SetBucket(impl_->config.bucket);
  request.SetKey(key);
  request.SetBody(body);
  request.SetContentLength(static_cast<long long>(content_length));
  request.SetMetadata(toAwsMetadata(metadata));

  auto outcome = impl_->client->PutObject(request);
  if (!outcome.IsSuccess()) {
    return failureFrom("PutObject", key, outcome);
  }
  BackendResult result = BackendResult::Success();
  result.etag = normalizeETag(outcome.GetResult().GetETag());
  return result;
}

BackendResult S3Backend::getObject(const std::string& key) {
  Aws::S3::Model::GetObjectRequest request;
  request.SetBucket(impl_->config.bucket);
  request.SetKey(key);

  auto outcome = impl_->client->GetObject(request);
  if (!outcome.IsSuccess()) {
    return failureFrom("GetObject", key, outcome);
  }
  Aws::S3::Model::GetObjectResult object = outcome.GetResultWithOwnership();
  std::ostringstream body;
  body << object.GetBody().rdbuf();

  BackendResult result = BackendResult::Success();
  result.body = body.str();
  result.etag = normalizeETag(object.GetETag());
  result.content_length = static_cast<uint64_t>(object.GetContentLength());
  result.metadata = fromAwsMetadata(object.GetMetadata());
  return result;
}

BackendResult S3Backend::headObject(const std::string& key) {
  Aws::S3::Model::HeadObjectRequest request;
  request.SetBucket(impl_->config.bucket);
  request.SetKey(key);

  auto outcome = impl_->client->HeadObject(request);
  if (!outcome.IsSuccess()) {
    return failureFrom("HeadObject", key, outcome);
  }
  const auto& head = outcome.GetResult();
  BackendResult result = BackendResult::Success();
  result.etag = normalizeETag(head.GetETag());
  result.content_length = static_cast<uint64_t>(head.GetContentLength());
  result.metadata = fromAwsMetadata(head.GetMetadata());
  return result;
}

BackendResult S3Backend::deleteObject(const std::string& key) {
  Aws::S3::Model::DeleteObjectRequest request;
  request.SetBucket(impl_->config.bucket);
  request.SetKey(key);

  auto outcome = impl_->client->DeleteObject(request);
  if (!outcome.IsSuccess()) {
    return failureFrom("DeleteObject", key, outcome);
  }
  return BackendResult::Success();
}

BackendResult S3Backend::deleteObjects(const std::vector<std::string>& keys) {
  BackendResult result = BackendResult::Success();

  for (size_t begin = 0; begin < keys.size(); begin += kMaxKeysPerDelete) {
    size_t end = std::min(keys.size(), begin + kMaxKeysPerDelete);
    Aws::S3::Model::Delete batch;
    for (size_t i = begin; i < end; ++i) {
      batch.AddObjects(Aws::S3::Model::ObjectIdentifier().WithKey(keys[i]));
    }
    batch.SetQuiet(true);

    Aws::S3::Model::DeleteObjectsRequest request;
    request.SetBucket(impl_->config.bucket);
    request.SetDelete(batch);

    auto outcome = impl_->client->DeleteObjects(request);
    if (!outcome.IsSuccess()) {
      BackendResult failure = failureFrom("DeleteObjects", keys[begin], outcome);
      failure.failed_keys.assign(keys.begin() + static_cast<std::ptrdiff_t>(begin), keys.end());
      return failure;
    }
    for (const auto& error : outcome.GetResult().GetErrors()) {
      // A key that is already gone counts as deleted.
      if (error.GetCode() == "NoSuchKey") {
        continue;
      }
      result.success = false;
      result.failed_keys.push_back(error.GetKey());
      result.error_code = error.GetCode();
      result.error_message = error.GetMessage();
    }
  }
  return result;
}

BackendResult S3Backend::createMultipartUpload(
  const std::string& key, const ObjectMetadata& metadata
) {
  Aws::S3::Model::CreateMultipartUploadRequest request;
  request.SetBucket(impl_->config.bucket);
  request.SetKey(key);
  request.SetMetadata(toAwsMetadata(metadata));
  if (impl_->config.checksum_sha256) {
    request.SetChecksumAlgorithm(Aws::S3::Model::ChecksumAlgorithm::SHA256);
  }

  auto outcome = impl_->client->CreateMultipartUpload(request);
  if (!outcome.IsSuccess()) {
    return failureFrom("CreateMultipartUpload", key, outcome);
  }
  BackendResult result = BackendResult::Success();
  result.upload_id = outcome.GetResult().GetUploadId();
  return result;
}

BackendResult S3Backend::uploadPart(const UploadPartRequest& part) {
  Aws::S3::Model::UploadPartRequest request;
  request.SetBucket(impl_->config.bucket);
  request.SetKey(part.key);
  request.SetUploadId(part.upload_id);
  request.SetPartNumber(part.part_number);
  request.SetBody(part.body);
  request.SetContentLength(static_cast<long long>(part.content_length));
  if (!part.content_md5.empty()) {
    request.SetContentMD5(part.content_md5);
  }
  if (!part.checksum_sha256.empty()) {
    request.SetChecksumAlgorithm(Aws::S3::Model::ChecksumAlgorithm::SHA256);
    request.SetChecksumSHA256(part.checksum_sha256);
  }

  auto outcome = impl_->client->UploadPart(request);
  if (!outcome.IsSuccess()) {
    return failureFrom("UploadPart", part.key, outcome);
  }
  BackendResult result = BackendResult::Success();
  result.etag = normalizeETag(outcome.GetResult().GetETag());
  result.checksum_sha256 = outcome.GetResult().GetChecksumSHA256();
  return result;
}

BackendResult S3Backend::uploadPartCopy(const UploadPartCopyRequest& part) {
  Aws::S3::Model::UploadPartCopyRequest request;
  request.SetBucket(impl_->config.bucket);
  request.SetKey(part.key);
  request.SetUploadId(part.upload_id);
  request.SetPartNumber(part.part_number);
  request.SetCopySource(impl_->config.bucket + "/" + part.source_key);

  auto outcome = impl_->client->UploadPartCopy(request);
  if (!outcome.IsSuccess()) {
    return failureFrom("UploadPartCopy", part.key, outcome);
  }
  BackendResult result = BackendResult::Success();
  const auto& copied = outcome.GetResult().GetCopyPartResult();
  result.etag = normalizeETag(copied.GetETag());
  result.checksum_sha256 = copied.GetChecksumSHA256();
  return result;
}

BackendResult S3Backend::completeMultipartUpload(const CompleteMultipartUploadRequest& complete) {
  Aws::S3::Model::CompletedMultipartUpload upload;
  for (const auto& part : complete.parts) {
    Aws::S3::Model::CompletedPart completed;
    completed.SetPartNumber(part.part_number);
    completed.SetETag(part.etag);
    if (!part.checksum_sha256.empty()) {
      completed.SetChecksumSHA256(part.checksum_sha256);
    }
    upload.AddParts(completed);
  }

  Aws::S3::Model::CompleteMultipartUploadRequest request;
  request.SetBucket(impl_->config.bucket);
  request.SetKey(complete.key);
  request.SetUploadId(complete.upload_id);
  request.SetMultipartUpload(upload);

  auto outcome = impl_->client->CompleteMultipartUpload(request);
  if (!outcome.IsSuccess()) {
    return failureFrom("CompleteMultipartUpload", complete.key, outcome);
  }
  BackendResult result = BackendResult::Success();
  result.etag = normalizeETag(outcome.GetResult().GetETag());
  return result;
}

BackendResult S3Backend::abortMultipartUpload(
  const std::string& key, const std::string& upload_id
) {
  Aws::S3::Model::AbortMultipartUploadRequest request;
  request.SetBucket(impl_->config.bucket);
  request.SetKey(key);
  request.SetUploadId(upload_id);

  auto outcome = impl_->client->AbortMultipartUpload(request);
  if (!outcome.IsSuccess()) {
    return failureFrom("AbortMultipartUpload", key, outcome);
  }
  return BackendResult::Success();
}

bool S3Backend::isRetryableError(const std::string& error_code) {
  return isTransientErrorCode(error_code);
}

std::string S3Backend::normalizeETag(const std::string& etag) {
  if (etag.size() >= 2 && etag.front() == '"' && etag.back() == '"') {
    return etag.substr(1, etag.size() - 2);
  }
  return etag;
}

const std::string& S3Backend::bucket() const {
  return impl_->config.bucket;
}

const std::string& S3Backend::endpoint() const {
  return impl_->config.endpoint_url;
}

}  // namespace upload
}  // namespace ferry
