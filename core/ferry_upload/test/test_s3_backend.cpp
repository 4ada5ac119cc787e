// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

/**
 * Unit tests for S3Backend
 *
 * Tests getters and static helpers. The round trip against a live store runs
 * only when MinIO credentials are present in the environment.
 */

#include <gtest/gtest.h>

#include <cstdlib>
#include <memory>
#include <sstream>
#include <string>

#include "content_hash.hpp"
#include "s3_backend.hpp"
#include "test_helpers.hpp"

using namespace ferry::upload;
using namespace ferry::upload::test;

class S3BackendTest : public ::testing::Test {
protected:
  void SetUp() override {
    config_.bucket = "test-bucket";
    config_.endpoint_url = "http://localhost:9000";
    config_.region = "us-east-1";
    config_.use_ssl = false;
    config_.verify_ssl = false;
    // Dummy credentials; no request is sent
    config_.access_key = "test_access_key";
    config_.secret_key = "test_secret_key";
  }

  S3Config config_;
};

TEST_F(S3BackendTest, DefaultConfig) {
  S3Config config;
  EXPECT_EQ(config.region, "us-east-1");
  EXPECT_TRUE(config.use_ssl);
  EXPECT_EQ(config.max_sdk_retries, 0);
  EXPECT_EQ(config.request_timeout_ms, 300000);
  EXPECT_TRUE(config.checksum_sha256);
}

TEST_F(S3BackendTest, Getters) {
  S3Backend backend(config_);
  EXPECT_EQ(backend.bucket(), "test-bucket");
  EXPECT_EQ(backend.endpoint(), "http://localhost:9000");
}

TEST_F(S3BackendTest, EmptyEndpointMeansAws) {
  config_.endpoint_url = "";
  S3Backend backend(config_);
  EXPECT_EQ(backend.endpoint(), "");
}

TEST_F(S3BackendTest, SeveralBackendsShareSdk) {
  auto first = std::make_unique<S3Backend>(config_);
  {
    S3Backend second(config_);
    EXPECT_EQ(second.bucket(), "test-bucket");
  }
  EXPECT_EQ(first->bucket(), "test-bucket");
}

TEST_F(S3BackendTest, IsRetryableError) {
  EXPECT_TRUE(S3Backend::isRetryableError("RequestTimeout"));
  EXPECT_TRUE(S3Backend::isRetryableError("SlowDown"));
  EXPECT_TRUE(S3Backend::isRetryableError("ServiceUnavailable"));
  EXPECT_FALSE(S3Backend::isRetryableError("AccessDenied"));
  EXPECT_FALSE(S3Backend::isRetryableError("NoSuchUpload"));
  EXPECT_FALSE(S3Backend::isRetryableError(""));
}

TEST_F(S3BackendTest, NormalizeETag) {
  EXPECT_EQ(S3Backend::normalizeETag("\"abc123\""), "abc123");
  EXPECT_EQ(S3Backend::normalizeETag("abc123"), "abc123");
  EXPECT_EQ(S3Backend::normalizeETag("\"\""), "");
  EXPECT_EQ(S3Backend::normalizeETag(""), "");
}

TEST_F(S3BackendTest, BackendResultFactories) {
  auto ok = BackendResult::Success();
  EXPECT_TRUE(ok.success);
  EXPECT_TRUE(ok.error_code.empty());

  auto failed = BackendResult::Failure("Slow Down", "SlowDown", true);
  EXPECT_FALSE(failed.success);
  EXPECT_EQ(failed.error_message, "Slow Down");
  EXPECT_EQ(failed.error_code, "SlowDown");
  EXPECT_TRUE(failed.is_retryable);
}

// ============================================================================
// Live store
// ============================================================================

TEST(S3BackendIntegrationTest, MultipartRoundTrip) {
  if (!isMinIOAvailable()) {
    GTEST_SKIP() << "AWS_ACCESS_KEY_ID/AWS_SECRET_ACCESS_KEY not set";
  }
  S3Config config;
  const char* endpoint = std::getenv("FERRY_TEST_S3_ENDPOINT");
  const char* bucket = std::getenv("FERRY_TEST_S3_BUCKET");
  config.endpoint_url = endpoint ? endpoint : "http://localhost:9000";
  config.bucket = bucket ? bucket : "ferry-test";
  config.use_ssl = config.endpoint_url.find("https://") == 0;
  S3Backend backend(config);

  const std::string key = "ferry-test/roundtrip-" + std::to_string(std::rand());
  BackendResult created = backend.createMultipartUpload(key, {{"filename", "roundtrip.bin"}});
  ASSERT_TRUE(created.success) << created.error_code << ": " << created.error_message;

  // 5 MiB minimum for all but the last part
  std::string first(5 * kMiB, 'a');
  std::string second = "tail";
  CompleteMultipartUploadRequest complete;
  complete.key = key;
  complete.upload_id = created.upload_id;
  int number = 1;
  for (const std::string* data : {&first, &second}) {
    UploadPartRequest request;
    request.key = key;
    request.upload_id = created.upload_id;
    request.part_number = number;
    request.body = std::make_shared<std::stringstream>(*data);
    request.content_length = data->size();
    // The upload declared SHA-256 checksums, so every part carries one.
    PartDigests digests;
    ASSERT_TRUE(computePartDigests(*request.body, digests));
    request.content_md5 = digests.md5_base64;
    request.checksum_sha256 = digests.sha256_base64;
    BackendResult part = backend.uploadPart(request);
    ASSERT_TRUE(part.success) << part.error_code << ": " << part.error_message;
    EXPECT_EQ(part.checksum_sha256, digests.sha256_base64);
    complete.parts.push_back({number++, part.etag, part.checksum_sha256});
  }
  BackendResult completed = backend.completeMultipartUpload(complete);
  ASSERT_TRUE(completed.success) << completed.error_code << ": " << completed.error_message;

  BackendResult head = backend.headObject(key);
  ASSERT_TRUE(head.success);
  EXPECT_EQ(head.content_length, first.size() + second.size());
  EXPECT_EQ(head.metadata["filename"], "roundtrip.bin");

  EXPECT_TRUE(backend.deleteObjects({key}).success);
  EXPECT_FALSE(backend.headObject(key).success);
}
