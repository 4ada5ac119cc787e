// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef FERRY_UPLOADER_MOCKS_HPP
#define FERRY_UPLOADER_MOCKS_HPP

#include <gmock/gmock.h>

#include <memory>
#include <string>
#include <vector>

#include "metrics_sink.hpp"
#include "object_backend.hpp"

namespace ferry {
namespace upload {
namespace test {

/**
 * Mock implementation of ObjectBackend for call-count expectations
 */
class MockObjectBackend : public ObjectBackend {
public:
  MOCK_METHOD(
    BackendResult, putObject,
    (const std::string& key, const std::shared_ptr<std::iostream>& body,
     uint64_t content_length, const ObjectMetadata& metadata),
    (override)
  );
  MOCK_METHOD(BackendResult, getObject, (const std::string& key), (override));
  MOCK_METHOD(BackendResult, headObject, (const std::string& key), (override));
  MOCK_METHOD(BackendResult, deleteObject, (const std::string& key), (override));
  MOCK_METHOD(
    BackendResult, deleteObjects, (const std::vector<std::string>& keys), (override)
  );
  MOCK_METHOD(
    BackendResult, createMultipartUpload,
    (const std::string& key, const ObjectMetadata& metadata), (override)
  );
  MOCK_METHOD(BackendResult, uploadPart, (const UploadPartRequest& request), (override));
  MOCK_METHOD(
    BackendResult, uploadPartCopy, (const UploadPartCopyRequest& request), (override)
  );
  MOCK_METHOD(
    BackendResult, completeMultipartUpload, (const CompleteMultipartUploadRequest& request),
    (override)
  );
  MOCK_METHOD(
    BackendResult, abortMultipartUpload,
    (const std::string& key, const std::string& upload_id), (override)
  );
};

/**
 * Mock implementation of MetricsSink
 */
class MockMetricsSink : public MetricsSink {
public:
  MOCK_METHOD(void, observeRequestDuration, (const std::string& operation, double ms), (override));
  MOCK_METHOD(void, observeDiskWriteDuration, (double ms), (override));
  MOCK_METHOD(void, setUploadSemaphoreDemand, (int64_t demand), (override));
  MOCK_METHOD(void, setUploadSemaphoreLimit, (int64_t limit), (override));
};

inline BackendResult createdResult(const std::string& upload_id) {
  BackendResult result = BackendResult::Success();
  result.upload_id = upload_id;
  return result;
}

inline BackendResult etagResult(const std::string& etag) {
  BackendResult result = BackendResult::Success();
  result.etag = etag;
  return result;
}

}  // namespace test
}  // namespace upload
}  // namespace ferry

#endif  // FERRY_UPLOADER_MOCKS_HPP
