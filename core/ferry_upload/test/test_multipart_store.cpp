// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

/**
 * Tests for MultipartStore: key layout, upload creation, concatenation and termination
 */

#include <gtest/gtest.h>

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <future>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "fake_backend.hpp"
#include "multipart_store.hpp"
#include "test_helpers.hpp"

using namespace ferry::upload;
using namespace ferry::upload::test;

namespace {

size_t threadCount() {
  size_t count = 0;
  for (const auto& entry : std::filesystem::directory_iterator("/proc/self/task")) {
    (void)entry;
    ++count;
  }
  return count;
}

}  // namespace

class MultipartStoreTest : public ::testing::Test {
protected:
  void SetUp() override {
    dir_ = createTempDir("ferry_store_test_");
    backend_.setMinPartSize(tinyPolicy().min_part_size);

    config_.object_prefix = "files";
    config_.size_policy = tinyPolicy();
    config_.max_buffered_parts = 4;
    config_.concurrent_part_uploads = 3;
    config_.temporary_directory = dir_;
    config_.retry.max_retries = 2;
    config_.retry.initial_delay = std::chrono::milliseconds(0);
  }

  void TearDown() override {
    cleanupTempDir(dir_);
  }

  bool wasDeleted(const std::string& key) const {
    auto deleted = backend_.deletedKeys();
    return std::find(deleted.begin(), deleted.end(), key) != deleted.end();
  }

  std::string dir_;
  FakeBackend backend_;
  RecordingMetricsSink metrics_;
  StoreConfig config_;
};

// ============================================================================
// Configuration and keys
// ============================================================================

TEST_F(MultipartStoreTest, RejectsInvalidConfig) {
  config_.concurrent_part_uploads = 0;
  try {
    MultipartStore store(config_, backend_, metrics_);
    FAIL() << "expected InvalidConfiguration";
  } catch (const UploadError& e) {
    EXPECT_EQ(e.kind(), ErrorKind::InvalidConfiguration);
  }
}

TEST_F(MultipartStoreTest, ObjectKeysUsePrefix) {
  MultipartStore store(config_, backend_, metrics_);
  EXPECT_EQ(store.objectKey("abc"), "files/abc");
  EXPECT_EQ(store.metadataKey("abc"), "files/abc.info");
}

TEST_F(MultipartStoreTest, MetadataPrefixOverridesObjectPrefix) {
  config_.metadata_object_prefix = "meta";
  MultipartStore store(config_, backend_, metrics_);
  EXPECT_EQ(store.objectKey("abc"), "files/abc");
  EXPECT_EQ(store.metadataKey("abc"), "meta/abc.info");
}

TEST_F(MultipartStoreTest, EmptyPrefixUsesBareId) {
  config_.object_prefix.clear();
  MultipartStore store(config_, backend_, metrics_);
  EXPECT_EQ(store.objectKey("abc"), "abc");
  EXPECT_EQ(store.metadataKey("abc"), "abc.info");
}

// ============================================================================
// Uploads
// ============================================================================

TEST_F(MultipartStoreTest, NewUploadWritesUnderPrefix) {
  MultipartStore store(config_, backend_, metrics_);
  auto upload = store.newUpload("abc", {{"filename", "a.txt"}});
  EXPECT_EQ(upload->id(), "abc");
  EXPECT_EQ(upload->objectKey(), "files/abc");

  std::string data = makePayload(100);
  upload->write(data);
  EXPECT_EQ(upload->finish(), SessionState::Completed);
  EXPECT_EQ(backend_.object("files/abc"), data);
  EXPECT_EQ(backend_.objectMetadata("files/abc").at("filename"), "a.txt");
  EXPECT_LE(backend_.maxUploadsInFlight(), 3u);
}

TEST_F(MultipartStoreTest, NewUploadRejectsOversizedLength) {
  MultipartStore store(config_, backend_, metrics_);
  try {
    store.newUpload("abc", {}, config_.size_policy.max_object_size + 1);
    FAIL() << "expected SizeLimitExceeded";
  } catch (const UploadError& e) {
    EXPECT_EQ(e.kind(), ErrorKind::SizeLimitExceeded);
  }
  EXPECT_EQ(backend_.createCalls(), 0);
}

TEST_F(MultipartStoreTest, SetConcurrentPartUploadsAffectsNewUploadsOnly) {
  MultipartStore store(config_, backend_, metrics_);
  auto before = store.semaphore();
  EXPECT_EQ(before->limit(), 3u);

  store.setConcurrentPartUploads(5);
  auto after = store.semaphore();
  EXPECT_NE(before, after);
  EXPECT_EQ(after->limit(), 5u);
  EXPECT_EQ(store.config().concurrent_part_uploads, 5u);
  EXPECT_EQ(metrics_.limit(), 5);
}

// ============================================================================
// concatenate
// ============================================================================

TEST_F(MultipartStoreTest, ConcatenateCopiesSourcesInOrder) {
  backend_.putObjectDirect("files/a", "AAAAAAAA");
  backend_.putObjectDirect("files/b", "BBBBBBBB");
  backend_.putObjectDirect("files/c", "CC");
  MultipartStore store(config_, backend_, metrics_);

  store.concatenate("dest", {"a", "b", "c"}, {{"filename", "joined.bin"}});

  EXPECT_EQ(backend_.object("files/dest"), "AAAAAAAABBBBBBBBCC");
  EXPECT_EQ(backend_.objectMetadata("files/dest").at("filename"), "joined.bin");
  EXPECT_EQ(backend_.copyCalls(), 3);
  EXPECT_EQ(backend_.completeCalls(), 1);
  EXPECT_EQ(metrics_.requests(ops::kHeadObject), 3);
  EXPECT_EQ(metrics_.requests(ops::kUploadPartCopy), 3);
}

TEST_F(MultipartStoreTest, ConcatenateRejectsEmptySourceList) {
  MultipartStore store(config_, backend_, metrics_);
  EXPECT_THROW(store.concatenate("dest", {}, {}), std::invalid_argument);
}

TEST_F(MultipartStoreTest, ConcatenateRejectsSmallNonFinalSource) {
  backend_.putObjectDirect("files/a", "AA");
  backend_.putObjectDirect("files/b", "BBBBBBBB");
  MultipartStore store(config_, backend_, metrics_);

  try {
    store.concatenate("dest", {"a", "b"}, {});
    FAIL() << "expected SizeLimitExceeded";
  } catch (const UploadError& e) {
    EXPECT_EQ(e.kind(), ErrorKind::SizeLimitExceeded);
  }
  EXPECT_EQ(backend_.createCalls(), 0);
}

TEST_F(MultipartStoreTest, ConcatenateMissingSourceIsPermanent) {
  backend_.putObjectDirect("files/a", "AAAAAAAA");
  MultipartStore store(config_, backend_, metrics_);

  try {
    store.concatenate("dest", {"a", "missing"}, {});
    FAIL() << "expected BackendPermanentError";
  } catch (const UploadError& e) {
    EXPECT_EQ(e.kind(), ErrorKind::BackendPermanentError);
  }
  EXPECT_EQ(backend_.createCalls(), 0);
}

TEST_F(MultipartStoreTest, ConcatenateRetriesTransientCopyFailure) {
  backend_.putObjectDirect("files/a", "AAAAAAAA");
  backend_.putObjectDirect("files/b", "BB");
  backend_.failUploadPartCopy(1, BackendResult::Failure("slow down", "SlowDown"));
  MultipartStore store(config_, backend_, metrics_);

  store.concatenate("dest", {"a", "b"}, {});
  EXPECT_EQ(backend_.object("files/dest"), "AAAAAAAABB");
  EXPECT_EQ(backend_.copyCalls(), 3);
}

TEST_F(MultipartStoreTest, ConcatenateCopyFailureAbortsDestination) {
  backend_.putObjectDirect("files/a", "AAAAAAAA");
  backend_.putObjectDirect("files/b", "BBBBBBBB");
  backend_.failUploadPartCopy(2, BackendResult::Failure("Access Denied", "AccessDenied"));
  MultipartStore store(config_, backend_, metrics_);

  try {
    store.concatenate("dest", {"a", "b"}, {});
    FAIL() << "expected BackendPermanentError";
  } catch (const UploadError& e) {
    EXPECT_EQ(e.kind(), ErrorKind::BackendPermanentError);
  }
  EXPECT_EQ(backend_.abortCalls(), 1);
  EXPECT_EQ(backend_.completeCalls(), 0);
  EXPECT_FALSE(backend_.hasObject("files/dest"));
}

TEST_F(MultipartStoreTest, ConcatenateRunsBoundedCopyWorkers) {
  std::vector<std::string> sources;
  std::string expected;
  for (int i = 0; i < 40; ++i) {
    std::string id = "s" + std::to_string(i);
    std::string data = makePayload(8, static_cast<uint32_t>(i));
    backend_.putObjectDirect("files/" + id, data);
    sources.push_back(id);
    expected += data;
  }
  MultipartStore store(config_, backend_, metrics_);
  size_t threads_before = threadCount();

  backend_.holdUploads();
  auto joined = std::async(std::launch::async, [&] {
    store.concatenate("dest", sources, {});
  });
  EXPECT_TRUE(backend_.waitForUploadsInFlight(3, std::chrono::seconds(5)));
  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  EXPECT_EQ(backend_.uploadsInFlight(), 3u);
  // The calling thread plus one copier per permit
  EXPECT_LE(threadCount(), threads_before + 1 + 3);

  backend_.releaseUploads();
  joined.get();
  EXPECT_EQ(backend_.object("files/dest"), expected);
  EXPECT_EQ(backend_.copyCalls(), 40);
  EXPECT_LE(backend_.maxUploadsInFlight(), 3u);
  EXPECT_EQ(backend_.abortCalls(), 0);
}

TEST_F(MultipartStoreTest, ConcatenateStopsRemainingCopiesAfterPermanentFailure) {
  std::vector<std::string> sources;
  for (int i = 0; i < 30; ++i) {
    std::string id = "s" + std::to_string(i);
    backend_.putObjectDirect("files/" + id, makePayload(8, static_cast<uint32_t>(i)));
    sources.push_back(id);
  }
  backend_.failUploadPartCopy(1, BackendResult::Failure("Access Denied", "AccessDenied"));
  MultipartStore store(config_, backend_, metrics_);

  try {
    store.concatenate("dest", sources, {});
    FAIL() << "expected BackendPermanentError";
  } catch (const UploadError& e) {
    EXPECT_EQ(e.kind(), ErrorKind::BackendPermanentError);
  }
  EXPECT_LT(backend_.copyCalls(), 30);
  EXPECT_EQ(backend_.abortCalls(), 1);
  EXPECT_FALSE(backend_.hasObject("files/dest"));
}

// ============================================================================
// terminate
// ============================================================================

TEST_F(MultipartStoreTest, TerminateDeletesObjectAndInfo) {
  backend_.putObjectDirect("files/a", "data");
  backend_.putObjectDirect("files/a.info", "{}");
  backend_.putObjectDirect("files/b", "data");
  MultipartStore store(config_, backend_, metrics_);

  store.terminate({"a"});
  EXPECT_FALSE(backend_.hasObject("files/a"));
  EXPECT_FALSE(backend_.hasObject("files/a.info"));
  EXPECT_TRUE(backend_.hasObject("files/b"));
  EXPECT_TRUE(wasDeleted("files/a"));
  EXPECT_TRUE(wasDeleted("files/a.info"));
  EXPECT_EQ(metrics_.requests(ops::kDeleteObjects), 1);
}

TEST_F(MultipartStoreTest, TerminateUsesMetadataPrefix) {
  config_.metadata_object_prefix = "meta";
  MultipartStore store(config_, backend_, metrics_);
  store.terminate({"a"});
  EXPECT_TRUE(wasDeleted("files/a"));
  EXPECT_TRUE(wasDeleted("meta/a.info"));
}

TEST_F(MultipartStoreTest, TerminateReportsUndeletableObjects) {
  backend_.failDelete("files/b.info");
  MultipartStore store(config_, backend_, metrics_);

  try {
    store.terminate({"a", "b"});
    FAIL() << "expected BackendPermanentError";
  } catch (const UploadError& e) {
    EXPECT_EQ(e.kind(), ErrorKind::BackendPermanentError);
  }
  EXPECT_TRUE(wasDeleted("files/a"));
}

TEST_F(MultipartStoreTest, TerminateWithoutIdsIsNoOp) {
  MultipartStore store(config_, backend_, metrics_);
  store.terminate({});
  EXPECT_TRUE(backend_.deletedKeys().empty());
  EXPECT_EQ(metrics_.requests(ops::kDeleteObjects), 0);
}
