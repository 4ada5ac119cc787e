// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "disk_stager.hpp"

#include <chrono>
#include <system_error>
#include <utility>

#include "upload_errors.hpp"

#define FERRY_LOG_COMPONENT "disk_stager"
#include <ferry_log_macros.hpp>

namespace ferry {
namespace upload {

namespace fs = std::filesystem;
using logging::kv;

DiskStager::DiskStager(
  const std::string& directory, size_t max_buffered_parts, MetricsSink& metrics,
  const std::string& file_prefix
)
    : max_buffered_parts_(max_buffered_parts == 0 ? 1 : max_buffered_parts)
    , metrics_(metrics)
    , file_prefix_(file_prefix) {
  std::error_code ec;
  directory_ = directory.empty() ? fs::temp_directory_path(ec) : fs::path(directory);
  if (ec) {
    throw UploadError(
      ErrorKind::StagingIOError, "cannot determine temporary directory: " + ec.message()
    );
  }
  fs::create_directories(directory_, ec);
  if (ec) {
    throw UploadError(
      ErrorKind::StagingIOError,
      "cannot create spool directory " + directory_.string() + ": " + ec.message()
    );
  }
}

DiskStager::~DiskStager() {
  releaseAll();
}

SpoolFile& DiskStager::openPart(uint32_t index) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (canceled_) {
      throw UploadError(ErrorKind::SessionCanceled, "staging canceled");
    }
    auto it = open_.find(index);
    if (it != open_.end()) {
      return it->second;
    }
  }
  // releaseAll() cannot run before the file is in open_.
  SpoolFile file = SpoolFile::create(directory_, file_prefix_);
  std::lock_guard<std::mutex> lock(mutex_);
  return open_.emplace(index, std::move(file)).first->second;
}

void DiskStager::appendLocked(uint32_t index, const char* data, size_t size) {
  auto start = std::chrono::steady_clock::now();
  openPart(index).append(data, size);
  metrics_.observeDiskWriteDuration(elapsedMs(start));
}

void DiskStager::appendToPart(uint32_t index, const char* data, size_t size) {
  std::lock_guard<std::mutex> producer(producer_mutex_);
  appendLocked(index, data, size);
}

void DiskStager::moveTail(uint32_t from_index, uint32_t to_index, uint64_t size) {
  std::lock_guard<std::mutex> producer(producer_mutex_);
  SpoolFile* from = nullptr;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (canceled_) {
      throw UploadError(ErrorKind::SessionCanceled, "staging canceled");
    }
    auto it = open_.find(from_index);
    if (it != open_.end()) {
      from = &it->second;
    }
  }
  if (!from) {
    throw UploadError(
      ErrorKind::StagingIOError, "part " + std::to_string(from_index) + " has no spool file"
    );
  }
  std::string tail = from->takeTail(size);
  appendLocked(to_index, tail.data(), tail.size());
  FERRY_LOG_DEBUG("relocated tail bytes" << kv("from", from_index) << kv("to", to_index)
                                         << kv("bytes", size));
}

void DiskStager::sealPart(uint32_t index, uint64_t offset, uint64_t size) {
  std::lock_guard<std::mutex> producer(producer_mutex_);
  // An empty sole part never saw an append.
  SpoolFile& file = openPart(index);
  file.finishWriting();
  if (file.size() != size) {
    throw UploadError(
      ErrorKind::StagingIOError, "part " + std::to_string(index) + " spooled " +
                                   std::to_string(file.size()) + " bytes, expected " +
                                   std::to_string(size)
    );
  }

  std::unique_lock<std::mutex> lock(mutex_);
  if (sealed_.size() >= max_buffered_parts_) {
    FERRY_LOG_DEBUG_EVERY_N(
      100, "staging full, producer waiting" << kv("index", index)
                                            << kv("buffered", sealed_.size())
    );
  }
  slot_cv_.wait(lock, [this] {
    return canceled_ || sealed_.size() < max_buffered_parts_;
  });
  if (canceled_) {
    throw UploadError(ErrorKind::SessionCanceled, "staging canceled");
  }

  auto it = open_.find(index);
  StagedPart part;
  part.index = index;
  part.offset = offset;
  part.size = size;
  part.path = it->second.path();
  sealed_.emplace(index, std::move(it->second));
  open_.erase(it);

  if (seal_callback_) {
    lock.unlock();
    seal_callback_(part);
    lock.lock();
  }
  if (canceled_) {
    throw UploadError(ErrorKind::SessionCanceled, "staging canceled");
  }
  ready_.push_back(part);
  lock.unlock();
  ready_cv_.notify_one();
}

std::optional<StagedPart> DiskStager::next() {
  std::unique_lock<std::mutex> lock(mutex_);
  ready_cv_.wait(lock, [this] {
    return canceled_ || closed_ || !ready_.empty();
  });
  if (canceled_ || ready_.empty()) {
    return std::nullopt;
  }
  StagedPart part = ready_.front();
  ready_.pop_front();
  return part;
}

std::shared_ptr<std::iostream> DiskStager::openForRead(const StagedPart& part) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = sealed_.find(part.index);
  if (it == sealed_.end()) {
    throw UploadError(
      ErrorKind::StagingIOError, "part " + std::to_string(part.index) + " is not staged"
    );
  }
  return it->second.openForRead();
}

void DiskStager::release(uint32_t index) {
  SpoolFile released;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sealed_.find(index);
    if (it == sealed_.end()) {
      return;
    }
    released = std::move(it->second);
    sealed_.erase(it);
  }
  slot_cv_.notify_one();
  // File removed here, outside the lock.
}

void DiskStager::close() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    closed_ = true;
  }
  ready_cv_.notify_all();
}

void DiskStager::cancel() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    canceled_ = true;
    ready_.clear();
  }
  slot_cv_.notify_all();
  ready_cv_.notify_all();
}

void DiskStager::releaseAll() {
  std::lock_guard<std::mutex> producer(producer_mutex_);
  std::map<uint32_t, SpoolFile> open;
  std::map<uint32_t, SpoolFile> sealed;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    open.swap(open_);
    sealed.swap(sealed_);
    ready_.clear();
  }
  slot_cv_.notify_all();
  if (!open.empty() || !sealed.empty()) {
    FERRY_LOG_DEBUG("releasing spool files" << kv("open", open.size())
                                            << kv("sealed", sealed.size()));
  }
}

bool DiskStager::canceled() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return canceled_;
}

size_t DiskStager::bufferedParts() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return sealed_.size();
}

size_t DiskStager::liveFiles() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return open_.size() + sealed_.size();
}

}  // namespace upload
}  // namespace ferry
