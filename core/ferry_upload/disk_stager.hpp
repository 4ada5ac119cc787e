// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef FERRY_DISK_STAGER_HPP
#define FERRY_DISK_STAGER_HPP

#include <condition_variable>
#include <cstdint>
#include <deque>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>

#include "chunker.hpp"
#include "metrics_sink.hpp"
#include "spool_file.hpp"

namespace ferry {
namespace upload {

/**
 * A sealed part waiting for (or undergoing) upload
 */
struct StagedPart {
  uint32_t index = 0;
  uint64_t offset = 0;
  uint64_t size = 0;
  std::filesystem::path path;
};

/**
 * Spools parts to local disk and hands sealed parts to upload workers
 *
 * The producer (through the Chunker) writes into the open part's spool file.
 * Sealing a part makes it available to next(); it keeps a staging slot until
 * release(). At most max_buffered_parts sealed parts hold a slot; sealPart()
 * blocks while all slots are taken.
 *
 * Thread-safe: one producer, any number of worker threads. Producer calls are
 * serialized with releaseAll(), and once canceled they throw
 * UploadError(SessionCanceled) without touching the spool directory.
 */
class DiskStager : public ChunkConsumer {
public:
  using SealCallback = std::function<void(const StagedPart&)>;

  /**
   * @param directory Spool directory, created if missing; empty for the system temp dir
   * @param max_buffered_parts Number of staging slots (>= 1)
   * @param metrics Receives disk write durations
   * @param file_prefix Spool file name prefix
   * @throws UploadError(StagingIOError) if the directory cannot be created
   */
  DiskStager(
    const std::string& directory, size_t max_buffered_parts, MetricsSink& metrics,
    const std::string& file_prefix = "ferry-part-"
  );

  /**
   * Invoked by sealPart() on the producer thread once the part holds a slot
   * and before workers can see it. An exception aborts the seal.
   */
  void setSealCallback(SealCallback callback) {
    seal_callback_ = std::move(callback);
  }

  // Deletes every remaining spool file
  ~DiskStager() override;

  // Non-copyable, non-movable
  DiskStager(const DiskStager&) = delete;
  DiskStager& operator=(const DiskStager&) = delete;
  DiskStager(DiskStager&&) = delete;
  DiskStager& operator=(DiskStager&&) = delete;

  // ChunkConsumer, producer thread only
  // @throws UploadError(SessionCanceled) once cancel() was called
  void appendToPart(uint32_t index, const char* data, size_t size) override;
  void moveTail(uint32_t from_index, uint32_t to_index, uint64_t size) override;

  /**
   * Hand a part to the workers. Blocks while all staging slots are in use.
   *
   * @throws UploadError(SessionCanceled) if cancel() is called before a slot frees
   */
  void sealPart(uint32_t index, uint64_t offset, uint64_t size) override;

  /**
   * Next sealed part in index order. Blocks until one is available.
   *
   * @return nullopt once canceled, or closed and drained
   */
  std::optional<StagedPart> next();

  /**
   * Open a read stream over a staged part's spool file
   */
  std::shared_ptr<std::iostream> openForRead(const StagedPart& part) const;

  /**
   * Delete a part's spool file and free its staging slot
   */
  void release(uint32_t index);

  /**
   * No more parts will be sealed; next() returns nullopt once drained
   */
  void close();

  /**
   * Wake blocked producer and workers and stop handing out parts
   */
  void cancel();

  /**
   * Delete every spool file, open or sealed. Call only after workers stopped
   * and after cancel() when a producer may still be running; waits for the
   * producer call in progress.
   */
  void releaseAll();

  bool canceled() const;

  /**
   * Sealed parts currently holding a staging slot
   */
  size_t bufferedParts() const;

  /**
   * Spool files currently on disk, open parts included
   */
  size_t liveFiles() const;

  size_t maxBufferedParts() const {
    return max_buffered_parts_;
  }

  const std::filesystem::path& directory() const {
    return directory_;
  }

private:
  // Both require producer_mutex_
  SpoolFile& openPart(uint32_t index);
  void appendLocked(uint32_t index, const char* data, size_t size);

  std::filesystem::path directory_;
  size_t max_buffered_parts_;
  MetricsSink& metrics_;
  std::string file_prefix_;
  SealCallback seal_callback_;

  // Held for a whole producer call; taken before mutex_
  std::mutex producer_mutex_;
  mutable std::mutex mutex_;
  std::condition_variable slot_cv_;
  std::condition_variable ready_cv_;
  std::map<uint32_t, SpoolFile> open_;    // being written by the producer
  std::map<uint32_t, SpoolFile> sealed_;  // holding a staging slot
  std::deque<StagedPart> ready_;
  bool closed_ = false;
  bool canceled_ = false;
};

}  // namespace upload
}  // namespace ferry

#endif  // FERRY_DISK_STAGER_HPP
