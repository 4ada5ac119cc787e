// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef FERRY_UPLOAD_SEMAPHORE_HPP
#define FERRY_UPLOAD_SEMAPHORE_HPP

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>

#include "metrics_sink.hpp"

namespace ferry {
namespace upload {

/**
 * Counting gate bounding part uploads in flight, shared by all uploads of a store
 *
 * Waiters are served strictly in arrival order: a later request never
 * overtakes an earlier one, even when the earlier one is still waiting.
 *
 * Reports demand (permits held plus waiters) and the limit to the MetricsSink.
 */
class UploadSemaphore {
public:
  /**
   * Held while a part upload runs; returns its slot on destruction
   */
  class Permit {
  public:
    Permit() = default;
    ~Permit() {
      release();
    }

    Permit(Permit&& other) noexcept
        : owner_(other.owner_) {
      other.owner_ = nullptr;
    }

    Permit& operator=(Permit&& other) noexcept {
      if (this != &other) {
        release();
        owner_ = other.owner_;
        other.owner_ = nullptr;
      }
      return *this;
    }

    Permit(const Permit&) = delete;
    Permit& operator=(const Permit&) = delete;

    void release() {
      if (owner_) {
        owner_->release();
        owner_ = nullptr;
      }
    }

    bool held() const {
      return owner_ != nullptr;
    }

  private:
    friend class UploadSemaphore;
    explicit Permit(UploadSemaphore* owner)
        : owner_(owner) {}

    UploadSemaphore* owner_ = nullptr;
  };

  static constexpr size_t kDefaultLimit = 10;

  UploadSemaphore(size_t limit, MetricsSink& metrics);

  // Non-copyable, non-movable
  UploadSemaphore(const UploadSemaphore&) = delete;
  UploadSemaphore& operator=(const UploadSemaphore&) = delete;
  UploadSemaphore(UploadSemaphore&&) = delete;
  UploadSemaphore& operator=(UploadSemaphore&&) = delete;

  /**
   * Wait for a permit in FIFO order
   *
   * @param canceled Checked whenever the waiter wakes; when it is true the
   *        request leaves the queue. Whoever sets it must call wakeWaiters().
   * @return nullopt if canceled before a permit was granted
   */
  std::optional<Permit> acquire(const std::atomic<bool>& canceled);

  /**
   * Wait for a permit without a cancellation source
   */
  Permit acquire();

  /**
   * Wake every waiter so that it re-checks its cancellation flag
   */
  void wakeWaiters();

  size_t limit() const {
    return limit_;
  }

  size_t inUse() const;
  size_t waiting() const;

private:
  void release();

  const size_t limit_;
  MetricsSink& metrics_;

  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::deque<uint64_t> queue_;  // tickets of waiting requests, oldest first
  uint64_t next_ticket_ = 0;
  size_t in_use_ = 0;
  int64_t demand_ = 0;
};

}  // namespace upload
}  // namespace ferry

#endif  // FERRY_UPLOAD_SEMAPHORE_HPP
