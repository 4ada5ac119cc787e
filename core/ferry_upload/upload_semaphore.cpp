// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "upload_semaphore.hpp"

#include <algorithm>

namespace ferry {
namespace upload {

UploadSemaphore::UploadSemaphore(size_t limit, MetricsSink& metrics)
    : limit_(limit == 0 ? 1 : limit)
    , metrics_(metrics) {
  metrics_.setUploadSemaphoreLimit(static_cast<int64_t>(limit_));
}

std::optional<UploadSemaphore::Permit> UploadSemaphore::acquire(const std::atomic<bool>& canceled) {
  std::unique_lock<std::mutex> lock(mutex_);
  uint64_t ticket = next_ticket_++;
  queue_.push_back(ticket);
  metrics_.setUploadSemaphoreDemand(++demand_);

  auto my_turn = [this, ticket] {
    return queue_.front() == ticket && in_use_ < limit_;
  };
  while (!my_turn()) {
    if (canceled.load()) {
      queue_.erase(std::find(queue_.begin(), queue_.end(), ticket));
      metrics_.setUploadSemaphoreDemand(--demand_);
      lock.unlock();
      // The head of the queue may have changed.
      cv_.notify_all();
      return std::nullopt;
    }
    cv_.wait(lock);
  }

  queue_.pop_front();
  ++in_use_;
  lock.unlock();
  cv_.notify_all();
  return Permit(this);
}

UploadSemaphore::Permit UploadSemaphore::acquire() {
  static const std::atomic<bool> never{false};
  return std::move(*acquire(never));
}

void UploadSemaphore::release() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    --in_use_;
    metrics_.setUploadSemaphoreDemand(--demand_);
  }
  cv_.notify_all();
}

void UploadSemaphore::wakeWaiters() {
  // Taking the lock orders the wake after any waiter's last flag check.
  {
    std::lock_guard<std::mutex> lock(mutex_);
  }
  cv_.notify_all();
}

size_t UploadSemaphore::inUse() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return in_use_;
}

size_t UploadSemaphore::waiting() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return queue_.size();
}

}  // namespace upload
}  // namespace ferry
