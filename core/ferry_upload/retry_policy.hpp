// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef FERRY_RETRY_POLICY_HPP
#define FERRY_RETRY_POLICY_HPP

#include <chrono>
#include <mutex>
#include <optional>
#include <random>
#include <string>

namespace ferry {
namespace upload {

struct RetryConfig {
  int max_retries = 5;  // re-sends after the first attempt
  std::chrono::milliseconds initial_delay{1000};
  std::chrono::milliseconds max_delay{300000};
  double exponential_base = 2.0;
  bool jitter = true;
  double jitter_factor = 0.5;  // delay scaled by a factor in [1 - f, 1 + f]
};

/**
 * Transient-failure retry budget of one backend request
 *
 * Shared by the workers of an upload; nextDelay() may be called concurrently.
 */
class RetryPolicy {
public:
  explicit RetryPolicy(const RetryConfig& config = {});

  /**
   * Backoff before the next attempt of a request that already used
   * `retries_used` retries, or nullopt once the budget is spent.
   *
   * The delay is initial_delay * exponential_base^retries_used, capped at
   * max_delay and jittered. A zero initial_delay retries immediately;
   * otherwise the delay is at least 1ms.
   */
  std::optional<std::chrono::milliseconds> nextDelay(int retries_used) const;

  const RetryConfig& config() const {
    return config_;
  }

private:
  RetryConfig config_;
  mutable std::mutex rng_mutex_;
  mutable std::minstd_rand rng_;
};

/**
 * True for S3 or transport error codes worth retrying: throttling, timeouts,
 * server-side 5xx conditions and dropped connections.
 */
bool isTransientErrorCode(const std::string& error_code);

}  // namespace upload
}  // namespace ferry

#endif  // FERRY_RETRY_POLICY_HPP
