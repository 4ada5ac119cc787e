// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "retry_policy.hpp"

#include <algorithm>
#include <cmath>
#include <string_view>

namespace ferry {
namespace upload {

namespace {

// Sorted for binary search.
constexpr std::string_view kTransientCodes[] = {
  "ConnectionRefused",
  "ConnectionReset",
  "ConnectionTimeout",
  "InternalError",
  "NetworkingError",
  "OperationAborted",
  "RequestTimeTooSkewed",
  "RequestTimeout",
  "ServiceUnavailable",
  "SlowDown",
  "Throttling",
  "ThrottlingException",
  "TransientError",
  "XAmzContentSHA256Mismatch",
  "XMinioServerNotInitialized",
};

}  // namespace

RetryPolicy::RetryPolicy(const RetryConfig& config)
    : config_(config)
    , rng_(std::random_device{}()) {}

std::optional<std::chrono::milliseconds> RetryPolicy::nextDelay(int retries_used) const {
  if (retries_used >= config_.max_retries) {
    return std::nullopt;
  }
  if (config_.initial_delay.count() == 0) {
    return std::chrono::milliseconds(0);
  }

  double delay_ms = static_cast<double>(config_.initial_delay.count()) *
                    std::pow(config_.exponential_base, retries_used);
  delay_ms = std::min(delay_ms, static_cast<double>(config_.max_delay.count()));
  if (config_.jitter) {
    std::uniform_real_distribution<double> factor(
      1.0 - config_.jitter_factor, 1.0 + config_.jitter_factor
    );
    std::lock_guard<std::mutex> lock(rng_mutex_);
    delay_ms *= factor(rng_);
  }
  return std::chrono::milliseconds(static_cast<int64_t>(std::max(delay_ms, 1.0)));
}

bool isTransientErrorCode(const std::string& error_code) {
  return std::binary_search(
    std::begin(kTransientCodes), std::end(kTransientCodes), std::string_view(error_code)
  );
}

}  // namespace upload
}  // namespace ferry
