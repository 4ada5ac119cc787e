// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef FERRY_SIZE_POLICY_HPP
#define FERRY_SIZE_POLICY_HPP

#include <cstdint>
#include <string>

namespace ferry {
namespace upload {

constexpr uint64_t kMiB = 1024ULL * 1024;
constexpr uint64_t kGiB = 1024ULL * kMiB;
constexpr uint64_t kTiB = 1024ULL * kGiB;

/**
 * Backend limits on multipart uploads
 *
 * Defaults match AWS S3: http://docs.aws.amazon.com/AmazonS3/latest/dev/qfacts.html
 * Other S3-compatible stores (Ceph RGW, MinIO, OSS) may need different values.
 */
struct SizePolicy {
  uint64_t min_part_size = 5 * kMiB;         // every part except a sole part
  uint64_t preferred_part_size = 50 * kMiB;  // target size while the part budget allows it
  uint64_t max_part_size = 5 * kGiB;
  uint64_t max_part_count = 10000;
  uint64_t max_object_size = 5 * kTiB;

  /**
   * Check min <= preferred <= max, positivity, and that max_object_size can be
   * expressed with max_part_count parts of at most max_part_size.
   *
   * @param policy Policy to check
   * @param error_msg Set to a human readable reason on failure
   * @return true if the policy is usable
   */
  static bool validate(const SizePolicy& policy, std::string& error_msg);

  /**
   * Part size to use for an object whose length is known up front.
   *
   * preferred_part_size when length fits in max_part_count parts of that size,
   * otherwise ceil(length / max_part_count).
   *
   * @throws UploadError(SizeLimitExceeded) if length exceeds max_object_size or
   *         the computed size would exceed max_part_size
   */
  uint64_t optimalPartSize(uint64_t length) const;
};

}  // namespace upload
}  // namespace ferry

#endif  // FERRY_SIZE_POLICY_HPP
