// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "size_policy.hpp"

#include "upload_errors.hpp"

namespace ferry {
namespace upload {

namespace {

uint64_t ceilDiv(uint64_t a, uint64_t b) {
  return a / b + (a % b == 0 ? 0 : 1);
}

}  // namespace

bool SizePolicy::validate(const SizePolicy& policy, std::string& error_msg) {
  if (policy.min_part_size == 0 || policy.preferred_part_size == 0 ||
      policy.max_part_size == 0 || policy.max_part_count == 0 || policy.max_object_size == 0) {
    error_msg = "All size policy values must be positive";
    return false;
  }
  if (policy.min_part_size > policy.preferred_part_size) {
    error_msg = "min_part_size (" + std::to_string(policy.min_part_size) +
                ") must not exceed preferred_part_size (" +
                std::to_string(policy.preferred_part_size) + ")";
    return false;
  }
  if (policy.preferred_part_size > policy.max_part_size) {
    error_msg = "preferred_part_size (" + std::to_string(policy.preferred_part_size) +
                ") must not exceed max_part_size (" + std::to_string(policy.max_part_size) + ")";
    return false;
  }
  // Below this some lengths cannot be split: with min 5 and max 6, 13 bytes
  // need more than two parts and fewer than three.
  if (policy.max_part_size - policy.min_part_size + 1 < policy.min_part_size) {
    error_msg = "max_part_size (" + std::to_string(policy.max_part_size) +
                ") must be at least 2 * min_part_size - 1 (" +
                std::to_string(2 * policy.min_part_size - 1) + ")";
    return false;
  }
  // Written as a division so that max_part_size * max_part_count cannot overflow.
  if (ceilDiv(policy.max_object_size, policy.max_part_count) > policy.max_part_size) {
    error_msg = "max_object_size (" + std::to_string(policy.max_object_size) +
                ") cannot be stored in " + std::to_string(policy.max_part_count) +
                " parts of at most " + std::to_string(policy.max_part_size) + " bytes";
    return false;
  }
  return true;
}

uint64_t SizePolicy::optimalPartSize(uint64_t length) const {
  if (length > max_object_size) {
    throw UploadError(
      ErrorKind::SizeLimitExceeded, "object of " + std::to_string(length) +
                                      " bytes exceeds max_object_size " +
                                      std::to_string(max_object_size)
    );
  }

  uint64_t per_part = ceilDiv(length, max_part_count);
  if (per_part <= preferred_part_size) {
    return preferred_part_size;
  }
  if (per_part > max_part_size) {
    throw UploadError(
      ErrorKind::SizeLimitExceeded, "uploading " + std::to_string(length) + " bytes needs parts of " +
                                      std::to_string(per_part) + " bytes, above max_part_size " +
                                      std::to_string(max_part_size)
    );
  }
  return per_part;
}

}  // namespace upload
}  // namespace ferry
