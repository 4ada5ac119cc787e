// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef FERRY_STORE_CONFIG_HPP
#define FERRY_STORE_CONFIG_HPP

#include <cstddef>
#include <string>

#include <ferry_log_init.hpp>

#include "retry_policy.hpp"
#include "s3_backend.hpp"
#include "size_policy.hpp"

namespace ferry {
namespace upload {

/**
 * Settings of one MultipartStore
 */
struct StoreConfig {
  S3Config s3;

  // Prepended as "<prefix>/" to each data object key
  std::string object_prefix;
  // Prepended to each .info metadata object key; object_prefix when empty
  std::string metadata_object_prefix;

  SizePolicy size_policy;

  // Sealed parts per upload kept on disk while waiting for upload
  size_t max_buffered_parts = 20;
  // Part uploads in flight across all uploads of the store
  size_t concurrent_part_uploads = 10;

  // Spool directory; empty for the system temporary directory
  std::string temporary_directory;

  // Skip Content-MD5 and SHA-256 checksums on part uploads (saves CPU)
  bool disable_content_hashes = false;

  RetryConfig retry;

  logging::LoggingConfig logging;
};

}  // namespace upload
}  // namespace ferry

#endif  // FERRY_STORE_CONFIG_HPP
