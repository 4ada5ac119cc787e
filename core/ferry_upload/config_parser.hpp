// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef FERRY_CONFIG_PARSER_HPP
#define FERRY_CONFIG_PARSER_HPP

#include <yaml-cpp/yaml.h>

#include <string>

#include "store_config.hpp"

namespace ferry {
namespace upload {

/**
 * Loads StoreConfig from YAML
 *
 * Missing keys keep their defaults. Sizes accept plain byte counts; keys
 * ending in _mb are mebibytes.
 *
 * Example:
 *   s3:
 *     bucket: uploads
 *     endpoint_url: http://localhost:9000
 *   object_prefix: files
 *   size_policy:
 *     min_part_size_mb: 5
 *     preferred_part_size_mb: 50
 *   max_buffered_parts: 20
 *   concurrent_part_uploads: 10
 *   logging:
 *     console:
 *       level: info
 */
class ConfigParser {
public:
  ConfigParser() = default;

  bool load_from_file(const std::string& path, StoreConfig& config);
  bool load_from_string(const std::string& yaml_content, StoreConfig& config);

  /**
   * Check size policy, buffering, concurrency, S3 and retry settings
   */
  static bool validate(const StoreConfig& config, std::string& error_msg);

  std::string get_last_error() const {
    return last_error_;
  }

private:
  bool parse_s3(const YAML::Node& node, S3Config& s3);
  bool parse_size_policy(const YAML::Node& node, SizePolicy& policy);
  bool parse_retry(const YAML::Node& node, RetryConfig& retry);
  bool parse_logging(const YAML::Node& node, logging::LoggingConfig& logging);

  mutable std::string last_error_;
};

}  // namespace upload
}  // namespace ferry

#endif  // FERRY_CONFIG_PARSER_HPP
