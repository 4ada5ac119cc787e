// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "config_parser.hpp"

#include <chrono>
#include <fstream>

namespace ferry {
namespace upload {

namespace {

// Reads `<name>` as bytes or `<name>_mb` as mebibytes.
void read_size(const YAML::Node& node, const std::string& name, uint64_t& value) {
  if (node[name]) {
    value = node[name].as<uint64_t>();
  } else if (node[name + "_mb"]) {
    value = node[name + "_mb"].as<uint64_t>() * kMiB;
  }
}

}  // namespace

bool ConfigParser::load_from_file(const std::string& path, StoreConfig& config) {
  std::ifstream file(path);
  if (!file.good()) {
    last_error_ = "Config file not found or not readable: " + path;
    return false;
  }

  try {
    YAML::Node yaml = YAML::LoadFile(path);
    return load_from_string(YAML::Dump(yaml), config);
  } catch (const YAML::Exception& e) {
    last_error_ = "Failed to parse YAML file: " + std::string(e.what());
    return false;
  }
}

bool ConfigParser::load_from_string(const std::string& yaml_content, StoreConfig& config) {
  try {
    YAML::Node node = YAML::Load(yaml_content);

    if (node["s3"] && !parse_s3(node["s3"], config.s3)) {
      return false;
    }
    if (node["object_prefix"]) {
      config.object_prefix = node["object_prefix"].as<std::string>();
    }
    if (node["metadata_object_prefix"]) {
      config.metadata_object_prefix = node["metadata_object_prefix"].as<std::string>();
    }
    if (node["size_policy"] && !parse_size_policy(node["size_policy"], config.size_policy)) {
      return false;
    }
    if (node["max_buffered_parts"]) {
      config.max_buffered_parts = node["max_buffered_parts"].as<size_t>();
    }
    if (node["concurrent_part_uploads"]) {
      config.concurrent_part_uploads = node["concurrent_part_uploads"].as<size_t>();
    }
    if (node["temporary_directory"]) {
      config.temporary_directory = node["temporary_directory"].as<std::string>();
    }
    if (node["disable_content_hashes"]) {
      config.disable_content_hashes = node["disable_content_hashes"].as<bool>();
    }
    if (node["retry"] && !parse_retry(node["retry"], config.retry)) {
      return false;
    }
    if (node["logging"] && !parse_logging(node["logging"], config.logging)) {
      return false;
    }
    if (config.disable_content_hashes) {
      config.s3.checksum_sha256 = false;
    }
    return true;
  } catch (const YAML::Exception& e) {
    last_error_ = "Failed to parse YAML content: " + std::string(e.what());
    return false;
  }
}

bool ConfigParser::parse_s3(const YAML::Node& node, S3Config& s3) {
  if (node["endpoint_url"]) {
    s3.endpoint_url = node["endpoint_url"].as<std::string>();
  }
  if (node["bucket"]) {
    s3.bucket = node["bucket"].as<std::string>();
  }
  if (node["region"]) {
    s3.region = node["region"].as<std::string>();
  }
  if (node["use_ssl"]) {
    s3.use_ssl = node["use_ssl"].as<bool>();
  }
  if (node["verify_ssl"]) {
    s3.verify_ssl = node["verify_ssl"].as<bool>();
  }
  if (node["access_key"]) {
    s3.access_key = node["access_key"].as<std::string>();
  }
  if (node["secret_key"]) {
    s3.secret_key = node["secret_key"].as<std::string>();
  }
  if (node["connect_timeout_ms"]) {
    s3.connect_timeout_ms = node["connect_timeout_ms"].as<int>();
  }
  if (node["request_timeout_ms"]) {
    s3.request_timeout_ms = node["request_timeout_ms"].as<int>();
  }
  if (node["max_sdk_retries"]) {
    s3.max_sdk_retries = node["max_sdk_retries"].as<int>();
  }
  return true;
}

bool ConfigParser::parse_size_policy(const YAML::Node& node, SizePolicy& policy) {
  read_size(node, "min_part_size", policy.min_part_size);
  read_size(node, "preferred_part_size", policy.preferred_part_size);
  read_size(node, "max_part_size", policy.max_part_size);
  read_size(node, "max_object_size", policy.max_object_size);
  if (node["max_part_count"]) {
    policy.max_part_count = node["max_part_count"].as<uint64_t>();
  }
  return true;
}

bool ConfigParser::parse_retry(const YAML::Node& node, RetryConfig& retry) {
  if (node["max_retries"]) {
    retry.max_retries = node["max_retries"].as<int>();
  }
  if (node["initial_delay_ms"]) {
    retry.initial_delay = std::chrono::milliseconds(node["initial_delay_ms"].as<int64_t>());
  }
  if (node["max_delay_ms"]) {
    retry.max_delay = std::chrono::milliseconds(node["max_delay_ms"].as<int64_t>());
  }
  if (node["exponential_base"]) {
    retry.exponential_base = node["exponential_base"].as<double>();
  }
  if (node["jitter"]) {
    retry.jitter = node["jitter"].as<bool>();
  }
  return true;
}

bool ConfigParser::parse_logging(const YAML::Node& node, logging::LoggingConfig& log_config) {
  if (node["console"]) {
    const auto& console = node["console"];
    if (console["enabled"]) {
      log_config.console_enabled = console["enabled"].as<bool>();
    }
    if (console["colors"]) {
      log_config.console_colors = console["colors"].as<bool>();
    }
    if (console["level"]) {
      auto level = logging::parse_severity_level(console["level"].as<std::string>());
      if (!level) {
        last_error_ = "Invalid logging.console.level: " + console["level"].as<std::string>();
        return false;
      }
      log_config.console_level = *level;
    }
  }

  if (node["file"]) {
    const auto& file = node["file"];
    if (file["enabled"]) {
      log_config.file_enabled = file["enabled"].as<bool>();
    }
    if (file["level"]) {
      auto level = logging::parse_severity_level(file["level"].as<std::string>());
      if (!level) {
        last_error_ = "Invalid logging.file.level: " + file["level"].as<std::string>();
        return false;
      }
      log_config.file_level = *level;
    }
    if (file["directory"]) {
      log_config.file_config.directory = file["directory"].as<std::string>();
    }
    if (file["pattern"]) {
      log_config.file_config.file_pattern = file["pattern"].as<std::string>();
    }
    if (file["format"]) {
      log_config.file_config.format_json = file["format"].as<std::string>() == "json";
    }
    if (file["rotation_size_mb"]) {
      log_config.file_config.rotation_size_mb = file["rotation_size_mb"].as<uint64_t>();
    }
    if (file["max_files"]) {
      log_config.file_config.max_files = file["max_files"].as<int>();
    }
    if (file["rotate_at_midnight"]) {
      log_config.file_config.rotate_at_midnight = file["rotate_at_midnight"].as<bool>();
    }
  }
  return true;
}

bool ConfigParser::validate(const StoreConfig& config, std::string& error_msg) {
  if (!SizePolicy::validate(config.size_policy, error_msg)) {
    return false;
  }

  if (config.max_buffered_parts < 1) {
    error_msg = "max_buffered_parts must be >= 1";
    return false;
  }
  if (config.concurrent_part_uploads < 1) {
    error_msg = "concurrent_part_uploads must be >= 1";
    return false;
  }

  if (!config.s3.endpoint_url.empty() && config.s3.endpoint_url.find("http://") != 0 &&
      config.s3.endpoint_url.find("https://") != 0) {
    error_msg = "Invalid s3.endpoint_url - must start with http:// or https://";
    return false;
  }
  if (config.s3.checksum_sha256 && config.disable_content_hashes) {
    error_msg = "s3.checksum_sha256 needs part content hashes; disable_content_hashes is set";
    return false;
  }

  if (config.retry.max_retries < 0 || config.retry.max_retries > 100) {
    error_msg = "Invalid retry.max_retries - must be between 0 and 100";
    return false;
  }
  if (config.retry.initial_delay.count() < 0) {
    error_msg = "Invalid retry.initial_delay_ms - must be >= 0";
    return false;
  }
  if (config.retry.max_delay < config.retry.initial_delay) {
    error_msg = "Invalid retry.max_delay_ms - must be >= initial_delay_ms";
    return false;
  }
  if (config.retry.exponential_base < 1.0) {
    error_msg = "Invalid retry.exponential_base - must be >= 1.0";
    return false;
  }

  return true;
}

}  // namespace upload
}  // namespace ferry
