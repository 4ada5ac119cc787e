// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

/**
 * Unit tests for ConfigParser
 */

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>

#include "config_parser.hpp"
#include "test_helpers.hpp"

using namespace ferry::upload;
using namespace ferry::upload::test;

class ConfigParserTest : public ::testing::Test {
protected:
  void SetUp() override {
    dir_ = createTempDir("ferry_config_test_");
  }

  void TearDown() override {
    cleanupTempDir(dir_);
  }

  std::string writeConfig(const std::string& content) {
    std::string path = dir_ + "/store.yaml";
    std::ofstream file(path);
    file << content;
    return path;
  }

  std::string dir_;
  ConfigParser parser_;
  StoreConfig config_;
};

TEST_F(ConfigParserTest, LoadFromFile) {
  std::string path = writeConfig(R"(
s3:
  endpoint_url: http://localhost:9000
  bucket: uploads
  region: eu-west-1
  use_ssl: false
  access_key: minioadmin
  secret_key: minioadmin
  request_timeout_ms: 60000
object_prefix: files
metadata_object_prefix: meta
size_policy:
  min_part_size_mb: 8
  preferred_part_size_mb: 64
  max_part_count: 5000
max_buffered_parts: 12
concurrent_part_uploads: 6
temporary_directory: /var/tmp/ferry
disable_content_hashes: true
retry:
  max_retries: 3
  initial_delay_ms: 250
  max_delay_ms: 10000
  jitter: false
logging:
  console:
    level: debug
    colors: false
  file:
    enabled: true
    directory: /var/log/ferry
    format: json
    max_files: 3
)");

  ASSERT_TRUE(parser_.load_from_file(path, config_)) << parser_.get_last_error();
  EXPECT_EQ(config_.s3.endpoint_url, "http://localhost:9000");
  EXPECT_EQ(config_.s3.bucket, "uploads");
  EXPECT_EQ(config_.s3.region, "eu-west-1");
  EXPECT_FALSE(config_.s3.use_ssl);
  EXPECT_EQ(config_.s3.access_key, "minioadmin");
  EXPECT_EQ(config_.s3.request_timeout_ms, 60000);
  EXPECT_EQ(config_.object_prefix, "files");
  EXPECT_EQ(config_.metadata_object_prefix, "meta");
  EXPECT_EQ(config_.size_policy.min_part_size, 8 * kMiB);
  EXPECT_EQ(config_.size_policy.preferred_part_size, 64 * kMiB);
  EXPECT_EQ(config_.size_policy.max_part_size, 5 * kGiB);
  EXPECT_EQ(config_.size_policy.max_part_count, 5000u);
  EXPECT_EQ(config_.max_buffered_parts, 12u);
  EXPECT_EQ(config_.concurrent_part_uploads, 6u);
  EXPECT_EQ(config_.temporary_directory, "/var/tmp/ferry");
  EXPECT_TRUE(config_.disable_content_hashes);
  EXPECT_FALSE(config_.s3.checksum_sha256);
  EXPECT_EQ(config_.retry.max_retries, 3);
  EXPECT_EQ(config_.retry.initial_delay.count(), 250);
  EXPECT_EQ(config_.retry.max_delay.count(), 10000);
  EXPECT_FALSE(config_.retry.jitter);
  EXPECT_EQ(config_.logging.console_level, ferry::logging::severity_level::debug);
  EXPECT_FALSE(config_.logging.console_colors);
  EXPECT_TRUE(config_.logging.file_enabled);
  EXPECT_EQ(config_.logging.file_config.directory, "/var/log/ferry");
  EXPECT_TRUE(config_.logging.file_config.format_json);
  EXPECT_EQ(config_.logging.file_config.max_files, 3);
}

TEST_F(ConfigParserTest, MissingKeysKeepDefaults) {
  ASSERT_TRUE(parser_.load_from_string("object_prefix: files\n", config_));
  EXPECT_EQ(config_.object_prefix, "files");
  EXPECT_EQ(config_.max_buffered_parts, 20u);
  EXPECT_EQ(config_.concurrent_part_uploads, 10u);
  EXPECT_EQ(config_.size_policy.min_part_size, 5 * kMiB);
  EXPECT_FALSE(config_.disable_content_hashes);
  EXPECT_TRUE(config_.s3.checksum_sha256);

  std::string error;
  EXPECT_TRUE(ConfigParser::validate(config_, error)) << error;
}

TEST_F(ConfigParserTest, SizesInBytesTakePrecedence) {
  ASSERT_TRUE(parser_.load_from_string(R"(
size_policy:
  min_part_size: 1048576
  min_part_size_mb: 9
)", config_));
  EXPECT_EQ(config_.size_policy.min_part_size, kMiB);
}

TEST_F(ConfigParserTest, MissingFile) {
  EXPECT_FALSE(parser_.load_from_file(dir_ + "/absent.yaml", config_));
  EXPECT_NE(parser_.get_last_error().find("not found"), std::string::npos);
}

TEST_F(ConfigParserTest, MalformedYaml) {
  EXPECT_FALSE(parser_.load_from_string("s3: [unclosed", config_));
  EXPECT_FALSE(parser_.get_last_error().empty());
}

TEST_F(ConfigParserTest, WrongValueType) {
  EXPECT_FALSE(parser_.load_from_string("max_buffered_parts: many\n", config_));
  EXPECT_FALSE(parser_.get_last_error().empty());
}

TEST_F(ConfigParserTest, InvalidLogLevel) {
  EXPECT_FALSE(parser_.load_from_string("logging:\n  console:\n    level: loud\n", config_));
  EXPECT_NE(parser_.get_last_error().find("logging.console.level"), std::string::npos);
}

// ============================================================================
// validate
// ============================================================================

TEST_F(ConfigParserTest, ValidateRejectsBadSizePolicy) {
  config_.size_policy.min_part_size = 100 * kMiB;
  std::string error;
  EXPECT_FALSE(ConfigParser::validate(config_, error));
  EXPECT_NE(error.find("min_part_size"), std::string::npos);
}

TEST_F(ConfigParserTest, ValidateRejectsZeroLimits) {
  std::string error;
  StoreConfig no_buffer = config_;
  no_buffer.max_buffered_parts = 0;
  EXPECT_FALSE(ConfigParser::validate(no_buffer, error));

  StoreConfig no_concurrency = config_;
  no_concurrency.concurrent_part_uploads = 0;
  EXPECT_FALSE(ConfigParser::validate(no_concurrency, error));
  EXPECT_NE(error.find("concurrent_part_uploads"), std::string::npos);
}

TEST_F(ConfigParserTest, ValidateRejectsEndpointWithoutScheme) {
  config_.s3.endpoint_url = "localhost:9000";
  std::string error;
  EXPECT_FALSE(ConfigParser::validate(config_, error));
  EXPECT_NE(error.find("endpoint_url"), std::string::npos);

  config_.s3.endpoint_url = "https://s3.example.com";
  EXPECT_TRUE(ConfigParser::validate(config_, error)) << error;
}

TEST_F(ConfigParserTest, ValidateRejectsBadRetrySettings) {
  std::string error;
  StoreConfig negative = config_;
  negative.retry.max_retries = -1;
  EXPECT_FALSE(ConfigParser::validate(negative, error));

  StoreConfig inverted = config_;
  inverted.retry.initial_delay = std::chrono::milliseconds(5000);
  inverted.retry.max_delay = std::chrono::milliseconds(1000);
  EXPECT_FALSE(ConfigParser::validate(inverted, error));

  StoreConfig shrinking = config_;
  shrinking.retry.exponential_base = 0.5;
  EXPECT_FALSE(ConfigParser::validate(shrinking, error));
}

TEST_F(ConfigParserTest, ValidateRejectsChecksumsWithoutContentHashes) {
  config_.disable_content_hashes = true;
  std::string error;
  EXPECT_FALSE(ConfigParser::validate(config_, error));
  EXPECT_NE(error.find("checksum_sha256"), std::string::npos);

  config_.s3.checksum_sha256 = false;
  EXPECT_TRUE(ConfigParser::validate(config_, error)) << error;
}
