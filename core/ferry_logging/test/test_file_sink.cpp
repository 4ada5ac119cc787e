// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

/**
 * Unit tests for the rotating file sink
 */

#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>

#include "ferry_file_sink.hpp"
#include "ferry_log_init.hpp"
#include "ferry_log_macros.hpp"

namespace fs = std::filesystem;

using namespace ferry::logging;

class FileSinkTest : public ::testing::Test {
protected:
  void SetUp() override {
    dir_ = fs::temp_directory_path() /
           ("ferry_log_test_" +
            std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()));
  }

  void TearDown() override {
    shutdown_logging();
    std::error_code ec;
    fs::remove_all(dir_, ec);
  }

  std::string readAllLogs() const {
    std::string all;
    for (const auto& entry : fs::directory_iterator(dir_)) {
      std::ifstream in(entry.path());
      all.append(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    }
    return all;
  }

  fs::path dir_;
};

TEST(EscapeJsonTest, EscapesControlCharacters) {
  EXPECT_EQ(escape_json("plain"), "plain");
  EXPECT_EQ(escape_json("a\"b\\c"), "a\\\"b\\\\c");
  EXPECT_EQ(escape_json("line\nnext\ttab"), "line\\nnext\\ttab");
  EXPECT_EQ(escape_json(std::string("\x01", 1)), "\\u0001");
  EXPECT_EQ(escape_json(std::string("\x1f", 1)), "\\u001f");
}

TEST_F(FileSinkTest, CreatesDirectoryAndWritesJsonLines) {
  LoggingConfig config;
  config.console_enabled = false;
  config.file_enabled = true;
  config.file_config.directory = dir_.string();
  config.file_config.format_json = true;
  init_logging(config);

  {
    FERRY_LOG_SCOPED_CONTEXT("upload-1", "prefix/upload-1");
    FERRY_LOG_INFO("part uploaded" << kv("index", 7));
  }
  shutdown_logging();

  ASSERT_TRUE(fs::exists(dir_));
  std::string logs = readAllLogs();
  EXPECT_NE(logs.find("\"level\":\"INFO\""), std::string::npos);
  EXPECT_NE(logs.find("\"component\":\"ferry\""), std::string::npos);
  EXPECT_NE(logs.find("\"msg\":\"part uploaded index=7\""), std::string::npos);
  EXPECT_NE(logs.find("\"upload_id\":\"upload-1\""), std::string::npos);
  EXPECT_NE(logs.find("\"object_key\":\"prefix/upload-1\""), std::string::npos);
}

TEST_F(FileSinkTest, TextFormatFiltersBelowLevel) {
  LoggingConfig config;
  config.console_enabled = false;
  config.file_enabled = true;
  config.file_level = severity_level::warn;
  config.file_config.directory = dir_.string();
  config.file_config.format_json = false;
  init_logging(config);

  FERRY_LOG_INFO("filtered out");
  FERRY_LOG_ERROR("kept");
  shutdown_logging();

  std::string logs = readAllLogs();
  EXPECT_EQ(logs.find("filtered out"), std::string::npos);
  EXPECT_NE(logs.find("[ERROR] [ferry] kept"), std::string::npos);
}
