// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

/**
 * Unit tests for the console sink
 */

#include <boost/log/core.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <gtest/gtest.h>

#include <iostream>
#include <sstream>
#include <string>

#include "ferry_console_sink.hpp"
#include "ferry_log_init.hpp"
#include "ferry_log_macros.hpp"

using namespace ferry::logging;

class ConsoleSinkTest : public ::testing::Test {
protected:
  void SetUp() override {
    shutdown_logging();
    boost::log::add_common_attributes();
    saved_ = std::clog.rdbuf(captured_.rdbuf());
  }

  void TearDown() override {
    std::clog.rdbuf(saved_);
  }

  // Installs a sink, runs fn, then drains the sink and returns what reached std::clog.
  template <typename Fn>
  std::string capture(severity_level level, bool colors, Fn fn) {
    auto sink = create_console_sink(level, colors);
    boost::log::core::get()->add_sink(sink);
    fn();
    boost::log::core::get()->remove_sink(sink);
    sink->stop();
    sink->flush();
    return captured_.str();
  }

  std::ostringstream captured_;
  std::streambuf* saved_ = nullptr;
};

TEST(SeverityColorTest, DistinctPerLevel) {
  EXPECT_STREQ(severity_color(severity_level::error), "\033[31m");
  EXPECT_STRNE(severity_color(severity_level::info), severity_color(severity_level::warn));
  EXPECT_STRNE(severity_color(severity_level::debug), severity_color(severity_level::fatal));
}

TEST_F(ConsoleSinkTest, FiltersBelowMinimumLevel) {
  std::string out = capture(severity_level::warn, false, [] {
    FERRY_LOG_INFO("quiet");
    FERRY_LOG_WARN("slow part" << kv("part", 3));
  });
  EXPECT_EQ(out.find("quiet"), std::string::npos);
  EXPECT_NE(out.find("[WARN] [ferry] slow part part=3"), std::string::npos);
}

TEST_F(ConsoleSinkTest, AppendsUploadContext) {
  std::string out = capture(severity_level::info, false, [] {
    FERRY_LOG_SCOPED_CONTEXT("u-42", "files/u-42");
    FERRY_LOG_INFO("sealed");
  });
  EXPECT_NE(out.find("sealed upload_id=u-42 object_key=files/u-42"), std::string::npos);
}

TEST_F(ConsoleSinkTest, ColorsWrapSeverity) {
  std::string out = capture(severity_level::info, true, [] { FERRY_LOG_ERROR("boom"); });
  EXPECT_NE(out.find("\033[31m[ERROR]\033[0m"), std::string::npos);

  captured_.str("");
  out = capture(severity_level::info, false, [] { FERRY_LOG_ERROR("boom"); });
  EXPECT_EQ(out.find("\033["), std::string::npos);
}
