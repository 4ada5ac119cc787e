// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "ferry_console_sink.hpp"

#include <boost/core/null_deleter.hpp>
#include <boost/date_time/posix_time/posix_time.hpp>
#include <boost/log/attributes/value_extraction.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/support/date_time.hpp>
#include <boost/make_shared.hpp>

#include <cstdio>
#include <iostream>
#include <string>

namespace ferry {
namespace logging {

namespace expr = boost::log::expressions;

const char* severity_color(severity_level level) {
  switch (level) {
    case severity_level::debug:
      return "\033[36m";
    case severity_level::info:
      return "\033[32m";
    case severity_level::warn:
      return "\033[33m";
    case severity_level::error:
      return "\033[31m";
    case severity_level::fatal:
      return "\033[35m";
  }
  return "";
}

namespace {

constexpr const char* kResetColor = "\033[0m";

// Console lines carry only the time of day.
void write_clock(boost::log::formatting_ostream& strm, const boost::posix_time::ptime& stamp) {
  auto tod = stamp.time_of_day();
  char buf[16];
  std::snprintf(
    buf, sizeof(buf), "%02d:%02d:%02d.%03d", static_cast<int>(tod.hours()),
    static_cast<int>(tod.minutes()), static_cast<int>(tod.seconds()),
    static_cast<int>(tod.fractional_seconds() * 1000 / tod.ticks_per_second())
  );
  strm << buf;
}

void format_console_record(
  boost::log::record_view const& rec, boost::log::formatting_ostream& strm, bool use_colors
) {
  if (auto stamp = boost::log::extract<boost::posix_time::ptime>("TimeStamp", rec)) {
    write_clock(strm, *stamp);
    strm << " ";
  }
  if (auto sev = boost::log::extract<severity_level>("Severity", rec)) {
    if (use_colors) {
      strm << severity_color(*sev);
    }
    strm << "[" << *sev << "]";
    if (use_colors) {
      strm << kResetColor;
    }
    strm << " ";
  }
  strm << rec[expr::smessage];

  if (auto upload_id = boost::log::extract<std::string>("UploadID", rec)) {
    strm << " upload_id=" << *upload_id;
  }
  if (auto object_key = boost::log::extract<std::string>("ObjectKey", rec)) {
    strm << " object_key=" << *object_key;
  }
}

}  // namespace

boost::shared_ptr<async_console_sink_t> create_console_sink(
  severity_level min_level, bool use_colors
) {
  auto backend = boost::make_shared<boost::log::sinks::text_ostream_backend>();
  backend->add_stream(boost::shared_ptr<std::ostream>(&std::clog, boost::null_deleter()));
  backend->auto_flush(true);

  auto sink = boost::make_shared<async_console_sink_t>(backend);
  sink->set_filter(severity >= min_level);
  sink->set_formatter(
    [use_colors](boost::log::record_view const& rec, boost::log::formatting_ostream& strm) {
      format_console_record(rec, strm, use_colors);
    }
  );
  return sink;
}

}  // namespace logging
}  // namespace ferry
