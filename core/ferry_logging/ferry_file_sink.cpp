// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "ferry_file_sink.hpp"

#include <boost/date_time/posix_time/posix_time.hpp>
#include <boost/filesystem.hpp>
#include <boost/log/attributes/current_thread_id.hpp>
#include <boost/log/attributes/value_extraction.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/support/date_time.hpp>
#include <boost/make_shared.hpp>

#include <iostream>
#include <sstream>

namespace ferry {
namespace logging {

namespace expr = boost::log::expressions;
namespace keywords = boost::log::keywords;
namespace sinks = boost::log::sinks;

namespace {

void write_json_string(std::ostream& out, const std::string& s) {
  static const char kHex[] = "0123456789abcdef";
  for (unsigned char c : s) {
    if (c == '"' || c == '\\') {
      out << '\\' << static_cast<char>(c);
    } else if (c == '\n') {
      out << "\\n";
    } else if (c == '\r') {
      out << "\\r";
    } else if (c == '\t') {
      out << "\\t";
    } else if (c == '\b') {
      out << "\\b";
    } else if (c == '\f') {
      out << "\\f";
    } else if (c < 0x20) {
      out << "\\u00" << kHex[c >> 4] << kHex[c & 0xf];
    } else {
      out << static_cast<char>(c);
    }
  }
}

// Records from FERRY_LOG_* start with "[component] ".
void split_component(const std::string& message, std::string& component, std::string& text) {
  if (message.size() > 2 && message[0] == '[') {
    auto close = message.find("] ");
    if (close != std::string::npos) {
      component = message.substr(1, close - 1);
      text = message.substr(close + 2);
      return;
    }
  }
  component.clear();
  text = message;
}

void json_field(boost::log::formatting_ostream& strm, const char* name, const std::string& value) {
  strm << ",\"" << name << "\":\"";
  write_json_string(strm.stream(), value);
  strm << "\"";
}

void json_formatter(boost::log::record_view const& rec, boost::log::formatting_ostream& strm) {
  strm << "{\"time\":\"";
  if (auto stamp = boost::log::extract<boost::posix_time::ptime>("TimeStamp", rec)) {
    strm << boost::posix_time::to_iso_extended_string(*stamp);
  }
  strm << "\",\"level\":\"";
  if (auto sev = boost::log::extract<severity_level>("Severity", rec)) {
    strm << *sev;
  }
  strm << "\"";

  std::string component;
  std::string text;
  auto message = rec[expr::smessage];
  split_component(message ? message.get() : std::string(), component, text);
  if (!component.empty()) {
    json_field(strm, "component", component);
  }
  json_field(strm, "msg", text);

  if (auto upload_id = boost::log::extract<std::string>("UploadID", rec)) {
    json_field(strm, "upload_id", *upload_id);
  }
  if (auto object_key = boost::log::extract<std::string>("ObjectKey", rec)) {
    json_field(strm, "object_key", *object_key);
  }
  auto tid =
    boost::log::extract<boost::log::attributes::current_thread_id::value_type>("ThreadID", rec);
  if (tid) {
    strm << ",\"thread\":\"" << *tid << "\"";
  }
  strm << "}";
}

void text_formatter(boost::log::record_view const& rec, boost::log::formatting_ostream& strm) {
  if (auto stamp = boost::log::extract<boost::posix_time::ptime>("TimeStamp", rec)) {
    strm << *stamp << " ";
  }
  if (auto sev = boost::log::extract<severity_level>("Severity", rec)) {
    strm << "[" << *sev << "] ";
  }
  strm << rec[expr::smessage];

  if (auto upload_id = boost::log::extract<std::string>("UploadID", rec)) {
    strm << " upload_id=" << *upload_id;
  }
  if (auto object_key = boost::log::extract<std::string>("ObjectKey", rec)) {
    strm << " object_key=" << *object_key;
  }
}

std::string resolve_directory(const std::string& configured) {
  boost::system::error_code ec;
  boost::filesystem::create_directories(configured, ec);
  if (!ec) {
    return configured;
  }
  std::string fallback = boost::filesystem::temp_directory_path(ec).string();
  if (ec) {
    fallback = "/tmp";
  }
  // The sinks are not installed yet.
  std::cerr << "[ferry_logging] cannot create log directory " << configured << " ("
            << ec.message() << "), writing to " << fallback << "\n";
  return fallback;
}

}  // namespace

std::string escape_json(const std::string& s) {
  std::ostringstream out;
  write_json_string(out, s);
  return out.str();
}

boost::shared_ptr<async_file_sink_t> create_file_sink(
  const FileSinkConfig& config, severity_level min_level
) {
  const std::string directory = resolve_directory(config.directory);

  auto backend = boost::make_shared<sinks::text_file_backend>(
    keywords::file_name = directory + "/" + config.file_pattern,
    keywords::rotation_size = config.rotation_size_mb * 1024 * 1024,
    keywords::auto_flush = true
  );
  if (config.rotate_at_midnight) {
    backend->set_time_based_rotation(sinks::file::rotation_at_time_point(0, 0, 0));
  }
  backend->set_file_collector(
    sinks::file::make_collector(keywords::target = directory, keywords::max_files = config.max_files)
  );
  backend->scan_for_files();

  auto sink = boost::make_shared<async_file_sink_t>(backend);
  sink->set_filter(severity >= min_level);
  sink->set_formatter(config.format_json ? &json_formatter : &text_formatter);
  return sink;
}

}  // namespace logging
}  // namespace ferry
