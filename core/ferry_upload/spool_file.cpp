// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "spool_file.hpp"

#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <utility>
#include <vector>

#include "upload_errors.hpp"

#define FERRY_LOG_COMPONENT "spool_file"
#include <ferry_log_macros.hpp>

namespace ferry {
namespace upload {

namespace fs = std::filesystem;

SpoolFile SpoolFile::create(const fs::path& directory, const std::string& prefix) {
  std::string pattern = (directory / (prefix + "XXXXXX")).string();
  std::vector<char> name(pattern.begin(), pattern.end());
  name.push_back('\0');

  int fd = ::mkstemp(name.data());
  if (fd < 0) {
    throw UploadError(
      ErrorKind::StagingIOError,
      "cannot create spool file in " + directory.string() + ": " + std::strerror(errno)
    );
  }
  ::close(fd);
  return SpoolFile(fs::path(name.data()));
}

SpoolFile::SpoolFile(fs::path path)
    : path_(std::move(path)) {}

SpoolFile::~SpoolFile() {
  remove();
}

SpoolFile::SpoolFile(SpoolFile&& other) noexcept
    : path_(std::move(other.path_))
    , writer_(std::move(other.writer_))
    , size_(other.size_) {
  other.path_.clear();
  other.size_ = 0;
}

SpoolFile& SpoolFile::operator=(SpoolFile&& other) noexcept {
  if (this != &other) {
    remove();
    path_ = std::move(other.path_);
    writer_ = std::move(other.writer_);
    size_ = other.size_;
    other.path_.clear();
    other.size_ = 0;
  }
  return *this;
}

void SpoolFile::ensureWriter() {
  if (writer_.is_open()) {
    return;
  }
  writer_.open(path_, std::ios::binary | std::ios::app);
  if (!writer_) {
    throw UploadError(ErrorKind::StagingIOError, "cannot open spool file " + path_.string());
  }
}

void SpoolFile::append(const char* data, size_t size) {
  ensureWriter();
  writer_.write(data, static_cast<std::streamsize>(size));
  if (!writer_) {
    throw UploadError(
      ErrorKind::StagingIOError, "write of " + std::to_string(size) + " bytes to " +
                                   path_.string() + " failed"
    );
  }
  size_ += size;
}

std::string SpoolFile::takeTail(uint64_t size) {
  if (size > size_) {
    throw UploadError(
      ErrorKind::StagingIOError, "cannot take " + std::to_string(size) + " bytes from " +
                                   path_.string() + " holding " + std::to_string(size_)
    );
  }
  finishWriting();

  std::string tail(static_cast<size_t>(size), '\0');
  {
    std::ifstream in(path_, std::ios::binary);
    in.seekg(static_cast<std::streamoff>(size_ - size), std::ios::beg);
    in.read(tail.data(), static_cast<std::streamsize>(size));
    if (!in || static_cast<uint64_t>(in.gcount()) != size) {
      throw UploadError(ErrorKind::StagingIOError, "cannot read tail of " + path_.string());
    }
  }

  std::error_code ec;
  fs::resize_file(path_, size_ - size, ec);
  if (ec) {
    throw UploadError(
      ErrorKind::StagingIOError, "cannot truncate " + path_.string() + ": " + ec.message()
    );
  }
  size_ -= size;
  return tail;
}

void SpoolFile::finishWriting() {
  if (!writer_.is_open()) {
    return;
  }
  writer_.flush();
  bool ok = static_cast<bool>(writer_);
  writer_.close();
  if (!ok || writer_.fail()) {
    throw UploadError(ErrorKind::StagingIOError, "cannot flush spool file " + path_.string());
  }
}

std::shared_ptr<std::iostream> SpoolFile::openForRead() const {
  auto stream = std::make_shared<std::fstream>(path_, std::ios::in | std::ios::binary);
  if (!stream->is_open()) {
    throw UploadError(ErrorKind::StagingIOError, "cannot open spool file " + path_.string());
  }
  return stream;
}

void SpoolFile::remove() {
  if (path_.empty()) {
    return;
  }
  if (writer_.is_open()) {
    writer_.close();
  }
  std::error_code ec;
  fs::remove(path_, ec);
  if (ec) {
    FERRY_LOG_WARN("failed to remove spool file" << logging::kv("path", path_.string())
                                                 << logging::kv("error", ec.message()));
  }
  path_.clear();
  size_ = 0;
}

}  // namespace upload
}  // namespace ferry
