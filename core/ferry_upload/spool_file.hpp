// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef FERRY_SPOOL_FILE_HPP
#define FERRY_SPOOL_FILE_HPP

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <memory>
#include <string>

namespace ferry {
namespace upload {

/**
 * Uniquely named temporary file holding one part's bytes
 *
 * The file is removed when the SpoolFile is destroyed or remove() is called.
 * Movable, non-copyable. All I/O failures throw UploadError(StagingIOError).
 */
class SpoolFile {
public:
  SpoolFile() = default;

  /**
   * Create an empty file named <directory>/<prefix>XXXXXX
   */
  static SpoolFile create(const std::filesystem::path& directory, const std::string& prefix);

  ~SpoolFile();

  SpoolFile(SpoolFile&& other) noexcept;
  SpoolFile& operator=(SpoolFile&& other) noexcept;
  SpoolFile(const SpoolFile&) = delete;
  SpoolFile& operator=(const SpoolFile&) = delete;

  void append(const char* data, size_t size);

  /**
   * Remove the last `size` bytes from the file and return them
   */
  std::string takeTail(uint64_t size);

  /**
   * Flush and close the write handle; the file stays on disk
   */
  void finishWriting();

  /**
   * Open an independent read handle positioned at the start
   */
  std::shared_ptr<std::iostream> openForRead() const;

  /**
   * Delete the file now. Safe to call more than once.
   */
  void remove();

  bool valid() const {
    return !path_.empty();
  }

  const std::filesystem::path& path() const {
    return path_;
  }

  uint64_t size() const {
    return size_;
  }

private:
  explicit SpoolFile(std::filesystem::path path);

  void ensureWriter();

  std::filesystem::path path_;
  std::ofstream writer_;
  uint64_t size_ = 0;
};

}  // namespace upload
}  // namespace ferry

#endif  // FERRY_SPOOL_FILE_HPP
