// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef FERRY_CHUNKER_HPP
#define FERRY_CHUNKER_HPP

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

#include "size_policy.hpp"

namespace ferry {
namespace upload {

/**
 * Receiver of the Chunker's decisions
 *
 * Bytes for a part arrive through appendToPart() in order; sealPart() hands the
 * part off and no further call refers to that index afterwards.
 */
class ChunkConsumer {
public:
  virtual ~ChunkConsumer() = default;

  /**
   * Append bytes to part `index`, creating it on first use
   */
  virtual void appendToPart(uint32_t index, const char* data, size_t size) = 0;

  /**
   * Move the last `size` bytes of part `from_index` to the start of the new part `to_index`
   */
  virtual void moveTail(uint32_t from_index, uint32_t to_index, uint64_t size) = 0;

  /**
   * Part `index` is final. It may never have been appended to (empty sole part).
   *
   * @param offset Position of the part's first byte in the object
   * @param size Part length in bytes
   */
  virtual void sealPart(uint32_t index, uint64_t offset, uint64_t size) = 0;
};

/**
 * Slices a byte stream into parts that satisfy a SizePolicy
 *
 * Parts are filled up to a target size. Bytes following a full part are held
 * in memory (the carry, at most min_part_size bytes) until it is known that the
 * next part will reach min_part_size; only then is the full part sealed. This
 * keeps the final part of a multi-part object at or above min_part_size
 * without ever touching a sealed part.
 *
 * Target size:
 * - declared length: SizePolicy::optimalPartSize(length)
 * - unknown length: preferred_part_size as long as the part slots left after
 *   the open part could still hold the rest of max_object_size at
 *   max_part_size each; past that point just enough to keep that true, which
 *   is max_part_size from the following part on. Any stream up to
 *   max_object_size therefore fits in max_part_count parts.
 * - the last available part slot always targets max_part_size
 *
 * Not thread-safe; driven by the single producer of an upload.
 */
class Chunker {
public:
  /**
   * @param policy Validated size policy
   * @param consumer Receives append/seal calls, must outlive the Chunker
   * @param declared_length Total object length if known in advance
   * @throws UploadError(SizeLimitExceeded) if declared_length cannot be stored
   */
  Chunker(
    const SizePolicy& policy, ChunkConsumer& consumer,
    std::optional<uint64_t> declared_length = std::nullopt
  );

  /**
   * Accept the next bytes of the stream.
   *
   * @throws UploadError(SizeLimitExceeded) before accepting bytes that would
   *         exceed max_object_size, the declared length, or the part budget
   */
  void write(const char* data, size_t size);

  /**
   * End of stream: seal the remaining bytes as the final part.
   * An empty stream produces one empty part. Calling finish() twice is a no-op.
   */
  void finish();

  uint64_t bytesWritten() const {
    return bytes_written_;
  }

  uint32_t partsSealed() const {
    return open_index_;
  }

  uint64_t currentTargetSize() const {
    return target_;
  }

  bool finished() const {
    return finished_;
  }

private:
  void checkCapacity(size_t incoming) const;
  void sealOpenPart();
  void startPartFromCarry();
  void adjustTarget();

  SizePolicy policy_;
  ChunkConsumer& consumer_;
  std::optional<uint64_t> declared_length_;

  uint64_t target_;

  uint32_t open_index_ = 0;  // also the number of sealed parts
  uint64_t open_size_ = 0;
  uint64_t sealed_bytes_ = 0;
  uint64_t bytes_written_ = 0;
  std::vector<char> carry_;
  bool finished_ = false;
};

}  // namespace upload
}  // namespace ferry

#endif  // FERRY_CHUNKER_HPP
