// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "chunker.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>

#include "upload_errors.hpp"

namespace ferry {
namespace upload {

Chunker::Chunker(
  const SizePolicy& policy, ChunkConsumer& consumer, std::optional<uint64_t> declared_length
)
    : policy_(policy)
    , consumer_(consumer)
    , declared_length_(declared_length)
    , target_(policy.preferred_part_size) {
  if (declared_length_) {
    target_ = policy_.optimalPartSize(*declared_length_);
  }
  carry_.reserve(policy_.min_part_size);
  adjustTarget();
}

void Chunker::write(const char* data, size_t size) {
  if (finished_) {
    throw std::logic_error("Chunker::write called after finish");
  }
  if (size == 0) {
    return;
  }
  checkCapacity(size);
  bytes_written_ += size;

  while (size > 0) {
    if (open_size_ < target_) {
      size_t take = static_cast<size_t>(std::min<uint64_t>(size, target_ - open_size_));
      consumer_.appendToPart(open_index_, data, take);
      open_size_ += take;
      data += take;
      size -= take;
      continue;
    }

    // Open part is full; hold back bytes until the next part can reach the minimum.
    if (open_index_ + 1 >= policy_.max_part_count) {
      throw UploadError(
        ErrorKind::SizeLimitExceeded, "stream needs more than " +
                                        std::to_string(policy_.max_part_count) + " parts"
      );
    }
    size_t take = std::min<size_t>(size, policy_.min_part_size - carry_.size());
    carry_.insert(carry_.end(), data, data + take);
    data += take;
    size -= take;
    if (carry_.size() == policy_.min_part_size) {
      sealOpenPart();
      startPartFromCarry();
    }
  }
}

void Chunker::finish() {
  if (finished_) {
    return;
  }

  if (carry_.empty()) {
    sealOpenPart();
  } else if (open_size_ + carry_.size() <= policy_.max_part_size) {
    consumer_.appendToPart(open_index_, carry_.data(), carry_.size());
    open_size_ += carry_.size();
    carry_.clear();
    sealOpenPart();
  } else {
    // Shorten the open part so that the final part reaches exactly min_part_size.
    uint64_t moved = policy_.min_part_size - carry_.size();
    if (open_size_ - moved < policy_.min_part_size) {
      throw UploadError(
        ErrorKind::SizeLimitExceeded,
        "cannot split " + std::to_string(open_size_ + carry_.size()) +
          " trailing bytes into parts within [" + std::to_string(policy_.min_part_size) + ", " +
          std::to_string(policy_.max_part_size) + "]"
      );
    }
    consumer_.moveTail(open_index_, open_index_ + 1, moved);
    open_size_ -= moved;
    sealOpenPart();
    open_size_ = moved;
    consumer_.appendToPart(open_index_, carry_.data(), carry_.size());
    open_size_ += carry_.size();
    carry_.clear();
    sealOpenPart();
  }
  finished_ = true;
}

void Chunker::checkCapacity(size_t incoming) const {
  uint64_t total = bytes_written_ + incoming;
  if (total < bytes_written_ || total > policy_.max_object_size) {
    throw UploadError(
      ErrorKind::SizeLimitExceeded, "stream exceeds max_object_size " +
                                      std::to_string(policy_.max_object_size)
    );
  }
  if (declared_length_ && total > *declared_length_) {
    throw UploadError(
      ErrorKind::SizeLimitExceeded, "stream exceeds declared length " +
                                      std::to_string(*declared_length_)
    );
  }

  // Even if every remaining part were max_part_size the bytes must fit.
  uint64_t unsealed = total - sealed_bytes_;
  uint64_t slots_left = policy_.max_part_count - open_index_;
  uint64_t slots_needed =
    unsealed / policy_.max_part_size + (unsealed % policy_.max_part_size == 0 ? 0 : 1);
  if (slots_needed > slots_left) {
    throw UploadError(
      ErrorKind::SizeLimitExceeded, std::to_string(unsealed) + " unsealed bytes do not fit in " +
                                      std::to_string(slots_left) + " remaining parts"
    );
  }
}

void Chunker::sealOpenPart() {
  consumer_.sealPart(open_index_, sealed_bytes_, open_size_);
  sealed_bytes_ += open_size_;
  ++open_index_;
  open_size_ = 0;
  adjustTarget();
}

void Chunker::startPartFromCarry() {
  consumer_.appendToPart(open_index_, carry_.data(), carry_.size());
  open_size_ = carry_.size();
  carry_.clear();
}

void Chunker::adjustTarget() {
  if (open_index_ >= policy_.max_part_count) {
    return;
  }
  if (!declared_length_) {
    // After the open part seals at target_, the slots behind it must still
    // hold the rest of max_object_size at max_part_size each.
    uint64_t slots_behind = policy_.max_part_count - open_index_ - 1;
    uint64_t outstanding = policy_.max_object_size - sealed_bytes_;
    uint64_t needed = 0;
    if (slots_behind <= outstanding / policy_.max_part_size) {
      needed = outstanding - slots_behind * policy_.max_part_size;
    }
    target_ = std::min(std::max(policy_.preferred_part_size, needed), policy_.max_part_size);
  }
  if (open_index_ + 1 == policy_.max_part_count) {
    target_ = policy_.max_part_size;
  }
}

}  // namespace upload
}  // namespace ferry
