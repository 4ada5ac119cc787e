// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef FERRY_CONTENT_HASH_HPP
#define FERRY_CONTENT_HASH_HPP

#include <istream>
#include <string>

namespace ferry {
namespace upload {

/**
 * Digests sent with an upload-part request
 */
struct PartDigests {
  std::string md5_base64;  // Content-MD5 header value
  std::string sha256_base64;  // x-amz-checksum-sha256 header value
};

/**
 * Compute MD5 and SHA-256 of the remaining bytes of `stream` in one pass.
 * The stream is rewound to its start afterwards.
 *
 * @param stream Open binary stream
 * @param digests Filled on success
 * @return false on read or OpenSSL failure
 */
bool computePartDigests(std::istream& stream, PartDigests& digests);

/**
 * Standard base64 (RFC 4648) with padding
 */
std::string base64Encode(const unsigned char* data, size_t size);

}  // namespace upload
}  // namespace ferry

#endif  // FERRY_CONTENT_HASH_HPP
