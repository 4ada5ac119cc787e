// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef FERRY_HEADER_SANITIZER_HPP
#define FERRY_HEADER_SANITIZER_HPP

#include <string>

#include "object_backend.hpp"

namespace ferry {
namespace upload {

/**
 * Remove every character outside horizontal tab and printable ASCII (0x20-0x7E).
 * Object stores reject or mangle request headers carrying other bytes.
 */
std::string sanitizeHeaderValue(const std::string& value);

/**
 * Sanitize all values of an upload's metadata. Keys are kept as-is.
 */
ObjectMetadata sanitizeMetadata(const ObjectMetadata& metadata);

}  // namespace upload
}  // namespace ferry

#endif  // FERRY_HEADER_SANITIZER_HPP
