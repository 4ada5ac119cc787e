// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "header_sanitizer.hpp"

namespace ferry {
namespace upload {

std::string sanitizeHeaderValue(const std::string& value) {
  std::string result;
  result.reserve(value.size());
  for (char c : value) {
    unsigned char uc = static_cast<unsigned char>(c);
    if (uc == '\t' || (uc >= 0x20 && uc <= 0x7E)) {
      result.push_back(c);
    }
  }
  return result;
}

ObjectMetadata sanitizeMetadata(const ObjectMetadata& metadata) {
  ObjectMetadata result;
  for (const auto& [key, value] : metadata) {
    result[key] = sanitizeHeaderValue(value);
  }
  return result;
}

}  // namespace upload
}  // namespace ferry
