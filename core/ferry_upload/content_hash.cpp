// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "content_hash.hpp"

#include <openssl/evp.h>

#include <vector>

namespace ferry {
namespace upload {

std::string base64Encode(const unsigned char* data, size_t size) {
  // EVP_EncodeBlock writes 4 bytes per 3 input bytes plus a terminating NUL.
  std::vector<unsigned char> out(4 * ((size + 2) / 3) + 1);
  int written = EVP_EncodeBlock(out.data(), data, static_cast<int>(size));
  return std::string(reinterpret_cast<const char*>(out.data()), static_cast<size_t>(written));
}

bool computePartDigests(std::istream& stream, PartDigests& digests) {
  EVP_MD_CTX* md5_ctx = EVP_MD_CTX_new();
  EVP_MD_CTX* sha_ctx = EVP_MD_CTX_new();
  if (!md5_ctx || !sha_ctx) {
    EVP_MD_CTX_free(md5_ctx);
    EVP_MD_CTX_free(sha_ctx);
    return false;
  }

  bool ok = EVP_DigestInit_ex(md5_ctx, EVP_md5(), nullptr) == 1 &&
            EVP_DigestInit_ex(sha_ctx, EVP_sha256(), nullptr) == 1;

  constexpr size_t buffer_size = 64 * 1024;
  std::vector<char> buffer(buffer_size);
  while (ok && (stream.read(buffer.data(), buffer_size) || stream.gcount() > 0)) {
    size_t n = static_cast<size_t>(stream.gcount());
    ok = EVP_DigestUpdate(md5_ctx, buffer.data(), n) == 1 &&
         EVP_DigestUpdate(sha_ctx, buffer.data(), n) == 1;
  }
  if (stream.bad()) {
    ok = false;
  }

  unsigned char md5[EVP_MAX_MD_SIZE];
  unsigned char sha[EVP_MAX_MD_SIZE];
  unsigned int md5_len = 0;
  unsigned int sha_len = 0;
  if (ok) {
    ok = EVP_DigestFinal_ex(md5_ctx, md5, &md5_len) == 1 &&
         EVP_DigestFinal_ex(sha_ctx, sha, &sha_len) == 1;
  }
  EVP_MD_CTX_free(md5_ctx);
  EVP_MD_CTX_free(sha_ctx);
  if (!ok) {
    return false;
  }

  digests.md5_base64 = base64Encode(md5, md5_len);
  digests.sha256_base64 = base64Encode(sha, sha_len);

  stream.clear();
  stream.seekg(0, std::ios::beg);
  return !stream.fail();
}

}  // namespace upload
}  // namespace ferry
