// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "crypto/digest.hpp"
#include <openssl/evp.h>

namespace meshwalk {
namespace crypto {

static Bytes Digest(const EVP_MD *md, const uint8_t *data, size_t len) {
  unsigned char out[EVP_MAX_MD_SIZE];
  unsigned int out_len = 0;
  if (EVP_Digest(data, len, out, &out_len, md, nullptr) != 1) {
    throw CryptoError(std::string("digest failed: ") + EVP_MD_get0_name(md));
  }
  return Bytes(out, out + out_len);
}

Bytes Sha1Digest(const Bytes &data) {
  return Digest(EVP_sha1(), data.data(), data.size());
}

Bytes Sha1Digest(const std::string &data) {
  return Digest(EVP_sha1(), reinterpret_cast<const uint8_t *>(data.data()),
                data.size());
}

Bytes Sha256Digest(const Bytes &data) {
  return Digest(EVP_sha256(), data.data(), data.size());
}

} // namespace crypto
} // namespace meshwalk
