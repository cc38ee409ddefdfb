// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "crypto/crypto.hpp"
#include <string>

namespace meshwalk {
namespace crypto {

// Message digests (OpenSSL EVP). Throw CryptoError only if the backend fails.
Bytes Sha1Digest(const Bytes &data);
Bytes Sha1Digest(const std::string &data);
Bytes Sha256Digest(const Bytes &data);

} // namespace crypto
} // namespace meshwalk
