// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

// RAII owners for the OpenSSL objects the crypto module touches

#include <memory>
#include <openssl/bio.h>
#include <openssl/ec.h>
#include <openssl/evp.h>

namespace meshwalk {
namespace crypto {

struct EvpPkeyDeleter {
  void operator()(EVP_PKEY *p) const { EVP_PKEY_free(p); }
};
struct EvpPkeyCtxDeleter {
  void operator()(EVP_PKEY_CTX *p) const { EVP_PKEY_CTX_free(p); }
};
struct BioDeleter {
  void operator()(BIO *p) const { BIO_free_all(p); }
};
struct EcGroupDeleter {
  void operator()(EC_GROUP *p) const { EC_GROUP_free(p); }
};
struct EvpEncodeCtxDeleter {
  void operator()(EVP_ENCODE_CTX *p) const { EVP_ENCODE_CTX_free(p); }
};

using EvpPkeyPtr = std::unique_ptr<EVP_PKEY, EvpPkeyDeleter>;
using EvpPkeyCtxPtr = std::unique_ptr<EVP_PKEY_CTX, EvpPkeyCtxDeleter>;
using BioPtr = std::unique_ptr<BIO, BioDeleter>;
using EcGroupPtr = std::unique_ptr<EC_GROUP, EcGroupDeleter>;
using EvpEncodeCtxPtr = std::unique_ptr<EVP_ENCODE_CTX, EvpEncodeCtxDeleter>;

} // namespace crypto
} // namespace meshwalk
