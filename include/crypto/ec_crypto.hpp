// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "crypto/crypto.hpp"
#include "crypto/openssl_ptr.hpp"
#include <map>
#include <string>
#include <vector>

namespace meshwalk {
namespace crypto {

/**
 * ECKey - immutable handle to an OpenSSL EC key (public-only or full pair)
 *
 * Curve properties are resolved once at construction.
 */
class ECKey {
public:
  // Throws CryptoError if PKEY is null or not an EC key on a known curve
  ECKey(EvpPkeyPtr pkey, std::string security_level);

  ECKey(const ECKey &) = delete;
  ECKey &operator=(const ECKey &) = delete;

  // Level name the key was generated with, or the curve name for imports
  const std::string &security_level() const { return security_level_; }
  const std::string &curve_name() const { return curve_name_; }
  bool has_private_key() const { return has_private_; }

  // Field degree of the curve (163 for sect163k1, 571 for sect571r1, ...)
  int key_bits() const { return key_bits_; }

  // Bytes per signature half, from the field degree rather than the order
  // size. The two match on the four named levels; on curves whose order is
  // wider than the field (secp160r1: 161-bit order) a scalar can need one
  // more byte than this and loses its top byte in the fixed-width form.
  size_t signature_component_size() const {
    return static_cast<size_t>((key_bits_ + 7) / 8);
  }

  EVP_PKEY *native_handle() const { return pkey_.get(); }

private:
  EvpPkeyPtr pkey_;
  std::string security_level_;
  std::string curve_name_;
  int key_bits_{0};
  bool has_private_{false};
};

/**
 * ECCrypto - OpenSSL 3 implementation of the Crypto interface
 */
class ECCrypto : public Crypto {
public:
  ECCrypto();

  std::vector<std::string> security_levels() const override;
  KeyPtr generate_key(const std::string &security_level) const override;

  std::string key_to_pem(const ECKey &key) const override;
  KeyPtr key_from_public_pem(const std::string &pem) const override;
  KeyPtr key_from_private_pem(const std::string &pem) const override;
  bool is_valid_public_pem(const std::string &pem) const override;
  bool is_valid_private_pem(const std::string &pem) const override;

  Bytes key_to_bin(const ECKey &key) const override;
  KeyPtr key_from_public_bin(const Bytes &bin) const override;
  KeyPtr key_from_private_bin(const Bytes &bin) const override;
  bool is_valid_public_bin(const Bytes &bin) const override;
  bool is_valid_private_bin(const Bytes &bin) const override;

  KeyPtr key_to_public(const ECKey &key) const override;

  size_t get_signature_length(const ECKey &key) const override;
  Bytes create_signature(const ECKey &key, const Bytes &digest) const override;
  SignatureCheck verify_signature(const ECKey &key, const Bytes &digest,
                                  const Bytes &signature) const override;

  // Curve short name for a level or curve name; throws UnsupportedCurve
  std::string curve_for_level(const std::string &security_level) const;

  // PEM armor stripped, body base64-decoded; throws CryptoError
  static Bytes pem_to_bin(const std::string &pem);

  // Re-armor a binary key body (64-column base64)
  static std::string bin_to_pem(const Bytes &bin, const std::string &label);

private:
  // "very-low" -> "sect163k1", ... plus identity entries for builtin curves
  std::map<std::string, std::string> levels_;
  std::vector<std::string> level_order_;
};

/**
 * NoCrypto - wire-compatible stand-in for tests and simulations
 *
 * Signatures are get_signature_length(key) bytes of ASCII '0' and every
 * signature verifies. Key handling is the real ECCrypto one.
 */
class NoCrypto : public ECCrypto {
public:
  Bytes create_signature(const ECKey &key, const Bytes &digest) const override;
  SignatureCheck verify_signature(const ECKey &key, const Bytes &digest,
                                  const Bytes &signature) const override;
};

} // namespace crypto
} // namespace meshwalk
