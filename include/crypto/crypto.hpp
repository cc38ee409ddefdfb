// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

/*
 Crypto — message authentication interface for the overlay

 Purpose
 - Generate and (de)serialize elliptic-curve keys (PEM and binary forms)
 - Sign and verify message digests with fixed-width signatures

 Signature wire format
 - r || s, each scalar big-endian and left-zero-padded to
   ceil(key_bits / 8) bytes; no ASN.1 wrapper, no length prefix
 - The length is derivable from the signer's curve alone:
   get_signature_length(key) == 2 * ceil(key_bits / 8)

 Error model
 - Configuration errors (unknown security level) throw UnsupportedCurve
 - Explicit parsers (key_from_*) throw CryptoError on bad input
 - Every is_valid_* predicate and verify_signature() report failure as a
   value and never throw: their input comes from untrusted peers

 Implementations
 - ECCrypto: OpenSSL-backed
 - NoCrypto: correct-length dummy signatures, every signature accepted
   (removes crypto cost from tests while preserving wire sizes)
*/

#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace meshwalk {
namespace crypto {

using Bytes = std::vector<uint8_t>;

class ECKey;
using KeyPtr = std::shared_ptr<const ECKey>;

/**
 * Base class for all crypto failures that are reported by exception
 */
class CryptoError : public std::runtime_error {
public:
  explicit CryptoError(const std::string &what) : std::runtime_error(what) {}
};

/**
 * Requested security level / curve is not known to the backend
 */
class UnsupportedCurve : public CryptoError {
public:
  explicit UnsupportedCurve(const std::string &security_level)
      : CryptoError("unsupported security level or curve: " + security_level),
        security_level_(security_level) {}

  const std::string &security_level() const { return security_level_; }

private:
  std::string security_level_;
};

/**
 * Outcome of signature verification
 */
enum class SignatureCheck {
  kValid,            // Backend accepted the signature
  kMalformedLength,  // Signature length != get_signature_length(key)
  kMalformedScalar,  // r or s is zero and cannot be a valid scalar
  kRejected,         // Well-formed, but the backend refused it
};

const char *SignatureCheckName(SignatureCheck check);

/**
 * Crypto - capability interface used by the walker and the dispatch layer
 *
 * Callers depend on this interface only; ECCrypto and NoCrypto are
 * interchangeable.
 */
class Crypto {
public:
  virtual ~Crypto() = default;

  // Names accepted by generate_key(): "very-low", "low", "medium", "high"
  // plus every curve short name the backend exposes
  virtual std::vector<std::string> security_levels() const = 0;

  // Fresh key pair; throws UnsupportedCurve for unknown levels
  virtual KeyPtr generate_key(const std::string &security_level) const = 0;

  // PEM form: "EC PRIVATE KEY" armor if the key has a private part,
  // "PUBLIC KEY" armor otherwise
  virtual std::string key_to_pem(const ECKey &key) const = 0;
  virtual KeyPtr key_from_public_pem(const std::string &pem) const = 0;
  virtual KeyPtr key_from_private_pem(const std::string &pem) const = 0;
  virtual bool is_valid_public_pem(const std::string &pem) const = 0;
  virtual bool is_valid_private_pem(const std::string &pem) const = 0;

  // Binary form: PEM body without armor, base64-decoded
  virtual Bytes key_to_bin(const ECKey &key) const = 0;
  virtual KeyPtr key_from_public_bin(const Bytes &bin) const = 0;
  virtual KeyPtr key_from_private_bin(const Bytes &bin) const = 0;
  virtual bool is_valid_public_bin(const Bytes &bin) const = 0;
  virtual bool is_valid_private_bin(const Bytes &bin) const = 0;

  // Public half of any key
  virtual KeyPtr key_to_public(const ECKey &key) const = 0;

  virtual size_t get_signature_length(const ECKey &key) const = 0;

  // Signs DIGEST as-is (no hashing); throws CryptoError without a private key
  virtual Bytes create_signature(const ECKey &key, const Bytes &digest) const = 0;

  // Never throws
  virtual SignatureCheck verify_signature(const ECKey &key, const Bytes &digest,
                                          const Bytes &signature) const = 0;

  bool is_valid_signature(const ECKey &key, const Bytes &digest,
                          const Bytes &signature) const {
    return verify_signature(key, digest, signature) == SignatureCheck::kValid;
  }
};

} // namespace crypto
} // namespace meshwalk
