// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

/*
 Signature encoding - conversion between the backend's DER ECDSA-Sig-Value
 and the fixed-width r || s wire form

 DER (what OpenSSL produces and consumes):
   SEQUENCE { INTEGER r, INTEGER s }
   INTEGERs are minimal two's complement: no redundant leading 0x00, and a
   single 0x00 prefix when the top bit would otherwise read as a sign bit

 Wire form:
   r and s, big-endian, each left-zero-padded to component_size bytes

 These helpers are pure byte manipulation and have no OpenSSL dependency.
*/

#include "crypto/crypto.hpp"
#include <cstddef>
#include <cstdint>
#include <optional>

namespace meshwalk {
namespace crypto {

/**
 * Left-pad (or strip leading zeros from) a big-endian unsigned integer to
 * exactly WIDTH bytes. Throws CryptoError if the value does not fit.
 */
Bytes FixedWidth(const uint8_t *data, size_t len, size_t width);

/**
 * Minimal positive DER INTEGER content for a big-endian unsigned value:
 * leading zeros stripped, 0x00 prefixed if the top bit is set.
 * Returns std::nullopt for zero (not a valid ECDSA scalar).
 */
std::optional<Bytes> CanonicalInteger(const uint8_t *data, size_t len);

/**
 * Build SEQUENCE { INTEGER r, INTEGER s } from canonical integer contents
 */
Bytes EncodeDerSignature(const Bytes &r, const Bytes &s);

/**
 * Parse a DER ECDSA-Sig-Value; R and S receive the raw INTEGER contents.
 * Returns false on any structural error (never throws).
 */
bool ParseDerSignature(const Bytes &der, Bytes &r, Bytes &s);

/**
 * DER signature -> r || s with fixed COMPONENT_SIZE halves.
 * Throws CryptoError if the DER is malformed or a component is too wide.
 */
Bytes DerToFixedWidth(const Bytes &der, size_t component_size);

/**
 * r || s -> DER signature.
 * Returns kMalformedLength if SIGNATURE is not 2 * COMPONENT_SIZE bytes and
 * kMalformedScalar if either half is zero; DER_OUT is set only on kValid.
 */
SignatureCheck FixedWidthToDer(const Bytes &signature, size_t component_size,
                               Bytes &der_out);

} // namespace crypto
} // namespace meshwalk
