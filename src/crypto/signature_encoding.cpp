// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "crypto/signature_encoding.hpp"

namespace meshwalk {
namespace crypto {

namespace {

constexpr uint8_t DER_SEQUENCE = 0x30;
constexpr uint8_t DER_INTEGER = 0x02;

void WriteDerLength(Bytes &out, size_t len) {
  if (len < 0x80) {
    out.push_back(static_cast<uint8_t>(len));
  } else if (len <= 0xff) {
    out.push_back(0x81);
    out.push_back(static_cast<uint8_t>(len));
  } else {
    out.push_back(0x82);
    out.push_back(static_cast<uint8_t>(len >> 8));
    out.push_back(static_cast<uint8_t>(len & 0xff));
  }
}

// Reads a definite length at POS; advances POS. Long form up to 2 bytes.
bool ReadDerLength(const Bytes &in, size_t &pos, size_t &len) {
  if (pos >= in.size())
    return false;
  uint8_t first = in[pos++];
  if (first < 0x80) {
    len = first;
    return true;
  }
  size_t num_bytes = first & 0x7f;
  if (num_bytes == 0 || num_bytes > 2 || pos + num_bytes > in.size())
    return false;
  len = 0;
  for (size_t i = 0; i < num_bytes; ++i) {
    len = (len << 8) | in[pos++];
  }
  return true;
}

bool ReadDerInteger(const Bytes &in, size_t &pos, Bytes &value) {
  if (pos >= in.size() || in[pos++] != DER_INTEGER)
    return false;
  size_t len = 0;
  if (!ReadDerLength(in, pos, len))
    return false;
  if (len == 0 || pos + len > in.size())
    return false;
  value.assign(in.begin() + pos, in.begin() + pos + len);
  pos += len;
  return true;
}

} // anonymous namespace

Bytes FixedWidth(const uint8_t *data, size_t len, size_t width) {
  size_t start = 0;
  while (start < len && data[start] == 0) {
    ++start;
  }
  size_t significant = len - start;
  if (significant > width) {
    throw CryptoError("signature component wider than " +
                      std::to_string(width) + " bytes");
  }
  Bytes out(width - significant, 0);
  out.insert(out.end(), data + start, data + len);
  return out;
}

std::optional<Bytes> CanonicalInteger(const uint8_t *data, size_t len) {
  size_t start = 0;
  while (start < len && data[start] == 0) {
    ++start;
  }
  if (start == len) {
    return std::nullopt;
  }
  Bytes out;
  out.reserve(len - start + 1);
  if (data[start] & 0x80) {
    out.push_back(0x00);
  }
  out.insert(out.end(), data + start, data + len);
  return out;
}

Bytes EncodeDerSignature(const Bytes &r, const Bytes &s) {
  Bytes body;
  body.reserve(r.size() + s.size() + 8);
  body.push_back(DER_INTEGER);
  WriteDerLength(body, r.size());
  body.insert(body.end(), r.begin(), r.end());
  body.push_back(DER_INTEGER);
  WriteDerLength(body, s.size());
  body.insert(body.end(), s.begin(), s.end());

  Bytes der;
  der.reserve(body.size() + 4);
  der.push_back(DER_SEQUENCE);
  WriteDerLength(der, body.size());
  der.insert(der.end(), body.begin(), body.end());
  return der;
}

bool ParseDerSignature(const Bytes &der, Bytes &r, Bytes &s) {
  size_t pos = 0;
  if (der.empty() || der[pos++] != DER_SEQUENCE)
    return false;
  size_t seq_len = 0;
  if (!ReadDerLength(der, pos, seq_len))
    return false;
  if (pos + seq_len != der.size())
    return false;
  if (!ReadDerInteger(der, pos, r))
    return false;
  if (!ReadDerInteger(der, pos, s))
    return false;
  return pos == der.size();
}

Bytes DerToFixedWidth(const Bytes &der, size_t component_size) {
  Bytes r, s;
  if (!ParseDerSignature(der, r, s)) {
    throw CryptoError("backend produced a malformed DER signature");
  }
  Bytes out = FixedWidth(r.data(), r.size(), component_size);
  Bytes s_fixed = FixedWidth(s.data(), s.size(), component_size);
  out.insert(out.end(), s_fixed.begin(), s_fixed.end());
  return out;
}

SignatureCheck FixedWidthToDer(const Bytes &signature, size_t component_size,
                               Bytes &der_out) {
  if (component_size == 0 || signature.size() != 2 * component_size) {
    return SignatureCheck::kMalformedLength;
  }
  auto r = CanonicalInteger(signature.data(), component_size);
  auto s = CanonicalInteger(signature.data() + component_size, component_size);
  if (!r || !s) {
    return SignatureCheck::kMalformedScalar;
  }
  der_out = EncodeDerSignature(*r, *s);
  return SignatureCheck::kValid;
}

} // namespace crypto
} // namespace meshwalk
