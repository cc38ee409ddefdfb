// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "crypto/crypto.hpp"

namespace meshwalk {
namespace crypto {

const char *SignatureCheckName(SignatureCheck check) {
  switch (check) {
  case SignatureCheck::kValid:
    return "valid";
  case SignatureCheck::kMalformedLength:
    return "malformed-length";
  case SignatureCheck::kMalformedScalar:
    return "malformed-scalar";
  case SignatureCheck::kRejected:
    return "rejected";
  }
  return "unknown";
}

} // namespace crypto
} // namespace meshwalk
