// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "crypto/ec_crypto.hpp"
#include "crypto/signature_encoding.hpp"
#include "util/logging.hpp"
#include <openssl/bn.h>
#include <openssl/core_names.h>
#include <openssl/err.h>
#include <openssl/objects.h>
#include <openssl/pem.h>
#include <sstream>

namespace meshwalk {
namespace crypto {

namespace {

constexpr const char *PUBLIC_LABEL = "PUBLIC KEY";
constexpr const char *PRIVATE_LABEL = "EC PRIVATE KEY";

// Predefined security levels, weakest first
const std::vector<std::pair<std::string, std::string>> &PredefinedLevels() {
  static const std::vector<std::pair<std::string, std::string>> levels = {
      {"very-low", "sect163k1"},
      {"low", "sect233k1"},
      {"medium", "sect409k1"},
      {"high", "sect571r1"},
  };
  return levels;
}

// Drain the OpenSSL error queue into a message
std::string OpenSSLError(const std::string &what) {
  unsigned long code = ERR_get_error();
  std::string msg = what;
  if (code != 0) {
    char buf[256];
    ERR_error_string_n(code, buf, sizeof(buf));
    msg += ": ";
    msg += buf;
  }
  ERR_clear_error();
  return msg;
}

// Never prompt: encrypted private keys are refused
int NoPassphrase(char *, int, int, void *) { return 0; }

int CurveNid(const std::string &name) {
  int nid = OBJ_sn2nid(name.c_str());
  if (nid == NID_undef) {
    nid = EC_curve_nist2nid(name.c_str());
  }
  return nid;
}

BioPtr MemoryBio(const std::string &data) {
  BioPtr bio(BIO_new_mem_buf(data.data(), static_cast<int>(data.size())));
  if (!bio) {
    throw CryptoError(OpenSSLError("BIO_new_mem_buf failed"));
  }
  return bio;
}

std::string DrainBio(BIO *bio) {
  char *data = nullptr;
  long len = BIO_get_mem_data(bio, &data);
  if (len <= 0 || data == nullptr) {
    return {};
  }
  return std::string(data, static_cast<size_t>(len));
}

// Imported keys on a predefined curve report that level's name
KeyPtr WrapImportedKey(EvpPkeyPtr pkey) {
  std::string level;
  char group_name[80];
  size_t group_name_len = 0;
  if (EVP_PKEY_get_group_name(pkey.get(), group_name, sizeof(group_name),
                              &group_name_len)) {
    std::string curve(group_name, group_name_len);
    for (const auto &[name, predefined] : PredefinedLevels()) {
      if (predefined == curve)
        level = name;
    }
  }
  ERR_clear_error();
  return std::make_shared<const ECKey>(std::move(pkey), level);
}

} // anonymous namespace

// ECKey

ECKey::ECKey(EvpPkeyPtr pkey, std::string security_level)
    : pkey_(std::move(pkey)), security_level_(std::move(security_level)) {
  if (!pkey_) {
    throw CryptoError("null key handle");
  }
  if (!EVP_PKEY_is_a(pkey_.get(), "EC")) {
    throw CryptoError("not an EC key");
  }

  char group_name[80];
  size_t group_name_len = 0;
  if (!EVP_PKEY_get_group_name(pkey_.get(), group_name, sizeof(group_name),
                               &group_name_len)) {
    throw CryptoError(OpenSSLError("EC key without a named curve"));
  }
  curve_name_.assign(group_name, group_name_len);

  int nid = CurveNid(curve_name_);
  if (nid == NID_undef) {
    throw UnsupportedCurve(curve_name_);
  }
  EcGroupPtr group(EC_GROUP_new_by_curve_name(nid));
  if (!group) {
    throw UnsupportedCurve(curve_name_);
  }
  key_bits_ = EC_GROUP_get_degree(group.get());
  if (key_bits_ <= 0) {
    throw CryptoError("curve " + curve_name_ + " has no degree");
  }

  BIGNUM *priv = nullptr;
  if (EVP_PKEY_get_bn_param(pkey_.get(), OSSL_PKEY_PARAM_PRIV_KEY, &priv) == 1) {
    has_private_ = true;
    BN_clear_free(priv);
  }
  // A failed lookup of the private scalar is the normal public-key case
  ERR_clear_error();

  if (security_level_.empty()) {
    security_level_ = curve_name_;
  }
}

// ECCrypto

ECCrypto::ECCrypto() {
  for (const auto &[level, curve] : PredefinedLevels()) {
    levels_[level] = curve;
    level_order_.push_back(level);
  }

  size_t count = EC_get_builtin_curves(nullptr, 0);
  std::vector<EC_builtin_curve> curves(count);
  EC_get_builtin_curves(curves.data(), count);
  for (const auto &curve : curves) {
    const char *short_name = OBJ_nid2sn(curve.nid);
    if (short_name == nullptr || levels_.count(short_name))
      continue;
    levels_[short_name] = short_name;
    level_order_.push_back(short_name);
  }
}

std::vector<std::string> ECCrypto::security_levels() const {
  return level_order_;
}

std::string ECCrypto::curve_for_level(const std::string &security_level) const {
  auto it = levels_.find(security_level);
  if (it == levels_.end()) {
    throw UnsupportedCurve(security_level);
  }
  return it->second;
}

KeyPtr ECCrypto::generate_key(const std::string &security_level) const {
  const std::string curve = curve_for_level(security_level);

  EvpPkeyCtxPtr ctx(EVP_PKEY_CTX_new_from_name(nullptr, "EC", nullptr));
  if (!ctx || EVP_PKEY_keygen_init(ctx.get()) <= 0) {
    throw CryptoError(OpenSSLError("EC keygen context"));
  }
  if (EVP_PKEY_CTX_set_group_name(ctx.get(), curve.c_str()) <= 0) {
    ERR_clear_error();
    throw UnsupportedCurve(security_level);
  }

  EVP_PKEY *raw = nullptr;
  if (EVP_PKEY_generate(ctx.get(), &raw) <= 0) {
    throw CryptoError(OpenSSLError("EC key generation on " + curve));
  }

  LOG_CRYPTO_DEBUG("Generated {} key ({})", security_level, curve);
  return std::make_shared<const ECKey>(EvpPkeyPtr(raw), security_level);
}

std::string ECCrypto::key_to_pem(const ECKey &key) const {
  BioPtr bio(BIO_new(BIO_s_mem()));
  if (!bio) {
    throw CryptoError(OpenSSLError("BIO_new failed"));
  }

  int ok = 0;
  if (key.has_private_key()) {
    ok = PEM_write_bio_PrivateKey_traditional(bio.get(), key.native_handle(),
                                              nullptr, nullptr, 0, nullptr,
                                              nullptr);
  } else {
    ok = PEM_write_bio_PUBKEY(bio.get(), key.native_handle());
  }
  if (ok != 1) {
    throw CryptoError(OpenSSLError("PEM encoding failed"));
  }
  return DrainBio(bio.get());
}

KeyPtr ECCrypto::key_from_public_pem(const std::string &pem) const {
  BioPtr bio = MemoryBio(pem);
  EvpPkeyPtr pkey(PEM_read_bio_PUBKEY(bio.get(), nullptr, NoPassphrase, nullptr));
  if (!pkey) {
    throw CryptoError(OpenSSLError("invalid public key PEM"));
  }
  return WrapImportedKey(std::move(pkey));
}

KeyPtr ECCrypto::key_from_private_pem(const std::string &pem) const {
  BioPtr bio = MemoryBio(pem);
  EvpPkeyPtr pkey(PEM_read_bio_PrivateKey(bio.get(), nullptr, NoPassphrase, nullptr));
  if (!pkey) {
    throw CryptoError(OpenSSLError("invalid private key PEM"));
  }
  KeyPtr key = WrapImportedKey(std::move(pkey));
  if (!key->has_private_key()) {
    throw CryptoError("PEM holds no private key");
  }
  return key;
}

bool ECCrypto::is_valid_public_pem(const std::string &pem) const {
  try {
    return key_from_public_pem(pem) != nullptr;
  } catch (const CryptoError &e) {
    LOG_CRYPTO_DEBUG("Rejected public key PEM: {}", e.what());
    return false;
  }
}

bool ECCrypto::is_valid_private_pem(const std::string &pem) const {
  try {
    return key_from_private_pem(pem) != nullptr;
  } catch (const CryptoError &e) {
    LOG_CRYPTO_DEBUG("Rejected private key PEM: {}", e.what());
    return false;
  }
}

Bytes ECCrypto::pem_to_bin(const std::string &pem) {
  std::istringstream in(pem);
  std::string line;
  std::string body;
  while (std::getline(in, line)) {
    if (!line.empty() && line.back() == '\r')
      line.pop_back();
    if (line.rfind("-----", 0) == 0)
      continue;
    body += line;
  }
  if (body.empty()) {
    throw CryptoError("PEM without body");
  }

  EvpEncodeCtxPtr ctx(EVP_ENCODE_CTX_new());
  if (!ctx) {
    throw CryptoError(OpenSSLError("EVP_ENCODE_CTX_new failed"));
  }
  Bytes out(body.size() / 4 * 3 + 3);
  int out_len = 0;
  int final_len = 0;
  EVP_DecodeInit(ctx.get());
  if (EVP_DecodeUpdate(ctx.get(), out.data(), &out_len,
                       reinterpret_cast<const unsigned char *>(body.data()),
                       static_cast<int>(body.size())) < 0 ||
      EVP_DecodeFinal(ctx.get(), out.data() + out_len, &final_len) != 1) {
    throw CryptoError(OpenSSLError("invalid base64 in PEM body"));
  }
  out.resize(static_cast<size_t>(out_len + final_len));
  return out;
}

std::string ECCrypto::bin_to_pem(const Bytes &bin, const std::string &label) {
  EvpEncodeCtxPtr ctx(EVP_ENCODE_CTX_new());
  if (!ctx) {
    throw CryptoError(OpenSSLError("EVP_ENCODE_CTX_new failed"));
  }
  std::string encoded(EVP_ENCODE_LENGTH(bin.size()), '\0');
  int out_len = 0;
  int final_len = 0;
  EVP_EncodeInit(ctx.get());
  if (EVP_EncodeUpdate(ctx.get(), reinterpret_cast<unsigned char *>(encoded.data()),
                       &out_len, bin.data(), static_cast<int>(bin.size())) != 1) {
    throw CryptoError(OpenSSLError("base64 encoding failed"));
  }
  EVP_EncodeFinal(ctx.get(),
                  reinterpret_cast<unsigned char *>(encoded.data()) + out_len,
                  &final_len);
  encoded.resize(static_cast<size_t>(out_len + final_len));

  return "-----BEGIN " + label + "-----\n" + encoded + "-----END " + label +
         "-----\n";
}

Bytes ECCrypto::key_to_bin(const ECKey &key) const {
  return pem_to_bin(key_to_pem(key));
}

KeyPtr ECCrypto::key_from_public_bin(const Bytes &bin) const {
  return key_from_public_pem(bin_to_pem(bin, PUBLIC_LABEL));
}

KeyPtr ECCrypto::key_from_private_bin(const Bytes &bin) const {
  return key_from_private_pem(bin_to_pem(bin, PRIVATE_LABEL));
}

bool ECCrypto::is_valid_public_bin(const Bytes &bin) const {
  if (bin.empty())
    return false;
  return is_valid_public_pem(bin_to_pem(bin, PUBLIC_LABEL));
}

bool ECCrypto::is_valid_private_bin(const Bytes &bin) const {
  if (bin.empty())
    return false;
  return is_valid_private_pem(bin_to_pem(bin, PRIVATE_LABEL));
}

KeyPtr ECCrypto::key_to_public(const ECKey &key) const {
  BioPtr bio(BIO_new(BIO_s_mem()));
  if (!bio || PEM_write_bio_PUBKEY(bio.get(), key.native_handle()) != 1) {
    throw CryptoError(OpenSSLError("public key export failed"));
  }
  EvpPkeyPtr pub(PEM_read_bio_PUBKEY(bio.get(), nullptr, NoPassphrase, nullptr));
  if (!pub) {
    throw CryptoError(OpenSSLError("public key import failed"));
  }
  return std::make_shared<const ECKey>(std::move(pub), key.security_level());
}

size_t ECCrypto::get_signature_length(const ECKey &key) const {
  return 2 * key.signature_component_size();
}

Bytes ECCrypto::create_signature(const ECKey &key, const Bytes &digest) const {
  if (!key.has_private_key()) {
    throw CryptoError("cannot sign with a public key");
  }

  EvpPkeyCtxPtr ctx(EVP_PKEY_CTX_new_from_pkey(nullptr, key.native_handle(), nullptr));
  if (!ctx || EVP_PKEY_sign_init(ctx.get()) <= 0) {
    throw CryptoError(OpenSSLError("sign context"));
  }

  size_t der_len = 0;
  if (EVP_PKEY_sign(ctx.get(), nullptr, &der_len, digest.data(), digest.size()) <= 0) {
    throw CryptoError(OpenSSLError("signature size query"));
  }
  Bytes der(der_len);
  if (EVP_PKEY_sign(ctx.get(), der.data(), &der_len, digest.data(), digest.size()) <= 0) {
    throw CryptoError(OpenSSLError("ECDSA sign"));
  }
  der.resize(der_len);

  return DerToFixedWidth(der, key.signature_component_size());
}

SignatureCheck ECCrypto::verify_signature(const ECKey &key, const Bytes &digest,
                                          const Bytes &signature) const {
  Bytes der;
  SignatureCheck check =
      FixedWidthToDer(signature, key.signature_component_size(), der);
  if (check != SignatureCheck::kValid) {
    return check;
  }

  EvpPkeyCtxPtr ctx(EVP_PKEY_CTX_new_from_pkey(nullptr, key.native_handle(), nullptr));
  if (!ctx || EVP_PKEY_verify_init(ctx.get()) <= 0) {
    LOG_CRYPTO_WARN("{}", OpenSSLError("verify context"));
    return SignatureCheck::kRejected;
  }

  int rc = EVP_PKEY_verify(ctx.get(), der.data(), der.size(), digest.data(),
                           digest.size());
  ERR_clear_error();
  return rc == 1 ? SignatureCheck::kValid : SignatureCheck::kRejected;
}

// NoCrypto

Bytes NoCrypto::create_signature(const ECKey &key, const Bytes &) const {
  return Bytes(get_signature_length(key), '0');
}

SignatureCheck NoCrypto::verify_signature(const ECKey &, const Bytes &,
                                          const Bytes &) const {
  return SignatureCheck::kValid;
}

} // namespace crypto
} // namespace meshwalk
