// Copyright (c) 2024 LunaChain
// Distributed under the MIT software license

#include "crypto/key.hpp"
#include "crypto/sha256.hpp"
#include "util/logging.hpp"
#include "util/strencodings.hpp"
#include <cstring>
#include <openssl/bn.h>
#include <openssl/ec.h>
#include <openssl/ecdsa.h>
#include <openssl/obj_mac.h>

namespace lunachain {
namespace crypto {

namespace {

struct BNDeleter {
  void operator()(BIGNUM *bn) const { BN_clear_free(bn); }
};
using BNPtr = std::unique_ptr<BIGNUM, BNDeleter>;

struct PointDeleter {
  void operator()(EC_POINT *p) const { EC_POINT_free(p); }
};
using PointPtr = std::unique_ptr<EC_POINT, PointDeleter>;

struct ECKeyFree {
  void operator()(EC_KEY *k) const { EC_KEY_free(k); }
};
using ECKeyPtr = std::unique_ptr<EC_KEY, ECKeyFree>;

ECKeyPtr NewCurveKey() {
  ECKeyPtr key(EC_KEY_new_by_curve_name(NID_secp256k1));
  if (key) {
    EC_KEY_set_conv_form(key.get(), POINT_CONVERSION_COMPRESSED);
  }
  return key;
}

} // namespace

void CKey::KeyDeleter::operator()(ec_key_st *key) const { EC_KEY_free(key); }

CKey::CKey() = default;
CKey::~CKey() = default;
CKey::CKey(CKey &&) noexcept = default;
CKey &CKey::operator=(CKey &&) noexcept = default;

bool CKey::MakeNewKey() {
  ECKeyPtr key = NewCurveKey();
  if (!key || EC_KEY_generate_key(key.get()) != 1) {
    LOG_CRYPTO_ERROR("EC_KEY_generate_key failed");
    return false;
  }
  key_.reset(key.release());
  return true;
}

bool CKey::SetSecret(const std::vector<uint8_t> &secret) {
  if (secret.size() != 32) {
    return false;
  }
  ECKeyPtr key = NewCurveKey();
  if (!key) {
    return false;
  }
  const EC_GROUP *group = EC_KEY_get0_group(key.get());

  BNPtr priv(BN_bin2bn(secret.data(), static_cast<int>(secret.size()), nullptr));
  BNPtr order(BN_new());
  if (!priv || !order || EC_GROUP_get_order(group, order.get(), nullptr) != 1) {
    return false;
  }
  if (BN_is_zero(priv.get()) || BN_cmp(priv.get(), order.get()) >= 0) {
    return false;
  }

  PointPtr pub(EC_POINT_new(group));
  if (!pub ||
      EC_POINT_mul(group, pub.get(), priv.get(), nullptr, nullptr, nullptr) != 1) {
    return false;
  }
  if (EC_KEY_set_private_key(key.get(), priv.get()) != 1 ||
      EC_KEY_set_public_key(key.get(), pub.get()) != 1) {
    return false;
  }
  key_.reset(key.release());
  return true;
}

std::vector<uint8_t> CKey::GetSecret() const {
  if (!key_) {
    return {};
  }
  const BIGNUM *priv = EC_KEY_get0_private_key(key_.get());
  std::vector<uint8_t> out(32, 0);
  if (!priv || BN_bn2binpad(priv, out.data(), static_cast<int>(out.size())) != 32) {
    return {};
  }
  return out;
}

PubKey CKey::GetPubKey() const {
  if (!key_) {
    return {};
  }
  int len = i2o_ECPublicKey(key_.get(), nullptr);
  if (len <= 0) {
    return {};
  }
  PubKey out(static_cast<size_t>(len));
  unsigned char *p = out.data();
  if (i2o_ECPublicKey(key_.get(), &p) != len) {
    return {};
  }
  return out;
}

std::string CKey::GetAddress() const { return AddressFromPubKey(GetPubKey()); }

std::vector<uint8_t> CKey::Sign(const uint256 &hash) const {
  if (!key_) {
    return {};
  }
  unsigned int sig_len = static_cast<unsigned int>(ECDSA_size(key_.get()));
  std::vector<uint8_t> sig(sig_len);
  if (ECDSA_sign(0, hash.data(), static_cast<int>(hash.size()), sig.data(),
                 &sig_len, key_.get()) != 1) {
    LOG_CRYPTO_ERROR("ECDSA_sign failed");
    return {};
  }
  sig.resize(sig_len);
  return sig;
}

bool VerifySignature(const PubKey &pubkey, const uint256 &hash,
                     const std::vector<uint8_t> &signature) {
  if (pubkey.empty() || signature.empty()) {
    return false;
  }
  ECKeyPtr key = NewCurveKey();
  if (!key) {
    return false;
  }
  EC_KEY *raw = key.get();
  const unsigned char *p = pubkey.data();
  if (!o2i_ECPublicKey(&raw, &p, static_cast<long>(pubkey.size()))) {
    return false;
  }
  int ok = ECDSA_verify(0, hash.data(), static_cast<int>(hash.size()),
                        signature.data(), static_cast<int>(signature.size()),
                        key.get());
  return ok == 1;
}

std::string AddressFromPubKey(const PubKey &pubkey) {
  uint256 h = SHA256(pubkey);
  return std::string(ADDRESS_PREFIX) + util::HexStr(h.data(), ADDRESS_HASH_BYTES);
}

bool IsValidAddress(const std::string &address) {
  const size_t prefix_len = std::strlen(ADDRESS_PREFIX);
  if (address.size() != prefix_len + ADDRESS_HASH_BYTES * 2 ||
      address.compare(0, prefix_len, ADDRESS_PREFIX) != 0) {
    return false;
  }
  for (size_t i = prefix_len; i < address.size(); ++i) {
    char c = address[i];
    if (!((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f'))) {
      return false;
    }
  }
  return true;
}

std::optional<std::string> NormalizeAddress(const std::string &address) {
  std::string trimmed = util::TrimQuotes(address);
  const size_t prefix_len = std::strlen(ADDRESS_PREFIX);
  if (trimmed.size() < prefix_len) {
    return std::nullopt;
  }
  std::string prefix = util::ToLower(trimmed.substr(0, prefix_len));
  if (prefix != util::ToLower(ADDRESS_PREFIX)) {
    return std::nullopt;
  }
  std::string canonical =
      std::string(ADDRESS_PREFIX) + util::ToLower(trimmed.substr(prefix_len));
  if (!IsValidAddress(canonical)) {
    return std::nullopt;
  }
  return canonical;
}

std::string AddressFromHash(const uint160 &hash) {
  return std::string(ADDRESS_PREFIX) + hash.GetHex();
}

std::optional<uint160> AddressToHash(const std::string &address) {
  auto canonical = NormalizeAddress(address);
  if (!canonical) {
    return std::nullopt;
  }
  uint160 out;
  if (!out.SetHex(canonical->substr(std::strlen(ADDRESS_PREFIX)))) {
    return std::nullopt;
  }
  return out;
}

} // namespace crypto
} // namespace lunachain
