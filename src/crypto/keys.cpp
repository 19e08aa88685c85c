// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "crypto/keys.hpp"

#include "util/logging.hpp"
#include "util/string_parsing.hpp"

#include <algorithm>
#include <memory>

#include <openssl/bn.h>
#include <openssl/crypto.h>
#include <openssl/ec.h>
#include <openssl/obj_mac.h>

namespace quorumwire {
namespace crypto {

namespace {

struct GroupDeleter {
  void operator()(EC_GROUP* group) const { EC_GROUP_free(group); }
};
struct PointDeleter {
  void operator()(EC_POINT* point) const { EC_POINT_clear_free(point); }
};
struct BignumDeleter {
  void operator()(BIGNUM* bn) const { BN_clear_free(bn); }
};
struct BnCtxDeleter {
  void operator()(BN_CTX* ctx) const { BN_CTX_free(ctx); }
};

using GroupPtr = std::unique_ptr<EC_GROUP, GroupDeleter>;
using PointPtr = std::unique_ptr<EC_POINT, PointDeleter>;
using BignumPtr = std::unique_ptr<BIGNUM, BignumDeleter>;
using BnCtxPtr = std::unique_ptr<BN_CTX, BnCtxDeleter>;

GroupPtr NewCurve() {
  return GroupPtr(EC_GROUP_new_by_curve_name(NID_secp256k1));
}

BignumPtr BignumFromBytes(std::span<const uint8_t> bytes) {
  return BignumPtr(BN_bin2bn(bytes.data(), static_cast<int>(bytes.size()), nullptr));
}

// Big-endian, left-padded to 32 bytes
bool BignumToArray(const BIGNUM* bn, std::array<uint8_t, COORDINATE_SIZE>& out) {
  return BN_bn2binpad(bn, out.data(), static_cast<int>(out.size())) == static_cast<int>(out.size());
}

bool PointToPublicKey(const EC_GROUP* group, const EC_POINT* point, BN_CTX* ctx, PublicKey& out) {
  BignumPtr x(BN_new());
  BignumPtr y(BN_new());
  if (!x || !y) {
    return false;
  }
  if (EC_POINT_get_affine_coordinates(group, point, x.get(), y.get(), ctx) != 1) {
    return false;
  }
  return BignumToArray(x.get(), out.x) && BignumToArray(y.get(), out.y);
}

// Returns nullptr if the coordinates do not describe a finite point on the curve
PointPtr PointFromPublicKey(const EC_GROUP* group, const PublicKey& key, BN_CTX* ctx) {
  BignumPtr x = BignumFromBytes(key.x);
  BignumPtr y = BignumFromBytes(key.y);
  PointPtr point(EC_POINT_new(group));
  if (!x || !y || !point) {
    return nullptr;
  }
  if (EC_POINT_set_affine_coordinates(group, point.get(), x.get(), y.get(), ctx) != 1) {
    return nullptr;
  }
  if (EC_POINT_is_on_curve(group, point.get(), ctx) != 1 || EC_POINT_is_at_infinity(group, point.get())) {
    return nullptr;
  }
  return point;
}

}  // namespace

std::optional<PublicKey> PublicKey::FromCoordinates(std::span<const uint8_t> x, std::span<const uint8_t> y) {
  if (x.empty() || y.empty() || x.size() > COORDINATE_SIZE || y.size() > COORDINATE_SIZE) {
    return std::nullopt;
  }

  PublicKey key;
  std::copy(x.begin(), x.end(), key.x.begin() + (COORDINATE_SIZE - x.size()));
  std::copy(y.begin(), y.end(), key.y.begin() + (COORDINATE_SIZE - y.size()));

  GroupPtr group = NewCurve();
  BnCtxPtr ctx(BN_CTX_new());
  if (!group || !ctx) {
    LOG_CRYPTO_ERROR("failed to allocate secp256k1 context");
    return std::nullopt;
  }
  if (!PointFromPublicKey(group.get(), key, ctx.get())) {
    return std::nullopt;
  }
  return key;
}

std::string PublicKey::ToHex() const {
  return util::HexStr(x) + util::HexStr(y);
}

std::optional<PrivateKey> PrivateKey::Generate() {
  GroupPtr group = NewCurve();
  BignumPtr scalar(BN_secure_new());
  if (!group || !scalar) {
    LOG_CRYPTO_ERROR("failed to allocate secp256k1 key");
    return std::nullopt;
  }

  const BIGNUM* order = EC_GROUP_get0_order(group.get());
  do {
    if (BN_priv_rand_range(scalar.get(), order) != 1) {
      LOG_CRYPTO_ERROR("random scalar generation failed");
      return std::nullopt;
    }
  } while (BN_is_zero(scalar.get()));

  std::array<uint8_t, PRIVATE_KEY_SIZE> bytes{};
  if (!BignumToArray(scalar.get(), bytes)) {
    return std::nullopt;
  }
  auto key = FromBytes(bytes);
  OPENSSL_cleanse(bytes.data(), bytes.size());
  return key;
}

std::optional<PrivateKey> PrivateKey::FromBytes(std::span<const uint8_t> scalar_bytes) {
  if (scalar_bytes.size() != PRIVATE_KEY_SIZE) {
    return std::nullopt;
  }

  GroupPtr group = NewCurve();
  BnCtxPtr ctx(BN_CTX_new());
  BignumPtr scalar = BignumFromBytes(scalar_bytes);
  if (!group || !ctx || !scalar) {
    LOG_CRYPTO_ERROR("failed to allocate secp256k1 key");
    return std::nullopt;
  }

  if (BN_is_zero(scalar.get()) || BN_cmp(scalar.get(), EC_GROUP_get0_order(group.get())) >= 0) {
    return std::nullopt;
  }

  PointPtr point(EC_POINT_new(group.get()));
  if (!point || EC_POINT_mul(group.get(), point.get(), scalar.get(), nullptr, nullptr, ctx.get()) != 1) {
    LOG_CRYPTO_ERROR("public key derivation failed");
    return std::nullopt;
  }

  PrivateKey key;
  std::copy(scalar_bytes.begin(), scalar_bytes.end(), key.scalar_.begin());
  if (!PointToPublicKey(group.get(), point.get(), ctx.get(), key.public_key_)) {
    return std::nullopt;
  }
  return key;
}

PrivateKey::~PrivateKey() {
  OPENSSL_cleanse(scalar_.data(), scalar_.size());
}

std::optional<SharedSecret> PrivateKey::ComputeSharedSecret(const PublicKey& peer) const {
  GroupPtr group = NewCurve();
  BnCtxPtr ctx(BN_CTX_new());
  BignumPtr scalar = BignumFromBytes(scalar_);
  if (!group || !ctx || !scalar) {
    LOG_CRYPTO_ERROR("failed to allocate ECDH context");
    return std::nullopt;
  }

  PointPtr peer_point = PointFromPublicKey(group.get(), peer, ctx.get());
  if (!peer_point) {
    return std::nullopt;
  }

  PointPtr product(EC_POINT_new(group.get()));
  if (!product || EC_POINT_mul(group.get(), product.get(), nullptr, peer_point.get(), scalar.get(), ctx.get()) != 1) {
    LOG_CRYPTO_ERROR("ECDH scalar multiplication failed");
    return std::nullopt;
  }
  if (EC_POINT_is_at_infinity(group.get(), product.get())) {
    return std::nullopt;
  }

  BignumPtr x(BN_new());
  if (!x || EC_POINT_get_affine_coordinates(group.get(), product.get(), x.get(), nullptr, ctx.get()) != 1) {
    return std::nullopt;
  }

  SharedSecret secret{};
  if (!BignumToArray(x.get(), secret)) {
    return std::nullopt;
  }
  return secret;
}

}  // namespace crypto
}  // namespace quorumwire
