// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <span>
#include <string>

namespace quorumwire {
namespace crypto {

// secp256k1 sizes
constexpr size_t COORDINATE_SIZE = 32;
constexpr size_t PRIVATE_KEY_SIZE = 32;
constexpr size_t SHARED_SECRET_SIZE = 32;

using SharedSecret = std::array<uint8_t, SHARED_SECRET_SIZE>;

// Affine secp256k1 point, coordinates big-endian and left-padded to 32 bytes.
// A PublicKey obtained from FromCoordinates() or PrivateKey is always on the curve.
struct PublicKey {
  std::array<uint8_t, COORDINATE_SIZE> x{};
  std::array<uint8_t, COORDINATE_SIZE> y{};

  // Build from big-endian integers of at most 32 bytes each (leading zeros may be
  // stripped, as a bignum encoder would). Returns nullopt if the point is not on
  // the curve.
  [[nodiscard]] static std::optional<PublicKey> FromCoordinates(std::span<const uint8_t> x,
                                                                std::span<const uint8_t> y);

  // "x||y" hex, used in logs and diagnostics
  [[nodiscard]] std::string ToHex() const;

  bool operator==(const PublicKey& other) const = default;
};

// Long-term or ephemeral secp256k1 private key. The scalar is wiped on destruction.
class PrivateKey {
public:
  // Fresh random key from the OpenSSL CSPRNG
  [[nodiscard]] static std::optional<PrivateKey> Generate();

  // Import a 32-byte big-endian scalar; rejects 0 and values >= the group order.
  [[nodiscard]] static std::optional<PrivateKey> FromBytes(std::span<const uint8_t> scalar);

  PrivateKey(const PrivateKey& other) = default;
  PrivateKey& operator=(const PrivateKey& other) = default;
  ~PrivateKey();

  const PublicKey& public_key() const { return public_key_; }
  const std::array<uint8_t, PRIVATE_KEY_SIZE>& bytes() const { return scalar_; }

  // Elliptic-curve Diffie-Hellman: X coordinate of (this scalar * peer point).
  [[nodiscard]] std::optional<SharedSecret> ComputeSharedSecret(const PublicKey& peer) const;

private:
  PrivateKey() = default;

  std::array<uint8_t, PRIVATE_KEY_SIZE> scalar_{};
  PublicKey public_key_;
};

}  // namespace crypto
}  // namespace quorumwire
