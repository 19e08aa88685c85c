// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "crypto/keys.hpp"

#include <cstdint>
#include <optional>
#include <span>
#include <vector>

namespace quorumwire {
namespace crypto {

// AES block / CFB initialization vector size
constexpr size_t IV_SIZE = 16;

// Fill out with bytes from the OpenSSL CSPRNG. Returns false if the RNG failed.
[[nodiscard]] bool GetRandomBytes(std::span<uint8_t> out);

// AES-256 in 128-bit CFB mode keyed by an ECDH shared secret. CFB is a stream
// mode, output size equals input size. Returns nullopt on an OpenSSL failure or
// a wrong IV size.
[[nodiscard]] std::optional<std::vector<uint8_t>> EncryptCfb(const SharedSecret& key, std::span<const uint8_t> iv,
                                                             std::span<const uint8_t> plaintext);
[[nodiscard]] std::optional<std::vector<uint8_t>> DecryptCfb(const SharedSecret& key, std::span<const uint8_t> iv,
                                                             std::span<const uint8_t> ciphertext);

// Length-checked constant-time comparison
[[nodiscard]] bool ConstantTimeEqual(std::span<const uint8_t> a, std::span<const uint8_t> b);

// Overwrite and release a buffer holding secret material
void SecureWipe(std::vector<uint8_t>& buffer);

}  // namespace crypto
}  // namespace quorumwire
