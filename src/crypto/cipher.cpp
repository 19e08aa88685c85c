// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "crypto/cipher.hpp"

#include "util/logging.hpp"

#include <limits>
#include <memory>

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/rand.h>

namespace quorumwire {
namespace crypto {

namespace {

struct CipherCtxDeleter {
  void operator()(EVP_CIPHER_CTX* ctx) const { EVP_CIPHER_CTX_free(ctx); }
};
using CipherCtxPtr = std::unique_ptr<EVP_CIPHER_CTX, CipherCtxDeleter>;

std::optional<std::vector<uint8_t>> RunCfb(bool encrypt, const SharedSecret& key, std::span<const uint8_t> iv,
                                           std::span<const uint8_t> in) {
  if (iv.size() != IV_SIZE || in.size() > static_cast<size_t>(std::numeric_limits<int>::max())) {
    return std::nullopt;
  }

  CipherCtxPtr ctx(EVP_CIPHER_CTX_new());
  if (!ctx) {
    LOG_CRYPTO_ERROR("EVP_CIPHER_CTX_new failed");
    return std::nullopt;
  }

  if (EVP_CipherInit_ex(ctx.get(), EVP_aes_256_cfb128(), nullptr, key.data(), iv.data(), encrypt ? 1 : 0) != 1) {
    LOG_CRYPTO_ERROR("AES-256-CFB init failed");
    return std::nullopt;
  }

  std::vector<uint8_t> out(in.size());
  int out_len = 0;
  if (!in.empty() &&
      EVP_CipherUpdate(ctx.get(), out.data(), &out_len, in.data(), static_cast<int>(in.size())) != 1) {
    LOG_CRYPTO_ERROR("AES-256-CFB update failed");
    return std::nullopt;
  }

  // Stream mode: nothing buffered, final emits zero bytes
  int final_len = 0;
  if (EVP_CipherFinal_ex(ctx.get(), out.data() + out_len, &final_len) != 1 ||
      static_cast<size_t>(out_len + final_len) != in.size()) {
    LOG_CRYPTO_ERROR("AES-256-CFB finalization failed");
    return std::nullopt;
  }
  return out;
}

}  // namespace

bool GetRandomBytes(std::span<uint8_t> out) {
  if (out.empty()) {
    return true;
  }
  if (RAND_bytes(out.data(), static_cast<int>(out.size())) != 1) {
    LOG_CRYPTO_ERROR("RAND_bytes failed for {} bytes", out.size());
    return false;
  }
  return true;
}

std::optional<std::vector<uint8_t>> EncryptCfb(const SharedSecret& key, std::span<const uint8_t> iv,
                                               std::span<const uint8_t> plaintext) {
  return RunCfb(true, key, iv, plaintext);
}

std::optional<std::vector<uint8_t>> DecryptCfb(const SharedSecret& key, std::span<const uint8_t> iv,
                                               std::span<const uint8_t> ciphertext) {
  return RunCfb(false, key, iv, ciphertext);
}

bool ConstantTimeEqual(std::span<const uint8_t> a, std::span<const uint8_t> b) {
  if (a.size() != b.size()) {
    return false;
  }
  if (a.empty()) {
    return true;
  }
  return CRYPTO_memcmp(a.data(), b.data(), a.size()) == 0;
}

void SecureWipe(std::vector<uint8_t>& buffer) {
  if (!buffer.empty()) {
    OPENSSL_cleanse(buffer.data(), buffer.size());
  }
  buffer.clear();
  buffer.shrink_to_fit();
}

}  // namespace crypto
}  // namespace quorumwire
