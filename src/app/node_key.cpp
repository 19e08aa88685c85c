// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "app/node_key.hpp"

#include "util/files.hpp"
#include "util/logging.hpp"
#include "util/string_parsing.hpp"

#include <system_error>

#include <openssl/crypto.h>

namespace quorumwire {
namespace app {

bool SaveNodeKey(const std::filesystem::path& path, const crypto::PrivateKey& key) {
  std::string hex = util::HexStr(key.bytes()) + "\n";
  bool ok = util::atomic_write_file(path, hex, 0600);
  OPENSSL_cleanse(hex.data(), hex.size());
  return ok;
}

std::shared_ptr<const crypto::PrivateKey> LoadOrCreateNodeKey(const std::filesystem::path& path) {
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    auto key = crypto::PrivateKey::Generate();
    if (!key) {
      LOG_APP_ERROR("failed to generate node key");
      return nullptr;
    }
    if (!SaveNodeKey(path, *key)) {
      LOG_APP_ERROR("failed to write node key to {}", path.string());
      return nullptr;
    }
    LOG_APP_INFO("generated new node key {} in {}", key->public_key().ToHex(), path.string());
    return std::make_shared<const crypto::PrivateKey>(*key);
  }

  std::string text = util::read_file_string(path);
  auto bytes = util::ParseHex(text);
  OPENSSL_cleanse(text.data(), text.size());
  if (!bytes || bytes->size() != crypto::PRIVATE_KEY_SIZE) {
    LOG_APP_ERROR("{} does not hold a {}-byte hex key", path.string(), crypto::PRIVATE_KEY_SIZE);
    return nullptr;
  }

  auto key = crypto::PrivateKey::FromBytes(*bytes);
  OPENSSL_cleanse(bytes->data(), bytes->size());
  if (!key) {
    LOG_APP_ERROR("{} holds an invalid secp256k1 scalar", path.string());
    return nullptr;
  }

  LOG_APP_INFO("loaded node key {}", key->public_key().ToHex());
  return std::make_shared<const crypto::PrivateKey>(*key);
}

}  // namespace app
}  // namespace quorumwire
