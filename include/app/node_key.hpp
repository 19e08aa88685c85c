// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "crypto/keys.hpp"

#include <filesystem>
#include <memory>

namespace quorumwire {
namespace app {

// Load the node's long-term key from a hex-encoded file. If the file does not
// exist a fresh key is generated and written with mode 0600.
// Returns nullptr (logged) if the file is malformed or cannot be written.
std::shared_ptr<const crypto::PrivateKey> LoadOrCreateNodeKey(const std::filesystem::path& path);

bool SaveNodeKey(const std::filesystem::path& path, const crypto::PrivateKey& key);

}  // namespace app
}  // namespace quorumwire
