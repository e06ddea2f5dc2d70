#pragma once

#include <expected>
#include <span>
#include <string>
#include <system_error>
#include <vector>

#include "crypto/common.hpp"
#include "crypto/hash.hpp"

namespace Nebula::Crypto::MerkleTree {

// Binary Merkle root over already-hashed leaves:
//   - no leaves      -> empty digest (the "" sentinel in hex form)
//   - one leaf       -> the leaf itself
//   - otherwise pair left to right, duplicating the last node of an odd
//     layer, parent = H(left || right), until one node remains.
// Leaves are not re-hashed and there is no domain separation prefix.
[[nodiscard]]
auto compute_root(HashAlgorithm algorithm, std::span<const Digest> leaves)
    -> std::expected<Digest, std::error_code>;

// Same rules on hex encoded leaves; returns the lowercase hex root.
[[nodiscard]]
auto compute_root_hex(HashAlgorithm algorithm, std::span<const std::string> leaf_hashes)
    -> std::expected<std::string, std::error_code>;

namespace detail {
    // H(left || right)
    [[nodiscard]]
    auto hash_pair(HashAlgorithm algorithm, const Digest& left, const Digest& right)
        -> std::expected<Digest, std::error_code>;
}

} // namespace Nebula::Crypto::MerkleTree
