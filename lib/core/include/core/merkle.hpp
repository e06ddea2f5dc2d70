#pragma once

#include <cstdint>
#include <expected>
#include <string_view>
#include <system_error>

#include "core/manifest.hpp"

namespace Nebula::Reconstruct {

enum class MerkleStatus : std::uint8_t {
    NotPresent,
    Verified,
    Failed,
};

[[nodiscard]] std::string_view to_string(MerkleStatus status) noexcept;

namespace Merkle {

    // Recomputes the root from merkle.leaf_hashes. A manifest without a
    // Merkle block verifies trivially; callers that care use validate().
    [[nodiscard]] bool verify(const Manifest& manifest);

    // Leaf i must equal the declared hash of the shard with the i-th smallest
    // index, tying the commitment to the shard set. True without a Merkle block.
    [[nodiscard]] bool check_leaf_binding(const Manifest& manifest);

    // NotPresent or Verified; MerkleErrc::RootMismatch / LeafMismatch otherwise.
    [[nodiscard]]
    auto validate(const Manifest& manifest, bool bind_leaves = true)
        -> std::expected<MerkleStatus, std::error_code>;

} // namespace Merkle

} // namespace Nebula::Reconstruct
