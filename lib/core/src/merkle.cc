#include "core/merkle.hpp"
#include "core/error.hpp"
#include "core/logging.hpp"
#include "crypto/merkle_tree.hpp"

namespace Nebula::Reconstruct {

std::string_view to_string(MerkleStatus status) noexcept
{
    switch (status) {
    case MerkleStatus::NotPresent:
        return "not_present";
    case MerkleStatus::Verified:
        return "verified";
    case MerkleStatus::Failed:
        return "failed";
    }
    return "unknown";
}

namespace Merkle {

    bool verify(const Manifest& manifest)
    {
        return validate(manifest, false).has_value();
    }

    bool check_leaf_binding(const Manifest& manifest)
    {
        const auto& merkle = manifest.merkle();
        if (!merkle)
            return true;

        auto ordered = manifest.shards_by_index();
        if (ordered.size() != merkle->leaf_hashes.size())
            return false;
        for (std::size_t i = 0; i < ordered.size(); ++i) {
            if (merkle->leaf_hashes[i] != ordered[i]->hash) {
                NEBULA_DEBUG("merkle leaf " << i << " does not match shard " << ordered[i]->index);
                return false;
            }
        }
        return true;
    }

    auto validate(const Manifest& manifest, bool bind_leaves)
        -> std::expected<MerkleStatus, std::error_code>
    {
        const auto& merkle = manifest.merkle();
        if (!merkle)
            return MerkleStatus::NotPresent;

        auto root = Crypto::MerkleTree::compute_root(merkle->algorithm, merkle->leaf_hashes);
        if (!root)
            return std::unexpected(root.error());
        if (*root != merkle->root) {
            NEBULA_DEBUG("merkle root mismatch: declared " << Crypto::Utils::to_hex(merkle->root)
                                                           << " computed " << Crypto::Utils::to_hex(*root));
            return std::unexpected(make_error_code(MerkleErrc::RootMismatch));
        }

        if (bind_leaves && !check_leaf_binding(manifest))
            return std::unexpected(make_error_code(MerkleErrc::LeafMismatch));

        return MerkleStatus::Verified;
    }

} // namespace Merkle

} // namespace Nebula::Reconstruct
