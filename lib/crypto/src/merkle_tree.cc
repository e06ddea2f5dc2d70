#include "crypto/merkle_tree.hpp"
#include "crypto/error.hpp"
#include <utility>

namespace Nebula::Crypto::MerkleTree {

namespace detail {

    auto hash_pair(HashAlgorithm algorithm, const Digest& left, const Digest& right)
        -> std::expected<Digest, std::error_code>
    {
        const BytesSpan parts[] = { left, right };
        return digest(algorithm, parts);
    }

} // namespace detail

auto compute_root(HashAlgorithm algorithm, std::span<const Digest> leaves)
    -> std::expected<Digest, std::error_code>
{
    if (leaves.empty())
        return Digest {};
    if (leaves.size() == 1)
        return leaves.front();

    std::vector<Digest> layer(leaves.begin(), leaves.end());
    while (layer.size() > 1) {
        if (layer.size() % 2 == 1)
            layer.push_back(layer.back());

        std::vector<Digest> next;
        next.reserve(layer.size() / 2);
        for (size_t i = 0; i < layer.size(); i += 2) {
            auto parent = detail::hash_pair(algorithm, layer[i], layer[i + 1]);
            if (!parent)
                return std::unexpected(parent.error());
            next.push_back(std::move(*parent));
        }
        layer = std::move(next);
    }

    return std::move(layer.front());
}

auto compute_root_hex(HashAlgorithm algorithm, std::span<const std::string> leaf_hashes)
    -> std::expected<std::string, std::error_code>
{
    std::vector<Digest> leaves;
    leaves.reserve(leaf_hashes.size());
    for (const auto& hex : leaf_hashes) {
        auto bytes = Utils::from_hex(hex);
        if (!bytes) {
            return std::unexpected(make_error_code(DigestErrc::InvalidHex));
        }
        leaves.push_back(std::move(*bytes));
    }

    auto root = compute_root(algorithm, leaves);
    if (!root)
        return std::unexpected(root.error());
    return Utils::to_hex(*root);
}

} // namespace Nebula::Crypto::MerkleTree
