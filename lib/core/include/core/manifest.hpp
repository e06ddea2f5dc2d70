#pragma once

#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include "core/common.hpp"

namespace Nebula::Reconstruct {

inline constexpr std::string_view MANIFEST_VERSION = "nebula_reconstruct_v1";

enum class EncryptionAlgorithm : std::uint8_t {
    Aes256Gcm,
};

[[nodiscard]] std::string_view to_string(EncryptionAlgorithm algorithm) noexcept;

// Accepts the manifest spelling ("aes-256-gcm").
[[nodiscard]] std::optional<EncryptionAlgorithm> parse_encryption_algorithm(std::string_view name) noexcept;

struct RsParams {
    int k; // data shards
    int m; // parity shards
    int n; // total shards, k + m
};

struct ShardRef {
    ShardIndex index;
    Digest hash;
    std::optional<std::uint64_t> size_bytes;
    // Opaque to the library; "path" in the document, or "url" when no path is given.
    std::optional<std::string> locator;
};

struct MerkleInfo {
    HashAlgorithm algorithm;
    Digest root;
    std::vector<Digest> leaf_hashes;
};

struct EncryptionInfo {
    EncryptionAlgorithm algorithm;
    std::vector<Byte> iv;
    std::optional<std::vector<Byte>> tag; // absent: tag trails the ciphertext
    std::optional<std::string> key_hint;
};

// Validated, immutable description of an erasure-coded object.
//
// Everything the rest of the library relies on is checked here, so a Manifest
// value always satisfies: 0 < k <= n <= 256, n == k + m, unique shard indices
// in [0, n), at least k declared shards, digests of the declared algorithm's
// length, and one Merkle leaf per shard.
class Manifest {
public:
    [[nodiscard]]
    static auto parse(BytesSpan document) -> std::expected<Manifest, std::error_code>;

    [[nodiscard]]
    static auto parse(std::string_view document) -> std::expected<Manifest, std::error_code>;

    [[nodiscard]] HashAlgorithm hash_algorithm() const noexcept { return hash_algorithm_; }
    [[nodiscard]] std::uint64_t original_size() const noexcept { return original_size_; }
    [[nodiscard]] const std::optional<Digest>& original_hash() const noexcept { return original_hash_; }
    [[nodiscard]] const RsParams& rs() const noexcept { return rs_; }

    // Declaration order.
    [[nodiscard]] const std::vector<ShardRef>& shards() const noexcept { return shards_; }

    // Ascending shard index.
    [[nodiscard]] std::vector<const ShardRef*> shards_by_index() const;

    [[nodiscard]] const std::optional<MerkleInfo>& merkle() const noexcept { return merkle_; }
    [[nodiscard]] const std::optional<EncryptionInfo>& encryption() const noexcept { return encryption_; }

private:
    Manifest() = default;

    HashAlgorithm hash_algorithm_ = HashAlgorithm::Sha256;
    std::uint64_t original_size_ = 0;
    std::optional<Digest> original_hash_;
    RsParams rs_ {};
    std::vector<ShardRef> shards_;
    std::optional<MerkleInfo> merkle_;
    std::optional<EncryptionInfo> encryption_;
};

} // namespace Nebula::Reconstruct
