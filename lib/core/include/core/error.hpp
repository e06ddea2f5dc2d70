#pragma once

#include <cstdint>
#include <string>
#include <system_error>

#include "crypto/error.hpp"

namespace Nebula::Reconstruct {

enum class ManifestErrc : std::uint8_t {
    Success = 0,
    MalformedDocument, // not JSON, or not an object
    MissingField,
    InvalidField, // present but of the wrong type or range
    UnsupportedVersion,
    UnsupportedHashAlgorithm,
    UnsupportedMerkleAlgorithm,
    UnsupportedEncryption,
    InvalidParameters, // rs block violates 0 < k <= n, n == k + m, n <= 256
    DuplicateShardIndex,
    ShardIndexOutOfRange,
    TooFewShards, // fewer declared shards than k
    LeafCountMismatch,
    InvalidDigest, // bad hex, or wrong length for the algorithm
};

enum class ShardErrc : std::uint8_t {
    Success = 0,
    FetchFailed,
    HashMismatch,
    Cancelled,
};

enum class MerkleErrc : std::uint8_t {
    Success = 0,
    RootMismatch,
    LeafMismatch,
};

enum class ReconstructErrc : std::uint8_t {
    Success = 0,
    Infeasible,
    FinalHashMismatch,
    ReducedIntegrity,
};

class ManifestErrorCategory : public std::error_category {
public:
    [[nodiscard]] const char* name() const noexcept override { return "nebula.manifest"; }

    std::string message(int ev) const override
    {
        switch (static_cast<ManifestErrc>(ev)) {
        case ManifestErrc::Success:
            return "Success";
        case ManifestErrc::MalformedDocument:
            return "Manifest is not a valid JSON object";
        case ManifestErrc::MissingField:
            return "Missing required field";
        case ManifestErrc::InvalidField:
            return "Field has an invalid type or value";
        case ManifestErrc::UnsupportedVersion:
            return "Unsupported manifest version";
        case ManifestErrc::UnsupportedHashAlgorithm:
            return "Unsupported hash algorithm";
        case ManifestErrc::UnsupportedMerkleAlgorithm:
            return "Unsupported Merkle algorithm";
        case ManifestErrc::UnsupportedEncryption:
            return "Unsupported encryption algorithm";
        case ManifestErrc::InvalidParameters:
            return "Invalid erasure parameters";
        case ManifestErrc::DuplicateShardIndex:
            return "Duplicate shard index";
        case ManifestErrc::ShardIndexOutOfRange:
            return "Shard index out of range";
        case ManifestErrc::TooFewShards:
            return "Not enough shards to reconstruct (less than data_shards)";
        case ManifestErrc::LeafCountMismatch:
            return "Merkle leaf count does not match shard count";
        case ManifestErrc::InvalidDigest:
            return "Invalid digest";
        default:
            return "Unknown manifest error";
        }
    }
};

class ShardErrorCategory : public std::error_category {
public:
    [[nodiscard]] const char* name() const noexcept override { return "nebula.shard"; }

    std::string message(int ev) const override
    {
        switch (static_cast<ShardErrc>(ev)) {
        case ShardErrc::Success:
            return "Success";
        case ShardErrc::FetchFailed:
            return "Shard fetch failed";
        case ShardErrc::HashMismatch:
            return "Shard hash mismatch";
        case ShardErrc::Cancelled:
            return "Shard fetch cancelled";
        default:
            return "Unknown shard error";
        }
    }
};

class MerkleErrorCategory : public std::error_category {
public:
    [[nodiscard]] const char* name() const noexcept override { return "nebula.merkle"; }

    std::string message(int ev) const override
    {
        switch (static_cast<MerkleErrc>(ev)) {
        case MerkleErrc::Success:
            return "Success";
        case MerkleErrc::RootMismatch:
            return "Merkle root mismatch";
        case MerkleErrc::LeafMismatch:
            return "Merkle leaves do not match shard hashes";
        default:
            return "Unknown Merkle error";
        }
    }
};

class ReconstructErrorCategory : public std::error_category {
public:
    [[nodiscard]] const char* name() const noexcept override { return "nebula.reconstruct"; }

    std::string message(int ev) const override
    {
        switch (static_cast<ReconstructErrc>(ev)) {
        case ReconstructErrc::Success:
            return "Success";
        case ReconstructErrc::Infeasible:
            return "Not enough valid shards to reconstruct";
        case ReconstructErrc::FinalHashMismatch:
            return "Reconstructed data does not match original hash";
        case ReconstructErrc::ReducedIntegrity:
            return "Integrity guarantee below required level";
        default:
            return "Unknown reconstruction error";
        }
    }
};

inline const std::error_category& manifest_category()
{
    static ManifestErrorCategory instance;
    return instance;
}

inline const std::error_category& shard_category()
{
    static ShardErrorCategory instance;
    return instance;
}

inline const std::error_category& merkle_category()
{
    static MerkleErrorCategory instance;
    return instance;
}

inline const std::error_category& reconstruct_category()
{
    static ReconstructErrorCategory instance;
    return instance;
}

inline std::error_code make_error_code(ManifestErrc e)
{
    return { static_cast<int>(e), manifest_category() };
}

inline std::error_code make_error_code(ShardErrc e)
{
    return { static_cast<int>(e), shard_category() };
}

inline std::error_code make_error_code(MerkleErrc e)
{
    return { static_cast<int>(e), merkle_category() };
}

inline std::error_code make_error_code(ReconstructErrc e)
{
    return { static_cast<int>(e), reconstruct_category() };
}
} // namespace Nebula::Reconstruct

namespace std {
template <>
struct is_error_code_enum<Nebula::Reconstruct::ManifestErrc> : true_type { };
template <>
struct is_error_code_enum<Nebula::Reconstruct::ShardErrc> : true_type { };
template <>
struct is_error_code_enum<Nebula::Reconstruct::MerkleErrc> : true_type { };
template <>
struct is_error_code_enum<Nebula::Reconstruct::ReconstructErrc> : true_type { };
} // namespace std
