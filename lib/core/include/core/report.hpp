#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include "core/common.hpp"
#include "core/merkle.hpp"
#include "core/recoverability.hpp"
#include "core/shard_verifier.hpp"

namespace Nebula::Reconstruct {

enum class Stage : std::uint8_t {
    Manifest,
    Fetch,
    Merkle,
    Recoverability,
    Decode,
    Decrypt,
    FinalHash,
    Policy,
};

[[nodiscard]] std::string_view to_string(Stage stage) noexcept;

enum class IntegrityLevel : std::uint8_t {
    Full, // Merkle commitment and final hash both verified
    Reduced,
};

[[nodiscard]] std::string_view to_string(IntegrityLevel level) noexcept;

struct ReportError {
    Stage stage;
    std::error_code code;
    std::string detail;
};

struct ShardDetail {
    ShardIndex index;
    std::optional<std::string> locator;
    ShardStatus status;
    std::error_code error;
    std::optional<std::size_t> size;
};

struct ReconstructionReport {
    bool success = false;
    bool feasible = false;
    std::uint64_t original_size = 0;
    std::uint64_t reconstructed_size = 0; // decoded, before decryption
    std::uint64_t output_size = 0; // bytes handed to the caller
    std::optional<Digest> original_hash;
    std::optional<Digest> reconstructed_hash;
    bool hash_verified = false;
    bool decrypted = false;
    MerkleStatus merkle = MerkleStatus::NotPresent;
    IntegrityLevel integrity = IntegrityLevel::Reduced;
    int shards_required = 0;
    std::size_t shards_available = 0; // bytes retrieved, valid or not
    std::size_t shards_valid = 0;
    bool fast_path = false;
    std::size_t rs_errors_corrected = 0; // missing data shards rebuilt from parity
    bool fetch_cancelled = false; // fail-fast abort left shards unfetched
    std::vector<ShardDetail> shard_details;
    std::optional<RecoverabilityReport> recoverability;
    std::optional<ReportError> error;

    // Stable JSON object for audit logs; digests in lowercase hex.
    void dump(std::ostream& os) const;

    [[nodiscard]] std::string to_json() const;
};

inline std::ostream& operator<<(std::ostream& os, const ReconstructionReport& report)
{
    report.dump(os);
    return os;
}

void dump(std::ostream& os, const RecoverabilityReport& report);

[[nodiscard]] std::string to_json(const ReconstructionReport& report);
[[nodiscard]] std::string to_json(const RecoverabilityAssessment& assessment);

} // namespace Nebula::Reconstruct
