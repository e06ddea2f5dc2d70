#pragma once

#include <cstddef>
#include <optional>
#include <set>
#include <span>
#include <string>
#include <system_error>
#include <vector>

#include "core/common.hpp"
#include "core/concepts.hpp"
#include "core/manifest.hpp"
#include "core/shard_verifier.hpp"

namespace Nebula::Reconstruct {

struct RecoverabilityReport {
    bool feasible = false;
    int k = 0;
    int n = 0;
    std::size_t valid_count = 0;
    std::vector<ShardIndex> missing_indices; // ascending
    std::vector<ShardIndex> unknown_indices; // declared, cancelled before they were fetched
    long redundancy_margin = 0; // valid_count - k, negative when infeasible
    bool fast_path = false; // every data shard 0..k-1 is valid

    [[nodiscard]] std::size_t missing_count() const noexcept { return missing_indices.size(); }
    [[nodiscard]] std::size_t unknown_count() const noexcept { return unknown_indices.size(); }
    [[nodiscard]] bool complete() const noexcept { return unknown_indices.empty(); }

    // "Reconstruction possible" or "Need X more shard(s)". Unknown shards
    // are counted as if they would turn out valid.
    [[nodiscard]] std::string message() const;
};

// Indices outside [0, n) cannot take part in decoding and are not counted.
[[nodiscard]] RecoverabilityReport analyze(const std::set<ShardIndex>& valid, int k, int n);

// As above, from verifier output: Unfetched records are unknown, neither
// valid nor missing.
[[nodiscard]] RecoverabilityReport analyze(std::span<const ShardRecord> records, int k, int n);

struct ShardAvailability {
    ShardIndex index;
    ShardStatus status;
    std::error_code error;
};

struct RecoverabilityAssessment {
    RecoverabilityReport report;
    std::size_t shards_declared = 0;
    std::optional<std::size_t> shards_found; // shards whose bytes were retrieved
    std::vector<ShardAvailability> shard_status;
    bool availability_verified = false;
};

// Assumes every declared shard is present and valid.
[[nodiscard]] RecoverabilityAssessment assess(const Manifest& manifest);

// Fetches and verifies the shards first, then analyzes the valid ones.
[[nodiscard]]
RecoverabilityAssessment assess(const Manifest& manifest, const FetchFn& fetch,
    const VerifyOptions& options = {});

} // namespace Nebula::Reconstruct
