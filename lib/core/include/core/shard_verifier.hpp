#pragma once

#include <cstdint>
#include <optional>
#include <set>
#include <span>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include "core/common.hpp"
#include "core/concepts.hpp"
#include "core/manifest.hpp"

namespace Nebula::Reconstruct {

enum class ShardStatus : std::uint8_t {
    Unfetched, // never attempted, the attempt was abandoned first
    Valid,
    HashMismatch,
    FetchError,
};

[[nodiscard]] std::string_view to_string(ShardStatus status) noexcept;

struct ShardRecord {
    ShardIndex index;
    Digest declared_hash;
    std::optional<std::string> locator;
    std::optional<std::vector<Byte>> bytes;
    std::optional<Digest> computed_hash;
    ShardStatus status = ShardStatus::Unfetched;
    std::error_code error;

    [[nodiscard]] bool valid() const noexcept { return status == ShardStatus::Valid; }
    [[nodiscard]] bool fetched() const noexcept { return bytes.has_value(); }
};

struct VerifyOptions {
    unsigned max_workers = 0; // 0: hardware concurrency
    // Stop once k valid shards are out of reach. Shards not fetched by then
    // come back Unfetched with ShardErrc::Cancelled.
    bool fail_fast = false;
};

// Fetches and hashes every declared shard on a bounded worker pool.
// Never throws; per-shard failures are recorded, not raised. Records come
// back in manifest declaration order.
//
// With fail_fast, an abort returns without waiting for fetches already in
// flight; they finish on detached workers that hold their own copy of
// `fetch`. Anything `fetch` refers to must outlive those calls.
[[nodiscard]]
std::vector<ShardRecord> verify_shards(const Manifest& manifest, const FetchFn& fetch,
    const VerifyOptions& options = {});

template <ShardSource Source>
[[nodiscard]]
std::vector<ShardRecord> verify_shards(const Manifest& manifest, Source& source,
    const VerifyOptions& options = {})
{
    return verify_shards(manifest, as_fetch_fn(source), options);
}

[[nodiscard]] std::set<ShardIndex> valid_indices(std::span<const ShardRecord> records);

} // namespace Nebula::Reconstruct
