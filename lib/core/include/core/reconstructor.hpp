#pragma once

#include <expected>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

#include "core/common.hpp"
#include "core/concepts.hpp"
#include "core/manifest.hpp"
#include "core/options.hpp"
#include "core/report.hpp"
#include "core/shard_verifier.hpp"

namespace Nebula::Reconstruct {

struct Reconstruction {
    ReconstructionReport report;
    std::vector<Byte> data; // empty unless report.success
};

// One reconstruction attempt:
//   verify shards -> Merkle -> recoverability -> decode -> decrypt -> final hash -> policy
// Each failing stage stops the attempt and is recorded in report.error; the
// shard details gathered up to that point are kept.
//
// The key is borrowed for the duration of run() and never copied.
class Reconstructor {
public:
    Reconstructor(const Manifest& manifest, FetchFn fetch,
        std::optional<BytesSpan> key = std::nullopt, ReconstructOptions options = {})
        : manifest_(manifest)
        , fetch_(std::move(fetch))
        , key_(key)
        , options_(options)
    {
    }

    Reconstructor(const Reconstructor&) = delete;
    Reconstructor& operator=(const Reconstructor&) = delete;

    [[nodiscard]] Reconstruction run();

private:
    const Manifest& manifest_;
    FetchFn fetch_;
    std::optional<BytesSpan> key_;
    ReconstructOptions options_;

    [[nodiscard]] std::vector<ShardRecord> fetch_shards(ReconstructionReport& report) const;

    [[nodiscard]]
    auto check_merkle(ReconstructionReport& report) const -> std::expected<void, ReportError>;

    [[nodiscard]]
    auto check_recoverability(ReconstructionReport& report, const std::vector<ShardRecord>& records) const
        -> std::expected<void, ReportError>;

    [[nodiscard]]
    auto decode(ReconstructionReport& report, std::vector<ShardRecord>& records) const
        -> std::expected<std::vector<Byte>, ReportError>;

    [[nodiscard]]
    auto decrypt(std::vector<Byte>&& data) const -> std::expected<std::vector<Byte>, ReportError>;

    [[nodiscard]]
    auto check_final_hash(ReconstructionReport& report, BytesSpan data) const -> std::expected<void, ReportError>;

    [[nodiscard]]
    auto apply_policy(ReconstructionReport& report) const -> std::expected<void, ReportError>;
};

[[nodiscard]]
Reconstruction reconstruct(const Manifest& manifest, const FetchFn& fetch,
    std::optional<BytesSpan> key = std::nullopt, const ReconstructOptions& options = {});

template <ShardSource Source>
[[nodiscard]]
Reconstruction reconstruct(const Manifest& manifest, Source& source,
    std::optional<BytesSpan> key = std::nullopt, const ReconstructOptions& options = {})
{
    return reconstruct(manifest, as_fetch_fn(source), key, options);
}

// Parses the manifest document first; a parse failure is reported at Stage::Manifest.
[[nodiscard]]
Reconstruction reconstruct(BytesSpan manifest_document, const FetchFn& fetch,
    std::optional<BytesSpan> key = std::nullopt, const ReconstructOptions& options = {});

} // namespace Nebula::Reconstruct
