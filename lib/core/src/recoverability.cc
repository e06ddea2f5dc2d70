#include "core/recoverability.hpp"
#include "core/logging.hpp"

#include <algorithm>

namespace Nebula::Reconstruct {

std::string RecoverabilityReport::message() const
{
    if (feasible)
        return "Reconstruction possible";
    const long reachable = static_cast<long>(valid_count + unknown_count());
    return "Need " + std::to_string(std::max(1L, k - reachable)) + " more shard(s)";
}

namespace {

    RecoverabilityReport analyze(const std::set<ShardIndex>& valid, const std::set<ShardIndex>& unknown,
        int k, int n)
    {
        RecoverabilityReport report;
        report.k = k;
        report.n = n;

        for (ShardIndex i = 0; i < n; ++i) {
            if (valid.contains(i))
                ++report.valid_count;
            else if (unknown.contains(i))
                report.unknown_indices.push_back(i);
            else
                report.missing_indices.push_back(i);
        }

        report.redundancy_margin = static_cast<long>(report.valid_count) - k;
        report.feasible = report.redundancy_margin >= 0;
        report.fast_path = k > 0 && k <= n;
        for (ShardIndex i = 0; i < k && report.fast_path; ++i)
            report.fast_path = valid.contains(i);
        return report;
    }

} // namespace

RecoverabilityReport analyze(const std::set<ShardIndex>& valid, int k, int n)
{
    return analyze(valid, {}, k, n);
}

RecoverabilityReport analyze(std::span<const ShardRecord> records, int k, int n)
{
    std::set<ShardIndex> unknown;
    for (const auto& r : records) {
        if (r.status == ShardStatus::Unfetched)
            unknown.insert(r.index);
    }
    return analyze(valid_indices(records), unknown, k, n);
}

RecoverabilityAssessment assess(const Manifest& manifest)
{
    std::set<ShardIndex> declared;
    for (const auto& s : manifest.shards())
        declared.insert(s.index);

    RecoverabilityAssessment out;
    out.report = analyze(declared, manifest.rs().k, manifest.rs().n);
    out.shards_declared = manifest.shards().size();
    return out;
}

RecoverabilityAssessment assess(const Manifest& manifest, const FetchFn& fetch,
    const VerifyOptions& options)
{
    auto records = verify_shards(manifest, fetch, options);

    RecoverabilityAssessment out;
    out.report = analyze(records, manifest.rs().k, manifest.rs().n);
    out.shards_declared = manifest.shards().size();
    out.shards_found = static_cast<std::size_t>(std::ranges::count_if(records, &ShardRecord::fetched));
    out.availability_verified = true;
    out.shard_status.reserve(records.size());
    for (const auto& r : records)
        out.shard_status.push_back({ .index = r.index, .status = r.status, .error = r.error });

    NEBULA_DEBUG("recoverability: " << out.report.valid_count << "/" << out.report.n << " valid, "
                                    << out.report.message());
    return out;
}

} // namespace Nebula::Reconstruct
