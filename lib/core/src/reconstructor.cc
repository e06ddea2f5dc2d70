#include "core/reconstructor.hpp"
#include "core/error.hpp"
#include "core/logging.hpp"
#include "core/merkle.hpp"
#include "core/recoverability.hpp"
#include "crypto/aes.hpp"
#include "crypto/erasure_code.hpp"

#include <algorithm>

namespace Nebula::Reconstruct {

std::string_view to_string(IntegrityPolicy policy) noexcept
{
    switch (policy) {
    case IntegrityPolicy::AllowReduced:
        return "allow_reduced";
    case IntegrityPolicy::RequireFull:
        return "require_full";
    }
    return "unknown";
}

std::vector<ShardRecord> Reconstructor::fetch_shards(ReconstructionReport& report) const
{
    NEBULA_DEBUG("stage fetch: " << manifest_.shards().size() << " shards declared");
    auto records = verify_shards(manifest_, fetch_, options_.verify_options());

    report.shard_details.reserve(records.size());
    for (const auto& r : records) {
        report.shard_details.push_back(ShardDetail {
            .index = r.index,
            .locator = r.locator,
            .status = r.status,
            .error = r.error,
            .size = r.bytes ? std::optional<std::size_t>(r.bytes->size()) : std::nullopt,
        });
    }
    report.shards_available = static_cast<std::size_t>(std::ranges::count_if(records, &ShardRecord::fetched));
    report.shards_valid = static_cast<std::size_t>(std::ranges::count_if(records, &ShardRecord::valid));
    return records;
}

auto Reconstructor::check_merkle(ReconstructionReport& report) const -> std::expected<void, ReportError>
{
    NEBULA_DEBUG("stage merkle");
    auto status = Merkle::validate(manifest_, options_.bind_merkle_leaves);
    if (!status) {
        report.merkle = MerkleStatus::Failed;
        return std::unexpected(ReportError { Stage::Merkle, status.error(), "Merkle commitment does not verify" });
    }
    report.merkle = *status;
    if (report.merkle == MerkleStatus::NotPresent)
        NEBULA_WARN("manifest carries no Merkle commitment");
    return {};
}

auto Reconstructor::check_recoverability(ReconstructionReport& report,
    const std::vector<ShardRecord>& records) const -> std::expected<void, ReportError>
{
    NEBULA_DEBUG("stage recoverability");
    auto analysis = analyze(records, manifest_.rs().k, manifest_.rs().n);
    report.fetch_cancelled = !analysis.complete();
    report.feasible = analysis.feasible;
    report.fast_path = analysis.fast_path;
    report.recoverability = analysis;

    if (!analysis.feasible) {
        return std::unexpected(ReportError {
            Stage::Recoverability,
            make_error_code(ReconstructErrc::Infeasible),
            "Need " + std::to_string(manifest_.rs().k) + " valid shards, only "
                + std::to_string(analysis.valid_count) + " available: " + analysis.message(),
        });
    }
    if (!analysis.complete())
        NEBULA_INFO(analysis.unknown_count() << " shards were not fetched before the abort");
    if (analysis.missing_count() > 0) {
        NEBULA_WARN("degraded redundancy: " << analysis.missing_count() << " of " << analysis.n
                                            << " shards missing or invalid, margin " << analysis.redundancy_margin);
    }
    return {};
}

auto Reconstructor::decode(ReconstructionReport& report, std::vector<ShardRecord>& records) const
    -> std::expected<std::vector<Byte>, ReportError>
{
    NEBULA_DEBUG("stage decode");
    auto ctx = Crypto::ErasureCode::Context::create(manifest_.rs().k, manifest_.rs().n);
    if (!ctx)
        return std::unexpected(ReportError { Stage::Decode, ctx.error(), "invalid erasure parameters" });

    // Records are private to this attempt, so the valid buffers are moved out.
    std::map<int, std::vector<Byte>> shards;
    for (auto& r : records) {
        if (r.valid())
            shards.emplace(r.index, std::move(*r.bytes));
    }

    Crypto::ErasureCode::Decoder decoder(*ctx);
    if (auto ok = decoder.select(shards); !ok)
        return std::unexpected(ReportError { Stage::Decode, ok.error(), "shard selection failed" });

    // Each parity shard in the selection stands in for one missing data shard.
    report.rs_errors_corrected = static_cast<std::size_t>(
        std::ranges::count_if(decoder.selected(), [k = ctx->K()](int index) { return index >= k; }));

    if (auto ok = decoder.invert(); !ok)
        return std::unexpected(ReportError { Stage::Decode, ok.error(), "decode matrix inversion failed" });
    auto data = decoder.recover(manifest_.original_size());
    if (!data)
        return std::unexpected(ReportError { Stage::Decode, data.error(), "erasure decoding failed" });
    if (report.rs_errors_corrected > 0)
        NEBULA_DEBUG("recovered " << report.rs_errors_corrected << " data shards from parity");
    return std::move(*data);
}

auto Reconstructor::decrypt(std::vector<Byte>&& data) const -> std::expected<std::vector<Byte>, ReportError>
{
    const auto& enc = manifest_.encryption();
    if (!enc)
        return std::move(data);

    NEBULA_DEBUG("stage decrypt: " << to_string(enc->algorithm));
    if (!key_) {
        std::string detail = "decryption key required";
        if (enc->key_hint)
            detail += " (hint: " + *enc->key_hint + ")";
        return std::unexpected(ReportError { Stage::Decrypt, make_error_code(Crypto::DecryptionErrc::KeyRequired), detail });
    }

    std::optional<BytesSpan> tag;
    if (enc->tag)
        tag = BytesSpan(*enc->tag);

    Crypto::Aes::Context ctx;
    auto plaintext = Crypto::Aes::decrypt(ctx, *key_, enc->iv, data, tag);
    if (!plaintext)
        return std::unexpected(ReportError { Stage::Decrypt, plaintext.error(), "decryption failed" });
    return std::move(*plaintext);
}

auto Reconstructor::check_final_hash(ReconstructionReport& report, BytesSpan data) const
    -> std::expected<void, ReportError>
{
    NEBULA_DEBUG("stage final hash");
    auto computed = Crypto::digest(manifest_.hash_algorithm(), data);
    if (!computed)
        return std::unexpected(ReportError { Stage::FinalHash, computed.error(), "could not hash output" });
    report.reconstructed_hash = std::move(*computed);

    if (!options_.verify_final_hash || !manifest_.original_hash())
        return {};

    report.hash_verified = *report.reconstructed_hash == *manifest_.original_hash();
    if (!report.hash_verified) {
        return std::unexpected(ReportError {
            Stage::FinalHash,
            make_error_code(ReconstructErrc::FinalHashMismatch),
            "expected " + Crypto::Utils::to_hex(*manifest_.original_hash()) + ", got "
                + Crypto::Utils::to_hex(*report.reconstructed_hash),
        });
    }
    return {};
}

auto Reconstructor::apply_policy(ReconstructionReport& report) const -> std::expected<void, ReportError>
{
    report.integrity = report.merkle == MerkleStatus::Verified && report.hash_verified
        ? IntegrityLevel::Full
        : IntegrityLevel::Reduced;
    if (report.integrity == IntegrityLevel::Full)
        return {};

    std::string detail = std::string("merkle ") + std::string(to_string(report.merkle))
        + ", final hash " + (report.hash_verified ? "verified" : "not verified");
    if (options_.integrity_policy == IntegrityPolicy::RequireFull)
        return std::unexpected(ReportError { Stage::Policy, make_error_code(ReconstructErrc::ReducedIntegrity), detail });

    NEBULA_WARN("reduced integrity: " << detail);
    return {};
}

Reconstruction Reconstructor::run()
{
    Reconstruction out;
    auto& report = out.report;
    report.original_size = manifest_.original_size();
    report.original_hash = manifest_.original_hash();
    report.shards_required = manifest_.rs().k;

    NEBULA_INFO("reconstruction started: k=" << manifest_.rs().k << " n=" << manifest_.rs().n
                                             << " size=" << manifest_.original_size());

    auto fail = [&](ReportError&& e) -> Reconstruction {
        NEBULA_ERROR("reconstruction failed at " << to_string(e.stage) << ": " << e.code.message()
                                                 << (e.detail.empty() ? "" : " - ") << e.detail);
        report.success = false;
        report.error = std::move(e);
        out.data.clear();
        return std::move(out);
    };

    auto records = fetch_shards(report);

    if (auto ok = check_merkle(report); !ok)
        return fail(std::move(ok.error()));

    if (auto ok = check_recoverability(report, records); !ok)
        return fail(std::move(ok.error()));

    auto decoded = decode(report, records);
    if (!decoded)
        return fail(std::move(decoded.error()));
    report.reconstructed_size = decoded->size();

    auto data = decrypt(std::move(*decoded));
    if (!data)
        return fail(std::move(data.error()));
    report.decrypted = manifest_.encryption().has_value();

    if (auto ok = check_final_hash(report, *data); !ok)
        return fail(std::move(ok.error()));

    if (auto ok = apply_policy(report); !ok)
        return fail(std::move(ok.error()));

    report.output_size = data->size();
    report.success = true;
    out.data = std::move(*data);

    NEBULA_INFO("reconstruction succeeded: " << report.output_size << " bytes, integrity "
                                             << to_string(report.integrity));
    return out;
}

Reconstruction reconstruct(const Manifest& manifest, const FetchFn& fetch,
    std::optional<BytesSpan> key, const ReconstructOptions& options)
{
    return Reconstructor(manifest, fetch, key, options).run();
}

Reconstruction reconstruct(BytesSpan manifest_document, const FetchFn& fetch,
    std::optional<BytesSpan> key, const ReconstructOptions& options)
{
    auto manifest = Manifest::parse(manifest_document);
    if (!manifest) {
        NEBULA_ERROR("reconstruction failed at manifest: " << manifest.error().message());
        Reconstruction out;
        out.report.error = ReportError { Stage::Manifest, manifest.error(), "manifest rejected" };
        return out;
    }
    return reconstruct(*manifest, fetch, key, options);
}

} // namespace Nebula::Reconstruct
