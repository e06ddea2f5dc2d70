#include "core/report.hpp"

#include <cstdio>
#include <sstream>

namespace Nebula::Reconstruct {

namespace {

    void write_string(std::ostream& os, std::string_view s)
    {
        os << '"';
        for (char c : s) {
            switch (c) {
            case '"':
                os << "\\\"";
                break;
            case '\\':
                os << "\\\\";
                break;
            case '\n':
                os << "\\n";
                break;
            case '\r':
                os << "\\r";
                break;
            case '\t':
                os << "\\t";
                break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(c));
                    os << buf;
                } else {
                    os << c;
                }
            }
        }
        os << '"';
    }

    void write_bool(std::ostream& os, bool v) { os << (v ? "true" : "false"); }

    void write_digest(std::ostream& os, const std::optional<Digest>& d)
    {
        if (d)
            write_string(os, Crypto::Utils::to_hex(*d));
        else
            os << "null";
    }

    void write_error_code(std::ostream& os, std::error_code ec)
    {
        if (!ec) {
            os << "null";
            return;
        }
        os << "{\"category\":";
        write_string(os, ec.category().name());
        os << ",\"value\":" << ec.value() << ",\"message\":";
        write_string(os, ec.message());
        os << "}";
    }

    void dump_shard(std::ostream& os, const ShardDetail& s)
    {
        os << "{\"index\":" << s.index << ",\"locator\":";
        if (s.locator)
            write_string(os, *s.locator);
        else
            os << "null";
        os << ",\"status\":";
        write_string(os, to_string(s.status));
        os << ",\"valid\":";
        write_bool(os, s.status == ShardStatus::Valid);
        os << ",\"size\":";
        if (s.size)
            os << *s.size;
        else
            os << "null";
        os << ",\"error\":";
        write_error_code(os, s.error);
        os << "}";
    }

} // namespace

std::string_view to_string(Stage stage) noexcept
{
    switch (stage) {
    case Stage::Manifest:
        return "manifest";
    case Stage::Fetch:
        return "fetch";
    case Stage::Merkle:
        return "merkle";
    case Stage::Recoverability:
        return "recoverability";
    case Stage::Decode:
        return "decode";
    case Stage::Decrypt:
        return "decrypt";
    case Stage::FinalHash:
        return "final_hash";
    case Stage::Policy:
        return "policy";
    }
    return "unknown";
}

std::string_view to_string(IntegrityLevel level) noexcept
{
    switch (level) {
    case IntegrityLevel::Full:
        return "full";
    case IntegrityLevel::Reduced:
        return "reduced";
    }
    return "unknown";
}

void dump(std::ostream& os, const RecoverabilityReport& r)
{
    os << "{\"feasible\":";
    write_bool(os, r.feasible);
    os << ",\"k\":" << r.k << ",\"n\":" << r.n << ",\"valid_count\":" << r.valid_count
       << ",\"missing_count\":" << r.missing_count() << ",\"missing_indices\":[";
    for (std::size_t i = 0; i < r.missing_indices.size(); ++i) {
        if (i != 0)
            os << ",";
        os << r.missing_indices[i];
    }
    os << "],\"unknown_count\":" << r.unknown_count() << ",\"unknown_indices\":[";
    for (std::size_t i = 0; i < r.unknown_indices.size(); ++i) {
        if (i != 0)
            os << ",";
        os << r.unknown_indices[i];
    }
    os << "],\"redundancy_margin\":" << r.redundancy_margin << ",\"fast_path\":";
    write_bool(os, r.fast_path);
    os << ",\"message\":";
    write_string(os, r.message());
    os << "}";
}

void ReconstructionReport::dump(std::ostream& os) const
{
    os << "{\"success\":";
    write_bool(os, success);
    os << ",\"feasible\":";
    write_bool(os, feasible);
    os << ",\"original_size\":" << original_size
       << ",\"reconstructed_size\":" << reconstructed_size
       << ",\"output_size\":" << output_size
       << ",\"original_hash\":";
    write_digest(os, original_hash);
    os << ",\"reconstructed_hash\":";
    write_digest(os, reconstructed_hash);
    os << ",\"hash_verified\":";
    write_bool(os, hash_verified);
    os << ",\"decrypted\":";
    write_bool(os, decrypted);
    os << ",\"merkle\":";
    write_string(os, to_string(merkle));
    os << ",\"integrity\":";
    write_string(os, to_string(integrity));
    os << ",\"shards_required\":" << shards_required
       << ",\"shards_available\":" << shards_available
       << ",\"shards_valid\":" << shards_valid
       << ",\"fast_path\":";
    write_bool(os, fast_path);
    os << ",\"rs_errors_corrected\":" << rs_errors_corrected
       << ",\"fetch_cancelled\":";
    write_bool(os, fetch_cancelled);

    os << ",\"shard_details\":[";
    for (std::size_t i = 0; i < shard_details.size(); ++i) {
        if (i != 0)
            os << ",";
        dump_shard(os, shard_details[i]);
    }
    os << "]";

    os << ",\"recoverability\":";
    if (recoverability)
        Reconstruct::dump(os, *recoverability);
    else
        os << "null";

    os << ",\"error\":";
    if (error) {
        os << "{\"stage\":";
        write_string(os, to_string(error->stage));
        os << ",\"code\":";
        write_error_code(os, error->code);
        os << ",\"detail\":";
        write_string(os, error->detail);
        os << "}";
    } else {
        os << "null";
    }
    os << "}";
}

std::string ReconstructionReport::to_json() const
{
    std::ostringstream oss;
    dump(oss);
    return oss.str();
}

std::string to_json(const ReconstructionReport& report)
{
    return report.to_json();
}

std::string to_json(const RecoverabilityAssessment& a)
{
    std::ostringstream os;
    os << "{\"shards_declared\":" << a.shards_declared << ",\"shards_found\":";
    if (a.shards_found)
        os << *a.shards_found;
    else
        os << "null";
    os << ",\"availability_verified\":";
    write_bool(os, a.availability_verified);
    os << ",\"analysis\":";
    dump(os, a.report);
    os << ",\"shard_status\":[";
    for (std::size_t i = 0; i < a.shard_status.size(); ++i) {
        const auto& s = a.shard_status[i];
        if (i != 0)
            os << ",";
        os << "{\"index\":" << s.index << ",\"status\":";
        write_string(os, to_string(s.status));
        os << ",\"error\":";
        write_error_code(os, s.error);
        os << "}";
    }
    os << "]}";
    return os.str();
}

} // namespace Nebula::Reconstruct
