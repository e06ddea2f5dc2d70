#include "core/manifest.hpp"
#include "core/error.hpp"
#include "core/logging.hpp"

#include <algorithm>
#include <limits>
#include <set>

#include "simdjson.h"

namespace Nebula::Reconstruct {

namespace {

    using Element = simdjson::dom::element;

    // GF(256) Cauchy construction limit.
    constexpr int MAX_TOTAL_SHARDS = 256;

    std::unexpected<std::error_code> reject(ManifestErrc e, std::string_view field)
    {
        NEBULA_DEBUG("manifest rejected at '" << field << "': " << make_error_code(e).message());
        return std::unexpected(make_error_code(e));
    }

    // Missing keys and JSON null both read as absent.
    std::optional<Element> field(const Element& obj, const char* key)
    {
        Element out;
        if (obj[key].get(out) != simdjson::SUCCESS || out.is_null())
            return std::nullopt;
        return out;
    }

    auto require(const Element& obj, const char* key) -> std::expected<Element, std::error_code>
    {
        auto f = field(obj, key);
        if (!f)
            return reject(ManifestErrc::MissingField, key);
        return *f;
    }

    auto as_object(const Element& e, const char* key) -> std::expected<Element, std::error_code>
    {
        if (e.type() != simdjson::dom::element_type::OBJECT)
            return reject(ManifestErrc::InvalidField, key);
        return e;
    }

    auto as_string(const Element& e, const char* key) -> std::expected<std::string_view, std::error_code>
    {
        std::string_view sv;
        if (e.get(sv) != simdjson::SUCCESS)
            return reject(ManifestErrc::InvalidField, key);
        return sv;
    }

    auto as_uint64(const Element& e, const char* key) -> std::expected<std::uint64_t, std::error_code>
    {
        std::uint64_t v = 0;
        if (e.get(v) != simdjson::SUCCESS)
            return reject(ManifestErrc::InvalidField, key);
        return v;
    }

    auto as_int(const Element& e, const char* key) -> std::expected<int, std::error_code>
    {
        std::int64_t v = 0;
        if (e.get(v) != simdjson::SUCCESS)
            return reject(ManifestErrc::InvalidField, key);
        if (v < std::numeric_limits<int>::min() || v > std::numeric_limits<int>::max())
            return reject(ManifestErrc::InvalidField, key);
        return static_cast<int>(v);
    }

    auto as_hex(const Element& e, const char* key) -> std::expected<std::vector<Byte>, std::error_code>
    {
        auto sv = as_string(e, key);
        if (!sv)
            return std::unexpected(sv.error());
        auto bytes = Crypto::Utils::from_hex(*sv);
        if (!bytes)
            return reject(ManifestErrc::InvalidDigest, key);
        return std::move(*bytes);
    }

    auto as_digest(const Element& e, const char* key, HashAlgorithm algorithm)
        -> std::expected<Digest, std::error_code>
    {
        auto bytes = as_hex(e, key);
        if (!bytes)
            return std::unexpected(bytes.error());
        if (bytes->size() != Crypto::digest_size(algorithm))
            return reject(ManifestErrc::InvalidDigest, key);
        return std::move(*bytes);
    }

    auto parse_rs(const Element& rs) -> std::expected<RsParams, std::error_code>
    {
        RsParams params {};
        std::pair<const char*, int*> fields[] = {
            { "data_shards", &params.k },
            { "parity_shards", &params.m },
            { "total_shards", &params.n },
        };
        for (auto [key, out] : fields) {
            auto e = require(rs, key);
            if (!e)
                return std::unexpected(e.error());
            auto v = as_int(*e, key);
            if (!v)
                return std::unexpected(v.error());
            *out = *v;
        }

        if (params.k <= 0 || params.m < 0 || params.n > MAX_TOTAL_SHARDS || params.n != params.k + params.m)
            return reject(ManifestErrc::InvalidParameters, "rs");
        return params;
    }

    auto parse_shard(const Element& e, HashAlgorithm algorithm, int n) -> std::expected<ShardRef, std::error_code>
    {
        auto obj = as_object(e, "shards[]");
        if (!obj)
            return std::unexpected(obj.error());

        ShardRef ref {};

        auto index = require(*obj, "index").and_then([](const Element& v) { return as_int(v, "index"); });
        if (!index)
            return std::unexpected(index.error());
        if (*index < 0 || *index >= n)
            return reject(ManifestErrc::ShardIndexOutOfRange, "index");
        ref.index = *index;

        auto hash = require(*obj, "hash").and_then([algorithm](const Element& v) { return as_digest(v, "hash", algorithm); });
        if (!hash)
            return std::unexpected(hash.error());
        ref.hash = std::move(*hash);

        if (auto size = field(*obj, "size_bytes")) {
            auto v = as_uint64(*size, "size_bytes");
            if (!v)
                return std::unexpected(v.error());
            ref.size_bytes = *v;
        }

        for (const char* key : { "path", "url" }) {
            if (auto loc = field(*obj, key)) {
                auto v = as_string(*loc, key);
                if (!v)
                    return std::unexpected(v.error());
                ref.locator = std::string(*v);
                break;
            }
        }
        return ref;
    }

    auto parse_merkle(const Element& merkle, HashAlgorithm default_algorithm)
        -> std::expected<MerkleInfo, std::error_code>
    {
        MerkleInfo info {};
        info.algorithm = default_algorithm;

        if (auto alg = field(merkle, "algorithm")) {
            auto name = as_string(*alg, "merkle.algorithm");
            if (!name)
                return std::unexpected(name.error());
            auto parsed = Crypto::parse_hash_algorithm(*name);
            if (!parsed)
                return reject(ManifestErrc::UnsupportedMerkleAlgorithm, "merkle.algorithm");
            info.algorithm = *parsed;
        }

        auto root = require(merkle, "root").and_then([&](const Element& v) { return as_digest(v, "merkle.root", info.algorithm); });
        if (!root)
            return std::unexpected(root.error());
        info.root = std::move(*root);

        auto leaves = require(merkle, "leaf_hashes");
        if (!leaves)
            return std::unexpected(leaves.error());
        simdjson::dom::array arr;
        if (leaves->get(arr) != simdjson::SUCCESS)
            return reject(ManifestErrc::InvalidField, "merkle.leaf_hashes");
        for (Element leaf : arr) {
            auto d = as_digest(leaf, "merkle.leaf_hashes[]", info.algorithm);
            if (!d)
                return std::unexpected(d.error());
            info.leaf_hashes.push_back(std::move(*d));
        }
        return info;
    }

    auto parse_encryption(const Element& enc) -> std::expected<EncryptionInfo, std::error_code>
    {
        EncryptionInfo info {};

        auto name = require(enc, "algorithm").and_then([](const Element& v) { return as_string(v, "encryption.algorithm"); });
        if (!name)
            return std::unexpected(name.error());
        auto alg = parse_encryption_algorithm(*name);
        if (!alg)
            return reject(ManifestErrc::UnsupportedEncryption, "encryption.algorithm");
        info.algorithm = *alg;

        auto iv = require(enc, "iv").and_then([](const Element& v) { return as_hex(v, "encryption.iv"); });
        if (!iv)
            return std::unexpected(iv.error());
        if (iv->empty())
            return reject(ManifestErrc::InvalidField, "encryption.iv");
        info.iv = std::move(*iv);

        if (auto tag = field(enc, "tag")) {
            auto v = as_hex(*tag, "encryption.tag");
            if (!v)
                return std::unexpected(v.error());
            info.tag = std::move(*v);
        }

        if (auto hint = field(enc, "key_hint")) {
            auto v = as_string(*hint, "encryption.key_hint");
            if (!v)
                return std::unexpected(v.error());
            info.key_hint = std::string(*v);
        }
        return info;
    }

} // namespace

std::string_view to_string(EncryptionAlgorithm algorithm) noexcept
{
    switch (algorithm) {
    case EncryptionAlgorithm::Aes256Gcm:
        return "aes-256-gcm";
    }
    return "unknown";
}

std::optional<EncryptionAlgorithm> parse_encryption_algorithm(std::string_view name) noexcept
{
    if (name == "aes-256-gcm")
        return EncryptionAlgorithm::Aes256Gcm;
    return std::nullopt;
}

auto Manifest::parse(std::string_view document) -> std::expected<Manifest, std::error_code>
{
    return parse(Crypto::as_span(document));
}

auto Manifest::parse(BytesSpan document) -> std::expected<Manifest, std::error_code>
{
    if (document.empty())
        return reject(ManifestErrc::MalformedDocument, "<root>");

    simdjson::padded_string padded(reinterpret_cast<const char*>(document.data()), document.size());
    simdjson::dom::parser parser;
    Element root;
    if (auto err = parser.parse(padded).get(root); err != simdjson::SUCCESS) {
        NEBULA_DEBUG("manifest is not valid JSON: " << simdjson::error_message(err));
        return std::unexpected(make_error_code(ManifestErrc::MalformedDocument));
    }
    if (root.type() != simdjson::dom::element_type::OBJECT)
        return reject(ManifestErrc::MalformedDocument, "<root>");

    Manifest m;

    auto version = require(root, "version").and_then([](const Element& v) { return as_string(v, "version"); });
    if (!version)
        return std::unexpected(version.error());
    if (*version != MANIFEST_VERSION)
        return reject(ManifestErrc::UnsupportedVersion, "version");

    auto hash_name = require(root, "hash_algorithm").and_then([](const Element& v) { return as_string(v, "hash_algorithm"); });
    if (!hash_name)
        return std::unexpected(hash_name.error());
    auto hash_alg = Crypto::parse_hash_algorithm(*hash_name);
    if (!hash_alg)
        return reject(ManifestErrc::UnsupportedHashAlgorithm, "hash_algorithm");
    m.hash_algorithm_ = *hash_alg;

    auto size = require(root, "original_size_bytes").and_then([](const Element& v) { return as_uint64(v, "original_size_bytes"); });
    if (!size)
        return std::unexpected(size.error());
    m.original_size_ = *size;

    if (auto h = field(root, "original_hash")) {
        auto d = as_digest(*h, "original_hash", m.hash_algorithm_);
        if (!d)
            return std::unexpected(d.error());
        m.original_hash_ = std::move(*d);
    }

    auto rs = require(root, "rs")
                  .and_then([](const Element& v) { return as_object(v, "rs"); })
                  .and_then(parse_rs);
    if (!rs)
        return std::unexpected(rs.error());
    m.rs_ = *rs;

    auto shards = require(root, "shards");
    if (!shards)
        return std::unexpected(shards.error());
    simdjson::dom::array shard_array;
    if (shards->get(shard_array) != simdjson::SUCCESS)
        return reject(ManifestErrc::InvalidField, "shards");

    std::set<ShardIndex> seen;
    for (Element e : shard_array) {
        auto ref = parse_shard(e, m.hash_algorithm_, m.rs_.n);
        if (!ref)
            return std::unexpected(ref.error());
        if (!seen.insert(ref->index).second)
            return reject(ManifestErrc::DuplicateShardIndex, "index");
        m.shards_.push_back(std::move(*ref));
    }
    if (m.shards_.size() < static_cast<std::size_t>(m.rs_.k))
        return reject(ManifestErrc::TooFewShards, "shards");

    if (auto merkle = field(root, "merkle")) {
        auto info = as_object(*merkle, "merkle").and_then([&](const Element& v) { return parse_merkle(v, m.hash_algorithm_); });
        if (!info)
            return std::unexpected(info.error());
        if (info->leaf_hashes.size() != m.shards_.size())
            return reject(ManifestErrc::LeafCountMismatch, "merkle.leaf_hashes");
        m.merkle_ = std::move(*info);
    }

    if (auto enc = field(root, "encryption")) {
        auto info = as_object(*enc, "encryption").and_then(parse_encryption);
        if (!info)
            return std::unexpected(info.error());
        m.encryption_ = std::move(*info);
    }

    NEBULA_DEBUG("manifest parsed: k=" << m.rs_.k << " n=" << m.rs_.n << " shards=" << m.shards_.size()
                                       << " size=" << m.original_size_);
    return m;
}

std::vector<const ShardRef*> Manifest::shards_by_index() const
{
    std::vector<const ShardRef*> out;
    out.reserve(shards_.size());
    for (const auto& s : shards_)
        out.push_back(&s);
    std::ranges::sort(out, {}, [](const ShardRef* s) { return s->index; });
    return out;
}

} // namespace Nebula::Reconstruct
