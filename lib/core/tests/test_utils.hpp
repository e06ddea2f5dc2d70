#pragma once

#include "core/concepts.hpp"
#include "core/error.hpp"
#include "core/manifest.hpp"
#include "crypto/aes.hpp"
#include "crypto/erasure_code.hpp"
#include "crypto/hash.hpp"
#include "crypto/merkle_tree.hpp"

#include <atomic>
#include <map>
#include <mutex>
#include <optional>
#include <random>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace Nebula::Reconstruct::Testing {

inline std::vector<Byte> to_bytes(std::string_view s)
{
    return std::vector<Byte>(s.begin(), s.end());
}

inline std::vector<Byte> random_bytes(size_t len, unsigned seed = 42)
{
    std::vector<Byte> res(len);
    std::mt19937 rng(seed);
    std::uniform_int_distribution<uint16_t> dist(0, 255);
    for (auto& b : res)
        b = static_cast<Byte>(dist(rng));
    return res;
}

inline std::string hex(BytesSpan data) { return Crypto::Utils::to_hex(data); }

inline Digest sha256(BytesSpan data)
{
    auto d = Crypto::Utils::sha256(data);
    return Digest(d.begin(), d.end());
}

inline std::string shard_path(int index) { return "shard-" + std::to_string(index) + ".bin"; }

// An object as a producer would publish it: optionally encrypted, then
// erasure coded. Test-only; throws on setup failure.
struct Encoded {
    std::vector<Byte> plaintext;
    std::vector<Byte> stored; // what was erasure coded
    std::vector<std::vector<Byte>> shards;
    int k = 0;
    int n = 0;
    std::optional<std::vector<Byte>> key;
    std::vector<Byte> iv;
    std::optional<std::vector<Byte>> tag; // set when the tag is kept out of band
};

inline Encoded encode_object(std::vector<Byte> plaintext, int k, int n,
    std::optional<std::vector<Byte>> key = std::nullopt, bool detached_tag = true)
{
    Encoded e;
    e.plaintext = std::move(plaintext);
    e.k = k;
    e.n = n;
    e.stored = e.plaintext;

    if (key) {
        e.key = key;
        e.iv = random_bytes(Crypto::Aes::IV_SIZE, 99);
        Crypto::Aes::Context ctx;
        auto sealed = Crypto::Aes::encrypt(ctx, *key, e.iv, e.plaintext);
        if (!sealed)
            throw std::runtime_error("test setup: encrypt failed");
        e.stored = sealed->ciphertext;
        if (detached_tag)
            e.tag = std::vector<Byte>(sealed->tag.begin(), sealed->tag.end());
        else
            e.stored.insert(e.stored.end(), sealed->tag.begin(), sealed->tag.end());
    }

    auto ctx = Crypto::ErasureCode::Context::create(k, n);
    if (!ctx)
        throw std::runtime_error("test setup: bad erasure parameters");
    auto shards = Crypto::ErasureCode::encode(*ctx, e.stored);
    if (!shards)
        throw std::runtime_error("test setup: encode failed");
    e.shards = std::move(*shards);
    return e;
}

// A manifest document whose top-level members are kept as raw JSON text, so
// tests can replace or drop any of them.
struct ManifestDoc {
    std::vector<std::pair<std::string, std::string>> members;

    ManifestDoc& set(const std::string& key, std::string raw_json)
    {
        for (auto& [k, v] : members) {
            if (k == key) {
                v = std::move(raw_json);
                return *this;
            }
        }
        members.emplace_back(key, std::move(raw_json));
        return *this;
    }

    ManifestDoc& erase(const std::string& key)
    {
        std::erase_if(members, [&](const auto& m) { return m.first == key; });
        return *this;
    }

    [[nodiscard]] std::string str() const
    {
        std::ostringstream os;
        os << "{";
        for (size_t i = 0; i < members.size(); ++i) {
            if (i != 0)
                os << ",";
            os << "\"" << members[i].first << "\":" << members[i].second;
        }
        os << "}";
        return os.str();
    }
};

inline std::string quoted(std::string_view s) { return "\"" + std::string(s) + "\""; }

inline std::string rs_json(int k, int m, int n)
{
    return "{\"data_shards\":" + std::to_string(k) + ",\"parity_shards\":" + std::to_string(m)
        + ",\"total_shards\":" + std::to_string(n) + "}";
}

inline std::string shards_json(const Encoded& e)
{
    std::ostringstream os;
    os << "[";
    for (int i = 0; i < e.n; ++i) {
        if (i != 0)
            os << ",";
        os << "{\"index\":" << i << ",\"hash\":\"" << hex(sha256(e.shards[i])) << "\",\"size_bytes\":"
           << e.shards[i].size() << ",\"path\":\"" << shard_path(i) << "\"}";
    }
    os << "]";
    return os.str();
}

inline std::string merkle_json(const Encoded& e)
{
    std::vector<Digest> leaves;
    for (const auto& s : e.shards)
        leaves.push_back(sha256(s));
    auto root = Crypto::MerkleTree::compute_root(HashAlgorithm::Sha256, leaves);
    if (!root)
        throw std::runtime_error("test setup: merkle root failed");

    std::ostringstream os;
    os << "{\"algorithm\":\"sha256\",\"root\":\"" << hex(*root) << "\",\"leaf_hashes\":[";
    for (size_t i = 0; i < leaves.size(); ++i) {
        if (i != 0)
            os << ",";
        os << "\"" << hex(leaves[i]) << "\"";
    }
    os << "]}";
    return os.str();
}

inline std::string encryption_json(const Encoded& e)
{
    std::string out = "{\"algorithm\":\"aes-256-gcm\",\"iv\":\"" + hex(e.iv) + "\"";
    if (e.tag)
        out += ",\"tag\":\"" + hex(*e.tag) + "\"";
    out += ",\"key_hint\":\"test-key\"}";
    return out;
}

inline ManifestDoc manifest_doc(const Encoded& e, bool with_merkle = true)
{
    ManifestDoc doc;
    doc.set("version", quoted(MANIFEST_VERSION))
        .set("hash_algorithm", quoted("sha256"))
        .set("original_size_bytes", std::to_string(e.stored.size()))
        .set("original_hash", quoted(hex(sha256(e.plaintext))))
        .set("rs", rs_json(e.k, e.n - e.k, e.n))
        .set("shards", shards_json(e));
    if (with_merkle)
        doc.set("merkle", merkle_json(e));
    if (e.key)
        doc.set("encryption", encryption_json(e));
    return doc;
}

inline Manifest parse_or_throw(const ManifestDoc& doc)
{
    auto m = Manifest::parse(std::string_view(doc.str()));
    if (!m)
        throw std::runtime_error("test setup: manifest rejected: " + m.error().message());
    return std::move(*m);
}

// In-memory shard source keyed by locator.
class MemoryStore {
public:
    explicit MemoryStore(const Encoded& e)
    {
        for (int i = 0; i < e.n; ++i)
            blobs_[shard_path(i)] = e.shards[i];
    }

    FetchResult fetch(const ShardRef& ref, std::stop_token stop)
    {
        ++calls_;
        if (stop.stop_requested())
            return std::unexpected(make_error_code(ShardErrc::Cancelled));
        std::lock_guard<std::mutex> lock(mutex_);
        if (!ref.locator)
            return std::unexpected(make_error_code(ShardErrc::FetchFailed));
        auto it = blobs_.find(*ref.locator);
        if (it == blobs_.end())
            return std::unexpected(std::make_error_code(std::errc::no_such_file_or_directory));
        return it->second;
    }

    void remove(int index) { blobs_.erase(shard_path(index)); }

    void tamper(int index, size_t offset = 0) { blobs_.at(shard_path(index)).at(offset) ^= 0x01; }

    [[nodiscard]] int calls() const noexcept { return calls_.load(); }

private:
    std::mutex mutex_;
    std::map<std::string, std::vector<Byte>> blobs_;
    std::atomic<int> calls_ { 0 };
};

static_assert(ShardSource<MemoryStore>);

} // namespace Nebula::Reconstruct::Testing
