#pragma once

#include <cstddef>
#include <cstdint>
#include <expected>
#include <map>
#include <span>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

#include "crypto/common.hpp"
#include "crypto/gf256.hpp"

namespace Nebula::Crypto::ErasureCode {

// Systematic Reed-Solomon code over GF(256): shard i < K is data chunk i of
// the zero-padded object, shard i >= K is row i of the Cauchy encoding matrix
// applied to the K data chunks.
class Context {
public:
    [[nodiscard]]
    static std::expected<Context, std::error_code> create(int K, int N);

    Context(const Context&) = delete;
    Context& operator=(const Context&) = delete;

    Context(Context&&) noexcept = default;
    Context& operator=(Context&&) noexcept = default;

    ~Context() = default;

    [[nodiscard]] int K() const noexcept { return K_; }
    [[nodiscard]] int N() const noexcept { return N_; }
    [[nodiscard]] int M() const noexcept { return N_ - K_; }

    [[nodiscard]] const GF256::Matrix& encode_matrix() const noexcept { return encode_matrix_; }

    // Row `index` of the N x K encoding matrix.
    [[nodiscard]] BytesSpan row(int index) const noexcept
    {
        return BytesSpan(encode_matrix_).subspan(static_cast<size_t>(index) * K_, K_);
    }

private:
    int K_;
    int N_;
    GF256::Matrix encode_matrix_;
    std::vector<unsigned char> parity_g_tbls_;

    Context(int K, int N, GF256::Matrix&& encode_matrix,
        std::vector<unsigned char>&& parity_g_tbls)
        : K_(K)
        , N_(N)
        , encode_matrix_(std::move(encode_matrix))
        , parity_g_tbls_(std::move(parity_g_tbls))
    {
    }

    friend auto encode(const Context& ctx, BytesSpan data)
        -> std::expected<std::vector<std::vector<Byte>>, std::error_code>;
};

// ceil(data_size / K); the common length of every shard.
[[nodiscard]] std::size_t chunk_size(const Context& ctx, std::size_t data_size) noexcept;

[[nodiscard]]
auto encode(const Context& ctx, BytesSpan data)
    -> std::expected<std::vector<std::vector<Byte>>, std::error_code>;

enum class DecodePath : std::uint8_t {
    Auto, // concatenate when shards 0..K-1 are selected
    General, // always invert, used to cross-check the fast path
};

// Single-pass decoder. The shard buffers passed to select() must outlive it.
class Decoder {
public:
    enum class State : std::uint8_t {
        Idle,
        MatrixBuilt,
        Inverted,
        Recovered,
        Failed,
    };

    explicit Decoder(const Context& ctx, DecodePath path = DecodePath::Auto)
        : ctx_(ctx)
        , path_(path)
    {
    }

    [[nodiscard]] State state() const noexcept { return state_; }
    [[nodiscard]] bool fast_path() const noexcept { return fast_path_; }
    [[nodiscard]] std::span<const int> selected() const noexcept { return indices_; }

    // Idle -> MatrixBuilt. Takes the first K shards by ascending index.
    [[nodiscard]]
    auto select(const std::map<int, std::vector<Byte>>& shards) -> std::expected<void, std::error_code>;

    // MatrixBuilt -> Inverted. No field arithmetic on the fast path.
    [[nodiscard]]
    auto invert() -> std::expected<void, std::error_code>;

    // Inverted -> Recovered. Output is truncated to original_size.
    [[nodiscard]]
    auto recover(std::size_t original_size) -> std::expected<std::vector<Byte>, std::error_code>;

private:
    const Context& ctx_;
    DecodePath path_;
    State state_ = State::Idle;
    bool fast_path_ = false;
    std::size_t chunk_size_ = 0;
    std::vector<int> indices_;
    std::vector<BytesSpan> chunks_;
    GF256::Matrix matrix_;

    std::unexpected<std::error_code> fail(std::error_code ec) noexcept
    {
        state_ = State::Failed;
        return std::unexpected(ec);
    }
};

[[nodiscard]] std::string_view to_string(Decoder::State state) noexcept;

[[nodiscard]]
auto decode(const Context& ctx, const std::map<int, std::vector<Byte>>& received_shards,
    std::size_t original_size, DecodePath path = DecodePath::Auto)
    -> std::expected<std::vector<Byte>, std::error_code>;

} // namespace Nebula::Crypto::ErasureCode
