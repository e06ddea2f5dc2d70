#include "crypto/erasure_code.hpp"
#include "crypto/error.hpp"
#include <algorithm>
#include <climits>
#include <cstring>
#include <isa-l/erasure_code.h>
#include <utility>
#include <vector>

namespace Nebula::Crypto::ErasureCode {

namespace {

    constexpr int MAX_SHARDS = 256;

    std::unexpected<std::error_code> out_of_order()
    {
        return std::unexpected(std::make_error_code(std::errc::operation_not_permitted));
    }

} // namespace

std::expected<Context, std::error_code> Context::create(int K, int N)
{
    if (K <= 0 || N < K || N > MAX_SHARDS) {
        return std::unexpected(make_error_code(DecodeErrc::InvalidParameters));
    }

    GF256::Matrix encode_matrix = GF256::cauchy_encode_matrix(N, K);

    // ISA-L only needs the parity rows [K, N) for encoding, expanded into
    // 32-byte SIMD lookup tables per coefficient.
    const int M = N - K;
    std::vector<unsigned char> g_tbls(static_cast<size_t>(M) * K * 32);
    if (M > 0) {
        ec_init_tables(K, M, &encode_matrix[static_cast<size_t>(K) * K], g_tbls.data());
    }

    return Context(K, N, std::move(encode_matrix), std::move(g_tbls));
}

std::size_t chunk_size(const Context& ctx, std::size_t data_size) noexcept
{
    const auto k = static_cast<std::size_t>(ctx.K());
    return (data_size + k - 1) / k;
}

auto encode(const Context& ctx, BytesSpan data)
    -> std::expected<std::vector<std::vector<Byte>>, std::error_code>
{
    const int K = ctx.K();
    const int M = ctx.M();
    const std::size_t block_size = chunk_size(ctx, data.size());
    if (block_size > static_cast<std::size_t>(INT_MAX)) {
        return std::unexpected(make_error_code(DecodeErrc::DataTooLarge));
    }

    // Data shards: the object split into K chunks, the last one zero-padded.
    std::vector<std::vector<Byte>> result(ctx.N(), std::vector<Byte>(block_size, Byte { 0 }));
    for (int i = 0; i < K; ++i) {
        const std::size_t offset = static_cast<std::size_t>(i) * block_size;
        if (offset >= data.size())
            break;
        const std::size_t len = std::min(block_size, data.size() - offset);
        std::memcpy(result[i].data(), data.data() + offset, len);
    }

    if (M == 0 || block_size == 0)
        return result;

    std::vector<unsigned char*> data_ptrs(K);
    std::vector<unsigned char*> parity_ptrs(M);
    for (int i = 0; i < K; ++i)
        data_ptrs[i] = result[i].data();
    for (int i = 0; i < M; ++i)
        parity_ptrs[i] = result[K + i].data();

    // ec_encode_data only reads the tables.
    auto* g_tbls = const_cast<unsigned char*>(ctx.parity_g_tbls_.data());
    ec_encode_data(static_cast<int>(block_size), K, M, g_tbls, data_ptrs.data(), parity_ptrs.data());

    return result;
}

auto Decoder::select(const std::map<int, std::vector<Byte>>& shards)
    -> std::expected<void, std::error_code>
{
    if (state_ != State::Idle)
        return out_of_order();

    const int K = ctx_.K();
    if (shards.size() < static_cast<size_t>(K)) {
        return fail(make_error_code(DecodeErrc::InsufficientShards));
    }

    indices_.clear();
    chunks_.clear();
    indices_.reserve(K);
    chunks_.reserve(K);

    // std::map iterates by ascending index, which gives a deterministic pick.
    bool is_identity = true;
    chunk_size_ = shards.begin()->second.size();
    for (const auto& [idx, data] : shards) {
        if (idx < 0 || idx >= ctx_.N()) {
            return fail(make_error_code(DecodeErrc::InvalidIndex));
        }
        if (data.size() != chunk_size_) {
            return fail(make_error_code(DecodeErrc::SizeMismatch));
        }
        if (idx != static_cast<int>(indices_.size()))
            is_identity = false;

        indices_.push_back(idx);
        chunks_.emplace_back(data);

        if (static_cast<int>(indices_.size()) == K)
            break;
    }

    fast_path_ = is_identity && path_ == DecodePath::Auto;

    if (!fast_path_) {
        const auto k = static_cast<size_t>(K);
        matrix_.assign(k * k, 0);
        for (size_t i = 0; i < k; ++i) {
            auto src = ctx_.row(indices_[i]);
            std::copy(src.begin(), src.end(), matrix_.begin() + static_cast<std::ptrdiff_t>(i * k));
        }
    }

    state_ = State::MatrixBuilt;
    return {};
}

auto Decoder::invert() -> std::expected<void, std::error_code>
{
    if (state_ != State::MatrixBuilt)
        return out_of_order();

    if (!fast_path_) {
        auto inv = GF256::invert(matrix_, ctx_.K());
        if (!inv) {
            return fail(inv.error());
        }
        matrix_ = std::move(*inv);
    }

    state_ = State::Inverted;
    return {};
}

auto Decoder::recover(std::size_t original_size) -> std::expected<std::vector<Byte>, std::error_code>
{
    if (state_ != State::Inverted)
        return out_of_order();

    const auto k = static_cast<size_t>(ctx_.K());
    if (chunk_size_ * k < original_size) {
        return fail(make_error_code(DecodeErrc::SizeMismatch));
    }

    std::vector<Byte> output;
    if (fast_path_) {
        output.reserve(chunk_size_ * k);
        for (const auto& chunk : chunks_)
            output.insert(output.end(), chunk.begin(), chunk.end());
    } else {
        // data_i = sum_j inv[i][j] * chunk_j, byte by byte through the field tables.
        output.assign(chunk_size_ * k, Byte { 0 });
        for (size_t i = 0; i < k; ++i) {
            MutableBytesSpan dst(output.data() + i * chunk_size_, chunk_size_);
            for (size_t j = 0; j < k; ++j) {
                GF256::mul_add_region(matrix_[i * k + j], chunks_[j], dst);
            }
        }
    }

    output.resize(original_size);
    state_ = State::Recovered;
    return output;
}

std::string_view to_string(Decoder::State state) noexcept
{
    switch (state) {
    case Decoder::State::Idle:
        return "Idle";
    case Decoder::State::MatrixBuilt:
        return "MatrixBuilt";
    case Decoder::State::Inverted:
        return "Inverted";
    case Decoder::State::Recovered:
        return "Recovered";
    case Decoder::State::Failed:
        return "Failed";
    }
    return "unknown";
}

auto decode(const Context& ctx, const std::map<int, std::vector<Byte>>& received_shards,
    std::size_t original_size, DecodePath path)
    -> std::expected<std::vector<Byte>, std::error_code>
{
    Decoder decoder(ctx, path);

    if (auto r = decoder.select(received_shards); !r)
        return std::unexpected(r.error());
    if (auto r = decoder.invert(); !r)
        return std::unexpected(r.error());
    return decoder.recover(original_size);
}

} // namespace Nebula::Crypto::ErasureCode
