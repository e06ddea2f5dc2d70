#include "crypto/gf256.hpp"
#include "crypto/error.hpp"
#include <algorithm>
#include <cstddef>
#include <utility>

namespace Nebula::Crypto::GF256 {

namespace {

    Tables build_tables() noexcept
    {
        Tables t {};
        unsigned x = 1;
        for (unsigned i = 0; i < ORDER; ++i) {
            t.antilog[i] = static_cast<Byte>(x);
            t.log[x] = static_cast<Byte>(i);
            x <<= 1; // multiply by GENERATOR
            if (x & 0x100)
                x ^= POLYNOMIAL;
        }
        return t;
    }

    inline Byte exp_sum(const Tables& t, unsigned la, unsigned lb) noexcept
    {
        unsigned s = la + lb;
        if (s >= ORDER)
            s -= ORDER;
        return t.antilog[s];
    }

} // namespace

const Tables& tables() noexcept
{
    static const Tables instance = build_tables();
    return instance;
}

Byte mul(Byte a, Byte b) noexcept
{
    if (a == 0 || b == 0)
        return 0;
    const auto& t = tables();
    return exp_sum(t, t.log[a], t.log[b]);
}

auto div(Byte a, Byte b) -> std::expected<Byte, std::error_code>
{
    if (b == 0) {
        return std::unexpected(make_error_code(FieldErrc::DivisionByZero));
    }
    if (a == 0)
        return Byte { 0 };
    const auto& t = tables();
    return exp_sum(t, t.log[a], ORDER - t.log[b]);
}

Byte pow(Byte a, unsigned e) noexcept
{
    if (e == 0)
        return 1;
    if (a == 0)
        return 0;
    const auto& t = tables();
    auto l = (static_cast<unsigned long long>(t.log[a]) * (e % ORDER)) % ORDER;
    return t.antilog[l];
}

auto inverse(Byte a) -> std::expected<Byte, std::error_code>
{
    return div(1, a);
}

void mul_add_region(Byte coef, BytesSpan src, MutableBytesSpan dst) noexcept
{
    const size_t len = std::min(src.size(), dst.size());
    if (coef == 0)
        return;
    if (coef == 1) {
        for (size_t i = 0; i < len; ++i)
            dst[i] ^= src[i];
        return;
    }

    const auto& t = tables();
    const unsigned lc = t.log[coef];
    for (size_t i = 0; i < len; ++i) {
        Byte s = src[i];
        if (s != 0)
            dst[i] ^= exp_sum(t, lc, t.log[s]);
    }
}

Matrix cauchy_encode_matrix(int N, int K)
{
    Matrix m(static_cast<size_t>(N) * K, 0);
    for (int i = 0; i < K; ++i)
        m[static_cast<size_t>(i) * K + i] = 1;

    // i >= K > j, so i ^ j is never zero and the inverse always exists.
    for (int i = K; i < N; ++i) {
        for (int j = 0; j < K; ++j) {
            m[static_cast<size_t>(i) * K + j] = *inverse(static_cast<Byte>(i ^ j));
        }
    }
    return m;
}

auto invert(const Matrix& matrix, int K) -> std::expected<Matrix, std::error_code>
{
    const auto k = static_cast<size_t>(K);
    if (K <= 0 || matrix.size() != k * k) {
        return std::unexpected(make_error_code(DecodeErrc::InvalidParameters));
    }

    Matrix a = matrix;
    Matrix inv(k * k, 0);
    for (size_t i = 0; i < k; ++i)
        inv[i * k + i] = 1;

    auto row = [k](Matrix& m, size_t r) { return MutableBytesSpan(m.data() + r * k, k); };

    for (size_t col = 0; col < k; ++col) {
        // Pivot search
        size_t pivot = col;
        while (pivot < k && a[pivot * k + col] == 0)
            ++pivot;
        if (pivot == k) {
            return std::unexpected(make_error_code(DecodeErrc::SingularMatrix));
        }
        if (pivot != col) {
            std::swap_ranges(row(a, col).begin(), row(a, col).end(), row(a, pivot).begin());
            std::swap_ranges(row(inv, col).begin(), row(inv, col).end(), row(inv, pivot).begin());
        }

        // Normalize the pivot row
        const Byte scale = *inverse(a[col * k + col]);
        for (size_t c = 0; c < k; ++c) {
            a[col * k + c] = mul(a[col * k + c], scale);
            inv[col * k + c] = mul(inv[col * k + c], scale);
        }

        // Eliminate the column from every other row
        for (size_t r = 0; r < k; ++r) {
            if (r == col)
                continue;
            const Byte factor = a[r * k + col];
            if (factor == 0)
                continue;
            mul_add_region(factor, row(a, col), row(a, r));
            mul_add_region(factor, row(inv, col), row(inv, r));
        }
    }

    return inv;
}

} // namespace Nebula::Crypto::GF256
