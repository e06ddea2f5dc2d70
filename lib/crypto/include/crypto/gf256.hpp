#pragma once

#include <array>
#include <expected>
#include <system_error>
#include <vector>

#include "crypto/common.hpp"

namespace Nebula::Crypto::GF256 {

// x^8 + x^4 + x^3 + x^2 + 1, the usual Reed-Solomon field (same as ISA-L).
inline constexpr unsigned POLYNOMIAL = 0x11D;
inline constexpr Byte GENERATOR = 2;
inline constexpr unsigned ORDER = 255; // multiplicative group order

struct Tables {
    std::array<Byte, ORDER> antilog; // antilog[i] = GENERATOR^i
    std::array<Byte, 256> log; // log[antilog[i]] = i, log[0] unused
};

// Built once on first use, read-only afterwards.
[[nodiscard]] const Tables& tables() noexcept;

[[nodiscard]] constexpr Byte add(Byte a, Byte b) noexcept { return a ^ b; }

[[nodiscard]] Byte mul(Byte a, Byte b) noexcept;

[[nodiscard]]
auto div(Byte a, Byte b) -> std::expected<Byte, std::error_code>;

[[nodiscard]] Byte pow(Byte a, unsigned e) noexcept;

[[nodiscard]]
auto inverse(Byte a) -> std::expected<Byte, std::error_code>;

// dst[i] ^= coef * src[i]; both spans must have the same length.
void mul_add_region(Byte coef, BytesSpan src, MutableBytesSpan dst) noexcept;

// Row-major square or rectangular matrix over GF(256).
using Matrix = std::vector<Byte>;

// N x K systematic encoding matrix: identity on rows [0, K),
// rows i >= K hold 1 / (i ^ j). Matches ISA-L gf_gen_cauchy1_matrix.
[[nodiscard]] Matrix cauchy_encode_matrix(int N, int K);

// Gauss-Jordan inversion of a K x K matrix.
[[nodiscard]]
auto invert(const Matrix& matrix, int K) -> std::expected<Matrix, std::error_code>;

} // namespace Nebula::Crypto::GF256
