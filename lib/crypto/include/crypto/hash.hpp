#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include "crypto/common.hpp"

namespace Nebula::Crypto {

enum class HashAlgorithm : std::uint8_t {
    Sha256,
};

[[nodiscard]] std::string_view to_string(HashAlgorithm algorithm) noexcept;

// Accepts the manifest spelling ("sha256").
[[nodiscard]] std::optional<HashAlgorithm> parse_hash_algorithm(std::string_view name) noexcept;

[[nodiscard]] std::size_t digest_size(HashAlgorithm algorithm) noexcept;

[[nodiscard]]
auto digest(HashAlgorithm algorithm, BytesSpan data)
    -> std::expected<Digest, std::error_code>;

// H(part_0 || part_1 || ...), without materializing the concatenation.
[[nodiscard]]
auto digest(HashAlgorithm algorithm, std::span<const BytesSpan> parts)
    -> std::expected<Digest, std::error_code>;

namespace Utils {
    using Hash256 = std::array<Byte, 32>;

    Hash256 sha256(BytesSpan data);

    // Lowercase hex.
    [[nodiscard]] std::string to_hex(BytesSpan data);

    // Case-insensitive; nullopt on odd length or a non-hex character.
    [[nodiscard]] std::optional<std::vector<Byte>> from_hex(std::string_view hex);
} // namespace Utils

} // namespace Nebula::Crypto
