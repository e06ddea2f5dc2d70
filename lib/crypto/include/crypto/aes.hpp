#pragma once

#include "crypto/common.hpp"
#include <array>
#include <cstddef>
#include <expected>
#include <optional>
#include <system_error>
#include <vector>

struct evp_cipher_ctx_st;

namespace Nebula::Crypto::Aes {

inline constexpr std::size_t KEY_SIZE = 32; // AES-256
inline constexpr std::size_t TAG_SIZE = 16;
inline constexpr std::size_t IV_SIZE = 12; // recommended GCM nonce length

using AesKey = std::array<Byte, KEY_SIZE>;
using Tag = std::array<Byte, TAG_SIZE>;

class Context {
public:
    Context();
    ~Context();

    Context(const Context&) = delete;
    Context& operator=(const Context&) = delete;
    Context(Context&& other) noexcept;
    Context& operator=(Context&& other) noexcept;

    evp_cipher_ctx_st* get() { return ptr_; }

private:
    evp_cipher_ctx_st* ptr_ = nullptr;
};

struct Sealed {
    std::vector<Byte> ciphertext;
    Tag tag;
};

// AES-256-GCM, no associated data.
[[nodiscard]]
auto encrypt(Context& ctx, BytesSpan key, BytesSpan iv, BytesSpan plaintext)
    -> std::expected<Sealed, std::error_code>;

// Without a separate tag the trailing TAG_SIZE bytes of `ciphertext` are the
// tag. Nothing is returned unless the tag verifies.
[[nodiscard]]
auto decrypt(Context& ctx, BytesSpan key, BytesSpan iv, BytesSpan ciphertext,
    std::optional<BytesSpan> tag = std::nullopt)
    -> std::expected<std::vector<Byte>, std::error_code>;

} // namespace Nebula::Crypto::Aes
