#include "crypto/hash.hpp"
#include "crypto/error.hpp"
#include "impl.hpp"
#include <openssl/evp.h>
#include <openssl/sha.h>

namespace Nebula::Crypto {

namespace {

    const EVP_MD* evp_md(HashAlgorithm algorithm) noexcept
    {
        switch (algorithm) {
        case HashAlgorithm::Sha256:
            return EVP_sha256();
        }
        return nullptr;
    }

    int hex_value(char c) noexcept
    {
        if (c >= '0' && c <= '9')
            return c - '0';
        if (c >= 'a' && c <= 'f')
            return c - 'a' + 10;
        if (c >= 'A' && c <= 'F')
            return c - 'A' + 10;
        return -1;
    }

} // namespace

std::string_view to_string(HashAlgorithm algorithm) noexcept
{
    switch (algorithm) {
    case HashAlgorithm::Sha256:
        return "sha256";
    }
    return "unknown";
}

std::optional<HashAlgorithm> parse_hash_algorithm(std::string_view name) noexcept
{
    if (name == "sha256")
        return HashAlgorithm::Sha256;
    return std::nullopt;
}

std::size_t digest_size(HashAlgorithm algorithm) noexcept
{
    switch (algorithm) {
    case HashAlgorithm::Sha256:
        return SHA256_DIGEST_LENGTH;
    }
    return 0;
}

auto digest(HashAlgorithm algorithm, BytesSpan data)
    -> std::expected<Digest, std::error_code>
{
    const BytesSpan parts[] = { data };
    return digest(algorithm, parts);
}

auto digest(HashAlgorithm algorithm, std::span<const BytesSpan> parts)
    -> std::expected<Digest, std::error_code>
{
    const EVP_MD* md = evp_md(algorithm);
    if (md == nullptr) {
        return std::unexpected(make_error_code(DigestErrc::UnsupportedAlgorithm));
    }

    impl::EvpMdCtxPtr ctx(EVP_MD_CTX_new());
    if (!ctx) {
        return std::unexpected(make_error_code(DigestErrc::OpenSSLError));
    }

    if (1 != EVP_DigestInit_ex(ctx.get(), md, nullptr)) {
        return std::unexpected(make_error_code(DigestErrc::OpenSSLError));
    }

    for (const auto& part : parts) {
        if (part.empty())
            continue;
        if (1 != EVP_DigestUpdate(ctx.get(), part.data(), part.size())) {
            return std::unexpected(make_error_code(DigestErrc::OpenSSLError));
        }
    }

    Digest out(EVP_MAX_MD_SIZE);
    unsigned int len = 0;
    if (1 != EVP_DigestFinal_ex(ctx.get(), out.data(), &len)) {
        return std::unexpected(make_error_code(DigestErrc::OpenSSLError));
    }
    out.resize(len);
    return out;
}

namespace Utils {

    Hash256 sha256(BytesSpan data)
    {
        Hash256 hash;
        SHA256(data.data(), data.size(), hash.data());
        return hash;
    }

    std::string to_hex(BytesSpan data)
    {
        static constexpr char DIGITS[] = "0123456789abcdef";
        std::string out;
        out.reserve(data.size() * 2);
        for (Byte b : data) {
            out.push_back(DIGITS[b >> 4]);
            out.push_back(DIGITS[b & 0x0F]);
        }
        return out;
    }

    std::optional<std::vector<Byte>> from_hex(std::string_view hex)
    {
        if (hex.size() % 2 != 0)
            return std::nullopt;

        std::vector<Byte> out;
        out.reserve(hex.size() / 2);
        for (size_t i = 0; i < hex.size(); i += 2) {
            int hi = hex_value(hex[i]);
            int lo = hex_value(hex[i + 1]);
            if (hi < 0 || lo < 0)
                return std::nullopt;
            out.push_back(static_cast<Byte>((hi << 4) | lo));
        }
        return out;
    }

} // namespace Utils

} // namespace Nebula::Crypto
