#pragma once

#include <cstdint>
#include <string>
#include <system_error>

namespace Nebula::Crypto {

enum class FieldErrc : std::uint8_t {
    Success = 0,
    DivisionByZero, // div(a, 0) / inverse(0)
};

enum class DigestErrc : std::uint8_t {
    Success = 0,
    UnsupportedAlgorithm,
    InvalidHex, // odd length or non-hex character
    OpenSSLError,
};

enum class DecodeErrc : std::uint8_t {
    Success = 0,
    InvalidParameters, // 0 < K <= N <= 256 violated
    InsufficientShards,
    SingularMatrix,
    SizeMismatch,
    InvalidIndex,
    DataTooLarge,
};

enum class DecryptionErrc : std::uint8_t {
    Success = 0,
    KeyRequired,
    AuthFailed,
    InvalidKey,
    InvalidIv,
    InvalidTag,
    CiphertextTooShort,
    CipherFailure,
};

class FieldErrorCategory : public std::error_category {
public:
    [[nodiscard]] const char* name() const noexcept override { return "nebula.field"; }

    std::string message(int ev) const override
    {
        switch (static_cast<FieldErrc>(ev)) {
        case FieldErrc::Success:
            return "Success";
        case FieldErrc::DivisionByZero:
            return "Division by zero in GF(256)";
        default:
            return "Unknown field arithmetic error";
        }
    }
};

class DigestErrorCategory : public std::error_category {
public:
    [[nodiscard]] const char* name() const noexcept override { return "nebula.digest"; }

    std::string message(int ev) const override
    {
        switch (static_cast<DigestErrc>(ev)) {
        case DigestErrc::Success:
            return "Success";
        case DigestErrc::UnsupportedAlgorithm:
            return "Unsupported hash algorithm";
        case DigestErrc::InvalidHex:
            return "Invalid hex digest";
        case DigestErrc::OpenSSLError:
            return "OpenSSL digest failure";
        default:
            return "Unknown digest error";
        }
    }
};

class DecodeErrorCategory : public std::error_category {
public:
    [[nodiscard]] const char* name() const noexcept override { return "nebula.decode"; }

    std::string message(int ev) const override
    {
        switch (static_cast<DecodeErrc>(ev)) {
        case DecodeErrc::Success:
            return "Success";
        case DecodeErrc::InvalidParameters:
            return "Erasure parameters must satisfy 0 < k <= n <= 256";
        case DecodeErrc::InsufficientShards:
            return "Fewer than k shards available";
        case DecodeErrc::SingularMatrix:
            return "Decode matrix is singular";
        case DecodeErrc::SizeMismatch:
            return "Shard chunk lengths disagree";
        case DecodeErrc::InvalidIndex:
            return "Shard index out of range";
        case DecodeErrc::DataTooLarge:
            return "Data too large to encode";
        default:
            return "Unknown decode error";
        }
    }
};

class DecryptionErrorCategory : public std::error_category {
public:
    [[nodiscard]] const char* name() const noexcept override { return "nebula.decryption"; }

    std::string message(int ev) const override
    {
        switch (static_cast<DecryptionErrc>(ev)) {
        case DecryptionErrc::Success:
            return "Success";
        case DecryptionErrc::KeyRequired:
            return "Decryption key required but not provided";
        case DecryptionErrc::AuthFailed:
            return "Authentication tag verification failed";
        case DecryptionErrc::InvalidKey:
            return "AES-256 key must be 32 bytes";
        case DecryptionErrc::InvalidIv:
            return "Missing IV for AES-GCM";
        case DecryptionErrc::InvalidTag:
            return "GCM tag must be between 4 and 16 bytes";
        case DecryptionErrc::CiphertextTooShort:
            return "Ciphertext shorter than the embedded tag";
        case DecryptionErrc::CipherFailure:
            return "OpenSSL cipher failure";
        default:
            return "Unknown decryption error";
        }
    }
};

inline const std::error_category& field_category()
{
    static FieldErrorCategory instance;
    return instance;
}

inline const std::error_category& digest_category()
{
    static DigestErrorCategory instance;
    return instance;
}

inline const std::error_category& decode_category()
{
    static DecodeErrorCategory instance;
    return instance;
}

inline const std::error_category& decryption_category()
{
    static DecryptionErrorCategory instance;
    return instance;
}

inline std::error_code make_error_code(FieldErrc e)
{
    return { static_cast<int>(e), field_category() };
}

inline std::error_code make_error_code(DigestErrc e)
{
    return { static_cast<int>(e), digest_category() };
}

inline std::error_code make_error_code(DecodeErrc e)
{
    return { static_cast<int>(e), decode_category() };
}

inline std::error_code make_error_code(DecryptionErrc e)
{
    return { static_cast<int>(e), decryption_category() };
}
} // namespace Nebula::Crypto

namespace std {
template <>
struct is_error_code_enum<Nebula::Crypto::FieldErrc> : true_type { };
template <>
struct is_error_code_enum<Nebula::Crypto::DigestErrc> : true_type { };
template <>
struct is_error_code_enum<Nebula::Crypto::DecodeErrc> : true_type { };
template <>
struct is_error_code_enum<Nebula::Crypto::DecryptionErrc> : true_type { };
} // namespace std
