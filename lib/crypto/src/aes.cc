#include "crypto/aes.hpp"
#include "crypto/common.hpp"
#include "crypto/error.hpp"
#include <cstdint>
#include <cstring>
#include <openssl/crypto.h>
#include <openssl/evp.h>

namespace Nebula::Crypto::Aes {

namespace {

    constexpr std::size_t MIN_TAG_SIZE = 4;

    std::unexpected<std::error_code> cipher_failure()
    {
        return std::unexpected(make_error_code(DecryptionErrc::CipherFailure));
    }

} // namespace

Context::Context()
    : ptr_(EVP_CIPHER_CTX_new())
{
}

Context::~Context()
{
    if (ptr_ != nullptr)
        EVP_CIPHER_CTX_free(ptr_);
}

Context::Context(Context&& other) noexcept
    : ptr_(other.ptr_)
{
    other.ptr_ = nullptr;
}

Context& Context::operator=(Context&& other) noexcept
{
    if (this != &other) {
        if (ptr_ != nullptr)
            EVP_CIPHER_CTX_free(ptr_);
        ptr_ = other.ptr_;
        other.ptr_ = nullptr;
    }
    return *this;
}

auto encrypt(Context& ctx, BytesSpan key, BytesSpan iv, BytesSpan plaintext)
    -> std::expected<Sealed, std::error_code>
{
    if (key.size() != KEY_SIZE) {
        return std::unexpected(make_error_code(DecryptionErrc::InvalidKey));
    }
    if (iv.empty()) {
        return std::unexpected(make_error_code(DecryptionErrc::InvalidIv));
    }

    auto* native_ctx = ctx.get();
    if (native_ctx == nullptr)
        return cipher_failure();

    // Init resets the context when it is reused.
    if (1 != EVP_EncryptInit_ex(native_ctx, EVP_aes_256_gcm(), nullptr, nullptr, nullptr))
        return cipher_failure();
    if (1 != EVP_CIPHER_CTX_ctrl(native_ctx, EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(iv.size()), nullptr))
        return cipher_failure();
    if (1 != EVP_EncryptInit_ex(native_ctx, nullptr, nullptr, key.data(), iv.data()))
        return cipher_failure();

    Sealed sealed;
    sealed.ciphertext.resize(plaintext.size());
    int len = 0;
    int ciphertext_len = 0;

    if (!plaintext.empty()) {
        if (1 != EVP_EncryptUpdate(native_ctx, sealed.ciphertext.data(), &len, plaintext.data(), static_cast<int>(plaintext.size())))
            return cipher_failure();
        ciphertext_len = len;
    }

    // GCM is a stream mode, Final writes nothing.
    if (1 != EVP_EncryptFinal_ex(native_ctx, sealed.ciphertext.data() + ciphertext_len, &len))
        return cipher_failure();
    ciphertext_len += len;
    sealed.ciphertext.resize(ciphertext_len);

    if (1 != EVP_CIPHER_CTX_ctrl(native_ctx, EVP_CTRL_GCM_GET_TAG, static_cast<int>(TAG_SIZE), sealed.tag.data()))
        return cipher_failure();

    return sealed;
}

auto decrypt(Context& ctx, BytesSpan key, BytesSpan iv, BytesSpan ciphertext,
    std::optional<BytesSpan> tag)
    -> std::expected<std::vector<Byte>, std::error_code>
{
    if (key.size() != KEY_SIZE) {
        return std::unexpected(make_error_code(DecryptionErrc::InvalidKey));
    }
    if (iv.empty()) {
        return std::unexpected(make_error_code(DecryptionErrc::InvalidIv));
    }

    // Split off the embedded tag when none was supplied separately.
    BytesSpan data = ciphertext;
    BytesSpan tag_bytes;
    if (tag) {
        if (tag->size() < MIN_TAG_SIZE || tag->size() > TAG_SIZE) {
            return std::unexpected(make_error_code(DecryptionErrc::InvalidTag));
        }
        tag_bytes = *tag;
    } else {
        if (ciphertext.size() < TAG_SIZE) {
            return std::unexpected(make_error_code(DecryptionErrc::CiphertextTooShort));
        }
        data = ciphertext.first(ciphertext.size() - TAG_SIZE);
        tag_bytes = ciphertext.last(TAG_SIZE);
    }

    auto* native_ctx = ctx.get();
    if (native_ctx == nullptr)
        return cipher_failure();

    if (1 != EVP_DecryptInit_ex(native_ctx, EVP_aes_256_gcm(), nullptr, nullptr, nullptr))
        return cipher_failure();
    if (1 != EVP_CIPHER_CTX_ctrl(native_ctx, EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(iv.size()), nullptr))
        return cipher_failure();
    if (1 != EVP_DecryptInit_ex(native_ctx, nullptr, nullptr, key.data(), iv.data()))
        return cipher_failure();

    std::vector<Byte> plaintext(data.size());
    int len = 0;
    int plaintext_len = 0;

    if (!data.empty()) {
        if (1 != EVP_DecryptUpdate(native_ctx, plaintext.data(), &len, data.data(), static_cast<int>(data.size()))) {
            OPENSSL_cleanse(plaintext.data(), plaintext.size());
            return cipher_failure();
        }
        plaintext_len = len;
    }

    // The tag buffer is only read by OpenSSL.
    auto* tag_ptr = const_cast<Byte*>(tag_bytes.data());
    if (1 != EVP_CIPHER_CTX_ctrl(native_ctx, EVP_CTRL_GCM_SET_TAG, static_cast<int>(tag_bytes.size()), tag_ptr)) {
        OPENSSL_cleanse(plaintext.data(), plaintext.size());
        return cipher_failure();
    }

    // Final fails when the tag does not match (wrong key, tampered data or tag).
    if (EVP_DecryptFinal_ex(native_ctx, plaintext.data() + plaintext_len, &len) <= 0) {
        OPENSSL_cleanse(plaintext.data(), plaintext.size());
        return std::unexpected(make_error_code(DecryptionErrc::AuthFailed));
    }
    plaintext_len += len;

    plaintext.resize(plaintext_len);
    return plaintext;
}
} // namespace Nebula::Crypto::Aes
