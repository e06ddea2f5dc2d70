#include "crypto/aes.hpp"
#include "crypto/error.hpp"
#include "test_utils.hpp"
#include <gtest/gtest.h>

namespace Nebula::Crypto::Aes {

class AesGcmTest : public ::testing::Test {
protected:
    Context ctx;
    std::vector<Byte> key = random_bytes(KEY_SIZE, 1);
    std::vector<Byte> iv = random_bytes(IV_SIZE, 2);
    std::vector<Byte> plaintext = to_bytes("erasure coded payload, encrypted before sharding");

    std::vector<Byte> sealed_with_tag()
    {
        auto sealed = encrypt(ctx, key, iv, plaintext);
        EXPECT_TRUE(sealed.has_value());
        std::vector<Byte> out = sealed->ciphertext;
        out.insert(out.end(), sealed->tag.begin(), sealed->tag.end());
        return out;
    }
};

// McGrew/Viega GCM test cases 13 and 14: zero key and IV.
TEST_F(AesGcmTest, KnownAnswer)
{
    std::vector<Byte> zero_key(KEY_SIZE, 0);
    std::vector<Byte> zero_iv(IV_SIZE, 0);

    auto empty = encrypt(ctx, zero_key, zero_iv, {});
    ASSERT_TRUE(empty.has_value());
    EXPECT_TRUE(empty->ciphertext.empty());
    EXPECT_EQ(Utils::to_hex(empty->tag), "530f8afbc74536b9a963b4f1c4cb738b");

    std::vector<Byte> block(16, 0);
    auto one = encrypt(ctx, zero_key, zero_iv, block);
    ASSERT_TRUE(one.has_value());
    EXPECT_EQ(Utils::to_hex(one->ciphertext), "cea7403d4d606b6e074ec5d3baf39d18");
    EXPECT_EQ(Utils::to_hex(one->tag), "d0d1c8a799996bf0265b98b5d48ab919");

    auto back = decrypt(ctx, zero_key, zero_iv, one->ciphertext, BytesSpan(one->tag));
    ASSERT_TRUE(back.has_value());
    EXPECT_EQ(*back, block);
}

TEST_F(AesGcmTest, SeparateTag)
{
    auto sealed = encrypt(ctx, key, iv, plaintext);
    ASSERT_TRUE(sealed.has_value());
    EXPECT_EQ(sealed->ciphertext.size(), plaintext.size());

    auto out = decrypt(ctx, key, iv, sealed->ciphertext, BytesSpan(sealed->tag));
    ASSERT_TRUE(out.has_value());
    EXPECT_EQ(*out, plaintext);
}

TEST_F(AesGcmTest, TrailingTag)
{
    auto out = decrypt(ctx, key, iv, sealed_with_tag());
    ASSERT_TRUE(out.has_value());
    EXPECT_EQ(*out, plaintext);
}

TEST_F(AesGcmTest, FlippedTagByteFails)
{
    auto data = sealed_with_tag();
    data.back() ^= 0x01;
    auto out = decrypt(ctx, key, iv, data);
    ASSERT_FALSE(out.has_value());
    EXPECT_EQ(out.error(), DecryptionErrc::AuthFailed);
}

TEST_F(AesGcmTest, FlippedCiphertextByteFails)
{
    auto data = sealed_with_tag();
    data[3] ^= 0x80;
    auto out = decrypt(ctx, key, iv, data);
    ASSERT_FALSE(out.has_value());
    EXPECT_EQ(out.error(), DecryptionErrc::AuthFailed);
}

TEST_F(AesGcmTest, WrongKeyFails)
{
    auto data = sealed_with_tag();
    auto wrong = key;
    wrong[0] ^= 0xFF;
    auto out = decrypt(ctx, wrong, iv, data);
    ASSERT_FALSE(out.has_value());
    EXPECT_EQ(out.error(), DecryptionErrc::AuthFailed);
}

TEST_F(AesGcmTest, ContextIsReusable)
{
    for (int i = 0; i < 3; ++i) {
        auto out = decrypt(ctx, key, iv, sealed_with_tag());
        ASSERT_TRUE(out.has_value());
        EXPECT_EQ(*out, plaintext);
    }
}

TEST_F(AesGcmTest, ParameterErrors)
{
    auto data = sealed_with_tag();

    std::vector<Byte> short_key(16, 0);
    EXPECT_EQ(decrypt(ctx, short_key, iv, data).error(), DecryptionErrc::InvalidKey);
    EXPECT_EQ(encrypt(ctx, short_key, iv, plaintext).error(), DecryptionErrc::InvalidKey);

    EXPECT_EQ(decrypt(ctx, key, BytesSpan {}, data).error(), DecryptionErrc::InvalidIv);

    std::vector<Byte> too_short(TAG_SIZE - 1, 0);
    EXPECT_EQ(decrypt(ctx, key, iv, too_short).error(), DecryptionErrc::CiphertextTooShort);

    std::vector<Byte> long_tag(TAG_SIZE + 1, 0);
    EXPECT_EQ(decrypt(ctx, key, iv, data, BytesSpan(long_tag)).error(), DecryptionErrc::InvalidTag);
}

TEST_F(AesGcmTest, MovedContext)
{
    Context moved(std::move(ctx));
    auto sealed = encrypt(moved, key, iv, plaintext);
    ASSERT_TRUE(sealed.has_value());
    auto out = decrypt(moved, key, iv, sealed->ciphertext, BytesSpan(sealed->tag));
    ASSERT_TRUE(out.has_value());
    EXPECT_EQ(*out, plaintext);
}

} // namespace Nebula::Crypto::Aes
