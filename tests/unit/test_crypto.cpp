#include "Crypto.h"
#include "TestSupport.h"

#include <gtest/gtest.h>
#include <string>
#include <vector>

using namespace Chunkwise;

TEST(CryptoTest, KeyGeneration) {
    auto key1 = Crypto::generateKey();
    auto key2 = Crypto::generateKey();
    ASSERT_TRUE(key1.ok());
    ASSERT_TRUE(key2.ok());
    EXPECT_EQ(key1->size(), Crypto::KEY_SIZE);
    EXPECT_NE(*key1, *key2);

    auto nonce = Crypto::generateGcmNonce();
    ASSERT_TRUE(nonce.ok());
    EXPECT_EQ(nonce->size(), Crypto::GCM_IV_SIZE);
}

TEST(CryptoTest, SealOpenRoundTrip) {
    std::string message = "Hello, Chunkwise!";
    std::vector<uint8_t> plaintext(message.begin(), message.end());
    auto key = Testing::testKey();

    auto sealed = Crypto::seal(plaintext, key);
    ASSERT_TRUE(sealed.ok());
    EXPECT_EQ(sealed->size(), plaintext.size() + Crypto::SEAL_OVERHEAD);

    auto opened = Crypto::open(*sealed, key);
    ASSERT_TRUE(opened.ok());
    EXPECT_EQ(*opened, plaintext);
}

TEST(CryptoTest, FreshNonceEverySeal) {
    std::vector<uint8_t> plaintext(100, 0x11);
    auto key = Testing::testKey();

    auto a = Crypto::seal(plaintext, key);
    auto b = Crypto::seal(plaintext, key);
    ASSERT_TRUE(a.ok());
    ASSERT_TRUE(b.ok());
    EXPECT_NE(*a, *b);
}

TEST(CryptoTest, EmptyPlaintext) {
    auto key = Testing::testKey();
    auto sealed = Crypto::seal({}, key);
    ASSERT_TRUE(sealed.ok());
    EXPECT_EQ(sealed->size(), Crypto::SEAL_OVERHEAD);

    auto opened = Crypto::open(*sealed, key);
    ASSERT_TRUE(opened.ok());
    EXPECT_TRUE(opened->empty());
}

TEST(CryptoTest, WrongKeyFailsAuthentication) {
    std::vector<uint8_t> plaintext(256, 0x5A);
    auto sealed = Crypto::seal(plaintext, Testing::testKey(0x01));
    ASSERT_TRUE(sealed.ok());

    auto opened = Crypto::open(*sealed, Testing::testKey(0x02));
    ASSERT_FALSE(opened.ok());
    EXPECT_EQ(opened.error().code, ErrorCode::DecryptionFailed);
}

TEST(CryptoTest, TamperedOrTruncatedInputFails) {
    auto key = Testing::testKey();
    auto sealed = Crypto::seal(std::vector<uint8_t>(64, 0x33), key);
    ASSERT_TRUE(sealed.ok());

    auto flipped = *sealed;
    flipped[Crypto::GCM_IV_SIZE + 3] ^= 0x80;
    EXPECT_FALSE(Crypto::open(flipped, key).ok());

    auto badTag = *sealed;
    badTag.back() ^= 0x01;
    EXPECT_FALSE(Crypto::open(badTag, key).ok());

    std::vector<uint8_t> tooShort(Crypto::SEAL_OVERHEAD - 1, 0);
    auto result = Crypto::open(tooShort, key);
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error().code, ErrorCode::DecryptionFailed);
}

TEST(CryptoTest, RejectsShortKey) {
    std::vector<uint8_t> shortKey(16, 0x01);
    auto sealed = Crypto::seal({1, 2, 3}, shortKey);
    ASSERT_FALSE(sealed.ok());
    EXPECT_EQ(sealed.error().code, ErrorCode::EncryptionFailed);
}

TEST(CryptoTest, HexConversion) {
    std::vector<uint8_t> bytes = {0x00, 0x0f, 0xab, 0xff};
    EXPECT_EQ(Crypto::toHex(bytes), "000fabff");

    auto decoded = Crypto::fromHex("000FabFF");
    ASSERT_TRUE(decoded.ok());
    EXPECT_EQ(*decoded, bytes);

    EXPECT_FALSE(Crypto::fromHex("abc").ok());
    EXPECT_FALSE(Crypto::fromHex("zz").ok());
}
