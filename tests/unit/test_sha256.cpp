#include "SHA256.h"
#include "TestSupport.h"

#include <gtest/gtest.h>
#include <string>
#include <vector>

using namespace Chunkwise;
using Chunkwise::Testing::TempDir;

TEST(SHA256Test, KnownStringDigests) {
    EXPECT_EQ(SHA256::hash("hello"), "2cf24dba5fb0a30e26e83b2ac5b9e29e1b161e5c1fa7425e73043362938b9824");
    EXPECT_EQ(SHA256::hash(""), "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST(SHA256Test, KnownByteDigest) {
    std::vector<uint8_t> data = {0x01, 0x02, 0x03};
    EXPECT_EQ(SHA256::hashBytes(data), "039058c6f2c0cb492c533b0a4d14ef77cc0f78abccced5287d84a1a2011cfb81");
}

TEST(SHA256Test, StreamingMatchesOneShotAndResets) {
    auto data = Testing::randomBytes(100000, 7);

    SHA256 hasher;
    hasher.update(data.data(), 1000);
    hasher.update(data.data() + 1000, data.size() - 1000);
    EXPECT_EQ(hasher.finalHex(), SHA256::hashBytes(data));

    // finalHex() leaves the hasher ready for new input
    const std::string abc = "abc";
    hasher.update(reinterpret_cast<const uint8_t*>(abc.data()), abc.size());
    EXPECT_EQ(hasher.finalHex(), SHA256::hash("abc"));
}

TEST(SHA256Test, HashFile) {
    TempDir dir;
    auto data = Testing::randomBytes(300000, 3);
    Testing::writeBytes(dir.file("blob.bin"), data);

    auto digest = SHA256::hashFile(dir.file("blob.bin"));
    ASSERT_TRUE(digest.ok());
    EXPECT_EQ(*digest, SHA256::hashBytes(data));

    auto missing = SHA256::hashFile(dir.file("nope.bin"));
    ASSERT_FALSE(missing.ok());
    EXPECT_EQ(missing.error().code, ErrorCode::FileReadError);
}

TEST(SHA256Test, HexDigestShape) {
    EXPECT_TRUE(SHA256::isHexDigest(SHA256::hash("x")));
    EXPECT_FALSE(SHA256::isHexDigest("abc"));
    EXPECT_FALSE(SHA256::isHexDigest(std::string(64, 'G')));
    EXPECT_FALSE(SHA256::isHexDigest(std::string(64, 'A')));
}
