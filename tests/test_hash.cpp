#include <gtest/gtest.h>
#include "HashHelper.hpp"

#include <stdexcept>

using namespace http_pipeline;

TEST(HashTest, KnownDigests) {
    EXPECT_EQ(Hash::hexdigest(Hash::sha256("abc")),
        "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    EXPECT_EQ(Hash::hexdigest(Hash::sha1("abc")), "a9993e364706816aba3e25717850c26c9cd0d89d");
    EXPECT_EQ(Hash::hexdigest(Hash::sha256("")),
        "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST(HashTest, IncrementalMatchesOneShot) {
    Hash hash = Hash::sha256();
    hash.update("a").update("bc");

    std::string digest = hash.final();
    EXPECT_EQ(digest, Hash::sha256("abc"));
    EXPECT_EQ(hash.final(), digest);
    EXPECT_THROW(hash.update("more"), std::logic_error);
}

// RFC 4231, test case 2
TEST(HmacTest, Sha256Vector) {
    EXPECT_EQ(Hash::hexdigest(Hmac::sha256("Jefe", "what do ya want for nothing?")),
        "5bdcc146bf60754e6a042426089575c75a003f089d2739839dec58b964ec3843");
}

TEST(Base64Test, EncodesWithPadding) {
    EXPECT_EQ(base64::encode(""), "");
    EXPECT_EQ(base64::encode("f"), "Zg==");
    EXPECT_EQ(base64::encode("fo"), "Zm8=");
    EXPECT_EQ(base64::encode("foo"), "Zm9v");
    EXPECT_EQ(base64::encode("hello"), "aGVsbG8=");
    EXPECT_EQ(base64::encode(std::string("\x00\xff\x10", 3)), "AP8Q");
}
