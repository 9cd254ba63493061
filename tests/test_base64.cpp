#include <gtest/gtest.h>

#include "fake_link.hpp"
#include "lft_base64.hpp"

using namespace lft;
using fake::to_bytes;

TEST(Base64, Rfc4648Vectors) {
    EXPECT_EQ(b64_encode(to_bytes("")), "");
    EXPECT_EQ(b64_encode(to_bytes("f")), "Zg==");
    EXPECT_EQ(b64_encode(to_bytes("fo")), "Zm8=");
    EXPECT_EQ(b64_encode(to_bytes("foo")), "Zm9v");
    EXPECT_EQ(b64_encode(to_bytes("foob")), "Zm9vYg==");
    EXPECT_EQ(b64_encode(to_bytes("foobar")), "Zm9vYmFy");
}

TEST(Base64, DecodesVectors) {
    Bytes out;
    ASSERT_TRUE(b64_decode("Zm9vYmE=", out));
    EXPECT_EQ(out, to_bytes("fooba"));
    ASSERT_TRUE(b64_decode("", out));
    EXPECT_TRUE(out.empty());
}

TEST(Base64, BinaryPayloadHasNoDelimiters) {
    Bytes all(256);
    for (int i = 0; i < 256; ++i) all[i] = static_cast<uint8_t>(i);
    std::string enc = b64_encode(all);
    EXPECT_EQ(enc.find_first_of(":\r\n"), std::string::npos);

    Bytes back;
    ASSERT_TRUE(b64_decode(enc, back));
    EXPECT_EQ(back, all);
}

TEST(Base64, RejectsBrokenInput) {
    Bytes out;
    EXPECT_FALSE(b64_decode("Zg=", out));        // length not a multiple of 4
    EXPECT_FALSE(b64_decode("Z===", out));       // too much padding
    EXPECT_FALSE(b64_decode("Zg==Zm8=", out));   // padding before the end
    EXPECT_FALSE(b64_decode("Zm=v", out));       // data after padding
    EXPECT_FALSE(b64_decode("Zm9v!A==", out));   // outside the alphabet
    EXPECT_FALSE(b64_decode("Zm9 ", out));
}
