#include "common/base64.hpp"
#include "common/exceptions.hpp"
#include "gtest/gtest.h"

using namespace std;
using namespace tci;

TEST(Base64Test, EncodeWithPadding) {
    EXPECT_EQ(base64_encode(""), "");
    EXPECT_EQ(base64_encode("f"), "Zg==");
    EXPECT_EQ(base64_encode("fo"), "Zm8=");
    EXPECT_EQ(base64_encode("foo"), "Zm9v");
    EXPECT_EQ(base64_encode("foobar"), "Zm9vYmFy");
}

TEST(Base64Test, DecodeKnownValues) {
    EXPECT_EQ(base64_decode("Zg=="), "f");
    EXPECT_EQ(base64_decode("Zm8="), "fo");
    EXPECT_EQ(base64_decode("Zm9vYmFy"), "foobar");
    EXPECT_EQ(base64_decode("Zm9v\nYmFy\n"), "foobar");
}

TEST(Base64Test, BinaryContentSurvives) {
    string bytes;
    for (int i = 0; i < 256; ++i) bytes.push_back((char)i);
    EXPECT_EQ(base64_decode(base64_encode(bytes)), bytes);
}

TEST(Base64Test, RejectsMalformedInput) {
    EXPECT_THROW(base64_decode("Zm9"), invalid_argument_error);
    EXPECT_THROW(base64_decode("Zm9*"), invalid_argument_error);
    EXPECT_THROW(base64_decode("Z==="), invalid_argument_error);
}
