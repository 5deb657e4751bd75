#include "hubagent/util/base64.hpp"
#include "testing.hpp"

#include <gtest/gtest.h>
#include <string>

namespace hubagent {
namespace {

std::string AsString(const std::vector<std::uint8_t>& v) { return std::string(v.begin(), v.end()); }

TEST(Base64Test, StdEncodingKnownValues) {
    EXPECT_EQ(Base64Encode(testutil::Bytes("")), "");
    EXPECT_EQ(Base64Encode(testutil::Bytes("f")), "Zg==");
    EXPECT_EQ(Base64Encode(testutil::Bytes("fo")), "Zm8=");
    EXPECT_EQ(Base64Encode(testutil::Bytes("foo")), "Zm9v");
    EXPECT_EQ(Base64Encode(testutil::Bytes("foobar")), "Zm9vYmFy");
}

TEST(Base64Test, StdDecodingHonorsPadding) {
    auto one = Base64Decode("Zg==");
    ASSERT_TRUE(one.has_value()) << one.error();
    EXPECT_EQ(AsString(*one), "f");

    auto two = Base64Decode("Zm8=");
    ASSERT_TRUE(two.has_value()) << two.error();
    EXPECT_EQ(AsString(*two), "fo");
}

TEST(Base64Test, StdDecodingRejectsMalformedInput) {
    EXPECT_FALSE(Base64Decode("123").has_value());
    EXPECT_FALSE(Base64Decode("Zm9v!A==").has_value());
    EXPECT_FALSE(Base64Decode("Zg=a").has_value());
    EXPECT_FALSE(Base64Decode("Zm-_").has_value());
}

TEST(Base64Test, DecodesProductionSignatureToDer) {
    auto sig = Base64Decode(testutil::kTestSignature);
    ASSERT_TRUE(sig.has_value()) << sig.error();
    ASSERT_EQ(sig->size(), 72u);
    EXPECT_EQ((*sig)[0], 0x30); // DER SEQUENCE
}

TEST(Base64Test, RawUrlUsesUrlAlphabetWithoutPadding) {
    const std::vector<std::uint8_t> data = {0xfb, 0xff, 0xbf};
    EXPECT_EQ(Base64Encode(data), "+/+/");
    EXPECT_EQ(Base64RawUrlEncode(data), "-_-_");
    EXPECT_EQ(Base64RawUrlEncode(testutil::Bytes("f")), "Zg");

    auto back = Base64RawUrlDecode("-_-_");
    ASSERT_TRUE(back.has_value()) << back.error();
    EXPECT_EQ(*back, data);
}

TEST(Base64Test, RawUrlRejectsStdAlphabetAndBadLength) {
    EXPECT_FALSE(Base64RawUrlDecode("+/+/").has_value());
    EXPECT_FALSE(Base64RawUrlDecode("Zg==").has_value());
    EXPECT_FALSE(Base64RawUrlDecode("Zm9vY").has_value());
}

TEST(Base64Test, RawUrlDecodesPublicKeyCoordinates) {
    const std::string key = testutil::kProductionPublicKey;
    const auto dot = key.find('.');
    ASSERT_NE(dot, std::string::npos);

    auto x = Base64RawUrlDecode(key.substr(0, dot));
    auto y = Base64RawUrlDecode(key.substr(dot + 1));
    ASSERT_TRUE(x.has_value()) << x.error();
    ASSERT_TRUE(y.has_value()) << y.error();
    EXPECT_EQ(x->size(), 32u);
    EXPECT_EQ(y->size(), 32u);
}

} // namespace
} // namespace hubagent
