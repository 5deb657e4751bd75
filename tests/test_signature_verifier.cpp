#include "hubagent/crypto/sha256.hpp"
#include "hubagent/crypto/signature_verifier.hpp"
#include "hubagent/util/base64.hpp"
#include "testing.hpp"

#include <atomic>
#include <gtest/gtest.h>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace hubagent {
namespace {

Sha256Digest DigestOf(const std::string& content) {
    Sha256Hasher hasher;
    EXPECT_TRUE(hasher.Update(testutil::Bytes(content)));
    auto d = hasher.Final();
    EXPECT_TRUE(d.has_value());
    return d.value_or(Sha256Digest{});
}

std::vector<std::uint8_t> ProductionSignature() {
    auto sig = Base64Decode(testutil::kTestSignature);
    EXPECT_TRUE(sig.has_value());
    return sig.value_or(std::vector<std::uint8_t>{});
}

TEST(SignatureVerifierTest, AcceptsPublishedSignature) {
    SignatureVerifier verifier(testutil::kProductionPublicKey);
    EXPECT_TRUE(verifier.Verify(DigestOf(testutil::kTestContent), ProductionSignature()));
}

TEST(SignatureVerifierTest, RejectsOtherDigest) {
    SignatureVerifier verifier(testutil::kProductionPublicKey);
    EXPECT_FALSE(verifier.Verify(DigestOf("modified-content"), ProductionSignature()));
}

TEST(SignatureVerifierTest, RejectsAnySingleBitFlipInDigest) {
    SignatureVerifier verifier(testutil::kProductionPublicKey);
    const auto sig = ProductionSignature();
    const auto digest = DigestOf(testutil::kTestContent);

    for (size_t bit = 0; bit < digest.size() * 8; bit += 37) {
        auto flipped = digest;
        flipped[bit / 8] ^= static_cast<std::uint8_t>(1u << (bit % 8));
        EXPECT_FALSE(verifier.Verify(flipped, sig)) << "bit " << bit;
    }
}

TEST(SignatureVerifierTest, RejectsFlippedSignatureBits) {
    SignatureVerifier verifier(testutil::kProductionPublicKey);
    const auto digest = DigestOf(testutil::kTestContent);
    const auto sig = ProductionSignature();

    // Offsets inside r and s, past the DER headers.
    for (size_t pos : {size_t{10}, size_t{30}, size_t{50}, sig.size() - 1}) {
        auto flipped = sig;
        flipped[pos] ^= 0x01;
        EXPECT_FALSE(verifier.Verify(digest, flipped)) << "byte " << pos;
    }
}

TEST(SignatureVerifierTest, RejectsMalformedSignatureBytes) {
    SignatureVerifier verifier(testutil::kProductionPublicKey);
    const auto digest = DigestOf(testutil::kTestContent);

    EXPECT_FALSE(verifier.Verify(digest, {}));
    const std::vector<std::uint8_t> garbage = {0x30, 0x02, 0x01, 0x00};
    EXPECT_FALSE(verifier.Verify(digest, garbage));
    auto truncated = ProductionSignature();
    truncated.resize(20);
    EXPECT_FALSE(verifier.Verify(digest, truncated));
}

TEST(SignatureVerifierTest, MalformedKeysThrowAtConstruction) {
    EXPECT_THROW(SignatureVerifier(""), std::invalid_argument);
    EXPECT_THROW(SignatureVerifier("no-dot-here"), std::invalid_argument);
    EXPECT_THROW(SignatureVerifier("a.b.c"), std::invalid_argument);
    EXPECT_THROW(SignatureVerifier("!!!!.????"), std::invalid_argument);

    // Valid encoding but not a point on P-256.
    const std::string x = Base64RawUrlEncode(std::vector<std::uint8_t>(32, 0x01));
    const std::string y = Base64RawUrlEncode(std::vector<std::uint8_t>(32, 0x02));
    EXPECT_THROW(SignatureVerifier(x + "." + y), std::invalid_argument);

    // Coordinate longer than 32 bytes.
    const std::string big = Base64RawUrlEncode(std::vector<std::uint8_t>(33, 0x01));
    EXPECT_THROW(SignatureVerifier(big + "." + y), std::invalid_argument);
}

TEST(SignatureVerifierTest, GeneratedKeyRoundTrip) {
    testutil::TestSigner signer;
    SignatureVerifier verifier(signer.PublicKey());

    const auto digest = DigestOf("firmware-blob");
    const auto sig = signer.SignDigest(digest);
    EXPECT_TRUE(verifier.Verify(digest, sig));

    // A different key does not accept it.
    SignatureVerifier production(testutil::kProductionPublicKey);
    EXPECT_FALSE(production.Verify(digest, sig));
}

TEST(SignatureVerifierTest, ConcurrentVerifyIsConsistent) {
    const SignatureVerifier verifier(testutil::kProductionPublicKey);
    const auto good = DigestOf(testutil::kTestContent);
    const auto bad = DigestOf("modified-content");
    const auto sig = ProductionSignature();

    std::vector<std::thread> threads;
    std::atomic_int failures{0};
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&] {
            for (int i = 0; i < 50; ++i) {
                if (!verifier.Verify(good, sig)) failures.fetch_add(1);
                if (verifier.Verify(bad, sig)) failures.fetch_add(1);
            }
        });
    }
    for (auto& t : threads) t.join();
    EXPECT_EQ(failures.load(), 0);
}

} // namespace
} // namespace hubagent
