#include <gtest/gtest.h>
#include "hash_engine.hpp"
#include "crypto_utils.hpp"
#include <algorithm>
#include <stdexcept>

using namespace powgate;

namespace {

// All ones, then the first `zeros` bits cleared: exactly `zeros` leading zero bits.
Digest digest_with_leading_zeros(int zeros) {
    Digest d;
    d.fill(0xFF);
    for (int i = 0; i < zeros; ++i) {
        d[i / 8] &= static_cast<uint8_t>(~(0x80u >> (i % 8)));
    }
    return d;
}

}

TEST(HashEngineTest, DigestIsSha256OfPayloadAndBigEndianNonce) {
    Payload payload{};
    for (size_t i = 0; i < payload.size(); ++i) payload[i] = static_cast<uint8_t>(i);

    uint8_t buffer[36];
    std::copy(payload.begin(), payload.end(), buffer);
    buffer[32] = 0x01;
    buffer[33] = 0x02;
    buffer[34] = 0x03;
    buffer[35] = 0x04;

    auto expected = crypto::sha256(buffer, sizeof(buffer));
    EXPECT_EQ(HashEngine::digest(payload, 0x01020304u), expected);
}

TEST(HashEngineTest, DigestOfZeroInputMatchesKnownVector) {
    Payload payload{};
    Digest d = HashEngine::digest(payload, 0);
    // SHA-256 of 36 zero bytes
    uint8_t zeros[36] = {0};
    EXPECT_EQ(d, crypto::sha256(zeros, sizeof(zeros)));
    EXPECT_NE(d, HashEngine::digest(payload, 1));
}

TEST(HashEngineTest, DigestIsDeterministic) {
    Payload payload = RandomSource::generate_payload();
    EXPECT_EQ(HashEngine::digest(payload, 42), HashEngine::digest(payload, 42));
}

TEST(HashEngineTest, BoundaryAgreementForAllDifficulties) {
    for (int bits = MIN_DIFFICULTY_BITS; bits <= MAX_DIFFICULTY_BITS; ++bits) {
        Digest exact = digest_with_leading_zeros(bits);
        EXPECT_EQ(HashEngine::leading_zero_bits(exact), bits);
        EXPECT_TRUE(HashEngine::meets_difficulty(exact, bits)) << "bits=" << bits;

        Digest short_by_one = digest_with_leading_zeros(bits - 1);
        EXPECT_FALSE(HashEngine::meets_difficulty(short_by_one, bits)) << "bits=" << bits;

        if (bits < MAX_DIFFICULTY_BITS) {
            EXPECT_FALSE(HashEngine::meets_difficulty(exact, bits + 1)) << "bits=" << bits;
        }
    }
}

TEST(HashEngineTest, FullThirtyTwoBitsNeedsFourZeroBytes) {
    Digest d;
    d.fill(0);
    d[4] = 0xFF;
    EXPECT_TRUE(HashEngine::meets_difficulty(d, 32));

    d[3] = 0x01;
    EXPECT_FALSE(HashEngine::meets_difficulty(d, 32));
    EXPECT_TRUE(HashEngine::meets_difficulty(d, 31));
}

TEST(HashEngineTest, RejectsOutOfRangeDifficulty) {
    Digest d{};
    EXPECT_THROW(HashEngine::meets_difficulty(d, 0), std::invalid_argument);
    EXPECT_THROW(HashEngine::meets_difficulty(d, 33), std::invalid_argument);
    EXPECT_THROW(HashEngine::meets_difficulty(d, -1), std::invalid_argument);
}

TEST(HashEngineTest, LeadingZeroBits) {
    Digest d{};
    EXPECT_EQ(HashEngine::leading_zero_bits(d), 256);
    d[0] = 0x80;
    EXPECT_EQ(HashEngine::leading_zero_bits(d), 0);
    d[0] = 0x00;
    d[1] = 0x10;
    EXPECT_EQ(HashEngine::leading_zero_bits(d), 11);
}

TEST(HashEngineTest, VerifyFindsLowDifficultySolution) {
    Payload payload = RandomSource::generate_payload();
    bool found = false;
    for (uint32_t nonce = 0; nonce < 100000 && !found; ++nonce) {
        if (HashEngine::verify(payload, nonce, 4)) {
            found = true;
            EXPECT_GE(HashEngine::leading_zero_bits(HashEngine::digest(payload, nonce)), 4);
        }
    }
    EXPECT_TRUE(found);
}
