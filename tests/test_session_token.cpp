#include <gtest/gtest.h>
#include "session_token.hpp"
#include "challenge.hpp"
#include "crypto_utils.hpp"
#include <stdexcept>

using namespace powgate;

namespace {
const std::string SECRET = "0123456789abcdef0123456789abcdef";
}

TEST(SessionTokenTest, SignThenVerify) {
    SessionToken tokens(SECRET);
    std::string id = RandomSource::generate_id();

    std::string token = tokens.sign(id);
    EXPECT_EQ(token.size(), 64u);

    auto verified = tokens.verify(token);
    ASSERT_TRUE(verified.has_value());
    EXPECT_EQ(*verified, id);
}

TEST(SessionTokenTest, RejectsTamperedToken) {
    SessionToken tokens(SECRET);
    std::string token = tokens.sign(RandomSource::generate_id());

    std::string tampered = token;
    tampered[3] = (tampered[3] == 'A') ? 'B' : 'A';
    EXPECT_FALSE(tokens.verify(tampered).has_value());

    tampered = token;
    tampered[40] = (tampered[40] == 'A') ? 'B' : 'A';
    EXPECT_FALSE(tokens.verify(tampered).has_value());
}

TEST(SessionTokenTest, RejectsTokenFromOtherSecret) {
    SessionToken ours(SECRET);
    SessionToken theirs("another-secret-that-is-long-enough!!");
    std::string token = theirs.sign(RandomSource::generate_id());
    EXPECT_FALSE(ours.verify(token).has_value());
}

TEST(SessionTokenTest, RejectsMalformedInput) {
    SessionToken tokens(SECRET);
    EXPECT_FALSE(tokens.verify("").has_value());
    EXPECT_FALSE(tokens.verify("not-a-token").has_value());
    EXPECT_FALSE(tokens.verify(std::string(64, '$')).has_value());
    // A bare session id is not a token.
    EXPECT_FALSE(tokens.verify(RandomSource::generate_id()).has_value());
}

TEST(SessionTokenTest, SignRequiresUuid) {
    SessionToken tokens(SECRET);
    EXPECT_THROW(tokens.sign("not-a-uuid"), std::invalid_argument);
}

TEST(SessionTokenTest, EmptySecretRejected) {
    EXPECT_THROW(SessionToken(""), std::invalid_argument);
}
