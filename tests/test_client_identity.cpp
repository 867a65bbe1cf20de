#include <gtest/gtest.h>
#include "client_identity.hpp"
#include "crypto_utils.hpp"

using namespace powgate;

namespace {

http::request<http::string_body> make_request() {
    http::request<http::string_body> req{http::verb::get, "/api/pow/challenge", 11};
    return req;
}

}

TEST(ClientIdentityTest, WeakIdentityIsUserAgentDigest) {
    auto req = make_request();
    req.set(http::field::user_agent, "Mozilla/5.0 Test");

    auto identity = extract_client_identity(req, "192.0.2.1", true);
    ASSERT_TRUE(identity.has_value());
    EXPECT_EQ(identity->weak_identity, crypto::sha256_hex("Mozilla/5.0 Test"));
    EXPECT_EQ(identity->user_agent, "Mozilla/5.0 Test");
    EXPECT_EQ(identity->client_address, "192.0.2.1");
}

TEST(ClientIdentityTest, MissingOrBlankUserAgent) {
    auto req = make_request();
    EXPECT_FALSE(extract_client_identity(req, "192.0.2.1", true).has_value());

    req.set(http::field::user_agent, "   ");
    EXPECT_FALSE(extract_client_identity(req, "192.0.2.1", true).has_value());
}

TEST(ClientIdentityTest, ForwardedForFirstEntry) {
    auto req = make_request();
    req.set("X-Forwarded-For", " 203.0.113.7 , 10.0.0.1");

    EXPECT_EQ(extract_client_ip(req, "10.0.0.2", true), "203.0.113.7");
    EXPECT_EQ(extract_client_ip(req, "10.0.0.2", false), "10.0.0.2");
}

TEST(ClientIdentityTest, PeerAddressFallback) {
    auto req = make_request();
    EXPECT_EQ(extract_client_ip(req, "10.0.0.2", true), "10.0.0.2");
    EXPECT_EQ(extract_client_ip(req, "", true), "unknown");

    req.set("X-Forwarded-For", "");
    EXPECT_EQ(extract_client_ip(req, "10.0.0.2", true), "10.0.0.2");
}

TEST(ClientIdentityTest, ForwardedForMustBeAnAddress) {
    auto req = make_request();
    req.set("X-Forwarded-For", "rotating-token-17, 203.0.113.7");
    EXPECT_EQ(extract_client_ip(req, "10.0.0.2", true), "10.0.0.2");

    req.set("X-Forwarded-For", "203.0.113.7:8443");
    EXPECT_EQ(extract_client_ip(req, "10.0.0.2", true), "10.0.0.2");

    req.set("X-Forwarded-For", "2001:db8::1");
    EXPECT_EQ(extract_client_ip(req, "10.0.0.2", true), "2001:db8::1");
}

TEST(ClientIdentityTest, CookieExtraction) {
    auto req = make_request();
    req.set(http::field::cookie, "theme=dark; pow_session=abc123==; other=1");

    auto value = extract_cookie(req, "pow_session");
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(*value, "abc123==");

    EXPECT_FALSE(extract_cookie(req, "missing").has_value());
    EXPECT_FALSE(extract_cookie(req, "pow").has_value());
}

TEST(ClientIdentityTest, CookieAcrossMultipleHeaders) {
    auto req = make_request();
    req.insert(http::field::cookie, "a=1");
    req.insert(http::field::cookie, "pow_session=\"quoted\"");

    auto value = extract_cookie(req, "pow_session");
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(*value, "quoted");
}

TEST(ClientIdentityTest, SessionCookieAttributes) {
    ServerConfig config;
    std::string cookie = build_session_cookie(config, "TOKEN");
    EXPECT_EQ(cookie, "pow_session=TOKEN; HttpOnly; Path=/; Max-Age=3600; Secure; SameSite=Lax");

    config.cookie_secure = false;
    config.cookie_same_site = "Strict";
    config.session_ttl_sec = 60;
    EXPECT_EQ(build_session_cookie(config, "T"), "pow_session=T; HttpOnly; Path=/; Max-Age=60; SameSite=Strict");
}

TEST(ClientIdentityTest, ClearCookie) {
    ServerConfig config;
    EXPECT_EQ(build_clear_cookie(config), "pow_session=; HttpOnly; Path=/; Max-Age=0");
}
