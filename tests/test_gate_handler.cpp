#include <gtest/gtest.h>
#include "handlers/gate_handler.hpp"
#include "crypto_utils.hpp"
#include "hash_engine.hpp"
#include "memory_storage.hpp"
#include "rate_limiter.hpp"
#include "input_validator.hpp"
#include <algorithm>
#include <cctype>
#include <vector>

using namespace powgate;

namespace {

const char* const BROWSER_UA = "Mozilla/5.0 (X11; Linux x86_64) TestBrowser/1.0";

class GateHandlerTest : public ::testing::Test {
protected:
    void SetUp() override {
        config.difficulty_bits = 4;
        config.pow_rate_limit = 3;
        config.allowed_origins = {"https://app.example.com"};

        limiter = std::make_unique<RateLimiter>(windows);
        gate = std::make_unique<GateService>(challenges, sessions, *limiter, GatePolicy::from_config(config));
        tokens = std::make_unique<SessionToken>("0123456789abcdef0123456789abcdef");
        handler = std::make_unique<GateHandler>(config, *gate, *tokens);
    }

    http::request<http::string_body> make_request(http::verb verb, const std::string& target,
                                                  const std::string& user_agent = BROWSER_UA) {
        http::request<http::string_body> req{verb, target, 11};
        if (!user_agent.empty()) req.set(http::field::user_agent, user_agent);
        return req;
    }

    json::object fetch_challenge() {
        auto res = handler->handle_challenge(make_request(http::verb::get, "/api/pow/challenge"), "198.51.100.4");
        EXPECT_EQ(res.result(), http::status::ok);
        return json::parse(res.body()).as_object();
    }

    static uint32_t solve(const json::object& challenge) {
        auto decoded = crypto::base64_decode(std::string(challenge.at("powChallengeB64").as_string()));
        Payload payload{};
        std::copy(decoded->begin(), decoded->end(), payload.begin());
        int bits = static_cast<int>(challenge.at("powDifficultyBits").as_int64());

        uint32_t nonce = 0;
        while (!HashEngine::verify(payload, nonce, bits)) ++nonce;
        return nonce;
    }

    http::response<http::string_body> submit(const std::string& challenge_id, uint32_t nonce) {
        auto req = make_request(http::verb::post, "/api/pow/submit");
        json::object body;
        body["challengeId"] = challenge_id;
        body["nonceU32"] = nonce;
        body["elapsedMs"] = 120;
        body["totalHashes"] = 16;
        req.body() = json::serialize(body);
        req.prepare_payload();
        return handler->handle_submit(req, "198.51.100.4");
    }

    static std::string cookie_value(const http::response<http::string_body>& res) {
        std::string header(res[http::field::set_cookie]);
        std::string prefix = "pow_session=";
        if (header.rfind(prefix, 0) != 0) return "";
        return header.substr(prefix.size(), header.find(';') - prefix.size());
    }

    ServerConfig config;
    MemoryChallengeStore challenges;
    MemorySessionStore sessions;
    MemoryRateWindowStore windows;
    std::unique_ptr<RateLimiter> limiter;
    std::unique_ptr<GateService> gate;
    std::unique_ptr<SessionToken> tokens;
    std::unique_ptr<GateHandler> handler;
};

}

TEST_F(GateHandlerTest, ChallengeResponseFields) {
    json::object challenge = fetch_challenge();

    EXPECT_TRUE(InputValidator::is_valid_uuid(std::string(challenge.at("powChallengeId").as_string())));
    auto payload = crypto::base64_decode(std::string(challenge.at("powChallengeB64").as_string()));
    ASSERT_TRUE(payload.has_value());
    EXPECT_EQ(payload->size(), CHALLENGE_PAYLOAD_SIZE);
    EXPECT_EQ(challenge.at("powDifficultyBits").as_int64(), 4);
    EXPECT_GT(challenge.at("powExpiresAtMs").as_int64(), now_ms());
}

TEST_F(GateHandlerTest, MissingUserAgentIsBadRequest) {
    auto res = handler->handle_challenge(make_request(http::verb::get, "/api/pow/challenge", ""), "198.51.100.4");
    EXPECT_EQ(res.result(), http::status::bad_request);
    EXPECT_EQ(challenges.size(), 0u);

    auto blank = make_request(http::verb::get, "/api/pow/challenge", "   ");
    EXPECT_EQ(handler->handle_challenge(blank, "198.51.100.4").result(), http::status::bad_request);
}

TEST_F(GateHandlerTest, SubmitStatusLogoutFlow) {
    json::object challenge = fetch_challenge();
    std::string id(challenge.at("powChallengeId").as_string());

    auto submitted = submit(id, solve(challenge));
    ASSERT_EQ(submitted.result(), http::status::no_content);
    std::string set_cookie(submitted[http::field::set_cookie]);
    EXPECT_NE(set_cookie.find("HttpOnly"), std::string::npos);
    EXPECT_NE(set_cookie.find("Path=/"), std::string::npos);
    EXPECT_NE(set_cookie.find("Max-Age=3600"), std::string::npos);
    EXPECT_NE(set_cookie.find("Secure"), std::string::npos);

    std::string token = cookie_value(submitted);
    ASSERT_EQ(token.size(), 64u);

    auto status_req = make_request(http::verb::get, "/api/pow/status");
    status_req.set(http::field::cookie, "theme=dark; pow_session=" + token);
    auto status = handler->handle_status(status_req, "198.51.100.4");
    EXPECT_EQ(status.result(), http::status::ok);
    EXPECT_EQ(json::parse(status.body()).as_object().at("passed").as_bool(), true);

    // A different browser presenting the same cookie does not pass.
    auto foreign = make_request(http::verb::get, "/api/pow/status", "curl/8.0");
    foreign.set(http::field::cookie, "pow_session=" + token);
    EXPECT_EQ(json::parse(handler->handle_status(foreign, "198.51.100.4").body()).as_object().at("passed").as_bool(),
              false);

    auto logout_req = make_request(http::verb::post, "/api/pow/logout");
    logout_req.set(http::field::cookie, "pow_session=" + token);
    auto logged_out = handler->handle_logout(logout_req, "198.51.100.4");
    EXPECT_EQ(logged_out.result(), http::status::no_content);
    EXPECT_EQ(std::string(logged_out[http::field::set_cookie]), "pow_session=; HttpOnly; Path=/; Max-Age=0");

    auto after = handler->handle_status(status_req, "198.51.100.4");
    EXPECT_EQ(json::parse(after.body()).as_object().at("passed").as_bool(), false);
}

TEST_F(GateHandlerTest, StatusWithoutCookieIsNotPassed) {
    auto res = handler->handle_status(make_request(http::verb::get, "/api/pow/status"), "198.51.100.4");
    EXPECT_EQ(res.result(), http::status::ok);
    EXPECT_EQ(json::parse(res.body()).as_object().at("passed").as_bool(), false);

    auto forged = make_request(http::verb::get, "/api/pow/status");
    forged.set(http::field::cookie, "pow_session=" + std::string(64, 'A'));
    EXPECT_EQ(json::parse(handler->handle_status(forged, "198.51.100.4").body()).as_object().at("passed").as_bool(),
              false);
}

TEST_F(GateHandlerTest, LogoutWithoutCookieStillClears) {
    auto res = handler->handle_logout(make_request(http::verb::post, "/api/pow/logout"), "198.51.100.4");
    EXPECT_EQ(res.result(), http::status::no_content);
    EXPECT_NE(std::string(res[http::field::set_cookie]).find("Max-Age=0"), std::string::npos);
}

TEST_F(GateHandlerTest, MalformedSubmissionsAreBadRequest) {
    std::vector<std::string> bodies = {
        "",
        "not json",
        "[]",
        "{\"nonceU32\": 1}",
        "{\"challengeId\": 42, \"nonceU32\": 1}",
        "{\"challengeId\": \"not-a-uuid\", \"nonceU32\": 1}",
        "{\"challengeId\": \"0123abcd-4567-4def-89ab-0123456789ab\"}",
        "{\"challengeId\": \"0123abcd-4567-4def-89ab-0123456789ab\", \"nonceU32\": -1}",
        "{\"challengeId\": \"0123abcd-4567-4def-89ab-0123456789ab\", \"nonceU32\": 4294967296}",
        "{\"challengeId\": \"0123abcd-4567-4def-89ab-0123456789ab\", \"nonceU32\": \"7\"}",
    };

    for (const auto& body : bodies) {
        auto req = make_request(http::verb::post, "/api/pow/submit");
        req.body() = body;
        req.prepare_payload();
        EXPECT_EQ(handler->handle_submit(req, "198.51.100.4").result(), http::status::bad_request) << body;
    }
}

TEST_F(GateHandlerTest, LegacyNonceFieldAccepted) {
    json::object challenge = fetch_challenge();
    auto req = make_request(http::verb::post, "/api/pow/submit");
    json::object body;
    body["challengeId"] = challenge.at("powChallengeId");
    body["nonce"] = solve(challenge);
    req.body() = json::serialize(body);
    req.prepare_payload();

    EXPECT_EQ(handler->handle_submit(req, "198.51.100.4").result(), http::status::no_content);
}

TEST_F(GateHandlerTest, ReplayAndUnknownAreConflict) {
    json::object challenge = fetch_challenge();
    std::string id(challenge.at("powChallengeId").as_string());
    uint32_t nonce = solve(challenge);

    EXPECT_EQ(submit(id, nonce).result(), http::status::no_content);
    EXPECT_EQ(submit(id, nonce).result(), http::status::conflict);
    EXPECT_EQ(submit("0123abcd-4567-4def-89ab-0123456789ab", 0).result(), http::status::conflict);
}

TEST_F(GateHandlerTest, ChallengeRateLimitHeaders) {
    for (int i = 0; i < 3; ++i) fetch_challenge();

    auto res = handler->handle_challenge(make_request(http::verb::get, "/api/pow/challenge"), "198.51.100.4");
    EXPECT_EQ(res.result(), http::status::too_many_requests);
    int retry_after = std::stoi(std::string(res[http::field::retry_after]));
    EXPECT_GE(retry_after, 1);
    EXPECT_LE(retry_after, 60);
    EXPECT_EQ(std::string(res["X-RateLimit-Limit"]), "3");
    EXPECT_EQ(std::string(res["X-RateLimit-Remaining"]), "0");

    // Another User-Agent is counted separately.
    auto other = handler->handle_challenge(make_request(http::verb::get, "/api/pow/challenge", "Other/2.0"),
                                           "198.51.100.4");
    EXPECT_EQ(other.result(), http::status::ok);
}

TEST_F(GateHandlerTest, CorsOnlyForAllowedOrigins) {
    auto allowed = make_request(http::verb::get, "/api/pow/challenge");
    allowed.set(http::field::origin, "https://app.example.com");
    auto res = handler->handle_challenge(allowed, "198.51.100.4");
    EXPECT_EQ(std::string(res[http::field::access_control_allow_origin]), "https://app.example.com");
    EXPECT_EQ(std::string(res[http::field::access_control_allow_credentials]), "true");

    auto denied = make_request(http::verb::options, "/api/pow/submit");
    denied.set(http::field::origin, "https://evil.example.net");
    auto pre = handler->handle_preflight(denied);
    EXPECT_EQ(pre.result(), http::status::no_content);
    EXPECT_EQ(pre.find(http::field::access_control_allow_origin), pre.end());
}

TEST_F(GateHandlerTest, SecurityHeadersPresent) {
    auto res = handler->handle_status(make_request(http::verb::get, "/api/pow/status"), "198.51.100.4");
    EXPECT_EQ(std::string(res["X-Content-Type-Options"]), "nosniff");
    EXPECT_EQ(std::string(res[http::field::cache_control]), "no-store");
}

TEST_F(GateHandlerTest, UpperCaseChallengeIdIsAccepted) {
    json::object challenge = fetch_challenge();
    std::string id(challenge.at("powChallengeId").as_string());
    std::transform(id.begin(), id.end(), id.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    EXPECT_EQ(submit(id, solve(challenge)).result(), http::status::no_content);
    EXPECT_EQ(challenges.size(), 0u);
}

TEST_F(GateHandlerTest, GuardRejectsWithoutSession) {
    auto req = make_request(http::verb::get, "/protected/dashboard");
    auto rejection = handler->require_session(req, "198.51.100.4");
    ASSERT_TRUE(rejection.has_value());
    EXPECT_EQ(rejection->result(), http::status::unauthorized);
    EXPECT_EQ(std::string((*rejection)["X-PoW-Required"]), "true");

    req.set(http::field::cookie, "pow_session=" + std::string(64, 'A'));
    rejection = handler->require_session(req, "198.51.100.4");
    ASSERT_TRUE(rejection.has_value());
    EXPECT_EQ(rejection->result(), http::status::unauthorized);
}

TEST_F(GateHandlerTest, GuardRequiresUserAgent) {
    auto rejection = handler->require_session(make_request(http::verb::get, "/protected/", ""), "198.51.100.4");
    ASSERT_TRUE(rejection.has_value());
    EXPECT_EQ(rejection->result(), http::status::bad_request);
}

TEST_F(GateHandlerTest, GuardPassesWithValidSession) {
    json::object challenge = fetch_challenge();
    auto submitted = submit(std::string(challenge.at("powChallengeId").as_string()), solve(challenge));
    ASSERT_EQ(submitted.result(), http::status::no_content);
    std::string token = cookie_value(submitted);

    auto req = make_request(http::verb::get, "/protected/dashboard");
    req.set(http::field::cookie, "pow_session=" + token);
    EXPECT_FALSE(handler->require_session(req, "198.51.100.4").has_value());

    auto res = handler->handle_protected(req);
    EXPECT_EQ(res.result(), http::status::no_content);
    EXPECT_EQ(std::string(res["X-PoW-Session"]), "valid");

    // Bound to the browser that solved the puzzle.
    auto other = make_request(http::verb::get, "/protected/dashboard", "curl/8.0");
    other.set(http::field::cookie, "pow_session=" + token);
    auto rejection = handler->require_session(other, "198.51.100.4");
    ASSERT_TRUE(rejection.has_value());
    EXPECT_EQ(rejection->result(), http::status::unauthorized);
}

namespace {

class UnreachableSessionStore : public SessionStore {
public:
    Session create(const std::string&, const std::string&, int64_t, int64_t) override {
        throw StorageUnavailable("session store down");
    }
    bool is_valid(const std::string&, const std::string&, int64_t) override {
        throw StorageUnavailable("session store down");
    }
    void invalidate(const std::string&) override {
        throw StorageUnavailable("session store down");
    }
    std::size_t purge_expired_sessions(int64_t) override {
        throw StorageUnavailable("session store down");
    }
};

}

TEST_F(GateHandlerTest, GuardFailsClosedOnStoreFault) {
    UnreachableSessionStore down;
    GateService broken(challenges, down, *limiter, GatePolicy::from_config(config));
    GateHandler broken_handler(config, broken, *tokens);

    auto req = make_request(http::verb::get, "/protected/dashboard");
    req.set(http::field::cookie, "pow_session=" + tokens->sign(RandomSource::generate_id()));

    auto rejection = broken_handler.require_session(req, "198.51.100.4");
    ASSERT_TRUE(rejection.has_value());
    EXPECT_EQ(rejection->result(), http::status::service_unavailable);

    // The status endpoint stays fail-closed instead of erroring.
    auto status = broken_handler.handle_status(req, "198.51.100.4");
    EXPECT_EQ(json::parse(status.body()).as_object().at("passed").as_bool(), false);
}
