#include "handlers/gate_handler.hpp"
#include "client_identity.hpp"
#include "crypto_utils.hpp"
#include "input_validator.hpp"
#include "security_logger.hpp"
#include <algorithm>
#include <cctype>
#include <ctime>
#include <stdexcept>

namespace powgate {

namespace {

const char* const NO_USER_AGENT = "User-Agent header required";

}

http::response<http::string_body> GateHandler::error_response(http::status status, const std::string& message,
                                                              const http::request<http::string_body>& req) {
    json::object error;
    error["error"] = message;

    http::response<http::string_body> res{status, req.version()};
    res.set(http::field::content_type, "application/json");
    res.body() = json::serialize(error);
    res.prepare_payload();

    add_security_headers(res);
    add_cors_headers(res, req);
    return res;
}

http::response<http::string_body> GateHandler::handle_rate_limited(const RateLimitResult& res_info,
                                                                   const http::request<http::string_body>& req) {
    long long retry_after_sec = (res_info.reset_after_ms + 999) / 1000;
    if (retry_after_sec < 1) retry_after_sec = 1;

    json::object response;
    response["error"] = "Rate limit exceeded";
    response["retry_after"] = retry_after_sec;
    response["limit"] = res_info.limit;
    
    http::response<http::string_body> res{http::status::too_many_requests, req.version()};
    res.set(http::field::content_type, "application/json");
    res.set(http::field::retry_after, std::to_string(retry_after_sec));
    
    res.set("X-RateLimit-Limit", std::to_string(res_info.limit));
    res.set("X-RateLimit-Remaining", "0");
    res.set("X-RateLimit-Reset", std::to_string(std::time(nullptr) + retry_after_sec));
    
    res.body() = json::serialize(response);
    res.prepare_payload();
    
    add_security_headers(res);
    add_cors_headers(res, req);
    
    return res;
}

http::response<http::string_body> GateHandler::status_response(GateStatus status, const RateLimitResult& rate,
                                                               const http::request<http::string_body>& req) {
    switch (status) {
        case GateStatus::RateLimited:
            return handle_rate_limited(rate, req);
        case GateStatus::InvalidNonce:
            return error_response(http::status::conflict, "Invalid proof-of-work", req);
        case GateStatus::ExpiredChallenge:
            return error_response(http::status::gone, "Challenge expired", req);
        case GateStatus::TransientFailure:
            return error_response(http::status::service_unavailable, "Temporarily unavailable", req);
        case GateStatus::Ok:
        default:
            return error_response(http::status::internal_server_error, "Unexpected gate state", req);
    }
}

std::string GateHandler::session_from_cookie(const http::request<http::string_body>& req) {
    auto cookie = extract_cookie(req, config_.session_cookie_name);
    if (!cookie || cookie->empty()) return "";

    try {
        auto session_id = tokens_.verify(*cookie);
        return session_id ? *session_id : "";
    } catch (const std::runtime_error& e) {
        SecurityLogger::log(SecurityLogger::Level::ERROR, SecurityLogger::EventType::STORAGE_FAILURE,
                            "internal", std::string("Session token verification failed: ") + e.what());
        return "";
    }
}

http::response<http::string_body> GateHandler::handle_challenge(const http::request<http::string_body>& req,
                                                                const std::string& remote_addr) {
    auto identity = extract_client_identity(req, remote_addr, config_.trust_forwarded_for);
    if (!identity) {
        SecurityLogger::log(SecurityLogger::Level::WARNING, SecurityLogger::EventType::INVALID_INPUT,
                            remote_addr, "Challenge request without User-Agent");
        return error_response(http::status::bad_request, NO_USER_AGENT, req);
    }

    IssueOutcome outcome = gate_.issue_challenge(identity->weak_identity, identity->client_address, now_ms());
    if (outcome.status != GateStatus::Ok) {
        return status_response(outcome.status, outcome.rate, req);
    }

    const Challenge& challenge = outcome.challenge;
    json::object response;
    response["powChallengeId"] = challenge.id;
    response["powChallengeB64"] = crypto::base64_encode(challenge.payload.data(), challenge.payload.size());
    response["powDifficultyBits"] = challenge.difficulty_bits;
    response["powExpiresAtMs"] = challenge.expires_at_ms;
    
    http::response<http::string_body> res{http::status::ok, req.version()};
    res.set(http::field::content_type, "application/json");
    res.set("X-RateLimit-Limit", std::to_string(outcome.rate.limit));
    long long remaining = outcome.rate.limit - outcome.rate.current;
    res.set("X-RateLimit-Remaining", std::to_string(remaining > 0 ? remaining : 0));
    res.body() = json::serialize(response);
    res.prepare_payload();
    
    add_security_headers(res);
    add_cors_headers(res, req);
    
    return res;
}

http::response<http::string_body> GateHandler::handle_submit(const http::request<http::string_body>& req,
                                                             const std::string& remote_addr) {
    auto identity = extract_client_identity(req, remote_addr, config_.trust_forwarded_for);
    if (!identity) {
        SecurityLogger::log(SecurityLogger::Level::WARNING, SecurityLogger::EventType::INVALID_INPUT,
                            remote_addr, "Submission without User-Agent");
        return error_response(http::status::bad_request, NO_USER_AGENT, req);
    }

    if (!InputValidator::is_within_size_limit(req.body().size(), config_.max_message_size)) {
        return error_response(http::status::payload_too_large, "Payload too large", req);
    }

    SubmitRequest submit;
    try {
        auto json_val = InputValidator::safe_parse_json(req.body(), config_.max_json_depth);
        if (!json_val.is_object()) throw std::runtime_error("Not an object");
        const auto& obj = json_val.as_object();

        auto id_it = obj.find("challengeId");
        if (id_it == obj.end() || !id_it->value().is_string()) {
            throw std::runtime_error("challengeId missing");
        }
        submit.challenge_id = std::string(id_it->value().as_string());
        if (!InputValidator::is_valid_uuid(submit.challenge_id)) {
            throw std::runtime_error("challengeId malformed");
        }
        // Stores key challenges by the lower-case form issued.
        std::transform(submit.challenge_id.begin(), submit.challenge_id.end(), submit.challenge_id.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

        auto nonce_it = obj.find("nonceU32");
        if (nonce_it == obj.end()) nonce_it = obj.find("nonce");
        if (nonce_it == obj.end()) throw std::runtime_error("nonce missing");
        auto nonce = InputValidator::as_nonce(nonce_it->value());
        if (!nonce) throw std::runtime_error("nonce out of range");
        submit.nonce = *nonce;

        submit.elapsed_ms = InputValidator::as_telemetry(obj, "elapsedMs");
        submit.attempt_count = InputValidator::as_telemetry(obj, "totalHashes");
        if (!submit.attempt_count) {
            submit.attempt_count = InputValidator::as_telemetry(obj, "attemptCount");
        }
    } catch (const std::exception& e) {
        SecurityLogger::log(SecurityLogger::Level::WARNING, SecurityLogger::EventType::INVALID_INPUT,
                            identity->client_address, std::string("Malformed submission: ") + e.what());
        return error_response(http::status::bad_request, "Malformed submission", req);
    }

    SubmitOutcome outcome = gate_.submit_solution(submit, identity->weak_identity, now_ms(),
                                                  identity->client_address);
    if (outcome.status != GateStatus::Ok) {
        return status_response(outcome.status, outcome.rate, req);
    }

    std::string token;
    try {
        token = tokens_.sign(outcome.session.id);
    } catch (const std::exception& e) {
        SecurityLogger::log(SecurityLogger::Level::ERROR, SecurityLogger::EventType::STORAGE_FAILURE,
                            identity->client_address, std::string("Session token signing failed: ") + e.what());
        return error_response(http::status::service_unavailable, "Temporarily unavailable", req);
    }

    http::response<http::string_body> res{http::status::no_content, req.version()};
    res.set(http::field::set_cookie, build_session_cookie(config_, token));
    res.prepare_payload();

    add_security_headers(res);
    add_cors_headers(res, req);

    return res;
}

http::response<http::string_body> GateHandler::handle_status(const http::request<http::string_body>& req,
                                                             const std::string& remote_addr) {
    bool passed = false;

    auto identity = extract_client_identity(req, remote_addr, config_.trust_forwarded_for);
    std::string session_id = session_from_cookie(req);
    if (identity && !session_id.empty()) {
        passed = gate_.check_status(session_id, identity->weak_identity, now_ms());
    }

    json::object response;
    response["passed"] = passed;

    http::response<http::string_body> res{http::status::ok, req.version()};
    res.set(http::field::content_type, "application/json");
    res.body() = json::serialize(response);
    res.prepare_payload();

    add_security_headers(res);
    add_cors_headers(res, req);

    return res;
}

http::response<http::string_body> GateHandler::handle_logout(const http::request<http::string_body>& req,
                                                             const std::string& remote_addr) {
    std::string session_id = session_from_cookie(req);
    GateStatus status = gate_.logout(session_id);
    if (status != GateStatus::Ok) {
        SecurityLogger::log(SecurityLogger::Level::WARNING, SecurityLogger::EventType::STORAGE_FAILURE,
                            extract_client_ip(req, remote_addr, config_.trust_forwarded_for),
                            "Logout could not reach the session store");
        auto res = error_response(http::status::service_unavailable, "Temporarily unavailable", req);
        res.set(http::field::set_cookie, build_clear_cookie(config_));
        return res;
    }

    http::response<http::string_body> res{http::status::no_content, req.version()};
    res.set(http::field::set_cookie, build_clear_cookie(config_));
    res.prepare_payload();

    add_security_headers(res);
    add_cors_headers(res, req);

    return res;
}

http::response<http::string_body> GateHandler::handle_preflight(const http::request<http::string_body>& req) {
    http::response<http::string_body> res{http::status::no_content, req.version()};
    res.set(http::field::access_control_max_age, "86400");
    res.prepare_payload();

    add_security_headers(res);
    add_cors_headers(res, req);

    return res;
}

std::optional<http::response<http::string_body>> GateHandler::require_session(
        const http::request<http::string_body>& req, const std::string& remote_addr) {
    auto identity = extract_client_identity(req, remote_addr, config_.trust_forwarded_for);
    if (!identity) {
        return error_response(http::status::bad_request, NO_USER_AGENT, req);
    }

    std::string session_id = session_from_cookie(req);
    SessionCheck check = gate_.verify_session(session_id, identity->weak_identity, now_ms());
    if (check == SessionCheck::Valid) {
        return std::nullopt;
    }
    if (check == SessionCheck::Unavailable) {
        return error_response(http::status::service_unavailable, "Temporarily unavailable", req);
    }

    auto res = error_response(http::status::unauthorized, "Proof-of-work required", req);
    res.set("X-PoW-Required", "true");
    return res;
}

http::response<http::string_body> GateHandler::handle_protected(const http::request<http::string_body>& req) {
    http::response<http::string_body> res{http::status::no_content, req.version()};
    res.set("X-PoW-Session", "valid");
    res.prepare_payload();

    add_security_headers(res);
    add_cors_headers(res, req);

    return res;
}

http::response<http::string_body> GateHandler::handle_internal_error(const http::request<http::string_body>& req) {
    return error_response(http::status::internal_server_error, "Internal server error", req);
}

} // namespace powgate
