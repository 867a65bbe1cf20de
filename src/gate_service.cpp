#include "gate_service.hpp"
#include "hash_engine.hpp"
#include "metrics.hpp"
#include "security_logger.hpp"
#include "server_config.hpp"
#include <stdexcept>

namespace powgate {

namespace {

void record_storage_failure(const std::string& remote_addr, const std::string& operation, const std::exception& e) {
    MetricsRegistry::instance().increment_counter("powgate_storage_errors_total");
    SecurityLogger::log(SecurityLogger::Level::ERROR, SecurityLogger::EventType::STORAGE_FAILURE,
                        remote_addr, operation + " failed: " + e.what());
}

}

const char* to_string(GateStatus status) {
    switch (status) {
        case GateStatus::Ok: return "ok";
        case GateStatus::RateLimited: return "rate_limited";
        case GateStatus::InvalidNonce: return "invalid_nonce";
        case GateStatus::ExpiredChallenge: return "expired";
        case GateStatus::TransientFailure: return "transient_failure";
        default: return "unknown";
    }
}

GatePolicy GatePolicy::from_config(const ServerConfig& config) {
    GatePolicy policy;
    policy.difficulty_bits = config.difficulty_bits;
    policy.challenge_ttl_ms = static_cast<int64_t>(config.challenge_ttl_sec) * 1000;
    policy.session_ttl_ms = static_cast<int64_t>(config.session_ttl_sec) * 1000;
    policy.issue_rate_limit = config.pow_rate_limit;
    policy.issue_rate_window_ms = static_cast<int64_t>(config.pow_rate_window_sec) * 1000;
    policy.submit_rate_limit = config.submit_rate_limit;
    policy.submit_rate_window_ms = static_cast<int64_t>(config.submit_rate_window_sec) * 1000;
    policy.rate_window_retention_ms = static_cast<int64_t>(config.rate_window_retention_sec) * 1000;
    return policy;
}

GateService::GateService(ChallengeStore& challenges,
                         SessionStore& sessions,
                         RateLimiter& rate_limiter,
                         GatePolicy policy)
    : challenges_(challenges)
    , sessions_(sessions)
    , rate_limiter_(rate_limiter)
    , policy_(policy)
{
    if (!is_valid_difficulty(policy_.difficulty_bits)) {
        throw std::invalid_argument("difficulty_bits must be within [1, 32]");
    }
    if (policy_.challenge_ttl_ms <= 0 || policy_.session_ttl_ms <= 0) {
        throw std::invalid_argument("challenge and session ttl must be positive");
    }
    if (policy_.issue_rate_window_ms <= 0 || policy_.submit_rate_window_ms <= 0) {
        throw std::invalid_argument("rate limit windows must be positive");
    }
}

IssueOutcome GateService::issue_challenge(const std::string& weak_identity,
                                          const std::string& client_address,
                                          int64_t now) {
    IssueOutcome outcome;
    auto& metrics = MetricsRegistry::instance();

    try {
        outcome.rate = rate_limiter_.check_and_increment("issue:" + weak_identity, now,
                                                         policy_.issue_rate_limit,
                                                         policy_.issue_rate_window_ms);
        if (!outcome.rate.allowed) {
            outcome.status = GateStatus::RateLimited;
            metrics.increment_counter("powgate_rate_limited_total");
            SecurityLogger::log(SecurityLogger::Level::WARNING, SecurityLogger::EventType::RATE_LIMIT_HIT,
                                client_address, "Challenge issuance throttled (count=" +
                                std::to_string(outcome.rate.current) + ", limit=" +
                                std::to_string(outcome.rate.limit) + ")");
            return outcome;
        }

        outcome.challenge = challenges_.issue(policy_.difficulty_bits, weak_identity, client_address,
                                              policy_.challenge_ttl_ms, now);
        outcome.status = GateStatus::Ok;
        metrics.increment_counter("powgate_challenges_issued_total");
        SecurityLogger::log(SecurityLogger::Level::INFO, SecurityLogger::EventType::CHALLENGE_ISSUED,
                            client_address, "challenge_id=" + outcome.challenge.id +
                            " difficulty=" + std::to_string(policy_.difficulty_bits));
    } catch (const StorageUnavailable& e) {
        record_storage_failure(client_address, "Challenge issuance", e);
        outcome.status = GateStatus::TransientFailure;
    } catch (const std::runtime_error& e) {
        // CSPRNG exhaustion is surfaced the same way as a storage fault
        record_storage_failure(client_address, "Challenge generation", e);
        outcome.status = GateStatus::TransientFailure;
    }
    return outcome;
}

SubmitOutcome GateService::submit_solution(const SubmitRequest& request,
                                           const std::string& weak_identity,
                                           int64_t now,
                                           const std::string& client_address) {
    SubmitOutcome outcome;
    auto& metrics = MetricsRegistry::instance();

    if (request.elapsed_ms && request.attempt_count) {
        SecurityLogger::log(SecurityLogger::Level::INFO, SecurityLogger::EventType::POW_SUCCESS,
                            client_address, "Submit telemetry (unverified) challenge_id=" + request.challenge_id +
                            " elapsed_ms=" + std::to_string(*request.elapsed_ms) +
                            " attempts=" + std::to_string(*request.attempt_count));
    }

    try {
        if (policy_.submit_rate_limit > 0) {
            outcome.rate = rate_limiter_.check_and_increment("submit:" + weak_identity, now,
                                                             policy_.submit_rate_limit,
                                                             policy_.submit_rate_window_ms);
            if (!outcome.rate.allowed) {
                outcome.status = GateStatus::RateLimited;
                metrics.increment_counter("powgate_rate_limited_total");
                SecurityLogger::log(SecurityLogger::Level::WARNING, SecurityLogger::EventType::RATE_LIMIT_HIT,
                                    client_address, "Solution submission throttled");
                return outcome;
            }
        }

        ConsumeResult consumed = challenges_.consume_if_valid(request.challenge_id, now);

        if (consumed.status == ConsumeStatus::NotFound) {
            outcome.status = GateStatus::InvalidNonce;
            metrics.increment_counter("powgate_solutions_rejected_total");
            SecurityLogger::log(SecurityLogger::Level::WARNING, SecurityLogger::EventType::REPLAY_ATTEMPT,
                                client_address, "Challenge unknown or already consumed: " + request.challenge_id);
            return outcome;
        }

        if (consumed.status == ConsumeStatus::Expired) {
            outcome.status = GateStatus::ExpiredChallenge;
            metrics.increment_counter("powgate_challenges_expired_total");
            SecurityLogger::log(SecurityLogger::Level::WARNING, SecurityLogger::EventType::CHALLENGE_EXPIRED,
                                client_address, "Challenge expired before submission: " + request.challenge_id);
            return outcome;
        }

        const Challenge& challenge = *consumed.challenge;

        if (!HashEngine::verify(challenge.payload, request.nonce, challenge.difficulty_bits)) {
            outcome.status = GateStatus::InvalidNonce;
            metrics.increment_counter("powgate_solutions_rejected_total");
            SecurityLogger::log(SecurityLogger::Level::WARNING, SecurityLogger::EventType::POW_FAILURE,
                                client_address, "Nonce " + std::to_string(request.nonce) +
                                " does not meet difficulty " + std::to_string(challenge.difficulty_bits) +
                                " for challenge " + challenge.id);
            return outcome;
        }

        if (challenge.weak_identity != weak_identity) {
            SecurityLogger::log(SecurityLogger::Level::WARNING, SecurityLogger::EventType::SESSION_MISMATCH,
                                client_address, "Solution submitted from a different fingerprint than the issuer saw");
        }

        outcome.session = sessions_.create(weak_identity, challenge.id, policy_.session_ttl_ms, now);
        outcome.status = GateStatus::Ok;
        metrics.increment_counter("powgate_solutions_accepted_total");
        SecurityLogger::log(SecurityLogger::Level::INFO, SecurityLogger::EventType::POW_SUCCESS,
                            client_address, "challenge_id=" + challenge.id + " session_id=" + outcome.session.id);
    } catch (const StorageUnavailable& e) {
        record_storage_failure(client_address, "Solution submission", e);
        outcome.status = GateStatus::TransientFailure;
    } catch (const std::runtime_error& e) {
        record_storage_failure(client_address, "Session generation", e);
        outcome.status = GateStatus::TransientFailure;
    }
    return outcome;
}

SessionCheck GateService::verify_session(const std::string& session_id,
                                         const std::string& weak_identity,
                                         int64_t now) noexcept {
    if (session_id.empty() || weak_identity.empty()) return SessionCheck::Invalid;

    try {
        return sessions_.is_valid(session_id, weak_identity, now) ? SessionCheck::Valid : SessionCheck::Invalid;
    } catch (const std::exception& e) {
        record_storage_failure("internal", "Session lookup", e);
        return SessionCheck::Unavailable;
    }
}

bool GateService::check_status(const std::string& session_id,
                               const std::string& weak_identity,
                               int64_t now) noexcept {
    return verify_session(session_id, weak_identity, now) == SessionCheck::Valid;
}

GateStatus GateService::logout(const std::string& session_id) {
    if (session_id.empty()) return GateStatus::Ok;

    try {
        sessions_.invalidate(session_id);
        MetricsRegistry::instance().increment_counter("powgate_sessions_revoked_total");
        SecurityLogger::log(SecurityLogger::Level::INFO, SecurityLogger::EventType::SESSION_REVOKED,
                            "internal", "session_id=" + session_id);
        return GateStatus::Ok;
    } catch (const StorageUnavailable& e) {
        record_storage_failure("internal", "Session invalidation", e);
        return GateStatus::TransientFailure;
    }
}

ReapStats GateService::reap(int64_t now) {
    ReapStats stats;
    stats.challenges = challenges_.purge_expired_challenges(now);
    stats.sessions = sessions_.purge_expired_sessions(now);
    stats.rate_windows = rate_limiter_.purge_stale(now, policy_.rate_window_retention_ms);

    auto& metrics = MetricsRegistry::instance();
    metrics.increment_counter("powgate_reaped_challenges_total", static_cast<double>(stats.challenges));
    metrics.increment_counter("powgate_reaped_sessions_total", static_cast<double>(stats.sessions));
    metrics.increment_counter("powgate_reaped_rate_windows_total", static_cast<double>(stats.rate_windows));
    return stats;
}

}
