#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "challenge.hpp"
#include "gate_storage.hpp"
#include "rate_limiter.hpp"

namespace powgate {

struct ServerConfig;

enum class GateStatus {
    Ok,
    RateLimited,
    InvalidNonce,
    ExpiredChallenge,
    TransientFailure
};

const char* to_string(GateStatus status);

// Result of a session lookup that keeps store faults distinct from absence.
enum class SessionCheck {
    Valid,
    Invalid,
    Unavailable
};

// Protocol constants applied by the gate. Configuration, not protocol logic.
struct GatePolicy {
    int difficulty_bits = 23;
    int64_t challenge_ttl_ms = 120000;
    int64_t session_ttl_ms = 3600000;
    long long issue_rate_limit = 10;
    int64_t issue_rate_window_ms = 60000;
    long long submit_rate_limit = 30; // 0 disables submit throttling
    int64_t submit_rate_window_ms = 60000;
    int64_t rate_window_retention_ms = 3600000;

    static GatePolicy from_config(const ServerConfig& config);
};

struct IssueOutcome {
    GateStatus status = GateStatus::TransientFailure;
    Challenge challenge;          // valid when status == Ok
    RateLimitResult rate{};       // populated when the limiter was consulted
};

struct SubmitRequest {
    std::string challenge_id;
    uint32_t nonce = 0;
    // Client telemetry, logged only
    std::optional<int64_t> elapsed_ms;
    std::optional<int64_t> attempt_count;
};

struct SubmitOutcome {
    GateStatus status = GateStatus::TransientFailure;
    Session session;              // valid when status == Ok
    RateLimitResult rate{};
};

struct ReapStats {
    std::size_t challenges = 0;
    std::size_t sessions = 0;
    std::size_t rate_windows = 0;
};

// Challenge/response state machine. The only component that touches more than
// one store; transports talk to the gate exclusively through this class.
//
//   Issued --consume+verify--> Consumed (session created)
//   Issued --consume, bad nonce--> Discarded
//   Issued --expiry / reaper--> Expired
class GateService {
public:
    GateService(ChallengeStore& challenges,
                SessionStore& sessions,
                RateLimiter& rate_limiter,
                GatePolicy policy);

    GateService(const GateService&) = delete;
    GateService& operator=(const GateService&) = delete;

    // Throttles by weak identity, then issues a challenge with the policy difficulty and ttl.
    IssueOutcome issue_challenge(const std::string& weak_identity,
                                 const std::string& client_address,
                                 int64_t now);

    /**
     * Redeems a challenge. The challenge is consumed before the nonce is checked, so a
     * wrong nonce burns it; unknown and already-consumed ids both report InvalidNonce.
     */
    SubmitOutcome submit_solution(const SubmitRequest& request,
                                  const std::string& weak_identity,
                                  int64_t now,
                                  const std::string& client_address = "unknown");

    // Used by the protected-route guard: Unavailable on a store fault.
    SessionCheck verify_session(const std::string& session_id,
                                const std::string& weak_identity,
                                int64_t now) noexcept;

    // Fail-closed: storage faults and absence both yield false.
    bool check_status(const std::string& session_id,
                      const std::string& weak_identity,
                      int64_t now) noexcept;

    GateStatus logout(const std::string& session_id);

    // One garbage-collection pass over all stores.
    // @throws StorageUnavailable if a backend fails mid-pass.
    ReapStats reap(int64_t now);

    const GatePolicy& policy() const { return policy_; }

private:
    ChallengeStore& challenges_;
    SessionStore& sessions_;
    RateLimiter& rate_limiter_;
    GatePolicy policy_;
};

}
