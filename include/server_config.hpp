#pragma once

#include <string>
#include <cstdint>
#include <stdexcept>
#include <vector>

namespace powgate {

 
// Gate server configuration. Defaults are overridden by POWGATE_* environment
// variables and command-line flags in main.
struct ServerConfig {
    // --- Network & Infrastructure ---
    std::string address = "0.0.0.0";
    uint16_t port = 8080;
    int thread_count = 0;  // 0 defaults to hardware concurrency

    // --- Storage ---
    std::string storage_backend = "memory"; // "memory" or "redis"
    std::string redis_url = "tcp://127.0.0.1:6379";
    int redis_timeout_ms = 500;
    
    // --- Proof-of-Work policy ---
    int difficulty_bits = 23;
    int challenge_ttl_sec = 120;
    int session_ttl_sec = 3600;

    // --- Rate Limiting (fixed windows per weak identity) ---
    int pow_rate_limit = 10;          // challenge issuance per window
    int pow_rate_window_sec = 60;
    int submit_rate_limit = 30;       // submissions per window, 0 disables
    int submit_rate_window_sec = 60;
    int global_rate_limit = 120;      // any request, per blinded IP
    int global_rate_window_sec = 10;
    int rate_window_retention_sec = 3600;

    // --- Housekeeping ---
    int reaper_interval_sec = 300;

    // --- Session cookie ---
    std::string session_cookie_name = "pow_session";
    bool cookie_secure = true;
    std::string cookie_same_site = "Lax"; // Strict, Lax or None
    std::string session_secret = "";      // HMAC key for session tokens, MUST be set via ENV

    // --- Protected routes ---
    std::string protected_prefix = "/protected/"; // requests under it need a live session, empty disables

    // --- Client identification ---
    bool trust_forwarded_for = true;      // take the first X-Forwarded-For entry as client address

    // --- Identity & Secrets ---
    std::string admin_token = ""; // Used for privileged metrics access
    
    // --- Cross-Origin Resource Sharing (CORS) ---
    std::vector<std::string> allowed_origins = {};
    
    // --- Protocol Constraints ---
    size_t max_message_size = 16 * 1024;
    size_t max_json_depth = 8;
    size_t min_session_secret_length = 32;
};

// Rejects settings the request paths cannot run with.
// @throws std::invalid_argument naming the offending setting.
inline void validate_config(const ServerConfig& config) {
    auto require_positive = [](int value, const char* name) {
        if (value <= 0) {
            throw std::invalid_argument(std::string(name) + " must be positive, got " + std::to_string(value));
        }
    };
    auto require_non_negative = [](int value, const char* name) {
        if (value < 0) {
            throw std::invalid_argument(std::string(name) + " must not be negative, got " + std::to_string(value));
        }
    };

    if (config.difficulty_bits < 1 || config.difficulty_bits > 32) {
        throw std::invalid_argument("difficulty_bits must be within [1, 32], got " +
                                    std::to_string(config.difficulty_bits));
    }
    require_positive(config.challenge_ttl_sec, "challenge_ttl_sec");
    require_positive(config.session_ttl_sec, "session_ttl_sec");
    require_non_negative(config.pow_rate_limit, "pow_rate_limit");
    require_positive(config.pow_rate_window_sec, "pow_rate_window_sec");
    require_non_negative(config.submit_rate_limit, "submit_rate_limit");
    require_positive(config.submit_rate_window_sec, "submit_rate_window_sec");
    require_non_negative(config.global_rate_limit, "global_rate_limit");
    require_positive(config.global_rate_window_sec, "global_rate_window_sec");
    require_positive(config.rate_window_retention_sec, "rate_window_retention_sec");
    require_positive(config.reaper_interval_sec, "reaper_interval_sec");
    require_positive(config.redis_timeout_ms, "redis_timeout_ms");
    if (!config.protected_prefix.empty() && config.protected_prefix.front() != '/') {
        throw std::invalid_argument("protected_prefix must start with '/'");
    }
}

}
