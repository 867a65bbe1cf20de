#pragma once

#include <string>
#include <iostream>
#include <cctype>
#include <exception>
#include <chrono>
#include <iomanip>
#include <mutex>
#include <sstream>
#include <openssl/sha.h>
#include <openssl/rand.h>

namespace powgate {

// Logs gate events using blinded client addresses (salted hash).
class SecurityLogger {
public:
    enum class Level {
        INFO,
        WARNING,
        ERROR,
        CRITICAL
    };
    
    enum class EventType {
        CHALLENGE_ISSUED,
        RATE_LIMIT_HIT,
        POW_SUCCESS,
        POW_FAILURE,
        REPLAY_ATTEMPT,
        CHALLENGE_EXPIRED,
        SESSION_MISMATCH,
        SESSION_REVOKED,
        STORAGE_FAILURE,
        INVALID_INPUT,
        REAPER,
        LIFECYCLE
    };
    
    /**
     * Records a gate event with a blinded client address.
     * @param level Severity level of the event.
     * @param event The specific type of event.
     * @param remote_addr The source address (blinded before logging); "internal" and
     *                    "unknown" are written as-is.
     * @param message Optional descriptive message (will be sanitized).
     */
    static void log(Level level, EventType event, const std::string& remote_addr, 
                   const std::string& message = "") {
        std::stringstream ss;
        ss << "[" << timestamp() << " UTC] "
           << "[" << level_to_string(level) << "] "
           << "[" << event_to_string(event) << "] "
           << "ip=" << blind_address(remote_addr);
        
        if (!message.empty()) {
            ss << " msg=\"" << sanitize_log_message(message) << "\"";
        }
        
        // Errors go to stderr, everything else to stdout
        if (level == Level::ERROR || level == Level::CRITICAL) {
            std::cerr << ss.str() << "\n";
        } else {
            std::cout << ss.str() << "\n";
        }
    }

    static std::string level_to_string(Level level) {
        switch (level) {
            case Level::INFO: return "INFO";
            case Level::WARNING: return "WARN";
            case Level::ERROR: return "ERROR";
            case Level::CRITICAL: return "CRIT";
            default: return "UNKNOWN";
        }
    }
    
    static std::string event_to_string(EventType event) {
        switch (event) {
            case EventType::CHALLENGE_ISSUED: return "CHALLENGE_ISSUED";
            case EventType::RATE_LIMIT_HIT: return "RATE_LIMIT";
            case EventType::POW_SUCCESS: return "POW_SUCCESS";
            case EventType::POW_FAILURE: return "POW_FAILURE";
            case EventType::REPLAY_ATTEMPT: return "REPLAY_ATTEMPT";
            case EventType::CHALLENGE_EXPIRED: return "CHALLENGE_EXPIRED";
            case EventType::SESSION_MISMATCH: return "SESSION_MISMATCH";
            case EventType::SESSION_REVOKED: return "SESSION_REVOKED";
            case EventType::STORAGE_FAILURE: return "STORAGE_FAILURE";
            case EventType::INVALID_INPUT: return "INVALID_INPUT";
            case EventType::REAPER: return "REAPER";
            case EventType::LIFECYCLE: return "LIFECYCLE";
            default: return "UNKNOWN_EVENT";
        }
    }

    // Escapes non-printable characters and quotes to ensure log integrity
    static std::string sanitize_log_message(const std::string& msg) {
        std::string result;
        result.reserve(msg.size());
        for (char c : msg) {
            if (c == '"' || c == '\\' || c == '\n' || c == '\r') {
                result += ' ';
            } else if (std::isprint(static_cast<unsigned char>(c))) {
                result += c;
            }
        }
        return result;
    }

    // Salted, truncated SHA-256 of an address. The salt is random and rotated
    // every 6 hours, so old log lines cannot be linked to addresses later.
    static std::string blind_address(const std::string& remote_addr) {
        if (remote_addr.empty() || remote_addr == "unknown" || remote_addr == "internal") {
            return remote_addr.empty() ? "unknown" : remote_addr;
        }

        std::string salt = current_salt();
        std::string data = remote_addr + salt;
        unsigned char hash[SHA256_DIGEST_LENGTH];
        SHA256(reinterpret_cast<const unsigned char*>(data.c_str()), data.size(), hash);

        std::stringstream hs;
        for (int i = 0; i < 6; i++) hs << std::hex << std::setw(2) << std::setfill('0') << (int)hash[i];
        return "anon_" + hs.str();
    }

private:
    static std::string timestamp() {
        auto now = std::chrono::system_clock::now();
        auto time_t = std::chrono::system_clock::to_time_t(now);
        struct tm gmt;
        gmtime_r(&time_t, &gmt);

        std::stringstream ss;
        ss << std::put_time(&gmt, "%Y-%m-%d %H:%M:%S");
        return ss.str();
    }

    static std::string current_salt() {
        static std::mutex salt_mutex;
        static std::string log_salt;
        static std::chrono::steady_clock::time_point last_rotation;

        std::lock_guard<std::mutex> lock(salt_mutex);
        auto now_steady = std::chrono::steady_clock::now();
        if (log_salt.empty() || std::chrono::duration_cast<std::chrono::hours>(now_steady - last_rotation).count() >= 6) {
            unsigned char b[32];
            if (RAND_bytes(b, 32) != 1) {
                std::cerr << "[CRITICAL] CSPRNG failure in SecurityLogger. Terminating instance for safety.\n";
                std::terminate();
            }
            std::stringstream salt_ss;
            for (int i = 0; i < 32; i++) salt_ss << std::hex << std::setw(2) << std::setfill('0') << (int)b[i];
            log_salt = salt_ss.str();
            last_rotation = now_steady;

            std::cout << "[" << timestamp() << " UTC] [INFO] [LIFECYCLE] msg=\"Address blinding salt rotated\"\n";
        }
        return log_salt;
    }
};

}
