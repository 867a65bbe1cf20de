#pragma once

#include <array>
#include <chrono>
#include <cstdint>
#include <cstddef>
#include <stdexcept>
#include <string>

namespace powgate {

constexpr std::size_t CHALLENGE_PAYLOAD_SIZE = 32;
constexpr int MIN_DIFFICULTY_BITS = 1;
constexpr int MAX_DIFFICULTY_BITS = 32;

using Payload = std::array<uint8_t, CHALLENGE_PAYLOAD_SIZE>;

// Wall-clock milliseconds since the Unix epoch.
inline int64_t now_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

// A server-issued puzzle. Redeemable once; never mutated after issuance.
struct Challenge {
    std::string id;
    Payload payload{};
    int difficulty_bits = 0;
    int64_t expires_at_ms = 0;
    int64_t issued_at_ms = 0;
    std::string weak_identity;
    std::string client_address; // advisory only, may be empty

    bool is_expired(int64_t now) const { return expires_at_ms <= now; }

    /**
     * Builds a fresh challenge with CSPRNG payload and identifier.
     * @throws std::invalid_argument on difficulty outside [1, 32] or non-positive ttl.
     * @throws std::runtime_error if the CSPRNG fails.
     */
    static Challenge create(int difficulty_bits,
                            const std::string& weak_identity,
                            const std::string& client_address,
                            int64_t ttl_ms,
                            int64_t now);
};

// Post-verification credential bound to the weak identity of the solver.
struct Session {
    std::string id;
    int64_t expires_at_ms = 0;
    int64_t issued_at_ms = 0;
    std::string weak_identity;
    std::string challenge_id; // audit only

    bool is_expired(int64_t now) const { return expires_at_ms <= now; }

    static Session create(const std::string& weak_identity,
                          const std::string& challenge_id,
                          int64_t ttl_ms,
                          int64_t now);
};

// Cryptographically secure identifiers and payloads (OpenSSL RAND_bytes).
class RandomSource {
public:
    static Payload generate_payload();

    // Random (version 4) UUID in canonical lowercase text form.
    static std::string generate_id();

    static uint32_t random_u32();

    static void fill(uint8_t* buffer, std::size_t size);
};

inline bool is_valid_difficulty(int bits) {
    return bits >= MIN_DIFFICULTY_BITS && bits <= MAX_DIFFICULTY_BITS;
}

}
