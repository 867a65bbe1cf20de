#include "challenge.hpp"
#include "crypto_utils.hpp"
#include <openssl/rand.h>

namespace powgate {

void RandomSource::fill(uint8_t* buffer, std::size_t size) {
    if (RAND_bytes(buffer, static_cast<int>(size)) != 1) {
        throw std::runtime_error("CSPRNG failure: RAND_bytes returned an error");
    }
}

Payload RandomSource::generate_payload() {
    Payload payload{};
    fill(payload.data(), payload.size());
    return payload;
}

std::string RandomSource::generate_id() {
    std::array<uint8_t, 16> raw{};
    fill(raw.data(), raw.size());
    raw[6] = static_cast<uint8_t>((raw[6] & 0x0F) | 0x40); // version 4
    raw[8] = static_cast<uint8_t>((raw[8] & 0x3F) | 0x80); // RFC 4122 variant
    return crypto::uuid_from_bytes(raw);
}

uint32_t RandomSource::random_u32() {
    uint8_t b[4];
    fill(b, sizeof(b));
    return (static_cast<uint32_t>(b[0]) << 24) | (static_cast<uint32_t>(b[1]) << 16) |
           (static_cast<uint32_t>(b[2]) << 8) | static_cast<uint32_t>(b[3]);
}

Challenge Challenge::create(int difficulty_bits,
                            const std::string& weak_identity,
                            const std::string& client_address,
                            int64_t ttl_ms,
                            int64_t now) {
    if (!is_valid_difficulty(difficulty_bits)) {
        throw std::invalid_argument("difficulty_bits must be within [1, 32]");
    }
    if (ttl_ms <= 0) {
        throw std::invalid_argument("challenge ttl must be positive");
    }

    Challenge c;
    c.id = RandomSource::generate_id();
    c.payload = RandomSource::generate_payload();
    c.difficulty_bits = difficulty_bits;
    c.issued_at_ms = now;
    c.expires_at_ms = now + ttl_ms;
    c.weak_identity = weak_identity;
    c.client_address = client_address;
    return c;
}

Session Session::create(const std::string& weak_identity,
                        const std::string& challenge_id,
                        int64_t ttl_ms,
                        int64_t now) {
    if (ttl_ms <= 0) {
        throw std::invalid_argument("session ttl must be positive");
    }

    Session s;
    s.id = RandomSource::generate_id();
    s.issued_at_ms = now;
    s.expires_at_ms = now + ttl_ms;
    s.weak_identity = weak_identity;
    s.challenge_id = challenge_id;
    return s;
}

}
