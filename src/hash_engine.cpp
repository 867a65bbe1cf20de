#include "hash_engine.hpp"
#include <openssl/sha.h>
#include <algorithm>
#include <stdexcept>

namespace powgate {

Digest HashEngine::digest(const Payload& payload, uint32_t nonce) {
    unsigned char input[CHALLENGE_PAYLOAD_SIZE + 4];
    std::copy(payload.begin(), payload.end(), input);
    input[CHALLENGE_PAYLOAD_SIZE + 0] = static_cast<unsigned char>((nonce >> 24) & 0xFF);
    input[CHALLENGE_PAYLOAD_SIZE + 1] = static_cast<unsigned char>((nonce >> 16) & 0xFF);
    input[CHALLENGE_PAYLOAD_SIZE + 2] = static_cast<unsigned char>((nonce >> 8) & 0xFF);
    input[CHALLENGE_PAYLOAD_SIZE + 3] = static_cast<unsigned char>(nonce & 0xFF);

    Digest out{};
    SHA256(input, sizeof(input), out.data());
    return out;
}

bool HashEngine::meets_difficulty(const Digest& digest, int bits) {
    if (!is_valid_difficulty(bits)) {
        throw std::invalid_argument("difficulty bits must be within [1, 32]");
    }

    const int full_bytes = bits / 8;
    const int rem_bits = bits % 8;

    for (int i = 0; i < full_bytes; ++i) {
        if (digest[i] != 0) return false;
    }
    if (rem_bits == 0) return true;

    const uint8_t mask = static_cast<uint8_t>(0xFF << (8 - rem_bits));
    return (digest[full_bytes] & mask) == 0;
}

int HashEngine::leading_zero_bits(const Digest& digest) {
    int zeros = 0;
    for (uint8_t byte : digest) {
        if (byte == 0) {
            zeros += 8;
            continue;
        }
        for (int bit = 7; bit >= 0 && !(byte & (1u << bit)); --bit) {
            ++zeros;
        }
        break;
    }
    return zeros;
}

}
