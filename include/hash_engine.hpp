#pragma once

#include <array>
#include <cstdint>
#include "challenge.hpp"

namespace powgate {

using Digest = std::array<uint8_t, 32>;

// Proof-of-Work hashing rule shared by server verification and client search.
//
//   digest = SHA-256( payload[32] || nonce as 4 big-endian bytes )
//
// A digest meets difficulty `bits` when its leading `bits` bits are zero.
class HashEngine {
public:
    static Digest digest(const Payload& payload, uint32_t nonce);

    /**
     * Tests a digest against a leading-zero-bit threshold.
     * @param bits Required leading zero bits, within [1, 32].
     * @throws std::invalid_argument when bits is out of range.
     */
    static bool meets_difficulty(const Digest& digest, int bits);

    // Number of leading zero bits (0..256).
    static int leading_zero_bits(const Digest& digest);

    static bool verify(const Payload& payload, uint32_t nonce, int bits) {
        return meets_difficulty(digest(payload, nonce), bits);
    }
};

}
