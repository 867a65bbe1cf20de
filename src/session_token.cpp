#include "session_token.hpp"
#include "crypto_utils.hpp"

#include <algorithm>
#include <stdexcept>
#include <vector>

namespace powgate {

namespace {
constexpr std::size_t UUID_LEN = 16;
constexpr std::size_t MAC_LEN = 32;
constexpr std::size_t TOKEN_LEN = UUID_LEN + MAC_LEN;
}

SessionToken::SessionToken(std::string secret) : secret_(std::move(secret)) {
    if (secret_.empty()) {
        throw std::invalid_argument("session secret must not be empty");
    }
}

std::string SessionToken::sign(const std::string& session_id) const {
    auto uuid = crypto::uuid_to_bytes(session_id);
    if (!uuid) {
        throw std::invalid_argument("session id is not a UUID");
    }

    crypto::Sha256Digest mac = crypto::hmac_sha256(secret_, uuid->data(), uuid->size());

    std::vector<uint8_t> raw;
    raw.reserve(TOKEN_LEN);
    raw.insert(raw.end(), uuid->begin(), uuid->end());
    raw.insert(raw.end(), mac.begin(), mac.end());
    return crypto::base64_encode(raw.data(), raw.size());
}

std::optional<std::string> SessionToken::verify(const std::string& token) const {
    // 48 raw bytes encode to exactly 64 base64 characters
    if (token.size() != 64) return std::nullopt;

    auto raw = crypto::base64_decode(token);
    if (!raw || raw->size() != TOKEN_LEN) return std::nullopt;

    crypto::Sha256Digest expected = crypto::hmac_sha256(secret_, raw->data(), UUID_LEN);
    if (!crypto::constant_time_equal(expected.data(), raw->data() + UUID_LEN, MAC_LEN)) {
        return std::nullopt;
    }

    crypto::UuidBytes uuid{};
    std::copy(raw->begin(), raw->begin() + UUID_LEN, uuid.begin());
    return crypto::uuid_from_bytes(uuid);
}

}
