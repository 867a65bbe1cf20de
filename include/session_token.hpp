#pragma once

#include <optional>
#include <string>

namespace powgate {

// Opaque cookie value carrying a session id: base64(uuid bytes || HMAC-SHA256(secret, uuid bytes)).
// Forged or altered tokens are rejected before any store lookup.
class SessionToken {
public:
    explicit SessionToken(std::string secret);

    std::string sign(const std::string& session_id) const;

    // Returns the session id for a well-formed, correctly signed token.
    std::optional<std::string> verify(const std::string& token) const;

private:
    std::string secret_;
};

}
