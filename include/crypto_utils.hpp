#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace powgate {
namespace crypto {

using Sha256Digest = std::array<uint8_t, 32>;
using UuidBytes = std::array<uint8_t, 16>;

Sha256Digest sha256(const void* data, std::size_t len);

// Lowercase hex SHA-256 of a string.
std::string sha256_hex(const std::string& input);

Sha256Digest hmac_sha256(const std::string& key, const uint8_t* data, std::size_t len);

// Constant-time comparison (CRYPTO_memcmp); differing lengths compare unequal.
bool constant_time_equal(const std::string& a, const std::string& b);
bool constant_time_equal(const uint8_t* a, const uint8_t* b, std::size_t len);

std::string to_hex(const uint8_t* data, std::size_t len);
std::optional<std::vector<uint8_t>> from_hex(const std::string& hex);

std::string base64_encode(const uint8_t* data, std::size_t len);

// Strict standard-alphabet decoding; rejects bad characters and lengths.
std::optional<std::vector<uint8_t>> base64_decode(const std::string& input);

std::string uuid_from_bytes(const UuidBytes& bytes);
std::optional<UuidBytes> uuid_to_bytes(const std::string& text);

}
}
