#include "crypto_utils.hpp"
#include <boost/beast/core/detail/base64.hpp>
#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/sha.h>
#include <algorithm>
#include <iomanip>
#include <stdexcept>
#include <sstream>

namespace powgate {
namespace crypto {

Sha256Digest sha256(const void* data, std::size_t len) {
    Sha256Digest out{};
    SHA256(static_cast<const unsigned char*>(data), len, out.data());
    return out;
}

std::string sha256_hex(const std::string& input) {
    auto digest = sha256(input.data(), input.size());
    return to_hex(digest.data(), digest.size());
}

Sha256Digest hmac_sha256(const std::string& key, const uint8_t* data, std::size_t len) {
    Sha256Digest out{};
    unsigned int out_len = 0;
    if (HMAC(EVP_sha256(), key.data(), static_cast<int>(key.size()), data, len,
             out.data(), &out_len) == nullptr || out_len != out.size()) {
        throw std::runtime_error("HMAC-SHA256 computation failed");
    }
    return out;
}

bool constant_time_equal(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) return false;
    return CRYPTO_memcmp(a.data(), b.data(), a.size()) == 0;
}

bool constant_time_equal(const uint8_t* a, const uint8_t* b, std::size_t len) {
    return CRYPTO_memcmp(a, b, len) == 0;
}

std::string to_hex(const uint8_t* data, std::size_t len) {
    std::stringstream ss;
    for (std::size_t i = 0; i < len; ++i) {
        ss << std::hex << std::setw(2) << std::setfill('0') << (int)data[i];
    }
    return ss.str();
}

std::optional<std::vector<uint8_t>> from_hex(const std::string& hex) {
    if (hex.size() % 2 != 0) return std::nullopt;

    auto nibble = [](char c) -> int {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        return -1;
    };

    std::vector<uint8_t> out;
    out.reserve(hex.size() / 2);
    for (std::size_t i = 0; i < hex.size(); i += 2) {
        int hi = nibble(hex[i]);
        int lo = nibble(hex[i + 1]);
        if (hi < 0 || lo < 0) return std::nullopt;
        out.push_back(static_cast<uint8_t>((hi << 4) | lo));
    }
    return out;
}

std::string base64_encode(const uint8_t* data, std::size_t len) {
    namespace b64 = boost::beast::detail::base64;
    std::string out(b64::encoded_size(len), '\0');
    out.resize(b64::encode(out.data(), data, len));
    return out;
}

std::optional<std::vector<uint8_t>> base64_decode(const std::string& input) {
    namespace b64 = boost::beast::detail::base64;
    if (input.empty() || input.size() % 4 != 0) return std::nullopt;

    std::size_t body = input.size();
    for (int pad = 0; pad < 2 && body > 0 && input[body - 1] == '='; ++pad) {
        --body;
    }

    std::vector<uint8_t> out(b64::decoded_size(input.size()));
    auto result = b64::decode(out.data(), input.data(), body);
    if (result.second != body) return std::nullopt;
    out.resize(result.first);
    return out;
}

std::string uuid_from_bytes(const UuidBytes& bytes) {
    std::string hex = to_hex(bytes.data(), bytes.size());
    return hex.substr(0, 8) + "-" + hex.substr(8, 4) + "-" + hex.substr(12, 4) + "-" +
           hex.substr(16, 4) + "-" + hex.substr(20, 12);
}

std::optional<UuidBytes> uuid_to_bytes(const std::string& text) {
    if (text.size() != 36) return std::nullopt;
    if (text[8] != '-' || text[13] != '-' || text[18] != '-' || text[23] != '-') {
        return std::nullopt;
    }

    std::string hex;
    hex.reserve(32);
    for (char c : text) {
        if (c != '-') hex.push_back(c);
    }

    auto raw = from_hex(hex);
    if (!raw || raw->size() != 16) return std::nullopt;

    UuidBytes out{};
    std::copy(raw->begin(), raw->end(), out.begin());
    return out;
}

}
}
