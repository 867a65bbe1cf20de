#pragma once

#include <string>
#include <cctype>
#include <cstdint>
#include <algorithm>
#include <limits>
#include <optional>
#include <boost/json.hpp>

namespace powgate {

// Request field validation for the gate endpoints.
class InputValidator {
public:
    // Validates that a string is a correctly formatted hexadecimal sequence.
    static bool is_valid_hex(const std::string& str, size_t expected_length = 0) {
        if (str.empty()) return false;
        if (expected_length > 0 && str.length() != expected_length) return false;
        
        return std::all_of(str.begin(), str.end(), [](char c) {
            return std::isxdigit(static_cast<unsigned char>(c));
        });
    }

    // Canonical 8-4-4-4-12 UUID text, any case.
    static bool is_valid_uuid(const std::string& str) {
        if (str.size() != 36) return false;
        for (size_t i = 0; i < str.size(); ++i) {
            if (i == 8 || i == 13 || i == 18 || i == 23) {
                if (str[i] != '-') return false;
            } else if (!std::isxdigit(static_cast<unsigned char>(str[i]))) {
                return false;
            }
        }
        return true;
    }
    
    static bool is_within_size_limit(size_t size, size_t max_size) {
        return size <= max_size;
    }

    /**
     * JSON parsing with a recursion depth limit to prevent stack exhaustion.
     * @throws boost::system::system_error on malformed input or excessive depth.
     */
    static boost::json::value safe_parse_json(const std::string& input, size_t max_depth = 8) {
        boost::json::parse_options opt;
        opt.max_depth = max_depth;
        return boost::json::parse(input, {}, opt);
    }

    // Accepts a JSON integer in [0, 2^32 - 1]; rejects floats, strings and negatives.
    static std::optional<uint32_t> as_nonce(const boost::json::value& v) {
        if (v.is_uint64()) {
            uint64_t n = v.get_uint64();
            if (n > std::numeric_limits<uint32_t>::max()) return std::nullopt;
            return static_cast<uint32_t>(n);
        }
        if (v.is_int64()) {
            int64_t n = v.get_int64();
            if (n < 0 || n > static_cast<int64_t>(std::numeric_limits<uint32_t>::max())) return std::nullopt;
            return static_cast<uint32_t>(n);
        }
        return std::nullopt;
    }

    // Optional non-negative integer telemetry field; anything else reads as absent.
    static std::optional<int64_t> as_telemetry(const boost::json::object& obj, const char* key) {
        auto it = obj.find(key);
        if (it == obj.end()) return std::nullopt;
        const auto& v = it->value();
        if (v.is_int64() && v.get_int64() >= 0) return v.get_int64();
        if (v.is_uint64() && v.get_uint64() <= static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
            return static_cast<int64_t>(v.get_uint64());
        }
        if (v.is_double() && v.get_double() >= 0.0 && v.get_double() < 9.2e18) {
            return static_cast<int64_t>(v.get_double());
        }
        return std::nullopt;
    }
};

}
