#include "client_identity.hpp"
#include "crypto_utils.hpp"
#include <boost/asio/ip/address.hpp>
#include <boost/system/error_code.hpp>

namespace powgate {

namespace {

std::string trim(const std::string& s) {
    const char* ws = " \t";
    size_t begin = s.find_first_not_of(ws);
    if (begin == std::string::npos) return "";
    size_t end = s.find_last_not_of(ws);
    return s.substr(begin, end - begin + 1);
}

}

std::optional<ClientIdentity> extract_client_identity(const http::request<http::string_body>& req,
                                                      const std::string& remote_addr,
                                                      bool trust_forwarded_for) {
    auto it = req.find(http::field::user_agent);
    if (it == req.end()) return std::nullopt;

    std::string user_agent = trim(std::string(it->value()));
    if (user_agent.empty()) return std::nullopt;

    ClientIdentity identity;
    identity.weak_identity = crypto::sha256_hex(user_agent);
    identity.client_address = extract_client_ip(req, remote_addr, trust_forwarded_for);
    identity.user_agent = std::move(user_agent);
    return identity;
}

std::string extract_client_ip(const http::request<http::string_body>& req,
                              const std::string& remote_addr,
                              bool trust_forwarded_for) {
    if (trust_forwarded_for) {
        auto it = req.find("X-Forwarded-For");
        if (it != req.end()) {
            std::string value(it->value());
            std::string first = trim(value.substr(0, value.find(',')));
            // Anything that is not an address falls back to the socket peer.
            boost::system::error_code ec;
            auto address = boost::asio::ip::make_address(first, ec);
            if (!ec) return address.to_string();
        }
    }
    return remote_addr.empty() ? "unknown" : remote_addr;
}

std::optional<std::string> extract_cookie(const http::request<http::string_body>& req,
                                          const std::string& name) {
    // Multiple Cookie headers are allowed; the first matching pair wins.
    for (const auto& field : req) {
        if (field.name() != http::field::cookie) continue;

        std::string header(field.value());
        size_t pos = 0;
        while (pos <= header.size()) {
            size_t end = header.find(';', pos);
            if (end == std::string::npos) end = header.size();

            std::string pair = trim(header.substr(pos, end - pos));
            size_t eq = pair.find('=');
            if (eq != std::string::npos && trim(pair.substr(0, eq)) == name) {
                std::string value = trim(pair.substr(eq + 1));
                if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
                    value = value.substr(1, value.size() - 2);
                }
                return value;
            }
            pos = end + 1;
        }
    }
    return std::nullopt;
}

std::string build_session_cookie(const ServerConfig& config, const std::string& token) {
    std::string cookie = config.session_cookie_name + "=" + token +
                         "; HttpOnly; Path=/; Max-Age=" + std::to_string(config.session_ttl_sec);
    if (config.cookie_secure) {
        cookie += "; Secure";
    }
    if (!config.cookie_same_site.empty()) {
        cookie += "; SameSite=" + config.cookie_same_site;
    }
    return cookie;
}

std::string build_clear_cookie(const ServerConfig& config) {
    return config.session_cookie_name + "=; HttpOnly; Path=/; Max-Age=0";
}

}
