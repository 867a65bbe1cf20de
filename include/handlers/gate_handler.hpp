#pragma once

#include <boost/beast/http.hpp>
#include <boost/json.hpp>
#include <optional>
#include <string>
#include "server_config.hpp"
#include "gate_service.hpp"
#include "session_token.hpp"

namespace beast = boost::beast;
namespace http = beast::http;
namespace json = boost::json;

namespace powgate {

// HTTP adapter for the gate endpoints under /api/pow/. Translates requests
// into GateService calls and GateStatus values into status codes.
class GateHandler {
public:
    GateHandler(const ServerConfig& config, GateService& gate, const SessionToken& tokens)
        : config_(config)
        , gate_(gate)
        , tokens_(tokens) {}

    http::response<http::string_body> handle_challenge(const http::request<http::string_body>& req, const std::string& remote_addr);
    http::response<http::string_body> handle_submit(const http::request<http::string_body>& req, const std::string& remote_addr);
    http::response<http::string_body> handle_status(const http::request<http::string_body>& req, const std::string& remote_addr);
    http::response<http::string_body> handle_logout(const http::request<http::string_body>& req, const std::string& remote_addr);
    http::response<http::string_body> handle_preflight(const http::request<http::string_body>& req);

    /**
     * Guard for routes under the protected prefix.
     * @return nullopt when the caller holds a live session bound to its User-Agent;
     *         otherwise the rejection to send (401 with X-PoW-Required, 400 without
     *         a User-Agent, 503 when the session store cannot answer).
     */
    std::optional<http::response<http::string_body>> require_session(const http::request<http::string_body>& req,
                                                                     const std::string& remote_addr);

    // Answer for a guarded request that passed; a forward-auth proxy treats 2xx as allow.
    http::response<http::string_body> handle_protected(const http::request<http::string_body>& req);

    // Generic 500 for faults that escaped a handler.
    http::response<http::string_body> handle_internal_error(const http::request<http::string_body>& req);

    http::response<http::string_body> handle_rate_limited(const RateLimitResult& res_info, const http::request<http::string_body>& req);

private:
    const ServerConfig& config_;
    GateService& gate_;
    const SessionToken& tokens_;

    http::response<http::string_body> error_response(http::status status, const std::string& message,
                                                     const http::request<http::string_body>& req);
    http::response<http::string_body> status_response(GateStatus status, const RateLimitResult& rate,
                                                      const http::request<http::string_body>& req);

    // Session id from a correctly signed cookie, else empty.
    std::string session_from_cookie(const http::request<http::string_body>& req);

    template<class Body>
    void add_security_headers(http::response<Body>& res) {
        res.set("X-Content-Type-Options", "nosniff");
        res.set("X-Frame-Options", "DENY");
        res.set("Content-Security-Policy", "default-src 'none'");
        res.set(http::field::cache_control, "no-store");
    }
    
    // Credentialed CORS: the Origin is echoed only when allow-listed.
    template<class Body>
    void add_cors_headers(http::response<Body>& res, const http::request<http::string_body>& req) {
        auto origin_it = req.find(http::field::origin);
        if (origin_it == req.end()) return;

        std::string origin(origin_it->value());
        for (const auto& allowed : config_.allowed_origins) {
            if (allowed == origin) {
                res.set(http::field::access_control_allow_origin, origin);
                res.set(http::field::access_control_allow_credentials, "true");
                res.set(http::field::access_control_allow_methods, "GET, POST, OPTIONS");
                res.set(http::field::access_control_allow_headers, "Content-Type");
                res.set(http::field::vary, "Origin");
                return;
            }
        }
    }
};

} // namespace powgate
