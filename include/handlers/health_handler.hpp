#pragma once

#include <boost/beast/http.hpp>
#include <boost/json.hpp>
#include "server_config.hpp"
#include "metrics.hpp"

namespace beast = boost::beast;
namespace http = beast::http;
namespace json = boost::json;

namespace powgate {

class RedisManager;

class HealthHandler {
public:
    // redis may be null when the memory backend is in use.
    HealthHandler(const ServerConfig& config, RedisManager* redis)
        : config_(config), redis_(redis) {}

    http::response<http::string_body> handle_health(unsigned version);
    http::response<http::string_body> handle_metrics(unsigned version);
    
    // Constant-time check of X-Admin-Token. Disabled when no token is configured.
    bool verify_admin_request(const http::request<http::string_body>& req);

private:
    const ServerConfig& config_;
    RedisManager* redis_;

    template<class Body>
    void add_security_headers(http::response<Body>& res) {
        res.set("X-Content-Type-Options", "nosniff");
        res.set("X-Frame-Options", "DENY");
        res.set("Content-Security-Policy", "default-src 'none'");
        res.set(http::field::cache_control, "no-store");
    }
};

} // namespace powgate
