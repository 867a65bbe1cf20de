#include "handlers/health_handler.hpp"
#include "redis_manager.hpp"
#include "crypto_utils.hpp"

namespace powgate {

http::response<http::string_body> HealthHandler::handle_health(unsigned version) {
    bool storage_ok = true;
    if (redis_) {
        storage_ok = redis_->ping();
    }

    json::object response;
    response["status"] = storage_ok ? "healthy" : "degraded";
    response["storage"] = config_.storage_backend;
    response["storage_connected"] = storage_ok;
    response["difficulty_bits"] = config_.difficulty_bits;
    
    http::response<http::string_body> res{
        storage_ok ? http::status::ok : http::status::service_unavailable, version};
    res.set(http::field::content_type, "application/json");
    res.body() = json::serialize(response);
    res.prepare_payload();
    
    add_security_headers(res);
    res.set(http::field::access_control_allow_origin, "*");
    
    return res;
}

http::response<http::string_body> HealthHandler::handle_metrics(unsigned version) {
    std::string body = MetricsRegistry::instance().collect_prometheus();
    
    http::response<http::string_body> res{http::status::ok, version};
    res.set(http::field::content_type, "text/plain; version=0.0.4");
    res.body() = body;
    res.prepare_payload();
    
    add_security_headers(res);
    
    return res;
}

bool HealthHandler::verify_admin_request(const http::request<http::string_body>& req) {
    if (config_.admin_token.empty()) {
        return false;
    }

    auto auth_it = req.find("X-Admin-Token");
    if (auth_it == req.end()) {
        return false;
    }

    std::string provided_token(auth_it->value());
    return crypto::constant_time_equal(provided_token, config_.admin_token);
}

} // namespace powgate
