#include "http_session.hpp"
#include "client_identity.hpp"
#include "crypto_utils.hpp"
#include "metrics.hpp"
#include "security_logger.hpp"
#include <boost/asio/dispatch.hpp>
#include <boost/json.hpp>
#include <chrono>

namespace json = boost::json;

namespace powgate {

HttpSession::HttpSession(
    tcp::socket&& socket,
    const ServerConfig& config,
    GateService& gate,
    RateLimiter& rate_limiter,
    const SessionToken& tokens,
    RedisManager* redis
)
    : stream_(std::move(socket))
    , config_(config)
    , rate_limiter_(rate_limiter)
    , health_handler_(config, redis)
    , gate_handler_(config, gate, tokens)
{
    beast::error_code ec;
    auto ep = stream_.socket().remote_endpoint(ec);
    remote_addr_ = ec ? "unknown" : ep.address().to_string();
}

// Entry point; the first read is dispatched onto the stream executor
void HttpSession::run() {
    net::dispatch(stream_.get_executor(),
                  beast::bind_front_handler(&HttpSession::do_read, shared_from_this()));
}

// Reads one request with a fresh parser and body limit
void HttpSession::do_read() {
    req_ = {};
    
    // Idle connections are dropped after the expiry
    stream_.expires_after(std::chrono::seconds(60));
    
    auto self = shared_from_this();
    parser_.emplace();
    parser_->body_limit(config_.max_message_size);

    http::async_read(
        stream_,
        buffer_,
        *parser_,
        [self](beast::error_code ec, std::size_t bytes) {
            self->on_read(ec, bytes);
        });
}

// Global throttle first, then routing
void HttpSession::on_read(beast::error_code ec, std::size_t  ) {
    if (ec == http::error::end_of_stream || ec) {
        return;
    }
    
    req_ = parser_->release();

    try {
        if (!check_global_limit()) {
            return;
        }
        handle_request();
    } catch (const std::exception& e) {
        SecurityLogger::log(SecurityLogger::Level::ERROR, SecurityLogger::EventType::LIFECYCLE,
                            remote_addr_, std::string("Request handling failed: ") + e.what());
        send_response(gate_handler_.handle_internal_error(req_));
    }
}

bool HttpSession::check_global_limit() {
    if (config_.global_rate_limit <= 0) return true;

    std::string client_ip = extract_client_ip(req_, remote_addr_, config_.trust_forwarded_for);
    try {
        auto limit_res = rate_limiter_.check_and_increment(
            "global:" + blind_ip(client_ip), now_ms(),
            config_.global_rate_limit,
            static_cast<int64_t>(config_.global_rate_window_sec) * 1000);
        if (!limit_res.allowed) {
            MetricsRegistry::instance().increment_counter("powgate_rate_limited_total");
            SecurityLogger::log(SecurityLogger::Level::WARNING, SecurityLogger::EventType::RATE_LIMIT_HIT,
                                client_ip, "Global request limit reached");
            send_response(gate_handler_.handle_rate_limited(limit_res, req_));
            return false;
        }
    } catch (const StorageUnavailable& e) {
        // The global limit fails open; the gate's own limits still apply.
        MetricsRegistry::instance().increment_counter("powgate_storage_errors_total");
        SecurityLogger::log(SecurityLogger::Level::ERROR, SecurityLogger::EventType::STORAGE_FAILURE,
                            client_ip, std::string("Global rate limit unavailable: ") + e.what());
    }
    return true;
}

void HttpSession::handle_request() {
    std::string target(req_.target());
    auto query_pos = target.find('?');
    if (query_pos != std::string::npos) target.erase(query_pos);

    auto method = req_.method();
    
    // Handle CORS Preflight
    if (method == http::verb::options) {
        send_response(gate_handler_.handle_preflight(req_));
        return;
    }
    
    // --- Routing Table ---

    if (target == "/api/pow/challenge" && method == http::verb::get) {
        send_response(gate_handler_.handle_challenge(req_, remote_addr_));
    } else if (target == "/api/pow/submit" && method == http::verb::post) {
        send_response(gate_handler_.handle_submit(req_, remote_addr_));
    } else if (target == "/api/pow/status" && method == http::verb::get) {
        send_response(gate_handler_.handle_status(req_, remote_addr_));
    } else if (target == "/api/pow/logout" && method == http::verb::post) {
        send_response(gate_handler_.handle_logout(req_, remote_addr_));

    // Health Checks & Metrics
    } else if (target == "/health" && method == http::verb::get) {
        send_response(health_handler_.handle_health(req_.version()));
    } else if (target == "/metrics" && method == http::verb::get) {
        if (is_loopback() || health_handler_.verify_admin_request(req_)) {
            send_response(health_handler_.handle_metrics(req_.version()));
        } else {
            send_response(handle_not_found());
        }

    // Guarded application routes
    } else if (is_protected(target)) {
        auto rejection = gate_handler_.require_session(req_, remote_addr_);
        if (rejection) {
            send_response(std::move(*rejection));
        } else {
            send_response(gate_handler_.handle_protected(req_));
        }
    } else {
        send_response(handle_not_found());
    }
}

bool HttpSession::is_protected(const std::string& target) const {
    const std::string& prefix = config_.protected_prefix;
    return !prefix.empty() && target.compare(0, prefix.size(), prefix) == 0;
}

// Rate-limit keys never carry raw addresses.
std::string HttpSession::blind_ip(const std::string& ip) {
    auto mac = crypto::hmac_sha256(config_.session_secret,
                                   reinterpret_cast<const uint8_t*>(ip.data()), ip.size());
    return crypto::to_hex(mac.data(), 16);
}

bool HttpSession::is_loopback() const {
    return remote_addr_ == "127.0.0.1" || remote_addr_ == "::1";
}

http::response<http::string_body> HttpSession::handle_not_found() {
    json::object response;
    response["error"] = "Not Found";
    
    http::response<http::string_body> res{http::status::not_found, req_.version()};
    res.set(http::field::content_type, "application/json");
    res.set("X-Content-Type-Options", "nosniff");
    res.body() = json::serialize(response);
    res.prepare_payload();
    
    return res;
}

void HttpSession::send_response(http::response<http::string_body>&& res) {
    res.set(http::field::server, "powgate");
    res.keep_alive(req_.keep_alive());

    auto sp = std::make_shared<http::response<http::string_body>>(std::move(res));
    auto self = shared_from_this();
    
    http::async_write(
        stream_,
        *sp,
        [self, sp](beast::error_code ec, std::size_t bytes) {
            self->on_write(sp->need_eof(), ec, bytes);
        });
}

void HttpSession::on_write(bool close, beast::error_code ec, std::size_t  ) {
    if (ec) {
        SecurityLogger::log(SecurityLogger::Level::WARNING, SecurityLogger::EventType::LIFECYCLE,
                            remote_addr_, "HTTP write error: " + ec.message());
        return;
    }
    
    if (close) {
        stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
        return;
    }
    
    do_read();
}

}
