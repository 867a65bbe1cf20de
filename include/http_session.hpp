#pragma once

#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/asio/strand.hpp>
#include <boost/optional.hpp>
#include <memory>
#include <string>

#include "server_config.hpp"
#include "gate_service.hpp"
#include "rate_limiter.hpp"
#include "session_token.hpp"
#include "handlers/health_handler.hpp"
#include "handlers/gate_handler.hpp"

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = boost::asio::ip::tcp;

namespace powgate {

class RedisManager;

// One HTTP/1.1 keep-alive connection. TLS is terminated upstream.
class HttpSession : public std::enable_shared_from_this<HttpSession> {
public:
    HttpSession(
        tcp::socket&& socket,
        const ServerConfig& config,
        GateService& gate,
        RateLimiter& rate_limiter,
        const SessionToken& tokens,
        RedisManager* redis
    );
    
    ~HttpSession() = default;
    
    void run();

private:
    beast::tcp_stream stream_;
    beast::flat_buffer buffer_;
    http::request<http::string_body> req_;
    boost::optional<http::request_parser<http::string_body>> parser_; 
    
    const ServerConfig& config_;
    RateLimiter& rate_limiter_;
    
    // Handlers
    HealthHandler health_handler_;
    GateHandler gate_handler_;
    
    std::string remote_addr_;
    
    void do_read();
    void on_read(beast::error_code ec, std::size_t bytes_transferred);
    
    void handle_request();
    void send_response(http::response<http::string_body>&& res);
    void on_write(bool close, beast::error_code ec, std::size_t bytes_transferred);
    
    http::response<http::string_body> handle_not_found();

    // Per-address limit applied before routing.
    bool check_global_limit();
    std::string blind_ip(const std::string& ip);
    bool is_loopback() const;
    bool is_protected(const std::string& target) const;
};

}
