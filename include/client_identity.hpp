#pragma once

#include <boost/beast/http.hpp>
#include <optional>
#include <string>

#include "server_config.hpp"

namespace powgate {

namespace http = boost::beast::http;

// What the gate knows about the caller of a request.
struct ClientIdentity {
    std::string weak_identity;  // hex SHA-256 of the User-Agent
    std::string client_address; // advisory
    std::string user_agent;
};

// Returns nullopt when the request carries no usable User-Agent.
std::optional<ClientIdentity> extract_client_identity(const http::request<http::string_body>& req,
                                                      const std::string& remote_addr,
                                                      bool trust_forwarded_for);

// First X-Forwarded-For entry when trusted and a valid IP address, else the socket peer.
std::string extract_client_ip(const http::request<http::string_body>& req,
                              const std::string& remote_addr,
                              bool trust_forwarded_for);

std::optional<std::string> extract_cookie(const http::request<http::string_body>& req,
                                          const std::string& name);

std::string build_session_cookie(const ServerConfig& config, const std::string& token);
std::string build_clear_cookie(const ServerConfig& config);

}
