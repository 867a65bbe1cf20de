#include <boost/beast/core.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/strand.hpp>
#include <boost/asio/ip/tcp.hpp>

#include <iostream>
#include <string>
#include <thread>
#include <vector>
#include <memory>
#include <cstdlib>

#include "server_config.hpp"
#include "gate_service.hpp"
#include "memory_storage.hpp"
#include "redis_manager.hpp"
#include "http_session.hpp"
#include "rate_limiter.hpp"
#include "reaper.hpp"
#include "session_token.hpp"
#include "security_logger.hpp"


namespace beast = boost::beast;
namespace net = boost::asio;
using tcp = boost::asio::ip::tcp;

namespace powgate {

class Listener : public std::enable_shared_from_this<Listener> {
public:
    Listener(
        net::io_context& ioc,
        tcp::endpoint endpoint,
        const ServerConfig& config,
        GateService& gate,
        RateLimiter& rate_limiter,
        const SessionToken& tokens,
        RedisManager* redis
    )
        : ioc_(ioc)
        , acceptor_(net::make_strand(ioc))
        , config_(config)
        , gate_(gate)
        , rate_limiter_(rate_limiter)
        , tokens_(tokens)
        , redis_(redis)
    {
        beast::error_code ec;
        
        acceptor_.open(endpoint.protocol(), ec);
        if (ec) {
            throw std::runtime_error("Failed to open acceptor: " + ec.message());
        }
        
        acceptor_.set_option(net::socket_base::reuse_address(true), ec);
        if (ec) {
            throw std::runtime_error("Failed to set SO_REUSEADDR: " + ec.message());
        }
        
        acceptor_.bind(endpoint, ec);
        if (ec) {
            throw std::runtime_error("Failed to bind: " + ec.message());
        }
        
        acceptor_.listen(net::socket_base::max_listen_connections, ec);
        if (ec) {
            throw std::runtime_error("Failed to listen: " + ec.message());
        }
    }
    
    void run() {
        do_accept();
    }

    void stop() {
        beast::error_code ec;
        acceptor_.close(ec);
    }

private:
    net::io_context& ioc_;
    tcp::acceptor acceptor_;
    
    const ServerConfig& config_;
    GateService& gate_;
    RateLimiter& rate_limiter_;
    const SessionToken& tokens_;
    RedisManager* redis_;
    
    void do_accept() {
        acceptor_.async_accept(
            net::make_strand(ioc_),
            [self = shared_from_this()](beast::error_code ec, tcp::socket socket) {
                self->on_accept(ec, std::move(socket));
            });
    }
    
    void on_accept(beast::error_code ec, tcp::socket socket) {
        if (ec) {
            if (ec == net::error::operation_aborted) return;
            SecurityLogger::log(SecurityLogger::Level::ERROR, SecurityLogger::EventType::LIFECYCLE,
                                "internal", "Accept error: " + ec.message());
        } else {
            std::make_shared<HttpSession>(
                std::move(socket),
                config_,
                gate_,
                rate_limiter_,
                tokens_,
                redis_
            )->run();
        }
        
        do_accept();
    }
};

} 

namespace {

int env_int(const char* name, int current) {
    if (const char* e = std::getenv(name)) return std::stoi(e);
    return current;
}

bool env_bool(const char* name, bool current) {
    if (const char* e = std::getenv(name)) {
        std::string v(e);
        return v == "1" || v == "true" || v == "yes" || v == "on";
    }
    return current;
}

}

int main(int argc, char* argv[]) {
    using powgate::SecurityLogger;
    try {
        powgate::ServerConfig config;
        
        // --- POWGATE_* environment overrides ---
        
        if (const char* env_port = std::getenv("POWGATE_PORT")) {
            config.port = static_cast<uint16_t>(std::stoi(env_port));
        }
        if (const char* env_addr = std::getenv("POWGATE_ADDR")) {
            config.address = env_addr;
        }
        if (const char* env_backend = std::getenv("POWGATE_STORAGE")) {
            config.storage_backend = env_backend;
        }
        if (const char* env_redis = std::getenv("POWGATE_REDIS_URL")) {
            config.redis_url = env_redis;
        }
        if (const char* env_origins = std::getenv("POWGATE_ALLOWED_ORIGINS")) {
            config.allowed_origins.clear();
            std::string origins_str(env_origins);
            size_t pos = 0;
            while ((pos = origins_str.find(',')) != std::string::npos) {
                config.allowed_origins.push_back(origins_str.substr(0, pos));
                origins_str.erase(0, pos + 1);
            }
            if (!origins_str.empty()) {
                config.allowed_origins.push_back(origins_str);
            }
        }
        if (const char* env_secret = std::getenv("POWGATE_SESSION_SECRET")) {
            config.session_secret = env_secret;
        }
        if (const char* env_admin = std::getenv("POWGATE_ADMIN_TOKEN")) {
            config.admin_token = env_admin;
        }
        if (const char* env_same_site = std::getenv("POWGATE_COOKIE_SAMESITE")) {
            config.cookie_same_site = env_same_site;
        }
        if (const char* env_prefix = std::getenv("POWGATE_PROTECTED_PREFIX")) {
            config.protected_prefix = env_prefix;
        }

        config.thread_count = env_int("POWGATE_THREADS", config.thread_count);
        config.redis_timeout_ms = env_int("POWGATE_REDIS_TIMEOUT_MS", config.redis_timeout_ms);
        config.difficulty_bits = env_int("POWGATE_DIFFICULTY_BITS", config.difficulty_bits);
        config.challenge_ttl_sec = env_int("POWGATE_CHALLENGE_TTL", config.challenge_ttl_sec);
        config.session_ttl_sec = env_int("POWGATE_SESSION_TTL", config.session_ttl_sec);
        config.reaper_interval_sec = env_int("POWGATE_REAPER_INTERVAL", config.reaper_interval_sec);
        config.rate_window_retention_sec = env_int("POWGATE_RATE_RETENTION", config.rate_window_retention_sec);
        config.cookie_secure = env_bool("POWGATE_COOKIE_SECURE", config.cookie_secure);
        config.trust_forwarded_for = env_bool("POWGATE_TRUST_XFF", config.trust_forwarded_for);

        // Granular Rate Limits
        if (const char* e = std::getenv("POWGATE_LIMIT_POW")) config.pow_rate_limit = std::stoi(e);
        if (const char* e = std::getenv("POWGATE_LIMIT_POW_WINDOW")) config.pow_rate_window_sec = std::stoi(e);
        if (const char* e = std::getenv("POWGATE_LIMIT_SUBMIT")) config.submit_rate_limit = std::stoi(e);
        if (const char* e = std::getenv("POWGATE_LIMIT_SUBMIT_WINDOW")) config.submit_rate_window_sec = std::stoi(e);
        if (const char* e = std::getenv("POWGATE_LIMIT_GLOBAL")) config.global_rate_limit = std::stoi(e);
        if (const char* e = std::getenv("POWGATE_LIMIT_GLOBAL_WINDOW")) config.global_rate_window_sec = std::stoi(e);

        // --- CLI Argument Parsing (wins over environment) ---
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--redis" || arg == "-r") {
                config.storage_backend = "redis";
            } else if (arg == "--memory" || arg == "-m") {
                config.storage_backend = "memory";
            } else if (arg == "--insecure-cookie") {
                config.cookie_secure = false;
            } else if (arg == "--difficulty" && i + 1 < argc) {
                config.difficulty_bits = std::stoi(argv[++i]);
            } else if (arg == "--help" || arg == "-h") {
                std::cout << "Usage: " << argv[0] << " [port] [options]\n"
                          << "Options:\n"
                          << "  --memory, -m         In-process storage (default)\n"
                          << "  --redis, -r          Redis storage (POWGATE_REDIS_URL)\n"
                          << "  --difficulty <bits>  Required leading zero bits (1-32)\n"
                          << "  --insecure-cookie    Omit the Secure cookie flag (local development)\n"
                          << "  --help, -h           Show this help\n";
                return 0;
            } else {
                try {
                    config.port = static_cast<uint16_t>(std::stoi(arg));
                } catch (const std::exception&) {
                    std::cerr << "[!] Unknown argument: " << arg << "\n";
                    return 1;
                }
            }
        }
        
        if (config.allowed_origins.empty()) {
            SecurityLogger::log(SecurityLogger::Level::WARNING, SecurityLogger::EventType::LIFECYCLE, "internal",
                                "No CORS origins configured; cross-origin requests will not carry credentials");
        }
        
        if (config.session_secret.size() < config.min_session_secret_length) {
            std::cerr << "CRITICAL SECURITY ERROR: SESSION SECRET MISSING OR TOO SHORT\n";
            std::cerr << "Set 'POWGATE_SESSION_SECRET' to at least "
                      << config.min_session_secret_length << " characters.\n";
            return 1;
        }

        try {
            powgate::validate_config(config);
        } catch (const std::invalid_argument& e) {
            std::cerr << "[!] Invalid configuration: " << e.what() << "\n";
            return 1;
        }
        
        if (config.thread_count == 0) {
            config.thread_count = static_cast<int>(std::thread::hardware_concurrency());
            if (config.thread_count == 0) config.thread_count = 4;
        }
        
        std::cout << "POWGATE PROOF-OF-WORK GATE\n"
                  << "  listen     " << config.address << ":" << config.port << "\n"
                  << "  storage    " << config.storage_backend << "\n"
                  << "  difficulty " << config.difficulty_bits << " bits\n\n";
        
        net::io_context ioc{config.thread_count};

        // --- Storage backend ---
        std::unique_ptr<powgate::RedisManager> redis;
        std::unique_ptr<powgate::MemoryChallengeStore> memory_challenges;
        std::unique_ptr<powgate::MemorySessionStore> memory_sessions;
        std::unique_ptr<powgate::MemoryRateWindowStore> memory_windows;

        powgate::ChallengeStore* challenge_store = nullptr;
        powgate::SessionStore* session_store = nullptr;
        powgate::RateWindowStore* window_store = nullptr;

        if (config.storage_backend == "redis") {
            redis = std::make_unique<powgate::RedisManager>(config);
            if (!redis->is_connected()) {
                SecurityLogger::log(SecurityLogger::Level::WARNING, SecurityLogger::EventType::STORAGE_FAILURE, "internal",
                                    "Starting with Redis unreachable; requests fail until it recovers");
            }
            challenge_store = redis.get();
            session_store = redis.get();
            window_store = redis.get();
        } else if (config.storage_backend == "memory") {
            memory_challenges = std::make_unique<powgate::MemoryChallengeStore>();
            memory_sessions = std::make_unique<powgate::MemorySessionStore>();
            memory_windows = std::make_unique<powgate::MemoryRateWindowStore>();
            challenge_store = memory_challenges.get();
            session_store = memory_sessions.get();
            window_store = memory_windows.get();
        } else {
            std::cerr << "[!] Unknown storage backend: " << config.storage_backend << "\n";
            return 1;
        }

        powgate::RateLimiter rate_limiter(*window_store);
        powgate::GateService gate(*challenge_store, *session_store, rate_limiter,
                                  powgate::GatePolicy::from_config(config));
        powgate::SessionToken tokens(config.session_secret);

        // Clear leftovers from a previous run before serving.
        powgate::Reaper reaper(ioc, gate, std::chrono::seconds(config.reaper_interval_sec));
        reaper.run_once(powgate::now_ms());
        reaper.start();
        
        auto listener = std::make_shared<powgate::Listener>(
            ioc,
            tcp::endpoint{net::ip::make_address(config.address), config.port},
            config,
            gate,
            rate_limiter,
            tokens,
            redis.get()
        );
        listener->run();

        SecurityLogger::log(SecurityLogger::Level::INFO, SecurityLogger::EventType::LIFECYCLE, "internal",
                            "Listening on port " + std::to_string(config.port));
        
        // SIGINT/SIGTERM stop the reaper and the io_context
        net::signal_set signals(ioc, SIGINT, SIGTERM);
        signals.async_wait(
            [&ioc, listener, &reaper](beast::error_code const&, int) {
                SecurityLogger::log(SecurityLogger::Level::INFO, SecurityLogger::EventType::LIFECYCLE, "internal", "Initiating graceful shutdown");
                reaper.stop();
                listener->stop();
                ioc.stop();
            });
        
        std::vector<std::thread> threads;
        threads.reserve(config.thread_count - 1);
        
        for (int i = 0; i < config.thread_count - 1; ++i) {
            threads.emplace_back([&ioc] {
                ioc.run();
            });
        }
        
        ioc.run();
        
        for (auto& t : threads) {
            t.join();
        }
        
        return 0;
        
    } catch (const std::exception& e) {
        std::cerr << "[!] Fatal error: " << e.what() << "\n";
        return 1;
    }
}
