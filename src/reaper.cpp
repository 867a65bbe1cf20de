#include "reaper.hpp"
#include "metrics.hpp"
#include "security_logger.hpp"

#include <boost/asio/dispatch.hpp>
#include <boost/asio/post.hpp>

#include <stdexcept>

namespace powgate {

Reaper::Reaper(net::io_context& ioc, GateService& gate, std::chrono::milliseconds interval)
    : strand_(net::make_strand(ioc))
    , timer_(strand_)
    , gate_(gate)
    , interval_(interval)
{
    if (interval_.count() <= 0) {
        throw std::invalid_argument("reaper interval must be positive");
    }
}

void Reaper::start() {
    if (running_.exchange(true)) return;
    net::dispatch(strand_, [this]() {
        schedule();
    });
}

void Reaper::stop() {
    running_ = false;
    net::post(strand_, [this]() {
        boost::system::error_code ec;
        timer_.cancel(ec);
    });
}

bool Reaper::run_once(int64_t now) {
    passes_++;
    try {
        ReapStats stats = gate_.reap(now);
        if (stats.challenges + stats.sessions + stats.rate_windows > 0) {
            SecurityLogger::log(SecurityLogger::Level::INFO, SecurityLogger::EventType::REAPER, "internal",
                                "Purged challenges=" + std::to_string(stats.challenges) +
                                " sessions=" + std::to_string(stats.sessions) +
                                " rate_windows=" + std::to_string(stats.rate_windows));
        }
        return true;
    } catch (const StorageUnavailable& e) {
        MetricsRegistry::instance().increment_counter("powgate_storage_errors_total");
        SecurityLogger::log(SecurityLogger::Level::ERROR, SecurityLogger::EventType::STORAGE_FAILURE, "internal",
                            std::string("Reaper pass failed: ") + e.what());
        return false;
    }
}

void Reaper::schedule() {
    timer_.expires_after(interval_);
    timer_.async_wait([this](const boost::system::error_code& ec) {
        on_tick(ec);
    });
}

void Reaper::on_tick(const boost::system::error_code& ec) {
    if (ec || !running_) return;
    run_once(now_ms());
    schedule();
}

}
