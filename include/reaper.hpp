#pragma once

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>
#include <boost/system/error_code.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>

#include "gate_service.hpp"

namespace powgate {

namespace net = boost::asio;

// Periodic garbage collection of expired challenges, sessions and stale
// rate windows. Runs on the io_context; a failed pass is logged and retried
// on the next tick. The timer is only touched from its strand, so start and
// stop may be called from any thread.
class Reaper {
public:
    Reaper(net::io_context& ioc, GateService& gate, std::chrono::milliseconds interval);

    Reaper(const Reaper&) = delete;
    Reaper& operator=(const Reaper&) = delete;

    void start();
    void stop();

    // Synchronous pass. Returns false if a store failed.
    bool run_once(int64_t now);

    uint64_t passes() const { return passes_.load(); }

private:
    void schedule();
    void on_tick(const boost::system::error_code& ec);

    net::strand<net::io_context::executor_type> strand_;
    net::steady_timer timer_;
    GateService& gate_;
    const std::chrono::milliseconds interval_;
    std::atomic<bool> running_{false};
    std::atomic<uint64_t> passes_{0};
};

}
