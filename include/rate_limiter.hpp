#pragma once

#include <cstdint>
#include <string>

#include "gate_storage.hpp"

namespace powgate {

struct RateLimitResult {
    bool allowed;
    long long current;
    long long limit;
    int64_t window_start_ms;
    int64_t reset_after_ms;
};

 
// Fixed-window request counters keyed by weak client identity.
// Thin policy layer over a RateWindowStore, which owns the counters and
// provides the atomic increment.
class RateLimiter {
public:
    explicit RateLimiter(RateWindowStore& store);
    ~RateLimiter() = default;

    /**
     * Counts a request against the window containing `now` and reports whether it is allowed.
     * The increment is kept even when throttled so a persistent caller stays throttled
     * until the window rolls over.
     * @param key Weak client identity (optionally namespaced, e.g. "submit:<id>").
     * @param now Current time in epoch ms.
     * @param limit Maximum requests allowed per window.
     * @param window_ms Window length; windows start at multiples of it.
     * @throws std::invalid_argument on non-positive window or negative limit.
     */
    RateLimitResult check_and_increment(const std::string& key, int64_t now, long long limit, int64_t window_ms);

    // Drops windows that started before now - retention_ms.
    std::size_t purge_stale(int64_t now, int64_t retention_ms);

    static int64_t window_start(int64_t now, int64_t window_ms);

private:
    RateWindowStore& store_;
};

} 
