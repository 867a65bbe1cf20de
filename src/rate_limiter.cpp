#include "rate_limiter.hpp"
#include <stdexcept>

namespace powgate {

RateLimiter::RateLimiter(RateWindowStore& store)
    : store_(store)
{}

int64_t RateLimiter::window_start(int64_t now, int64_t window_ms) {
    int64_t start = (now / window_ms) * window_ms;
    // floor for pre-epoch timestamps
    if (now < 0 && start != now) start -= window_ms;
    return start;
}

// Increments the counter of the current window and compares the result to the limit.
RateLimitResult RateLimiter::check_and_increment(const std::string& key, int64_t now, long long limit, int64_t window_ms) {
    if (window_ms <= 0) {
        throw std::invalid_argument("rate limit window must be positive");
    }
    if (limit < 0) {
        throw std::invalid_argument("rate limit must not be negative");
    }

    const int64_t start = window_start(now, window_ms);
    const long long count = store_.increment_window(key, start);

    RateLimitResult result;
    result.current = count;
    result.limit = limit;
    result.window_start_ms = start;
    result.allowed = count <= limit;
    result.reset_after_ms = result.allowed ? 0 : (start + window_ms) - now;
    return result;
}

std::size_t RateLimiter::purge_stale(int64_t now, int64_t retention_ms) {
    return store_.purge_windows_before(now - retention_ms);
}

}
