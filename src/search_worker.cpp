#include "search_worker.hpp"

#include <stdexcept>

namespace powgate {

namespace {

using Clock = std::chrono::steady_clock;

int64_t elapsed_since(Clock::time_point start) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start).count();
}

double rate_of(uint64_t attempts, int64_t elapsed_ms) {
    if (elapsed_ms <= 0) return 0.0;
    return static_cast<double>(attempts) * 1000.0 / static_cast<double>(elapsed_ms);
}

constexpr uint64_t NONCE_SPACE = 1ULL << 32;

}

SearchWorker::SearchWorker(const Payload& payload, int difficulty_bits, SearchOptions options)
    : payload_(payload)
    , difficulty_bits_(difficulty_bits)
    , options_(options)
    , start_nonce_(options.start_nonce ? *options.start_nonce : RandomSource::random_u32())
    , channel_(options.channel_capacity)
{
    if (!is_valid_difficulty(difficulty_bits)) {
        throw std::invalid_argument("difficulty_bits must be within [1, 32]");
    }
    if (options_.batch_size == 0) {
        throw std::invalid_argument("batch_size must be positive");
    }
}

SearchWorker::~SearchWorker() {
    cancel();
}

void SearchWorker::start() {
    if (thread_.joinable() || channel_.closed()) return;
    thread_ = std::thread(&SearchWorker::run, this);
}

void SearchWorker::cancel() {
    should_stop_.store(true);
    channel_.cancel();
    if (thread_.joinable() && thread_.get_id() != std::this_thread::get_id()) {
        thread_.join();
    }
}

std::optional<SearchEvent> SearchWorker::next_event() {
    return channel_.pop();
}

std::optional<SearchEvent> SearchWorker::next_event_for(std::chrono::milliseconds timeout) {
    return channel_.pop_for(timeout);
}

void SearchWorker::run() {
    const auto started = Clock::now();
    auto last_report = started;
    uint64_t attempts = 0;
    uint32_t nonce = start_nonce_;

    while (!should_stop_.load(std::memory_order_relaxed) && attempts < NONCE_SPACE) {
        const uint64_t remaining = NONCE_SPACE - attempts;
        const uint64_t batch = remaining < options_.batch_size ? remaining : options_.batch_size;

        for (uint64_t i = 0; i < batch; ++i) {
            const Digest d = HashEngine::digest(payload_, nonce);
            ++attempts;
            if (HashEngine::meets_difficulty(d, difficulty_bits_)) {
                SearchFound found;
                found.nonce = nonce;
                found.attempts = attempts;
                found.elapsed_ms = elapsed_since(started);
                found.digest = d;
                channel_.push(found);
                channel_.close();
                return;
            }
            ++nonce; // wraps at 2^32
        }

        const auto now = Clock::now();
        if (now - last_report >= options_.progress_interval) {
            last_report = now;
            const int64_t elapsed = elapsed_since(started);
            // Progress is lossy; a slow consumer must not stall the search.
            channel_.try_push(SearchProgress{attempts, elapsed, rate_of(attempts, elapsed)});
        }
    }

    channel_.close();
}

SimulatedSearch::SimulatedSearch(double hash_rate, std::chrono::milliseconds progress_interval)
    : hash_rate_(hash_rate)
    , progress_interval_(progress_interval)
{
    if (hash_rate_ <= 0.0) {
        throw std::invalid_argument("hash_rate must be positive");
    }
    if (progress_interval_.count() <= 0) {
        throw std::invalid_argument("progress_interval must be positive");
    }
}

SimulatedSearch::~SimulatedSearch() {
    cancel();
}

void SimulatedSearch::start() {
    if (thread_.joinable() || channel_.closed()) return;
    thread_ = std::thread(&SimulatedSearch::run, this);
}

void SimulatedSearch::cancel() {
    {
        std::lock_guard<std::mutex> lock(wait_mutex_);
        should_stop_.store(true);
    }
    wait_cv_.notify_all();
    channel_.cancel();
    if (thread_.joinable() && thread_.get_id() != std::this_thread::get_id()) {
        thread_.join();
    }
}

std::optional<SearchEvent> SimulatedSearch::next_event() {
    return channel_.pop();
}

std::optional<SearchEvent> SimulatedSearch::next_event_for(std::chrono::milliseconds timeout) {
    return channel_.pop_for(timeout);
}

void SimulatedSearch::run() {
    const auto started = Clock::now();

    while (!should_stop_.load()) {
        {
            std::unique_lock<std::mutex> lock(wait_mutex_);
            wait_cv_.wait_for(lock, progress_interval_, [this] { return should_stop_.load(); });
        }
        if (should_stop_.load()) break;

        const int64_t elapsed = elapsed_since(started);
        const auto attempts = static_cast<uint64_t>(hash_rate_ * static_cast<double>(elapsed) / 1000.0);
        channel_.try_push(SearchProgress{attempts, elapsed, hash_rate_});
    }
}

}
