#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <cstdint>
#include <optional>
#include <thread>
#include <variant>

#include "challenge.hpp"
#include "hash_engine.hpp"
#include "message_channel.hpp"

namespace powgate {

struct SearchProgress {
    uint64_t attempts = 0;
    int64_t elapsed_ms = 0;
    double hash_rate = 0.0; // hashes per second
};

struct SearchFound {
    uint32_t nonce = 0;
    uint64_t attempts = 0;
    int64_t elapsed_ms = 0;
    Digest digest{};
};

using SearchEvent = std::variant<SearchProgress, SearchFound>;

struct SearchOptions {
    uint32_t batch_size = 50000;
    std::chrono::milliseconds progress_interval{250};
    std::optional<uint32_t> start_nonce; // random when unset
    std::size_t channel_capacity = 64;
};

// A cancellable background search. Events arrive in order: zero or more
// SearchProgress, then at most one SearchFound, then end of stream.
class SearchTask {
public:
    virtual ~SearchTask() = default;

    virtual void start() = 0;

    // After cancel() returns no further events are delivered.
    virtual void cancel() = 0;

    // Blocks for the next event; empty at end of stream.
    virtual std::optional<SearchEvent> next_event() = 0;
    virtual std::optional<SearchEvent> next_event_for(std::chrono::milliseconds timeout) = 0;
};

/**
 * Brute-force nonce search on a dedicated thread.
 * Nonces advance by one from the start value with wraparound; the search gives up
 * after covering the whole 32-bit space.
 */
class SearchWorker : public SearchTask {
public:
    SearchWorker(const Payload& payload, int difficulty_bits, SearchOptions options = {});
    ~SearchWorker() override;

    SearchWorker(const SearchWorker&) = delete;
    SearchWorker& operator=(const SearchWorker&) = delete;

    void start() override;
    void cancel() override;
    std::optional<SearchEvent> next_event() override;
    std::optional<SearchEvent> next_event_for(std::chrono::milliseconds timeout) override;

    uint32_t start_nonce() const { return start_nonce_; }

private:
    void run();

    const Payload payload_;
    const int difficulty_bits_;
    const SearchOptions options_;
    uint32_t start_nonce_;

    MessageChannel<SearchEvent> channel_;
    std::atomic<bool> should_stop_{false};
    std::thread thread_;
};

// Decorative playback at a fixed synthetic hash rate. Emits progress only and
// never a SearchFound; it runs until cancelled.
class SimulatedSearch : public SearchTask {
public:
    explicit SimulatedSearch(double hash_rate,
                             std::chrono::milliseconds progress_interval = std::chrono::milliseconds(250));
    ~SimulatedSearch() override;

    SimulatedSearch(const SimulatedSearch&) = delete;
    SimulatedSearch& operator=(const SimulatedSearch&) = delete;

    void start() override;
    void cancel() override;
    std::optional<SearchEvent> next_event() override;
    std::optional<SearchEvent> next_event_for(std::chrono::milliseconds timeout) override;

private:
    void run();

    const double hash_rate_;
    const std::chrono::milliseconds progress_interval_;
    MessageChannel<SearchEvent> channel_;
    std::atomic<bool> should_stop_{false};
    std::mutex wait_mutex_;
    std::condition_variable wait_cv_;
    std::thread thread_;
};

}
