#include <gtest/gtest.h>
#include "gate_service.hpp"
#include "hash_engine.hpp"
#include "memory_storage.hpp"
#include "rate_limiter.hpp"
#include <thread>
#include <vector>
#include <atomic>
#include <chrono>
#include <iostream>

using namespace powgate;

namespace {

GatePolicy stress_policy() {
    GatePolicy policy;
    policy.difficulty_bits = 4;
    policy.challenge_ttl_ms = 60000;
    policy.issue_rate_limit = 1000000;
    policy.submit_rate_limit = 0;
    return policy;
}

}

TEST(StressTest, ConcurrentIssueAndRedeem) {
    MemoryChallengeStore challenges;
    MemorySessionStore sessions;
    MemoryRateWindowStore windows;
    RateLimiter limiter(windows);
    GateService gate(challenges, sessions, limiter, stress_policy());

    const int num_threads = 8;
    const int rounds_per_thread = 250;
    std::atomic<int> success_count{0};

    auto worker = [&](int thread_id) {
        std::string identity = "client_" + std::to_string(thread_id);
        for (int i = 0; i < rounds_per_thread; ++i) {
            int64_t now = now_ms();
            IssueOutcome issued = gate.issue_challenge(identity, "", now);
            if (issued.status != GateStatus::Ok) continue;

            uint32_t nonce = 0;
            while (!HashEngine::verify(issued.challenge.payload, nonce, issued.challenge.difficulty_bits)) {
                ++nonce;
            }

            SubmitRequest req;
            req.challenge_id = issued.challenge.id;
            req.nonce = nonce;
            SubmitOutcome outcome = gate.submit_solution(req, identity, now);
            if (outcome.status == GateStatus::Ok && gate.check_status(outcome.session.id, identity, now)) {
                success_count++;
            }
        }
    };

    std::vector<std::thread> threads;
    auto start = std::chrono::high_resolution_clock::now();
    for (int i = 0; i < num_threads; ++i) {
        threads.emplace_back(worker, i);
    }

    for (auto& t : threads) {
        t.join();
    }
    auto end = std::chrono::high_resolution_clock::now();

    std::chrono::duration<double> diff = end - start;
    std::cout << "[*] Redeemed " << success_count << " challenges in " << diff.count() << "s" << std::endl;
    std::cout << "[*] Throughput: " << (success_count / diff.count()) << " ops/sec" << std::endl;

    EXPECT_EQ(success_count, num_threads * rounds_per_thread);
    EXPECT_EQ(challenges.size(), 0u);
    EXPECT_EQ(sessions.size(), static_cast<std::size_t>(num_threads * rounds_per_thread));
}

TEST(StressTest, RateLimiterHighConcurrency) {
    MemoryRateWindowStore windows;
    RateLimiter limiter(windows);

    const int num_threads = 16;
    const int hits_per_thread = 2000;
    const long long limit = 5000;
    const int64_t now = 1700000000000;
    std::atomic<int> allowed{0};

    auto worker = [&]() {
        for (int i = 0; i < hits_per_thread; ++i) {
            if (limiter.check_and_increment("shared", now, limit, 60000).allowed) {
                allowed++;
            }
        }
    };

    std::vector<std::thread> threads;
    auto start = std::chrono::high_resolution_clock::now();
    for (int i = 0; i < num_threads; ++i) {
        threads.emplace_back(worker);
    }
    for (auto& t : threads) {
        t.join();
    }
    auto end = std::chrono::high_resolution_clock::now();

    std::chrono::duration<double> diff = end - start;
    std::cout << "[*] Processed " << (num_threads * hits_per_thread) << " rate checks in "
              << diff.count() << "s" << std::endl;

    EXPECT_EQ(allowed.load(), limit);
    auto after = limiter.check_and_increment("shared", now, limit, 60000);
    EXPECT_FALSE(after.allowed);
    EXPECT_EQ(after.current, num_threads * hits_per_thread + 1);
}
