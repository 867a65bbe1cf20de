#pragma once

#include <map>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <utility>

#include "gate_storage.hpp"

namespace powgate {

// In-process challenge store. A single mutex makes consume a true
// fetch-and-delete: concurrent consumers of one id see exactly one success.
class MemoryChallengeStore : public ChallengeStore {
public:
    MemoryChallengeStore() = default;

    MemoryChallengeStore(const MemoryChallengeStore&) = delete;
    MemoryChallengeStore& operator=(const MemoryChallengeStore&) = delete;

    Challenge issue(int difficulty_bits,
                    const std::string& weak_identity,
                    const std::string& client_address,
                    int64_t ttl_ms,
                    int64_t now) override;

    ConsumeResult consume_if_valid(const std::string& challenge_id, int64_t now) override;

    std::size_t purge_expired_challenges(int64_t now) override;

    std::size_t size() const;

private:
    std::unordered_map<std::string, Challenge> challenges_;
    mutable std::mutex mutex_;
};

class MemorySessionStore : public SessionStore {
public:
    MemorySessionStore() = default;

    MemorySessionStore(const MemorySessionStore&) = delete;
    MemorySessionStore& operator=(const MemorySessionStore&) = delete;

    Session create(const std::string& weak_identity,
                   const std::string& challenge_id,
                   int64_t ttl_ms,
                   int64_t now) override;

    bool is_valid(const std::string& session_id,
                  const std::string& weak_identity,
                  int64_t now) override;

    void invalidate(const std::string& session_id) override;

    std::size_t purge_expired_sessions(int64_t now) override;

    std::size_t size() const;

private:
    std::unordered_map<std::string, Session> sessions_;
    mutable std::shared_mutex mutex_;
};

class MemoryRateWindowStore : public RateWindowStore {
public:
    MemoryRateWindowStore() = default;

    MemoryRateWindowStore(const MemoryRateWindowStore&) = delete;
    MemoryRateWindowStore& operator=(const MemoryRateWindowStore&) = delete;

    long long increment_window(const std::string& key, int64_t window_start_ms) override;

    std::size_t purge_windows_before(int64_t cutoff_ms) override;

    std::size_t size() const;

private:
    // Ordered by window start so purges only walk the stale prefix.
    std::map<std::pair<int64_t, std::string>, long long> windows_;
    mutable std::mutex mutex_;
};

}
