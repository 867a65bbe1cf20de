#pragma once

#include <string>
#include <memory>
#include <atomic>
#include <sw/redis++/redis++.h>
#include "gate_storage.hpp"

namespace powgate {

struct ServerConfig;

// Redis-backed persistence for the gate. Implements all three store
// interfaces; every mutating operation that must be atomic runs as a Lua script.
// Standalone Redis only: scripts touch several keys that share no hash slot.
//
// Key layout:
//   powgate:chal:<id>           hash, indexed by expiry in powgate:chal_expiry
//   powgate:sess:<id>           hash, indexed by expiry in powgate:sess_expiry
//   powgate:rl:<key>:<start>    counter, indexed by window start in powgate:rl_index
class RedisManager : public ChallengeStore, public SessionStore, public RateWindowStore {
public:
    explicit RedisManager(const ServerConfig& config);
    ~RedisManager() override = default;

    RedisManager(const RedisManager&) = delete;
    RedisManager& operator=(const RedisManager&) = delete;

    // Last known health; updated by every call.
    bool is_connected() const { return connected_; }

    // Round-trip check used by the health endpoint.
    bool ping();

    // --- ChallengeStore ---
    Challenge issue(int difficulty_bits,
                    const std::string& weak_identity,
                    const std::string& client_address,
                    int64_t ttl_ms,
                    int64_t now) override;
    ConsumeResult consume_if_valid(const std::string& challenge_id, int64_t now) override;
    std::size_t purge_expired_challenges(int64_t now) override;

    // --- SessionStore ---
    Session create(const std::string& weak_identity,
                   const std::string& challenge_id,
                   int64_t ttl_ms,
                   int64_t now) override;
    bool is_valid(const std::string& session_id,
                  const std::string& weak_identity,
                  int64_t now) override;
    void invalidate(const std::string& session_id) override;
    std::size_t purge_expired_sessions(int64_t now) override;

    // --- RateWindowStore ---
    long long increment_window(const std::string& key, int64_t window_start_ms) override;
    std::size_t purge_windows_before(int64_t cutoff_ms) override;

private:
    sw::redis::Redis& client();
    [[noreturn]] void fail(const std::string& operation, const std::exception& e);

    // Deletes index members up to max_score, with their records, in bounded batches.
    std::size_t purge_index(const std::string& index_key,
                            const std::string& max_score,
                            const std::string& prefix);

    std::unique_ptr<sw::redis::Redis> redis_;
    std::atomic<bool> connected_{false};
    int64_t challenge_grace_ms_;
};

}
