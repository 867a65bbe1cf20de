#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include "challenge.hpp"

namespace powgate {

// Raised by a storage backend that cannot complete an operation.
// Request paths translate it into a transient failure.
class StorageUnavailable : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

enum class ConsumeStatus {
    Consumed,
    Expired,
    NotFound
};

struct ConsumeResult {
    ConsumeStatus status = ConsumeStatus::NotFound;
    std::optional<Challenge> challenge; // set only when Consumed
};

 
// Abstract persistence interfaces for the gate. Every operation is atomic
// with respect to others on the same key. Implementations: in-process maps
// (memory_storage.hpp) and Redis (redis_manager.hpp).
class ChallengeStore {
public:
    virtual ~ChallengeStore() = default;

    /**
     * Generates and persists a new challenge.
     * @param difficulty_bits Required leading zero bits, 1..32.
     * @param weak_identity Fingerprint digest of the requesting client.
     * @param client_address Advisory network address, may be empty.
     * @param ttl_ms Lifetime; expiry = now + ttl.
     * @return The full record, payload included.
     */
    virtual Challenge issue(int difficulty_bits,
                            const std::string& weak_identity,
                            const std::string& client_address,
                            int64_t ttl_ms,
                            int64_t now) = 0;

    /**
     * Fetch-and-delete in one step. A live record is returned as Consumed,
     * an expired one is deleted and reported as Expired, an absent one as NotFound.
     */
    virtual ConsumeResult consume_if_valid(const std::string& challenge_id, int64_t now) = 0;

    // Deletes every challenge with expires_at_ms <= now. Returns the count removed.
    virtual std::size_t purge_expired_challenges(int64_t now) = 0;
};

class SessionStore {
public:
    virtual ~SessionStore() = default;

    virtual Session create(const std::string& weak_identity,
                           const std::string& challenge_id,
                           int64_t ttl_ms,
                           int64_t now) = 0;

    // True iff the session exists, has not expired and is bound to weak_identity.
    virtual bool is_valid(const std::string& session_id,
                          const std::string& weak_identity,
                          int64_t now) = 0;

    // Idempotent delete.
    virtual void invalidate(const std::string& session_id) = 0;

    virtual std::size_t purge_expired_sessions(int64_t now) = 0;
};

class RateWindowStore {
public:
    virtual ~RateWindowStore() = default;

    // Atomically increments the (key, window_start) counter, creating it at 1.
    // Returns the post-increment value.
    virtual long long increment_window(const std::string& key, int64_t window_start_ms) = 0;

    // Deletes windows whose start is strictly before cutoff_ms.
    virtual std::size_t purge_windows_before(int64_t cutoff_ms) = 0;
};

}
