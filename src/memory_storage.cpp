#include "memory_storage.hpp"
#include "crypto_utils.hpp"
#include <iterator>

namespace powgate {

Challenge MemoryChallengeStore::issue(int difficulty_bits,
                                      const std::string& weak_identity,
                                      const std::string& client_address,
                                      int64_t ttl_ms,
                                      int64_t now) {
    Challenge challenge = Challenge::create(difficulty_bits, weak_identity, client_address, ttl_ms, now);

    std::lock_guard<std::mutex> lock(mutex_);
    challenges_.emplace(challenge.id, challenge);
    return challenge;
}

ConsumeResult MemoryChallengeStore::consume_if_valid(const std::string& challenge_id, int64_t now) {
    ConsumeResult result;

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = challenges_.find(challenge_id);
    if (it == challenges_.end()) {
        result.status = ConsumeStatus::NotFound;
        return result;
    }

    Challenge challenge = std::move(it->second);
    challenges_.erase(it);

    if (challenge.is_expired(now)) {
        result.status = ConsumeStatus::Expired;
        return result;
    }

    result.status = ConsumeStatus::Consumed;
    result.challenge = std::move(challenge);
    return result;
}

std::size_t MemoryChallengeStore::purge_expired_challenges(int64_t now) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t removed = 0;
    for (auto it = challenges_.begin(); it != challenges_.end();) {
        if (it->second.is_expired(now)) {
            it = challenges_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}

std::size_t MemoryChallengeStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return challenges_.size();
}

Session MemorySessionStore::create(const std::string& weak_identity,
                                   const std::string& challenge_id,
                                   int64_t ttl_ms,
                                   int64_t now) {
    Session session = Session::create(weak_identity, challenge_id, ttl_ms, now);

    std::unique_lock lock(mutex_);
    sessions_.emplace(session.id, session);
    return session;
}

bool MemorySessionStore::is_valid(const std::string& session_id,
                                  const std::string& weak_identity,
                                  int64_t now) {
    std::shared_lock lock(mutex_);
    auto it = sessions_.find(session_id);
    if (it == sessions_.end()) return false;

    const Session& session = it->second;
    if (session.is_expired(now)) return false;

    return crypto::constant_time_equal(session.weak_identity, weak_identity);
}

void MemorySessionStore::invalidate(const std::string& session_id) {
    std::unique_lock lock(mutex_);
    sessions_.erase(session_id);
}

std::size_t MemorySessionStore::purge_expired_sessions(int64_t now) {
    std::unique_lock lock(mutex_);
    std::size_t removed = 0;
    for (auto it = sessions_.begin(); it != sessions_.end();) {
        if (it->second.is_expired(now)) {
            it = sessions_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}

std::size_t MemorySessionStore::size() const {
    std::shared_lock lock(mutex_);
    return sessions_.size();
}

long long MemoryRateWindowStore::increment_window(const std::string& key, int64_t window_start_ms) {
    std::lock_guard<std::mutex> lock(mutex_);
    return ++windows_[{window_start_ms, key}];
}

std::size_t MemoryRateWindowStore::purge_windows_before(int64_t cutoff_ms) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto end = windows_.lower_bound({cutoff_ms, std::string()});
    std::size_t removed = static_cast<std::size_t>(std::distance(windows_.begin(), end));
    windows_.erase(windows_.begin(), end);
    return removed;
}

std::size_t MemoryRateWindowStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return windows_.size();
}

}
