#include "redis_manager.hpp"
#include "server_config.hpp"
#include "crypto_utils.hpp"
#include "security_logger.hpp"
#include <algorithm>
#include <stdexcept>
#include <chrono>
#include <iterator>
#include <vector>

namespace powgate {

namespace {

const std::string CHALLENGE_PREFIX = "powgate:chal:";
const std::string CHALLENGE_INDEX = "powgate:chal_expiry";
const std::string SESSION_PREFIX = "powgate:sess:";
const std::string SESSION_INDEX = "powgate:sess_expiry";
const std::string RATE_PREFIX = "powgate:rl:";
const std::string RATE_INDEX = "powgate:rl_index";

// Records a new challenge and indexes it by expiry.
const std::string ISSUE_SCRIPT = R"(
    redis.call('HSET', KEYS[1],
        'payload', ARGV[1],
        'difficulty', ARGV[2],
        'expires_at', ARGV[3],
        'issued_at', ARGV[4],
        'weak_identity', ARGV[5],
        'client_address', ARGV[6])
    redis.call('PEXPIREAT', KEYS[1], ARGV[7])
    redis.call('ZADD', KEYS[2], ARGV[3], ARGV[8])
    return 1
)";

// Fetch-and-delete. Exactly one caller observes 'consumed' for a given id.
const std::string CONSUME_SCRIPT = R"(
    local f = redis.call('HMGET', KEYS[1], 'payload', 'difficulty', 'expires_at',
                         'issued_at', 'weak_identity', 'client_address')
    redis.call('ZREM', KEYS[2], ARGV[2])
    if not f[1] then
        return {'missing'}
    end
    redis.call('DEL', KEYS[1])
    if tonumber(f[3]) <= tonumber(ARGV[1]) then
        return {'expired'}
    end
    return {'consumed', f[1], f[2], f[3], f[4], f[5] or '', f[6] or ''}
)";

const std::string CREATE_SESSION_SCRIPT = R"(
    redis.call('HSET', KEYS[1],
        'expires_at', ARGV[1],
        'issued_at', ARGV[2],
        'weak_identity', ARGV[3],
        'challenge_id', ARGV[4])
    redis.call('PEXPIREAT', KEYS[1], ARGV[1])
    redis.call('ZADD', KEYS[2], ARGV[1], ARGV[5])
    return 1
)";

const std::string INVALIDATE_SCRIPT = R"(
    redis.call('DEL', KEYS[1])
    redis.call('ZREM', KEYS[2], ARGV[1])
    return 1
)";

// Fixed-window counter; the first hit in a window registers it for purging.
const std::string INCREMENT_SCRIPT = R"(
    local count = redis.call('INCR', KEYS[1])
    if count == 1 then
        redis.call('ZADD', KEYS[2], ARGV[1], KEYS[1])
    end
    return count
)";

// One page of index members scored at or below ARGV[1], at most ARGV[2] of them.
const std::string PURGE_SCAN_SCRIPT = R"(
    return redis.call('ZRANGEBYSCORE', KEYS[1], '-inf', ARGV[1], 'LIMIT', 0, tonumber(ARGV[2]))
)";

// KEYS[1] is the index, KEYS[2..] the records of the members listed in ARGV.
const std::string PURGE_BATCH_SCRIPT = R"(
    for i = 2, #KEYS do
        redis.call('DEL', KEYS[i])
    end
    if #ARGV > 0 then
        redis.call('ZREM', KEYS[1], unpack(ARGV))
    end
    return #ARGV
)";

constexpr std::size_t PURGE_BATCH = 256;

int64_t to_i64(const std::string& s) {
    return static_cast<int64_t>(std::stoll(s));
}

}

RedisManager::RedisManager(const ServerConfig& config)
    : challenge_grace_ms_(static_cast<int64_t>(config.rate_window_retention_sec) * 1000) {
    try {
        sw::redis::ConnectionOptions opts(config.redis_url);
        opts.socket_timeout = std::chrono::milliseconds(config.redis_timeout_ms);
        opts.connect_timeout = std::chrono::milliseconds(config.redis_timeout_ms);

        sw::redis::ConnectionPoolOptions pool_opts;
        pool_opts.size = config.thread_count > 0 ? static_cast<std::size_t>(config.thread_count) : 4;
        pool_opts.wait_timeout = std::chrono::milliseconds(config.redis_timeout_ms);

        redis_ = std::make_unique<sw::redis::Redis>(opts, pool_opts);
        redis_->ping();
        connected_ = true;

        SecurityLogger::log(SecurityLogger::Level::INFO, SecurityLogger::EventType::LIFECYCLE,
                            "internal", "Redis connected");
    } catch (const sw::redis::Error& e) {
        SecurityLogger::log(SecurityLogger::Level::ERROR, SecurityLogger::EventType::STORAGE_FAILURE,
                            "internal", std::string("Redis connection failed: ") + e.what());
        connected_ = false;
    }
}

sw::redis::Redis& RedisManager::client() {
    if (!redis_) {
        throw StorageUnavailable("Redis client not initialised");
    }
    return *redis_;
}

void RedisManager::fail(const std::string& operation, const std::exception& e) {
    connected_ = false;
    throw StorageUnavailable("Redis " + operation + ": " + e.what());
}

bool RedisManager::ping() {
    if (!redis_) return false;
    try {
        redis_->ping();
        connected_ = true;
    } catch (const sw::redis::Error&) {
        connected_ = false;
    }
    return connected_;
}

Challenge RedisManager::issue(int difficulty_bits,
                              const std::string& weak_identity,
                              const std::string& client_address,
                              int64_t ttl_ms,
                              int64_t now) {
    Challenge challenge = Challenge::create(difficulty_bits, weak_identity, client_address, ttl_ms, now);
    auto& redis = client();

    try {
        std::string key = CHALLENGE_PREFIX + challenge.id;
        // Expired records linger for the grace period so submit can report
        // Expired instead of NotFound; the reaper removes them sooner.
        std::string backstop = std::to_string(challenge.expires_at_ms + challenge_grace_ms_);
        redis.eval<long long>(ISSUE_SCRIPT,
            {key, CHALLENGE_INDEX},
            {crypto::base64_encode(challenge.payload.data(), challenge.payload.size()),
             std::to_string(challenge.difficulty_bits),
             std::to_string(challenge.expires_at_ms),
             std::to_string(challenge.issued_at_ms),
             challenge.weak_identity,
             challenge.client_address,
             backstop,
             challenge.id});
        connected_ = true;
    } catch (const sw::redis::Error& e) {
        fail("issue", e);
    }
    return challenge;
}

ConsumeResult RedisManager::consume_if_valid(const std::string& challenge_id, int64_t now) {
    ConsumeResult result;
    auto& redis = client();

    std::vector<sw::redis::OptionalString> reply;
    try {
        std::vector<std::string> keys = {CHALLENGE_PREFIX + challenge_id, CHALLENGE_INDEX};
        std::vector<std::string> args = {std::to_string(now), challenge_id};
        redis.eval(CONSUME_SCRIPT, keys.begin(), keys.end(), args.begin(), args.end(),
                   std::back_inserter(reply));
        connected_ = true;
    } catch (const sw::redis::Error& e) {
        fail("consume", e);
    }

    if (reply.empty() || !reply[0]) {
        throw StorageUnavailable("Redis consume: empty reply");
    }

    const std::string& status = *reply[0];
    if (status == "missing") {
        result.status = ConsumeStatus::NotFound;
        return result;
    }
    if (status == "expired") {
        result.status = ConsumeStatus::Expired;
        return result;
    }
    if (status != "consumed" || reply.size() < 7) {
        throw StorageUnavailable("Redis consume: malformed reply");
    }

    auto payload = crypto::base64_decode(reply[1].value_or(""));
    if (!payload || payload->size() != CHALLENGE_PAYLOAD_SIZE) {
        throw StorageUnavailable("Redis consume: corrupt challenge payload");
    }

    Challenge challenge;
    challenge.id = challenge_id;
    std::copy(payload->begin(), payload->end(), challenge.payload.begin());
    try {
        challenge.difficulty_bits = std::stoi(reply[2].value_or(""));
        challenge.expires_at_ms = to_i64(reply[3].value_or(""));
        challenge.issued_at_ms = to_i64(reply[4].value_or(""));
    } catch (const std::logic_error&) {
        throw StorageUnavailable("Redis consume: corrupt challenge fields");
    }
    challenge.weak_identity = reply[5].value_or("");
    challenge.client_address = reply[6].value_or("");

    result.status = ConsumeStatus::Consumed;
    result.challenge = std::move(challenge);
    return result;
}

std::size_t RedisManager::purge_expired_challenges(int64_t now) {
    return purge_index(CHALLENGE_INDEX, std::to_string(now), CHALLENGE_PREFIX);
}

Session RedisManager::create(const std::string& weak_identity,
                             const std::string& challenge_id,
                             int64_t ttl_ms,
                             int64_t now) {
    Session session = Session::create(weak_identity, challenge_id, ttl_ms, now);
    auto& redis = client();

    try {
        redis.eval<long long>(CREATE_SESSION_SCRIPT,
            {SESSION_PREFIX + session.id, SESSION_INDEX},
            {std::to_string(session.expires_at_ms),
             std::to_string(session.issued_at_ms),
             session.weak_identity,
             session.challenge_id,
             session.id});
        connected_ = true;
    } catch (const sw::redis::Error& e) {
        fail("create session", e);
    }
    return session;
}

bool RedisManager::is_valid(const std::string& session_id,
                            const std::string& weak_identity,
                            int64_t now) {
    auto& redis = client();

    std::vector<sw::redis::OptionalString> fields;
    try {
        redis.hmget(SESSION_PREFIX + session_id, {"expires_at", "weak_identity"},
                    std::back_inserter(fields));
        connected_ = true;
    } catch (const sw::redis::Error& e) {
        fail("session lookup", e);
    }

    if (fields.size() != 2 || !fields[0] || !fields[1]) return false;

    int64_t expires_at = 0;
    try {
        expires_at = to_i64(*fields[0]);
    } catch (const std::logic_error&) {
        return false;
    }
    if (expires_at <= now) return false;

    return crypto::constant_time_equal(*fields[1], weak_identity);
}

void RedisManager::invalidate(const std::string& session_id) {
    auto& redis = client();
    try {
        redis.eval<long long>(INVALIDATE_SCRIPT, {SESSION_PREFIX + session_id, SESSION_INDEX}, {session_id});
        connected_ = true;
    } catch (const sw::redis::Error& e) {
        fail("invalidate session", e);
    }
}

std::size_t RedisManager::purge_expired_sessions(int64_t now) {
    return purge_index(SESSION_INDEX, std::to_string(now), SESSION_PREFIX);
}

long long RedisManager::increment_window(const std::string& key, int64_t window_start_ms) {
    auto& redis = client();
    long long count = 0;
    try {
        count = redis.eval<long long>(INCREMENT_SCRIPT,
            {RATE_PREFIX + key + ":" + std::to_string(window_start_ms), RATE_INDEX},
            {std::to_string(window_start_ms)});
        connected_ = true;
    } catch (const sw::redis::Error& e) {
        fail("rate window increment", e);
    }
    return count;
}

std::size_t RedisManager::purge_windows_before(int64_t cutoff_ms) {
    // Index members are full keys, so no prefix; '(' makes the bound exclusive.
    return purge_index(RATE_INDEX, "(" + std::to_string(cutoff_ms), "");
}

std::size_t RedisManager::purge_index(const std::string& index_key,
                                      const std::string& max_score,
                                      const std::string& prefix) {
    auto& redis = client();
    std::size_t removed = 0;
    try {
        std::vector<std::string> index_keys = {index_key};
        std::vector<std::string> scan_args = {max_score, std::to_string(PURGE_BATCH)};
        while (true) {
            std::vector<std::string> members;
            redis.eval(PURGE_SCAN_SCRIPT, index_keys.begin(), index_keys.end(),
                       scan_args.begin(), scan_args.end(), std::back_inserter(members));
            if (members.empty()) break;

            std::vector<std::string> keys = {index_key};
            keys.reserve(members.size() + 1);
            for (const auto& m : members) keys.push_back(prefix + m);

            removed += static_cast<std::size_t>(redis.eval<long long>(PURGE_BATCH_SCRIPT,
                keys.begin(), keys.end(), members.begin(), members.end()));
            if (members.size() < PURGE_BATCH) break;
        }
        connected_ = true;
    } catch (const sw::redis::Error& e) {
        fail("purge " + index_key, e);
    }
    return removed;
}

}
