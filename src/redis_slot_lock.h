#pragma once

#include "redis_client.h"
#include "session_slots.h"

#include <chrono>
#include <memory>

namespace pyexec {

// Session slot shared by every instance on one Redis. The lock is
// "pyexec:slot:<session>" holding a random token, set with NX and a
// millisecond expiry; release deletes it only while the token still matches.
class RedisSlotLock : public SlotLock {
public:
    RedisSlotLock(std::unique_ptr<RedisClient> client, std::chrono::milliseconds ttl);

    std::optional<std::string> try_lock(const std::string& session_id) override;
    void unlock(const std::string& session_id, const std::string& token) override;

    static std::string key_for(const std::string& session_id);

private:
    std::unique_ptr<RedisClient> client_;
    std::chrono::milliseconds ttl_;
};

} // namespace pyexec
