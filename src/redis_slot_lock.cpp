#include "redis_slot_lock.h"
#include "errors.h"
#include "file_utils.h"

namespace pyexec {

namespace {

const char* KEY_PREFIX = "pyexec:slot:";

// KEYS[1] slot key, ARGV[1] token
const char* RELEASE_SCRIPT = R"LUA(
if redis.call('GET', KEYS[1]) == ARGV[1] then
  return redis.call('DEL', KEYS[1])
end
return 0
)LUA";

} // anonymous namespace

RedisSlotLock::RedisSlotLock(std::unique_ptr<RedisClient> client,
                             std::chrono::milliseconds ttl)
    : client_(std::move(client)), ttl_(ttl) {}

std::string RedisSlotLock::key_for(const std::string& session_id) {
    return KEY_PREFIX + session_id;
}

std::optional<std::string> RedisSlotLock::try_lock(const std::string& session_id) {
    std::string token = FileUtils::random_hex(16);
    RedisReply reply = client_->command({"SET", key_for(session_id), token,
                                         "NX", "PX", std::to_string(ttl_.count())});
    if (reply.type == RedisReply::Type::ERROR) {
        throw RedisError("SET failed: " + reply.str);
    }
    if (!reply.is_ok()) {
        return std::nullopt;
    }
    return token;
}

void RedisSlotLock::unlock(const std::string& session_id, const std::string& token) {
    RedisReply reply = client_->command({"EVAL", RELEASE_SCRIPT, "1", key_for(session_id), token});
    if (reply.type == RedisReply::Type::ERROR) {
        throw RedisError("EVAL failed: " + reply.str);
    }
}

} // namespace pyexec
