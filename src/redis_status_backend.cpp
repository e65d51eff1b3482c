#include "redis_status_backend.h"
#include "errors.h"
#include "json_util.h"

#include <iostream>

namespace pyexec {

namespace {

const char* KEY_PREFIX = "pyexec:task:";
const char* ALIAS_PREFIX = "pyexec:alias:";

// KEYS[1] record key, ARGV[1] expected state, ARGV[2] new JSON, ARGV[3] ttl
const char* CAS_SCRIPT = R"LUA(
local current = redis.call('GET', KEYS[1])
if not current then return 0 end
local ok, record = pcall(cjson.decode, current)
if not ok or record['state'] ~= ARGV[1] then return 0 end
redis.call('SET', KEYS[1], ARGV[2], 'EX', ARGV[3])
return 1
)LUA";

// KEYS[1] alias key, ARGV[1] "1" if expected is set, ARGV[2] expected id,
// ARGV[3] new id, ARGV[4] ttl
const char* ALIAS_CAS_SCRIPT = R"LUA(
local current = redis.call('GET', KEYS[1])
if ARGV[1] == '1' then
  if current ~= ARGV[2] then return 0 end
elseif current then
  return 0
end
redis.call('SET', KEYS[1], ARGV[3], 'EX', ARGV[4])
return 1
)LUA";

} // anonymous namespace

RedisStatusBackend::RedisStatusBackend(std::unique_ptr<RedisClient> client,
                                       std::chrono::seconds ttl)
    : client_(std::move(client)), ttl_(ttl) {}

std::string RedisStatusBackend::key_for(const std::string& task_id) {
    return KEY_PREFIX + task_id;
}

std::string RedisStatusBackend::alias_key_for(const std::string& alias) {
    return ALIAS_PREFIX + alias;
}

RedisReply RedisStatusBackend::checked(const std::vector<std::string>& args) {
    RedisReply reply = client_->command(args);
    if (reply.type == RedisReply::Type::ERROR) {
        throw RedisError(args.front() + " failed: " + reply.str);
    }
    return reply;
}

void RedisStatusBackend::put(const Task& task) {
    checked({"SET", key_for(task.task_id), task_to_json(task),
             "EX", std::to_string(ttl_.count())});
}

bool RedisStatusBackend::create(const Task& task) {
    RedisReply reply = checked({"SET", key_for(task.task_id), task_to_json(task),
                                "NX", "EX", std::to_string(ttl_.count())});
    // SET NX answers +OK when written and nil when the key already existed
    return reply.is_ok();
}

bool RedisStatusBackend::compare_and_set(const std::string& task_id,
                                         TaskState expected_state,
                                         const Task& new_record) {
    Task record = new_record;
    record.task_id = task_id;

    RedisReply reply = checked({"EVAL", CAS_SCRIPT, "1", key_for(task_id),
                                to_string(expected_state), task_to_json(record),
                                std::to_string(ttl_.count())});
    return reply.type == RedisReply::Type::INTEGER && reply.integer == 1;
}

std::optional<Task> RedisStatusBackend::get(const std::string& task_id) {
    RedisReply reply = checked({"GET", key_for(task_id)});
    if (reply.type != RedisReply::Type::STRING) {
        return std::nullopt;
    }
    try {
        return task_from_json(reply.str);
    } catch (const std::exception& e) {
        std::cerr << "[Redis] Discarding unreadable record " << task_id
                  << ": " << e.what() << std::endl;
        return std::nullopt;
    }
}

bool RedisStatusBackend::compare_and_set_alias(const std::string& alias,
                                               const std::optional<std::string>& expected,
                                               const std::string& task_id) {
    RedisReply reply = checked({"EVAL", ALIAS_CAS_SCRIPT, "1", alias_key_for(alias),
                                expected ? "1" : "0", expected.value_or(""), task_id,
                                std::to_string(ttl_.count())});
    return reply.type == RedisReply::Type::INTEGER && reply.integer == 1;
}

std::optional<std::string> RedisStatusBackend::resolve_alias(const std::string& alias) {
    RedisReply reply = checked({"GET", alias_key_for(alias)});
    if (reply.type != RedisReply::Type::STRING) {
        return std::nullopt;
    }
    return reply.str;
}

} // namespace pyexec
