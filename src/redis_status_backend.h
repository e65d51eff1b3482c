#pragma once

#include "redis_client.h"
#include "status_backend.h"

#include <chrono>
#include <memory>

namespace pyexec {

// Task store shared by a fleet of orchestration instances. Records are JSON
// strings under "pyexec:task:<id>" with a Redis-side expiry; aliases are plain
// strings under "pyexec:alias:<name>". Both compare-and-set operations run as
// Lua scripts so they are atomic across instances.
class RedisStatusBackend : public StatusBackend {
public:
    RedisStatusBackend(std::unique_ptr<RedisClient> client, std::chrono::seconds ttl);

    void put(const Task& task) override;
    bool create(const Task& task) override;
    bool compare_and_set(const std::string& task_id,
                         TaskState expected_state,
                         const Task& new_record) override;
    std::optional<Task> get(const std::string& task_id) override;
    bool compare_and_set_alias(const std::string& alias,
                               const std::optional<std::string>& expected,
                               const std::string& task_id) override;
    std::optional<std::string> resolve_alias(const std::string& alias) override;

    std::string name() const override { return "redis"; }

    static std::string key_for(const std::string& task_id);
    static std::string alias_key_for(const std::string& alias);

private:
    RedisReply checked(const std::vector<std::string>& args);

    std::unique_ptr<RedisClient> client_;
    std::chrono::seconds ttl_;
};

} // namespace pyexec
