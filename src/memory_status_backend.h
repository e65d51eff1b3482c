#pragma once

#include "status_backend.h"

#include <chrono>
#include <mutex>
#include <unordered_map>

namespace pyexec {

// Single-process task store. Records expire ttl after their last write.
class MemoryStatusBackend : public StatusBackend {
public:
    explicit MemoryStatusBackend(std::chrono::seconds ttl = std::chrono::seconds(3600));

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

    std::string name() const override { return "memory"; }

    size_t size() const;

private:
    struct Entry {
        Task task;
        std::chrono::steady_clock::time_point expires_at;
    };

    struct AliasEntry {
        std::string task_id;
        std::chrono::steady_clock::time_point expires_at;
    };

    // Caller holds mutex_
    Entry* find_live(const std::string& task_id);
    AliasEntry* find_live_alias(const std::string& alias);
    void purge_expired();

    std::chrono::seconds ttl_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, Entry> records_;
    std::unordered_map<std::string, AliasEntry> aliases_;
    std::chrono::steady_clock::time_point last_purge_;
};

} // namespace pyexec
