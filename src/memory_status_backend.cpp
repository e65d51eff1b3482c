#include "memory_status_backend.h"

namespace pyexec {

MemoryStatusBackend::MemoryStatusBackend(std::chrono::seconds ttl)
    : ttl_(ttl), last_purge_(std::chrono::steady_clock::now()) {}

MemoryStatusBackend::Entry* MemoryStatusBackend::find_live(const std::string& task_id) {
    auto it = records_.find(task_id);
    if (it == records_.end()) return nullptr;
    if (it->second.expires_at <= std::chrono::steady_clock::now()) {
        records_.erase(it);
        return nullptr;
    }
    return &it->second;
}

MemoryStatusBackend::AliasEntry* MemoryStatusBackend::find_live_alias(const std::string& alias) {
    auto it = aliases_.find(alias);
    if (it == aliases_.end()) return nullptr;
    if (it->second.expires_at <= std::chrono::steady_clock::now()) {
        aliases_.erase(it);
        return nullptr;
    }
    return &it->second;
}

void MemoryStatusBackend::purge_expired() {
    auto now = std::chrono::steady_clock::now();
    if (now - last_purge_ < std::chrono::seconds(60)) return;
    last_purge_ = now;

    auto it = records_.begin();
    while (it != records_.end()) {
        if (it->second.expires_at <= now) {
            it = records_.erase(it);
        } else {
            ++it;
        }
    }
    for (auto alias = aliases_.begin(); alias != aliases_.end();) {
        if (alias->second.expires_at <= now) {
            alias = aliases_.erase(alias);
        } else {
            ++alias;
        }
    }
}

void MemoryStatusBackend::put(const Task& task) {
    std::lock_guard<std::mutex> lock(mutex_);
    purge_expired();
    records_[task.task_id] = Entry{task, std::chrono::steady_clock::now() + ttl_};
}

bool MemoryStatusBackend::create(const Task& task) {
    std::lock_guard<std::mutex> lock(mutex_);
    purge_expired();
    if (find_live(task.task_id)) return false;
    records_[task.task_id] = Entry{task, std::chrono::steady_clock::now() + ttl_};
    return true;
}

bool MemoryStatusBackend::compare_and_set(const std::string& task_id,
                                          TaskState expected_state,
                                          const Task& new_record) {
    std::lock_guard<std::mutex> lock(mutex_);
    Entry* entry = find_live(task_id);
    if (!entry || entry->task.state != expected_state) {
        return false;
    }
    entry->task = new_record;
    entry->task.task_id = task_id;
    entry->expires_at = std::chrono::steady_clock::now() + ttl_;
    return true;
}

std::optional<Task> MemoryStatusBackend::get(const std::string& task_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    Entry* entry = find_live(task_id);
    if (!entry) return std::nullopt;
    return entry->task;
}

bool MemoryStatusBackend::compare_and_set_alias(const std::string& alias,
                                                const std::optional<std::string>& expected,
                                                const std::string& task_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    AliasEntry* entry = find_live_alias(alias);
    std::optional<std::string> current;
    if (entry) current = entry->task_id;
    if (current != expected) {
        return false;
    }
    aliases_[alias] = AliasEntry{task_id, std::chrono::steady_clock::now() + ttl_};
    return true;
}

std::optional<std::string> MemoryStatusBackend::resolve_alias(const std::string& alias) {
    std::lock_guard<std::mutex> lock(mutex_);
    AliasEntry* entry = find_live_alias(alias);
    if (!entry) return std::nullopt;
    return entry->task_id;
}

size_t MemoryStatusBackend::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return records_.size();
}

} // namespace pyexec
