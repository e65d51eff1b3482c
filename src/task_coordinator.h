#pragma once

#include "sandbox_executor.h"
#include "session_manager.h"
#include "session_slots.h"
#include "status_backend.h"
#include "task.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace pyexec {

struct CoordinatorSettings {
    size_t worker_count = 4;
    std::chrono::milliseconds slot_wait{50};
    std::chrono::milliseconds requeue_backoff{100};
    std::chrono::milliseconds requeue_backoff_max{2000};
};

// Accepts install/execute submissions, assigns ids, and drives each task
// through queued → running → success|failed on a bounded worker pool.
// The only writer of task state.
class TaskCoordinator {
public:
    TaskCoordinator(StatusBackend& status,
                    SessionManager& sessions,
                    SessionSlots& slots,
                    SandboxExecutor& executor,
                    const CoordinatorSettings& settings);
    ~TaskCoordinator();

    TaskCoordinator(const TaskCoordinator&) = delete;
    TaskCoordinator& operator=(const TaskCoordinator&) = delete;

    // Validation failures throw InvalidSessionId / InvalidRequest and
    // nothing is enqueued. Always returns install_task_id(session_id); a
    // second install while one is queued or running collapses onto it, and
    // one after it finished queues a new generation record.
    std::string submit_install(const std::string& session_id,
                               const std::vector<std::string>& packages);

    std::string submit_execute(const std::string& session_id,
                               const std::string& code,
                               const std::map<std::string, std::string>& env = {});

    // Accepts a record id or an install alias (latest generation)
    std::optional<Task> get_status(const std::string& task_id);

    void start();
    // Joins the workers. Entries still queued stay queued.
    void stop();

    struct Stats {
        size_t queue_depth = 0;
        size_t worker_count = 0;
        size_t active = 0;
    };
    Stats stats() const;

    static std::string install_task_id(const std::string& session_id);
    static std::string install_generation_id(const std::string& session_id,
                                             unsigned long generation);
    // 0 when task_id is not a generation id
    static unsigned long install_generation(const std::string& task_id);
    static void validate_packages(const std::vector<std::string>& packages);
    static void validate_env(const std::map<std::string, std::string>& env);

private:
    struct QueueEntry {
        Task task;
        int attempts = 0;
        std::chrono::steady_clock::time_point not_before;
    };

    void enqueue(QueueEntry entry);
    void worker_loop(size_t worker_id);

    // Blocks until an entry is due or the pool is stopping
    std::optional<QueueEntry> next_entry();

    void process(QueueEntry entry);
    void requeue(QueueEntry entry);
    void finish(const Task& running, const ExecutionOutcome& outcome);

    StatusBackend& status_;
    SessionManager& sessions_;
    SessionSlots& slots_;
    SandboxExecutor& executor_;
    CoordinatorSettings settings_;

    mutable std::mutex queue_mutex_;
    std::condition_variable queue_cv_;
    std::deque<QueueEntry> queue_;
    bool stopping_ = false;

    std::vector<std::thread> workers_;
    std::atomic<size_t> active_{0};
};

} // namespace pyexec
