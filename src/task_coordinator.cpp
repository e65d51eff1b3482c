#include "task_coordinator.h"
#include "errors.h"
#include "file_utils.h"

#include <algorithm>
#include <iostream>

namespace pyexec {

TaskCoordinator::TaskCoordinator(StatusBackend& status,
                                 SessionManager& sessions,
                                 SessionSlots& slots,
                                 SandboxExecutor& executor,
                                 const CoordinatorSettings& settings)
    : status_(status), sessions_(sessions), slots_(slots), executor_(executor),
      settings_(settings) {
    if (settings_.worker_count == 0) settings_.worker_count = 1;
}

TaskCoordinator::~TaskCoordinator() {
    stop();
}

std::string TaskCoordinator::install_task_id(const std::string& session_id) {
    return "install-" + session_id;
}

// '~' never appears in a session id, so generations cannot collide with
// another session's install alias
std::string TaskCoordinator::install_generation_id(const std::string& session_id,
                                                   unsigned long generation) {
    return install_task_id(session_id) + "~" + std::to_string(generation);
}

unsigned long TaskCoordinator::install_generation(const std::string& task_id) {
    auto tilde = task_id.rfind('~');
    if (tilde == std::string::npos) return 0;
    try {
        return std::stoul(task_id.substr(tilde + 1));
    } catch (const std::exception&) {
        return 0;
    }
}

void TaskCoordinator::validate_packages(const std::vector<std::string>& packages) {
    if (packages.empty()) {
        throw InvalidRequest("packages must be a non-empty list");
    }
    for (const auto& package : packages) {
        if (package.empty()) {
            throw InvalidRequest("package names must not be empty");
        }
        if (package[0] == '-') {
            throw InvalidRequest("package names must not start with '-': " + package);
        }
        for (unsigned char c : package) {
            if (c <= 0x20 || c == 0x7F) {
                throw InvalidRequest("package name contains whitespace or control characters");
            }
        }
    }
}

void TaskCoordinator::validate_env(const std::map<std::string, std::string>& env) {
    for (const auto& [name, value] : env) {
        bool ok = !name.empty() && !(name[0] >= '0' && name[0] <= '9');
        for (char c : name) {
            if (!((c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
                  (c >= '0' && c <= '9') || c == '_')) {
                ok = false;
            }
        }
        if (!ok) {
            throw InvalidRequest("invalid environment variable name: " + name);
        }
        if (value.find('\0') != std::string::npos) {
            throw InvalidRequest("environment variable " + name + " contains NUL");
        }
    }
}

std::string TaskCoordinator::submit_install(const std::string& session_id,
                                            const std::vector<std::string>& packages) {
    SessionManager::validate_session_id(session_id);
    validate_packages(packages);

    // The stable install id is an alias; each install runs under its own
    // generation record so a finished one is never rewritten.
    const std::string alias = install_task_id(session_id);
    std::optional<std::string> current = status_.resolve_alias(alias);
    if (current) {
        auto live = status_.get(*current);
        if (live && !live->is_terminal()) {
            std::cout << "[Coordinator] " << *current << " already "
                      << to_string(live->state) << ", collapsing" << std::endl;
            return alias;
        }
    }

    Task task;
    task.kind = TaskKind::INSTALL;
    task.session_id = session_id;
    task.state = TaskState::QUEUED;
    task.packages = packages;
    task.created_at = unix_now();

    unsigned long generation = current ? install_generation(*current) : 0;
    for (int attempt = 0; attempt < 8; attempt++) {
        generation++;
        task.task_id = install_generation_id(session_id, generation);

        if (!status_.create(task)) {
            auto existing = status_.get(task.task_id);
            if (existing && !existing->is_terminal()) {
                // A concurrent submitter took this generation
                std::cout << "[Coordinator] " << task.task_id << " already "
                          << to_string(existing->state) << ", collapsing" << std::endl;
                return alias;
            }
            // Left over from before the alias expired
            continue;
        }

        std::cout << "[Coordinator] Queued " << task.task_id << " ("
                  << packages.size() << " packages)" << std::endl;
        enqueue(QueueEntry{task, 0, std::chrono::steady_clock::now()});

        if (!status_.compare_and_set_alias(alias, current, task.task_id)) {
            std::cerr << "[Coordinator] " << alias << " moved past " << task.task_id
                      << " while queueing" << std::endl;
        }
        return alias;
    }
    throw std::runtime_error("could not allocate an install generation for session " + session_id);
}

std::string TaskCoordinator::submit_execute(const std::string& session_id,
                                            const std::string& code,
                                            const std::map<std::string, std::string>& env) {
    SessionManager::validate_session_id(session_id);
    if (code.empty()) {
        throw InvalidRequest("code must not be empty");
    }
    validate_env(env);

    Task task;
    task.kind = TaskKind::EXECUTE;
    task.session_id = session_id;
    task.state = TaskState::QUEUED;
    task.code = code;
    task.env = env;
    task.created_at = unix_now();

    for (int attempt = 0; attempt < 5; attempt++) {
        task.task_id = "exec-" + session_id + "-" + FileUtils::random_hex(4);
        if (status_.create(task)) {
            std::cout << "[Coordinator] Queued " << task.task_id << std::endl;
            enqueue(QueueEntry{task, 0, std::chrono::steady_clock::now()});
            return task.task_id;
        }
    }
    throw std::runtime_error("could not allocate a unique task id for session " + session_id);
}

std::optional<Task> TaskCoordinator::get_status(const std::string& task_id) {
    if (auto record = status_.get(task_id)) {
        return record;
    }
    if (auto target = status_.resolve_alias(task_id)) {
        return status_.get(*target);
    }
    return std::nullopt;
}

void TaskCoordinator::start() {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    if (!workers_.empty()) return;
    stopping_ = false;
    for (size_t i = 0; i < settings_.worker_count; i++) {
        workers_.emplace_back(&TaskCoordinator::worker_loop, this, i);
    }
    std::cout << "[Coordinator] Started " << settings_.worker_count << " workers" << std::endl;
}

void TaskCoordinator::stop() {
    std::vector<std::thread> workers;
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (workers_.empty()) return;
        stopping_ = true;
        workers.swap(workers_);
    }
    queue_cv_.notify_all();
    for (auto& worker : workers) {
        worker.join();
    }
    std::cout << "[Coordinator] Stopped workers (" << stats().queue_depth
              << " entries left queued)" << std::endl;
}

TaskCoordinator::Stats TaskCoordinator::stats() const {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    Stats stats;
    stats.queue_depth = queue_.size();
    stats.worker_count = workers_.empty() ? 0 : settings_.worker_count;
    stats.active = active_.load();
    return stats;
}

void TaskCoordinator::enqueue(QueueEntry entry) {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        queue_.push_back(std::move(entry));
    }
    queue_cv_.notify_one();
}

std::optional<TaskCoordinator::QueueEntry> TaskCoordinator::next_entry() {
    std::unique_lock<std::mutex> lock(queue_mutex_);
    while (!stopping_) {
        auto now = std::chrono::steady_clock::now();
        auto due = std::find_if(queue_.begin(), queue_.end(),
                                [now](const QueueEntry& e) { return e.not_before <= now; });
        if (due != queue_.end()) {
            QueueEntry entry = std::move(*due);
            queue_.erase(due);
            return entry;
        }

        if (queue_.empty()) {
            queue_cv_.wait(lock);
        } else {
            auto earliest = std::min_element(queue_.begin(), queue_.end(),
                [](const QueueEntry& a, const QueueEntry& b) { return a.not_before < b.not_before; });
            queue_cv_.wait_until(lock, earliest->not_before);
        }
    }
    return std::nullopt;
}

void TaskCoordinator::worker_loop(size_t worker_id) {
    while (auto entry = next_entry()) {
        std::string task_id = entry->task.task_id;
        try {
            process(std::move(*entry));
        } catch (const std::exception& e) {
            // Status backend unreachable and the like; the record stays where it was
            std::cerr << "[Coordinator] Worker " << worker_id << " failed on "
                      << task_id << ": " << e.what() << std::endl;
        }
    }
}

void TaskCoordinator::requeue(QueueEntry entry) {
    entry.attempts++;
    auto backoff = settings_.requeue_backoff;
    for (int i = 1; i < entry.attempts && backoff < settings_.requeue_backoff_max; i++) {
        backoff *= 2;
    }
    backoff = std::min(backoff, settings_.requeue_backoff_max);
    entry.not_before = std::chrono::steady_clock::now() + backoff;
    enqueue(std::move(entry));
}

void TaskCoordinator::process(QueueEntry entry) {
    const std::string& session_id = entry.task.session_id;

    auto lease = slots_.try_acquire(session_id, settings_.slot_wait);
    if (!lease) {
        requeue(std::move(entry));
        return;
    }

    Task running = entry.task;
    running.state = TaskState::RUNNING;
    if (!status_.compare_and_set(running.task_id, TaskState::QUEUED, running)) {
        std::cerr << "[Coordinator] " << running.task_id
                  << " is no longer queued, dropping" << std::endl;
        return;
    }
    std::cout << "[Coordinator] Task " << running.task_id << " running" << std::endl;

    active_++;
    ExecutionOutcome outcome;
    try {
        Session session = sessions_.resolve_or_create(session_id);
        sessions_.touch(session_id);
        outcome = executor_.run(running, session);
    } catch (const std::exception& e) {
        outcome = ExecutionOutcome{};
        outcome.reason = FailureReason::INFRASTRUCTURE_ERROR;
        outcome.message = e.what();
    }
    active_--;

    finish(running, outcome);
}

void TaskCoordinator::finish(const Task& running, const ExecutionOutcome& outcome) {
    Task done = running;
    done.state = outcome.succeeded() ? TaskState::SUCCESS : TaskState::FAILED;
    done.failure_reason = outcome.reason;
    done.output = outcome.output;
    done.error_output = outcome.error_output;
    done.exit_code = outcome.exit_code;
    done.error = outcome.message;
    done.completed_at = unix_now();

    if (!status_.compare_and_set(done.task_id, TaskState::RUNNING, done)) {
        std::cerr << "[Coordinator] Late write for " << done.task_id << " ignored" << std::endl;
        return;
    }

    std::cout << "[Coordinator] Task " << done.task_id << " " << to_string(done.state);
    if (done.exit_code) std::cout << " (exit=" << *done.exit_code << ")";
    if (!outcome.succeeded()) std::cout << " reason=" << to_string(outcome.reason);
    std::cout << std::endl;
}

} // namespace pyexec
