#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace pyexec {

enum class TaskKind {
    INSTALL,
    EXECUTE
};

enum class TaskState {
    QUEUED,
    RUNNING,
    SUCCESS,    // terminal
    FAILED      // terminal
};

// Why a task ended up FAILED
enum class FailureReason {
    NONE,
    NON_ZERO_EXIT,          // user code ran and returned failure
    TIMEOUT,                // wall clock exceeded, sandbox killed
    INFRASTRUCTURE_ERROR    // runtime unreachable, workspace error, ...
};

// One unit of asynchronous work and its status record
struct Task {
    std::string task_id;
    TaskKind kind = TaskKind::EXECUTE;
    std::string session_id;
    TaskState state = TaskState::QUEUED;
    FailureReason failure_reason = FailureReason::NONE;

    // Request payload
    std::vector<std::string> packages;          // install only
    std::string code;                           // execute only
    std::map<std::string, std::string> env;     // execute only

    // Populated on terminal transition
    std::string output;
    std::string error_output;
    std::optional<int> exit_code;
    std::string error;

    int64_t created_at = 0;     // unix seconds
    int64_t completed_at = 0;   // unix seconds, 0 while not terminal

    bool is_terminal() const {
        return state == TaskState::SUCCESS || state == TaskState::FAILED;
    }
};

std::string to_string(TaskKind kind);
std::string to_string(TaskState state);
std::string to_string(FailureReason reason);

std::optional<TaskKind> parse_task_kind(const std::string& value);
std::optional<TaskState> parse_task_state(const std::string& value);
std::optional<FailureReason> parse_failure_reason(const std::string& value);

// JSON form used by status backends that persist outside the process
std::string task_to_json(const Task& task);
Task task_from_json(const std::string& json);

int64_t unix_now();

} // namespace pyexec
