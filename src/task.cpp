#include "task.h"
#include "json_util.h"

#include <chrono>

namespace pyexec {

std::string to_string(TaskKind kind) {
    switch (kind) {
        case TaskKind::INSTALL: return "install";
        case TaskKind::EXECUTE: return "execute";
    }
    return "execute";
}

std::string to_string(TaskState state) {
    switch (state) {
        case TaskState::QUEUED:  return "queued";
        case TaskState::RUNNING: return "running";
        case TaskState::SUCCESS: return "success";
        case TaskState::FAILED:  return "failed";
    }
    return "failed";
}

std::string to_string(FailureReason reason) {
    switch (reason) {
        case FailureReason::NONE:                 return "none";
        case FailureReason::NON_ZERO_EXIT:        return "non_zero_exit";
        case FailureReason::TIMEOUT:              return "timeout";
        case FailureReason::INFRASTRUCTURE_ERROR: return "infrastructure_error";
    }
    return "none";
}

std::optional<TaskKind> parse_task_kind(const std::string& value) {
    if (value == "install") return TaskKind::INSTALL;
    if (value == "execute") return TaskKind::EXECUTE;
    return std::nullopt;
}

std::optional<TaskState> parse_task_state(const std::string& value) {
    if (value == "queued") return TaskState::QUEUED;
    if (value == "running") return TaskState::RUNNING;
    if (value == "success") return TaskState::SUCCESS;
    if (value == "failed") return TaskState::FAILED;
    return std::nullopt;
}

std::optional<FailureReason> parse_failure_reason(const std::string& value) {
    if (value == "none") return FailureReason::NONE;
    if (value == "non_zero_exit") return FailureReason::NON_ZERO_EXIT;
    if (value == "timeout") return FailureReason::TIMEOUT;
    if (value == "infrastructure_error") return FailureReason::INFRASTRUCTURE_ERROR;
    return std::nullopt;
}

std::string task_to_json(const Task& task) {
    Json::Value json(Json::objectValue);
    json["task_id"] = task.task_id;
    json["kind"] = to_string(task.kind);
    json["session_id"] = task.session_id;
    json["state"] = to_string(task.state);
    json["reason"] = to_string(task.failure_reason);
    json["packages"] = to_json_array(task.packages);
    json["code"] = task.code;
    json["env"] = to_json_object(task.env);
    json["output"] = task.output;
    json["error_output"] = task.error_output;
    json["exit_code"] = task.exit_code ? Json::Value(*task.exit_code) : Json::Value(Json::nullValue);
    json["error"] = task.error;
    json["created_at"] = static_cast<Json::Int64>(task.created_at);
    json["completed_at"] = static_cast<Json::Int64>(task.completed_at);
    return write_json(json);
}

Task task_from_json(const std::string& json) {
    Json::Value doc = parse_json(json);
    if (!doc.isObject()) {
        throw JsonParseError("task record must be an object");
    }

    Task task;
    task.task_id = get_string(doc, "task_id").value_or("");
    task.session_id = get_string(doc, "session_id").value_or("");

    auto kind = parse_task_kind(get_string(doc, "kind").value_or(""));
    auto state = parse_task_state(get_string(doc, "state").value_or(""));
    if (task.task_id.empty() || !kind || !state) {
        throw JsonParseError("task record missing id, kind or state");
    }
    task.kind = *kind;
    task.state = *state;
    task.failure_reason = parse_failure_reason(get_string(doc, "reason").value_or("none"))
                              .value_or(FailureReason::NONE);

    task.packages = get_string_array(doc, "packages").value_or(std::vector<std::string>{});
    task.code = get_string(doc, "code").value_or("");
    task.env = get_string_map(doc, "env").value_or(std::map<std::string, std::string>{});
    task.output = get_string(doc, "output").value_or("");
    task.error_output = get_string(doc, "error_output").value_or("");
    if (auto exit_code = get_int(doc, "exit_code")) {
        task.exit_code = static_cast<int>(*exit_code);
    }
    task.error = get_string(doc, "error").value_or("");
    task.created_at = get_int(doc, "created_at").value_or(0);
    task.completed_at = get_int(doc, "completed_at").value_or(0);
    return task;
}

int64_t unix_now() {
    return std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

} // namespace pyexec
