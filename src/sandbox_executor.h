#pragma once

#include "sandbox_runtime.h"
#include "session_manager.h"
#include "task.h"

#include <chrono>
#include <optional>
#include <string>

namespace pyexec {

struct ExecutorSettings {
    std::string image = "pyexec-base";
    std::string user = "appuser";
    size_t memory_limit_mb = 256;
    size_t cpu_shares = 512;
    std::chrono::seconds execute_timeout{30};
    std::chrono::seconds install_timeout{600};
};

// Result of one task run, handed back to the coordinator
struct ExecutionOutcome {
    FailureReason reason = FailureReason::NONE;     // NONE = success
    std::string output;
    std::string error_output;
    std::optional<int> exit_code;
    std::string message;

    bool succeeded() const { return reason == FailureReason::NONE; }
};

// Runs install/execute tasks in disposable sandboxes. The caller holds the
// session's slot for the duration of run().
class SandboxExecutor {
public:
    SandboxExecutor(SandboxRuntime& runtime,
                    SessionManager& sessions,
                    const ExecutorSettings& settings);

    // Never throws for task-level failures; infrastructure problems are
    // reported as INFRASTRUCTURE_ERROR outcomes
    ExecutionOutcome run(const Task& task, const Session& session);

    // Transient script name for an execute task
    static std::string script_name(const Task& task);

private:
    ExecutionOutcome run_install(const Task& task, const Session& session);
    ExecutionOutcome run_execute(const Task& task, const Session& session);

    SandboxSpec base_spec(const Session& session) const;

    // create → run → kill on timeout; the sandbox is removed on every path
    SandboxRunResult run_sandbox(const SandboxSpec& spec, std::chrono::milliseconds timeout);

    SandboxRuntime& runtime_;
    SessionManager& sessions_;
    ExecutorSettings settings_;
};

} // namespace pyexec
