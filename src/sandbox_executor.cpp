#include "sandbox_executor.h"
#include "constants.h"
#include "errors.h"
#include "file_utils.h"

#include <filesystem>
#include <iostream>
#include <thread>

namespace fs = std::filesystem;

namespace pyexec {

namespace {

// Removes a created sandbox when the scope ends, whatever the exit path
class SandboxGuard {
public:
    SandboxGuard(SandboxRuntime& runtime, SandboxHandle handle)
        : runtime_(runtime), handle_(std::move(handle)) {}

    ~SandboxGuard() {
        for (int attempt = 1; attempt <= TEARDOWN_ATTEMPTS; attempt++) {
            try {
                runtime_.remove(handle_);
                return;
            } catch (const TeardownError& e) {
                std::cerr << "[Executor] " << e.what() << " (attempt " << attempt
                          << "/" << TEARDOWN_ATTEMPTS << ")" << std::endl;
            } catch (const std::exception& e) {
                // Nothing may leave a destructor
                std::cerr << "[Executor] Removing sandbox " << handle_ << ": " << e.what()
                          << " (attempt " << attempt << "/" << TEARDOWN_ATTEMPTS << ")" << std::endl;
            }
            if (attempt < TEARDOWN_ATTEMPTS) {
                std::this_thread::sleep_for(std::chrono::milliseconds(TEARDOWN_RETRY_DELAY_MS));
            }
        }
        std::cerr << "[Executor] Giving up on removing sandbox " << handle_ << std::endl;
    }

    SandboxGuard(const SandboxGuard&) = delete;
    SandboxGuard& operator=(const SandboxGuard&) = delete;

private:
    SandboxRuntime& runtime_;
    SandboxHandle handle_;
};

// Deletes the transient script on scope exit
class ScriptGuard {
public:
    explicit ScriptGuard(std::string path) : path_(std::move(path)) {}
    ~ScriptGuard() {
        std::error_code ec;
        fs::remove(path_, ec);
        if (ec) {
            std::cerr << "[Executor] Failed to remove " << path_ << ": " << ec.message() << std::endl;
        }
    }

    ScriptGuard(const ScriptGuard&) = delete;
    ScriptGuard& operator=(const ScriptGuard&) = delete;

private:
    std::string path_;
};

ExecutionOutcome infrastructure_failure(const std::string& message) {
    ExecutionOutcome outcome;
    outcome.reason = FailureReason::INFRASTRUCTURE_ERROR;
    outcome.message = message;
    return outcome;
}

} // anonymous namespace

SandboxExecutor::SandboxExecutor(SandboxRuntime& runtime,
                                 SessionManager& sessions,
                                 const ExecutorSettings& settings)
    : runtime_(runtime), sessions_(sessions), settings_(settings) {}

std::string SandboxExecutor::script_name(const Task& task) {
    return std::string(RESERVED_FILE_PREFIX) + task.task_id + ".py";
}

SandboxSpec SandboxExecutor::base_spec(const Session& session) const {
    SandboxSpec spec;
    spec.image = settings_.image;
    spec.workspace_host_path = session.local_path;
    spec.workspace_mount_point = WORKSPACE_MOUNT_POINT;
    spec.user = settings_.user;
    spec.memory_limit_bytes = settings_.memory_limit_mb * 1024 * 1024;
    spec.cpu_shares = settings_.cpu_shares;
    spec.max_processes = MAX_PROCESSES_PER_SANDBOX;
    return spec;
}

SandboxRunResult SandboxExecutor::run_sandbox(const SandboxSpec& spec,
                                              std::chrono::milliseconds timeout) {
    SandboxHandle handle = runtime_.create(spec);
    SandboxGuard guard(runtime_, handle);

    std::cout << "[Executor] Sandbox " << handle << " started ("
              << runtime_.name() << ", network " << (spec.allow_network ? "on" : "off") << ")"
              << std::endl;

    SandboxRunResult result = runtime_.run_with_timeout(handle, timeout);
    if (result.timed_out) {
        std::cout << "[Executor] Sandbox " << handle << " timed out after "
                  << timeout.count() << "ms, killing" << std::endl;
        runtime_.kill(handle);
    }
    return result;
}

ExecutionOutcome SandboxExecutor::run(const Task& task, const Session& session) {
    try {
        std::error_code ec;
        fs::create_directories(session.local_path, ec);
        if (ec) {
            return infrastructure_failure("cannot create workspace: " + ec.message());
        }
        sessions_.sync_down(session);

        if (task.kind == TaskKind::INSTALL) {
            return run_install(task, session);
        }
        return run_execute(task, session);
    } catch (const LaunchError& e) {
        std::cerr << "[Executor] " << task.task_id << ": " << e.what() << std::endl;
        return infrastructure_failure(e.what());
    } catch (const StorageError& e) {
        std::cerr << "[Executor] " << task.task_id << ": " << e.what() << std::endl;
        return infrastructure_failure(e.what());
    }
}

ExecutionOutcome SandboxExecutor::run_install(const Task& task, const Session& session) {
    using namespace std::chrono;

    ExecutionOutcome outcome;
    auto deadline = steady_clock::now() + settings_.install_timeout;
    const std::string venv_python =
        std::string(WORKSPACE_MOUNT_POINT) + "/" + VENV_DIR + "/bin/python";

    // Step 1: virtual environment
    if (!SessionManager::environment_present(session)) {
        outcome.output += "Creating virtual environment...\n";

        SandboxSpec spec = base_spec(session);
        spec.allow_network = true;
        spec.command = {"python", "-m", "venv",
                        std::string(WORKSPACE_MOUNT_POINT) + "/" + VENV_DIR};

        SandboxRunResult result = run_sandbox(
            spec, duration_cast<milliseconds>(deadline - steady_clock::now()));
        outcome.output += result.stdout_output + result.stderr_output;
        outcome.error_output += result.stderr_output;

        if (result.timed_out) {
            outcome.reason = FailureReason::TIMEOUT;
            outcome.message = "venv creation exceeded " +
                              std::to_string(settings_.install_timeout.count()) + "s";
            return outcome;
        }
        if (result.exit_code != 0) {
            outcome.reason = FailureReason::NON_ZERO_EXIT;
            outcome.exit_code = result.exit_code;
            outcome.message = "venv creation failed";
            return outcome;
        }
    }

    // Step 2: packages
    auto remaining = duration_cast<milliseconds>(deadline - steady_clock::now());
    if (remaining.count() <= 0) {
        outcome.reason = FailureReason::TIMEOUT;
        outcome.message = "install exceeded " + std::to_string(settings_.install_timeout.count()) + "s";
        return outcome;
    }

    std::string package_list;
    for (const auto& package : task.packages) {
        if (!package_list.empty()) package_list += " ";
        package_list += package;
    }
    outcome.output += "Installing packages: " + package_list + "\n";

    SandboxSpec spec = base_spec(session);
    spec.allow_network = true;
    spec.command = {venv_python, "-m", "pip", "install", "--no-input", "--disable-pip-version-check"};
    spec.command.insert(spec.command.end(), task.packages.begin(), task.packages.end());

    SandboxRunResult result = run_sandbox(spec, remaining);
    outcome.output += result.stdout_output + result.stderr_output;
    outcome.error_output += result.stderr_output;

    if (result.timed_out) {
        outcome.reason = FailureReason::TIMEOUT;
        outcome.message = "install exceeded " + std::to_string(settings_.install_timeout.count()) + "s";
        return outcome;
    }

    outcome.exit_code = result.exit_code;
    if (result.exit_code != 0) {
        outcome.reason = FailureReason::NON_ZERO_EXIT;
        outcome.message = "pip install exited with code " + std::to_string(result.exit_code);
        return outcome;
    }

    outcome.output += "Packages installed successfully.\n";
    sessions_.mark_environment_ready(session.session_id);
    try {
        sessions_.publish_environment(session);
    } catch (const StorageError& e) {
        // The local venv is usable; only other instances miss it
        std::cerr << "[Executor] Publishing environment of " << session.session_id
                  << " failed: " << e.what() << std::endl;
    }
    return outcome;
}

ExecutionOutcome SandboxExecutor::run_execute(const Task& task, const Session& session) {
    const std::string script = script_name(task);

    ExecutionOutcome outcome;
    SandboxRunResult result;
    {
        ScriptGuard script_guard(session.local_path + "/" + script);
        FileUtils::write_file_beneath(session.local_path, script, task.code);

        SandboxSpec spec = base_spec(session);
        spec.allow_network = false;
        spec.env = task.env;

        std::string python = "python";
        if (SessionManager::environment_present(session)) {
            python = std::string(WORKSPACE_MOUNT_POINT) + "/" + VENV_DIR + "/bin/python";
        }
        spec.command = {python, std::string(WORKSPACE_MOUNT_POINT) + "/" + script};

        result = run_sandbox(spec, settings_.execute_timeout);
    }

    outcome.output = result.stdout_output;
    outcome.error_output = result.stderr_output;

    if (result.timed_out) {
        outcome.reason = FailureReason::TIMEOUT;
        outcome.message = "execution exceeded " +
                          std::to_string(settings_.execute_timeout.count()) + "s";
    } else {
        outcome.exit_code = result.exit_code;
        if (result.exit_code != 0) {
            outcome.reason = FailureReason::NON_ZERO_EXIT;
            outcome.message = "process exited with code " + std::to_string(result.exit_code);
        }
    }

    // Files produced by the run are published even when it failed
    try {
        sessions_.sync_up(session, script);
    } catch (const StorageError& e) {
        // The run itself already happened; keep its outcome
        std::cerr << "[Executor] Publishing workspace of " << session.session_id
                  << " failed: " << e.what() << std::endl;
    }
    return outcome;
}

} // namespace pyexec
