#include "docker_runtime.h"
#include "errors.h"
#include "process.h"

#include <iostream>

namespace pyexec {

namespace {

// CLI round trips other than the attached run
const std::chrono::milliseconds CLI_TIMEOUT{60000};

std::string trim(const std::string& text) {
    size_t start = text.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = text.find_last_not_of(" \t\r\n");
    return text.substr(start, end - start + 1);
}

ProcessResult run_cli(const std::vector<std::string>& argv) {
    ProcessOptions options;
    options.timeout = CLI_TIMEOUT;
    return run_process(argv, options);
}

} // anonymous namespace

DockerRuntime::DockerRuntime(const std::string& docker_binary) : docker_(docker_binary) {}

std::vector<std::string> DockerRuntime::create_command(const SandboxSpec& spec) const {
    std::vector<std::string> argv = {
        docker_, "create",
        "--network", spec.allow_network ? "bridge" : "none",
        "--memory", std::to_string(spec.memory_limit_bytes),
        "--memory-swap", std::to_string(spec.memory_limit_bytes),
        "--cpu-shares", std::to_string(spec.cpu_shares),
        "--pids-limit", std::to_string(spec.max_processes),
        "--user", spec.user,
        "--cap-drop", "ALL",
        "--security-opt", "no-new-privileges",
        "-v", spec.workspace_host_path + ":" + spec.workspace_mount_point + ":rw",
        "-w", spec.workspace_mount_point,
        "-e", "HOME=" + spec.workspace_mount_point,
    };

    // Airgapped runs get a read-only root; the workspace stays writable
    if (!spec.allow_network) {
        argv.insert(argv.end(), {"--read-only", "--tmpfs", "/tmp:rw,noexec,nosuid,size=64m"});
    }

    for (const auto& [key, value] : spec.env) {
        argv.push_back("-e");
        argv.push_back(key + "=" + value);
    }

    argv.push_back(spec.image);
    argv.insert(argv.end(), spec.command.begin(), spec.command.end());
    return argv;
}

bool DockerRuntime::is_available() const {
    try {
        return run_cli({docker_, "version", "--format", "{{.Server.Version}}"}).exit_code == 0;
    } catch (const LaunchError&) {
        return false;
    }
}

SandboxHandle DockerRuntime::create(const SandboxSpec& spec) {
    ProcessResult result = run_cli(create_command(spec));
    if (result.exit_code != 0) {
        throw LaunchError("docker create exited with " + std::to_string(result.exit_code) +
                          ": " + trim(result.stderr_output));
    }

    SandboxHandle handle = trim(result.stdout_output);
    if (handle.empty()) {
        throw LaunchError("docker create returned no container id");
    }
    return handle;
}

SandboxRunResult DockerRuntime::run_with_timeout(const SandboxHandle& handle,
                                                 std::chrono::milliseconds timeout) {
    ProcessOptions options;
    options.timeout = timeout;
    ProcessResult attached = run_process({docker_, "start", "-a", handle}, options);

    SandboxRunResult result;
    result.stdout_output = std::move(attached.stdout_output);
    result.stderr_output = std::move(attached.stderr_output);

    if (attached.timed_out) {
        // The CLI client is gone; the container keeps running until kill()
        result.timed_out = true;
        return result;
    }

    // The CLI's own exit code mixes daemon errors with the program's
    ProcessResult inspect = run_cli({docker_, "inspect", "--format",
                                     "{{.State.ExitCode}}|{{.State.Error}}", handle});
    if (inspect.exit_code != 0) {
        throw LaunchError("docker inspect " + handle + ": " + trim(inspect.stderr_output));
    }

    std::string state = trim(inspect.stdout_output);
    size_t bar = state.find('|');
    std::string daemon_error = bar == std::string::npos ? "" : state.substr(bar + 1);
    if (!daemon_error.empty()) {
        throw LaunchError("container " + handle + " failed to start: " + daemon_error);
    }
    try {
        result.exit_code = std::stoi(state.substr(0, bar));
    } catch (const std::logic_error&) {
        throw LaunchError("unexpected docker inspect output: " + state);
    }
    return result;
}

void DockerRuntime::kill(const SandboxHandle& handle) {
    try {
        ProcessResult result = run_cli({docker_, "kill", handle});
        if (result.exit_code != 0) {
            std::cerr << "[Docker] kill " << handle << ": " << trim(result.stderr_output) << std::endl;
        }
    } catch (const LaunchError& e) {
        std::cerr << "[Docker] kill " << handle << ": " << e.what() << std::endl;
    }
}

void DockerRuntime::remove(const SandboxHandle& handle) {
    ProcessResult result;
    try {
        result = run_cli({docker_, "rm", "-f", handle});
    } catch (const LaunchError& e) {
        throw TeardownError(e.what());
    }
    if (result.exit_code != 0) {
        std::string message = trim(result.stderr_output);
        if (message.find("No such container") != std::string::npos) {
            return;
        }
        throw TeardownError("docker rm -f " + handle + ": " + message);
    }
    std::cout << "[Docker] Removed container " << handle.substr(0, 12) << std::endl;
}

} // namespace pyexec
