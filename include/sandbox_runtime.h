#pragma once

#include <chrono>
#include <cstddef>
#include <map>
#include <string>
#include <vector>

namespace pyexec {

// Everything needed to create one disposable sandbox
struct SandboxSpec {
    std::string image;                          // base image / template identity
    std::vector<std::string> command;           // argv, paths as seen inside the sandbox
    std::string workspace_host_path;            // bind-mounted read-write
    std::string workspace_mount_point = "/app"; // where it appears inside
    std::string user = "appuser";               // non-privileged identity
    bool allow_network = false;                 // airgapped unless asked
    size_t memory_limit_bytes = 256 * 1024 * 1024;
    size_t cpu_shares = 512;
    size_t max_processes = 64;
    std::map<std::string, std::string> env;
};

struct SandboxRunResult {
    int exit_code = -1;
    std::string stdout_output;
    std::string stderr_output;
    bool timed_out = false;
};

// Opaque identifier of a created sandbox (container id, local handle, ...)
using SandboxHandle = std::string;

// Capability wrapper around the host's container / OS sandbox facility.
//
// create() and run_with_timeout() throw LaunchError when the runtime is
// unreachable or refuses the sandbox. remove() throws TeardownError.
// run_with_timeout() returns with timed_out set when the deadline passes;
// the sandbox may still be alive until kill() is called. kill() is best
// effort and never throws.
class SandboxRuntime {
public:
    virtual ~SandboxRuntime() = default;

    virtual SandboxHandle create(const SandboxSpec& spec) = 0;

    virtual SandboxRunResult run_with_timeout(const SandboxHandle& handle,
                                              std::chrono::milliseconds timeout) = 0;

    virtual void kill(const SandboxHandle& handle) = 0;

    virtual void remove(const SandboxHandle& handle) = 0;

    virtual std::string name() const = 0;
};

} // namespace pyexec
