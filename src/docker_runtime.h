#pragma once

#include "sandbox_runtime.h"

namespace pyexec {

// Drives the Docker daemon through its CLI: create, start -a, kill, rm -f
class DockerRuntime : public SandboxRuntime {
public:
    explicit DockerRuntime(const std::string& docker_binary = "docker");

    SandboxHandle create(const SandboxSpec& spec) override;
    SandboxRunResult run_with_timeout(const SandboxHandle& handle,
                                      std::chrono::milliseconds timeout) override;
    void kill(const SandboxHandle& handle) override;
    void remove(const SandboxHandle& handle) override;

    std::string name() const override { return "docker"; }

    // argv of the `docker create` call for a sandbox
    std::vector<std::string> create_command(const SandboxSpec& spec) const;

    // True when the daemon answers `docker version`
    bool is_available() const;

private:
    std::string docker_;
};

} // namespace pyexec
