#pragma once

#include "sandbox_runtime.h"

#include <map>
#include <mutex>

namespace pyexec {

// Host-local sandbox for machines without a container daemon.
//
// Each run forks a child that unshares its mount, PID, IPC, UTS and (unless
// the sandbox allows network) network namespaces, plus a user namespace when
// the server is not root. Inside, every host mount is remounted read-only,
// /tmp and the session root are covered with tmpfs, and only the task's own
// workspace is bound back read-write at its host path. The user program runs
// as PID 1 of the new PID namespace so anything it leaves behind dies with
// it. rlimits, the sandbox user (when started as root) and a seccomp filter
// are applied before exec. Any failed isolation step aborts the launch.
class NamespaceRuntime : public SandboxRuntime {
public:
    NamespaceRuntime() = default;

    SandboxHandle create(const SandboxSpec& spec) override;
    SandboxRunResult run_with_timeout(const SandboxHandle& handle,
                                      std::chrono::milliseconds timeout) override;
    void kill(const SandboxHandle& handle) override;
    void remove(const SandboxHandle& handle) override;

    std::string name() const override { return "namespace"; }

    // "/app/x.py" → "<workspace>/x.py"; other arguments unchanged
    static std::vector<std::string> rewrite_command(const SandboxSpec& spec);

    // Whether this process may create the namespaces it needs
    static bool is_supported();

    struct HostMount {
        std::string path;
        unsigned long flags = 0;    // MS_RDONLY, MS_NOSUID, ... as mounted
    };

    // Mount points and per-mount flags from /proc/self/mountinfo text
    static std::vector<HostMount> parse_mountinfo(const std::string& text);

    // Mounts to remount read-only: all but the /proc and /sys trees
    static std::vector<HostMount> read_only_targets(const std::vector<HostMount>& mounts);

    // Flags for re-binding path writable: those of the mount holding it,
    // without MS_RDONLY
    static unsigned long writable_flags_for(const std::vector<HostMount>& mounts,
                                            const std::string& path);

    // "/a/b/c" → {"/a", "/a/b", "/a/b/c"}
    static std::vector<std::string> path_prefixes(const std::string& path);

private:
    mutable std::mutex mutex_;
    std::map<SandboxHandle, SandboxSpec> sandboxes_;
};

} // namespace pyexec
