#pragma once

// In-process SandboxRuntime for unit tests. Records every spec, counts
// create/kill/remove calls and lets a test script each run.

#include "sandbox_runtime.h"
#include "errors.h"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <functional>
#include <map>
#include <mutex>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace pyexec {
namespace testing_support {

class FakeRuntime : public SandboxRuntime {
public:
    // Decides the result of one run. Default: exit 0, no output.
    using RunScript = std::function<SandboxRunResult(const SandboxSpec&,
                                                     std::chrono::milliseconds timeout)>;

    SandboxHandle create(const SandboxSpec& spec) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (fail_create) {
            throw LaunchError("fake runtime refused the sandbox");
        }
        SandboxHandle handle = "fake-" + std::to_string(++next_id_);
        live_[handle] = spec;
        specs_.push_back(spec);
        created_++;
        return handle;
    }

    SandboxRunResult run_with_timeout(const SandboxHandle& handle,
                                      std::chrono::milliseconds timeout) override {
        SandboxSpec spec;
        RunScript script;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = live_.find(handle);
            if (it == live_.end()) {
                throw LaunchError("unknown sandbox " + handle);
            }
            spec = it->second;
            script = on_run;

            int& running = running_per_workspace_[spec.workspace_host_path];
            running++;
            if (running > max_concurrent_per_workspace_) {
                max_concurrent_per_workspace_ = running;
            }
        }

        SandboxRunResult result;
        if (run_delay.count() > 0) {
            std::this_thread::sleep_for(run_delay);
        }
        try {
            if (script) result = script(spec, timeout);
            else result.exit_code = 0;
        } catch (...) {
            std::lock_guard<std::mutex> lock(mutex_);
            running_per_workspace_[spec.workspace_host_path]--;
            throw;
        }

        std::lock_guard<std::mutex> lock(mutex_);
        running_per_workspace_[spec.workspace_host_path]--;
        return result;
    }

    void kill(const SandboxHandle& handle) override {
        std::lock_guard<std::mutex> lock(mutex_);
        killed_.insert(handle);
    }

    void remove(const SandboxHandle& handle) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (teardown_failures > 0) {
            teardown_failures--;
            throw TeardownError("fake teardown failure for " + handle);
        }
        if (unexpected_remove_failures > 0) {
            unexpected_remove_failures--;
            throw std::runtime_error("unexpected failure removing " + handle);
        }
        remove_calls_[handle]++;
        live_.erase(handle);
        removed_++;
    }

    std::string name() const override { return "fake"; }

    // Knobs, set before the run starts
    RunScript on_run;
    bool fail_create = false;
    int teardown_failures = 0;
    int unexpected_remove_failures = 0;      // thrown as plain std::runtime_error
    std::chrono::milliseconds run_delay{0};

    int created() const { std::lock_guard<std::mutex> lock(mutex_); return created_; }
    int removed() const { std::lock_guard<std::mutex> lock(mutex_); return removed_; }
    size_t killed() const { std::lock_guard<std::mutex> lock(mutex_); return killed_.size(); }
    size_t live() const { std::lock_guard<std::mutex> lock(mutex_); return live_.size(); }
    int max_concurrent_per_workspace() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return max_concurrent_per_workspace_;
    }

    std::vector<SandboxSpec> specs() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return specs_;
    }

    // True when every created handle was removed exactly once
    bool each_removed_once() const {
        std::lock_guard<std::mutex> lock(mutex_);
        if (static_cast<int>(remove_calls_.size()) != created_) return false;
        for (const auto& [handle, count] : remove_calls_) {
            if (count != 1) return false;
        }
        return true;
    }

private:
    mutable std::mutex mutex_;
    int next_id_ = 0;
    int created_ = 0;
    int removed_ = 0;
    std::map<SandboxHandle, SandboxSpec> live_;
    std::map<SandboxHandle, int> remove_calls_;
    std::set<SandboxHandle> killed_;
    std::vector<SandboxSpec> specs_;
    std::map<std::string, int> running_per_workspace_;
    int max_concurrent_per_workspace_ = 0;
};

// Helpers for scripting runs
inline SandboxRunResult exit_with(int code, const std::string& out = "", const std::string& err = "") {
    SandboxRunResult result;
    result.exit_code = code;
    result.stdout_output = out;
    result.stderr_output = err;
    return result;
}

inline SandboxRunResult timed_out() {
    SandboxRunResult result;
    result.timed_out = true;
    return result;
}

inline bool command_contains(const SandboxSpec& spec, const std::string& arg) {
    for (const auto& a : spec.command) {
        if (a == arg) return true;
    }
    return false;
}

// Crude stand-in for the base image's python: understands venv creation,
// pip install, and a handful of script shapes used by the scenario tests
inline FakeRuntime::RunScript python_emulator() {
    return [](const SandboxSpec& spec, std::chrono::milliseconds) {
        namespace fs = std::filesystem;
        const std::string mount = spec.workspace_mount_point + "/";

        if (command_contains(spec, "venv")) {
            fs::create_directories(spec.workspace_host_path + "/venv/bin");
            std::ofstream(spec.workspace_host_path + "/venv/bin/python") << "#!fake\n";
            return exit_with(0);
        }
        if (command_contains(spec, "pip")) {
            std::string installed;
            bool packages = false;
            for (const auto& arg : spec.command) {
                if (packages && arg[0] != '-') installed += " " + arg;
                if (arg == "install") packages = true;
                if (packages && arg == "no-such-package") {
                    return exit_with(1, "", "ERROR: No matching distribution found for " + arg + "\n");
                }
            }
            return exit_with(0, "Successfully installed" + installed + "\n");
        }

        // Script run: last argument is the script path inside the sandbox
        std::string script = spec.command.back();
        if (script.compare(0, mount.size(), mount) != 0) {
            return exit_with(2, "", "can't open file " + script);
        }
        std::ifstream in(spec.workspace_host_path + "/" + script.substr(mount.size()));
        if (!in) {
            return exit_with(2, "", "can't open file " + script);
        }
        std::stringstream code;
        code << in.rdbuf();
        std::string source = code.str();

        if (source.find("time.sleep") != std::string::npos) {
            return timed_out();
        }
        if (source.find("urlopen") != std::string::npos) {
            if (!spec.allow_network) {
                return exit_with(1, "", "urllib.error.URLError: <urlopen error [Errno 101] Network is unreachable>\n");
            }
            return exit_with(0, "200\n");
        }
        if (source.find("raise") != std::string::npos) {
            return exit_with(1, "", "Traceback (most recent call last):\nValueError: boom\n");
        }
        if (source.find("print(1+1)") != std::string::npos) {
            return exit_with(0, "2\n");
        }
        return exit_with(0);
    };
}

} // namespace testing_support
} // namespace pyexec
