#pragma once

#include "constants.h"

#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace pyexec {

struct ProcessOptions {
    std::string working_directory;              // empty = inherit
    std::chrono::milliseconds timeout{0};       // 0 = wait forever
    size_t max_output_bytes = MAX_OUTPUT_SIZE;  // per stream, excess is dropped

    // "KEY=VALUE" entries replacing the inherited environment
    std::optional<std::vector<std::string>> environment;

    // Runs in the child between fork() and exec(). A non-zero return
    // aborts the child with exit code 126. Must not allocate: the parent
    // may be multithreaded.
    std::function<int()> child_setup;
};

struct ProcessResult {
    int exit_code = -1;         // 128 + signal when killed by a signal
    int term_signal = 0;
    std::string stdout_output;
    std::string stderr_output;
    bool timed_out = false;
    bool output_truncated = false;
};

// Fork/exec argv in its own process group, capture stdout and stderr
// separately, and SIGKILL the whole group when the timeout expires.
// argv[0] is looked up on PATH before forking. Throws LaunchError when the
// process cannot be started at all; an exec failure inside the child
// surfaces as exit code 127.
ProcessResult run_process(const std::vector<std::string>& argv,
                          const ProcessOptions& options = ProcessOptions{});

// Absolute path of name found on search_path (colon separated), or name
// unchanged when it already contains '/' or is not found
std::string find_executable(const std::string& name, const std::string& search_path);

} // namespace pyexec
