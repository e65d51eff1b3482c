#include "process.h"
#include "errors.h"

#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <cstring>

#include <fcntl.h>
#include <poll.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace pyexec {

namespace {

void close_fd(int& fd) {
    if (fd >= 0) {
        close(fd);
        fd = -1;
    }
}

// Append what is available on fd; returns false on EOF
bool drain(int fd, std::string& sink, size_t limit, bool& truncated) {
    char buffer[PIPE_BUFFER_SIZE];
    ssize_t n = read(fd, buffer, sizeof(buffer));
    if (n > 0) {
        size_t room = sink.size() < limit ? limit - sink.size() : 0;
        size_t take = std::min(room, static_cast<size_t>(n));
        sink.append(buffer, take);
        if (take < static_cast<size_t>(n)) truncated = true;
        return true;
    }
    if (n < 0 && (errno == EINTR || errno == EAGAIN)) {
        return true;
    }
    return false;
}

const char* DEFAULT_SEARCH_PATH = "/usr/local/bin:/usr/bin:/bin";

std::string search_path_for(const ProcessOptions& options) {
    if (options.environment) {
        for (const auto& entry : *options.environment) {
            if (entry.compare(0, 5, "PATH=") == 0) return entry.substr(5);
        }
        return DEFAULT_SEARCH_PATH;
    }
    const char* inherited = std::getenv("PATH");
    return inherited ? inherited : DEFAULT_SEARCH_PATH;
}

} // namespace

std::string find_executable(const std::string& name, const std::string& search_path) {
    if (name.find('/') != std::string::npos) {
        return name;
    }
    size_t start = 0;
    while (start <= search_path.size()) {
        size_t end = search_path.find(':', start);
        if (end == std::string::npos) end = search_path.size();
        std::string dir = search_path.substr(start, end - start);
        if (dir.empty()) dir = ".";

        std::string candidate = dir + "/" + name;
        struct stat st;
        if (stat(candidate.c_str(), &st) == 0 && S_ISREG(st.st_mode) &&
            access(candidate.c_str(), X_OK) == 0) {
            return candidate;
        }
        start = end + 1;
    }
    return name;
}

ProcessResult run_process(const std::vector<std::string>& argv, const ProcessOptions& options) {
    if (argv.empty() || argv[0].empty()) {
        throw LaunchError("empty command");
    }

    // Build argv, envp and the program path before forking
    std::vector<char*> cargv;
    cargv.reserve(argv.size() + 1);
    for (const auto& arg : argv) {
        cargv.push_back(const_cast<char*>(arg.c_str()));
    }
    cargv.push_back(nullptr);

    std::vector<char*> cenv;
    char** envp = environ;
    if (options.environment) {
        cenv.reserve(options.environment->size() + 1);
        for (const auto& entry : *options.environment) {
            cenv.push_back(const_cast<char*>(entry.c_str()));
        }
        cenv.push_back(nullptr);
        envp = cenv.data();
    }

    const std::string program = find_executable(argv[0], search_path_for(options));

    int stdin_pipe[2], stdout_pipe[2], stderr_pipe[2];
    if (pipe2(stdin_pipe, O_CLOEXEC) == -1) {
        throw LaunchError(std::string("pipe failed: ") + std::strerror(errno));
    }
    if (pipe2(stdout_pipe, O_CLOEXEC) == -1) {
        close(stdin_pipe[0]); close(stdin_pipe[1]);
        throw LaunchError(std::string("pipe failed: ") + std::strerror(errno));
    }
    if (pipe2(stderr_pipe, O_CLOEXEC) == -1) {
        close(stdin_pipe[0]); close(stdin_pipe[1]);
        close(stdout_pipe[0]); close(stdout_pipe[1]);
        throw LaunchError(std::string("pipe failed: ") + std::strerror(errno));
    }

    pid_t pid = fork();
    if (pid == -1) {
        int err = errno;
        for (int fd : {stdin_pipe[0], stdin_pipe[1], stdout_pipe[0],
                       stdout_pipe[1], stderr_pipe[0], stderr_pipe[1]}) {
            close(fd);
        }
        throw LaunchError(std::string("fork failed: ") + std::strerror(err));
    }

    if (pid == 0) {
        // Child process: own process group so a timeout kills the subtree
        setpgid(0, 0);
        dup2(stdin_pipe[0], STDIN_FILENO);
        dup2(stdout_pipe[1], STDOUT_FILENO);
        dup2(stderr_pipe[1], STDERR_FILENO);

        if (!options.working_directory.empty() &&
            chdir(options.working_directory.c_str()) != 0) {
            perror("chdir");
            _exit(126);
        }
        if (options.child_setup && options.child_setup() != 0) {
            _exit(126);
        }

        execve(program.c_str(), cargv.data(), envp);
        perror("execve");
        _exit(127);
    }

    // Parent process
    close(stdin_pipe[0]);
    close(stdout_pipe[1]);
    close(stderr_pipe[1]);

    // The child sees EOF on stdin
    close(stdin_pipe[1]);

    ProcessResult result;
    int out_fd = stdout_pipe[0];
    int err_fd = stderr_pipe[0];

    const bool has_deadline = options.timeout.count() > 0;
    const auto deadline = std::chrono::steady_clock::now() + options.timeout;
    bool killed = false;
    std::chrono::steady_clock::time_point kill_deadline;

    while (out_fd >= 0 || err_fd >= 0) {
        int wait_ms = -1;
        if (killed) {
            // A descendant outside the group may still hold the pipes open
            auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
                kill_deadline - std::chrono::steady_clock::now()).count();
            if (left <= 0) break;
            wait_ms = static_cast<int>(left);
        } else if (has_deadline) {
            auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - std::chrono::steady_clock::now()).count();
            if (left <= 0) {
                kill(-pid, SIGKILL);
                kill(pid, SIGKILL);
                killed = true;
                kill_deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
                result.timed_out = true;
                wait_ms = 2000;
            } else {
                wait_ms = static_cast<int>(left);
            }
        }

        struct pollfd fds[2];
        nfds_t count = 0;
        if (out_fd >= 0) fds[count++] = {out_fd, POLLIN, 0};
        if (err_fd >= 0) fds[count++] = {err_fd, POLLIN, 0};

        int ready = poll(fds, count, wait_ms);
        if (ready < 0) {
            if (errno == EINTR) continue;
            break;
        }
        if (ready == 0) continue;  // deadline check on next iteration

        for (nfds_t i = 0; i < count; i++) {
            if (!(fds[i].revents & (POLLIN | POLLHUP | POLLERR))) continue;
            if (fds[i].fd == out_fd) {
                if (!drain(out_fd, result.stdout_output, options.max_output_bytes,
                           result.output_truncated)) {
                    close_fd(out_fd);
                }
            } else if (fds[i].fd == err_fd) {
                if (!drain(err_fd, result.stderr_output, options.max_output_bytes,
                           result.output_truncated)) {
                    close_fd(err_fd);
                }
            }
        }
    }
    close_fd(out_fd);
    close_fd(err_fd);

    int status = 0;
    while (waitpid(pid, &status, 0) == -1) {
        if (errno != EINTR) {
            result.exit_code = -1;
            return result;
        }
    }

    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.term_signal = WTERMSIG(status);
        result.exit_code = 128 + result.term_signal;
    }
    return result;
}

} // namespace pyexec
