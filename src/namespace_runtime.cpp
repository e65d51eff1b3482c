#include "namespace_runtime.h"
#include "errors.h"
#include "file_utils.h"
#include "process.h"

#include <cerrno>
#include <csignal>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>

#include <fcntl.h>
#include <grp.h>
#include <linux/filter.h>
#include <linux/seccomp.h>
#include <pwd.h>
#include <sched.h>
#include <sys/mount.h>
#include <sys/prctl.h>
#include <sys/resource.h>
#include <sys/socket.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <unistd.h>

#include <seccomp.h>

namespace pyexec {

namespace {

namespace fs = std::filesystem;

// Marker written by the child when sandbox setup fails before exec
const char* SETUP_FAILURE_MARKER = "[NamespaceRuntime] setup failed: ";
constexpr int SETUP_FAILURE_EXIT = 126;

const char* TMP_OPTIONS = "mode=1777,size=64m";
const char* SESSION_ROOT_OPTIONS = "mode=755,size=1m";

struct Identity {
    bool drop = false;
    uid_t uid = 0;
    gid_t gid = 0;
};

Identity resolve_identity(const std::string& user) {
    Identity identity;
    if (geteuid() != 0) {
        return identity;    // already unprivileged
    }

    struct passwd pwd;
    struct passwd* found = nullptr;
    char buf[4096];
    if (getpwnam_r(user.c_str(), &pwd, buf, sizeof(buf), &found) != 0 || !found) {
        throw LaunchError("sandbox user '" + user + "' does not exist");
    }
    identity.drop = true;
    identity.uid = pwd.pw_uid;
    identity.gid = pwd.pw_gid;
    return identity;
}

// Everything the child acts on, computed before fork so the child only
// makes system calls
struct ChildPlan {
    const SandboxSpec* spec = nullptr;
    Identity identity;
    int namespaces = 0;

    bool map_user = false;
    std::string uid_map;
    std::string gid_map;

    std::vector<NamespaceRuntime::HostMount> read_only;
    std::vector<std::string> session_root_prefixes;
    std::string session_root;
    std::string workspace;
    std::string workspace_source;   // /proc/self/fd/<n> of an O_PATH handle
    unsigned long workspace_flags = 0;

    std::vector<sock_filter> filter;
    struct sock_fprog program = {};
};

void write_stderr(const char* text) {
    ssize_t written = write(STDERR_FILENO, text, std::strlen(text));
    (void)written;
}

int setup_failure(const char* step) {
    int err = errno;
    write_stderr(SETUP_FAILURE_MARKER);
    write_stderr(step);
    write_stderr(": ");
    write_stderr(std::strerror(err));
    write_stderr("\n");
    return 1;
}

bool write_proc_file(const char* path, const char* content) {
    int fd = open(path, O_WRONLY | O_CLOEXEC);
    if (fd < 0) return false;
    size_t length = std::strlen(content);
    bool ok = write(fd, content, length) == static_cast<ssize_t>(length);
    close(fd);
    return ok;
}

void apply_resource_limits(const SandboxSpec& spec) {
    struct rlimit limit;

    // Memory limit
    limit.rlim_cur = limit.rlim_max = spec.memory_limit_bytes;
    setrlimit(RLIMIT_AS, &limit);

    // Process limit
    limit.rlim_cur = limit.rlim_max = spec.max_processes;
    setrlimit(RLIMIT_NPROC, &limit);

    // File size limit
    limit.rlim_cur = limit.rlim_max = 100 * 1024 * 1024;
    setrlimit(RLIMIT_FSIZE, &limit);

    // File descriptor limit
    limit.rlim_cur = limit.rlim_max = 256;
    setrlimit(RLIMIT_NOFILE, &limit);

    // No CPU cgroup here; approximate shares with niceness (1024 = normal)
    int nice_value = spec.cpu_shares >= 1024 ? 0 : (spec.cpu_shares >= 512 ? 5 : 10);
    setpriority(PRIO_PROCESS, 0, nice_value);
}

// Compiles the filter to raw BPF in the parent; the child only installs it
std::vector<sock_filter> compile_seccomp_filter(bool allow_network) {
    scmp_filter_ctx ctx = seccomp_init(SCMP_ACT_ALLOW);
    if (!ctx) {
        throw LaunchError("seccomp_init failed");
    }

    // Syscalls user code never needs
    const int denied_syscalls[] = {
        SCMP_SYS(ptrace), SCMP_SYS(mount), SCMP_SYS(umount2), SCMP_SYS(pivot_root),
        SCMP_SYS(chroot), SCMP_SYS(unshare), SCMP_SYS(setns), SCMP_SYS(reboot),
        SCMP_SYS(kexec_load), SCMP_SYS(init_module), SCMP_SYS(finit_module),
        SCMP_SYS(delete_module), SCMP_SYS(swapon), SCMP_SYS(swapoff),
        SCMP_SYS(bpf), SCMP_SYS(perf_event_open), SCMP_SYS(keyctl),
        SCMP_SYS(add_key), SCMP_SYS(request_key), SCMP_SYS(userfaultfd)
    };

    int rc = 0;
    for (int syscall : denied_syscalls) {
        rc = seccomp_rule_add(ctx, SCMP_ACT_ERRNO(EPERM), syscall, 0);
        if (rc < 0) break;
    }

    if (rc == 0 && !allow_network) {
        // The network namespace is already empty; refuse IP sockets outright
        rc = seccomp_rule_add(ctx, SCMP_ACT_ERRNO(EACCES), SCMP_SYS(socket), 1,
                              SCMP_A0(SCMP_CMP_EQ, AF_INET));
        if (rc == 0) {
            rc = seccomp_rule_add(ctx, SCMP_ACT_ERRNO(EACCES), SCMP_SYS(socket), 1,
                                  SCMP_A0(SCMP_CMP_EQ, AF_INET6));
        }
    }

    std::unique_ptr<std::FILE, int (*)(std::FILE*)> out(std::tmpfile(), &std::fclose);
    if (rc == 0 && !out) {
        rc = -errno;
    }
    if (rc == 0) {
        rc = seccomp_export_bpf(ctx, fileno(out.get()));
    }
    seccomp_release(ctx);
    if (rc < 0) {
        throw LaunchError(std::string("seccomp filter: ") + std::strerror(-rc));
    }

    std::string bytes;
    int fd = fileno(out.get());
    lseek(fd, 0, SEEK_SET);
    char buffer[4096];
    ssize_t n;
    while ((n = read(fd, buffer, sizeof(buffer))) > 0) {
        bytes.append(buffer, static_cast<size_t>(n));
    }
    if (bytes.empty() || bytes.size() % sizeof(sock_filter) != 0) {
        throw LaunchError("seccomp filter: unexpected program size " + std::to_string(bytes.size()));
    }

    std::vector<sock_filter> program(bytes.size() / sizeof(sock_filter));
    std::memcpy(program.data(), bytes.data(), bytes.size());
    return program;
}

// Runs in the pid-1 child, before identity drop
int prepare_filesystem(const ChildPlan& plan) {
    // Keep every change below out of the host namespace
    if (mount(nullptr, "/", nullptr, MS_REC | MS_PRIVATE, nullptr) != 0) {
        return setup_failure("private mounts");
    }

    for (const auto& target : plan.read_only) {
        if (mount(nullptr, target.path.c_str(), nullptr,
                  MS_REMOUNT | MS_BIND | MS_RDONLY | target.flags, nullptr) != 0) {
            // Shadowed or unreachable mount points are invisible anyway
            if (errno == ENOENT || errno == EACCES) continue;
            return setup_failure("read-only remount");
        }
    }

    if (mount("tmpfs", "/tmp", "tmpfs", MS_NOSUID | MS_NODEV | MS_NOEXEC, TMP_OPTIONS) != 0) {
        return setup_failure("tmpfs on /tmp");
    }

    // The session root may have lived under the /tmp just covered
    for (const auto& dir : plan.session_root_prefixes) {
        if (mkdir(dir.c_str(), 0755) != 0 && errno != EEXIST) {
            return setup_failure("session root path");
        }
    }
    if (mount("tmpfs", plan.session_root.c_str(), "tmpfs",
              MS_NOSUID | MS_NODEV | MS_NOEXEC, SESSION_ROOT_OPTIONS) != 0) {
        return setup_failure("hide session root");
    }

    if (mkdir(plan.workspace.c_str(), 0755) != 0) {
        return setup_failure("workspace mount point");
    }
    if (mount(plan.workspace_source.c_str(), plan.workspace.c_str(), nullptr, MS_BIND, nullptr) != 0) {
        return setup_failure("bind workspace");
    }
    // The bind inherited the read-only flag set above
    if (mount(nullptr, plan.workspace.c_str(), nullptr,
              MS_REMOUNT | MS_BIND | plan.workspace_flags, nullptr) != 0) {
        return setup_failure("workspace read-write");
    }
    if (mount(nullptr, plan.session_root.c_str(), nullptr,
              MS_REMOUNT | MS_BIND | MS_RDONLY | MS_NOSUID | MS_NODEV | MS_NOEXEC, nullptr) != 0) {
        return setup_failure("seal session root");
    }

    // Nested containers refuse a fresh proc; the host one stays visible there
    if (mount("proc", "/proc", "proc", MS_NOSUID | MS_NODEV | MS_NOEXEC, nullptr) != 0 &&
        errno != EPERM && errno != EACCES) {
        return setup_failure("mount proc");
    }
    return 0;
}

int enter_sandbox(const ChildPlan& plan) {
    if (unshare(plan.namespaces) != 0) return setup_failure("unshare");

    if (plan.map_user) {
        if (!write_proc_file("/proc/self/setgroups", "deny")) return setup_failure("setgroups deny");
        if (!write_proc_file("/proc/self/uid_map", plan.uid_map.c_str())) return setup_failure("uid_map");
        if (!write_proc_file("/proc/self/gid_map", plan.gid_map.c_str())) return setup_failure("gid_map");
    }

    // Only children enter the new PID namespace. This process stays outside
    // and relays the exit status of the one that becomes its PID 1.
    pid_t init = fork();
    if (init < 0) return setup_failure("fork");
    if (init > 0) {
        int status = 0;
        while (waitpid(init, &status, 0) < 0) {
            if (errno != EINTR) _exit(SETUP_FAILURE_EXIT);
        }
        if (WIFEXITED(status)) _exit(WEXITSTATUS(status));
        _exit(128 + WTERMSIG(status));
    }

    if (prepare_filesystem(plan) != 0) return 1;
    if (chdir(plan.workspace.c_str()) != 0) return setup_failure("chdir");

    apply_resource_limits(*plan.spec);

    if (plan.identity.drop) {
        if (setgroups(0, nullptr) != 0) return setup_failure("setgroups");
        if (setgid(plan.identity.gid) != 0) return setup_failure("setgid");
        if (setuid(plan.identity.uid) != 0) return setup_failure("setuid");
    }

    // Set after the identity change, which clears it
    if (prctl(PR_SET_PDEATHSIG, SIGKILL, 0, 0, 0) != 0) return setup_failure("pdeathsig");
    if (prctl(PR_SET_NO_NEW_PRIVS, 1, 0, 0, 0) != 0) return setup_failure("no_new_privs");
    if (prctl(PR_SET_SECCOMP, SECCOMP_MODE_FILTER, &plan.program, 0, 0) != 0) {
        return setup_failure("seccomp");
    }
    return 0;
}

std::string unescape_mount_path(const std::string& field) {
    std::string path;
    for (size_t i = 0; i < field.size(); i++) {
        if (field[i] == '\\' && i + 3 < field.size() &&
            field[i + 1] >= '0' && field[i + 1] <= '7' &&
            field[i + 2] >= '0' && field[i + 2] <= '7' &&
            field[i + 3] >= '0' && field[i + 3] <= '7') {
            path += static_cast<char>((field[i + 1] - '0') * 64 + (field[i + 2] - '0') * 8 +
                                      (field[i + 3] - '0'));
            i += 3;
        } else {
            path += field[i];
        }
    }
    return path;
}

unsigned long mount_flags(const std::string& options) {
    unsigned long flags = 0;
    std::stringstream stream(options);
    std::string option;
    while (std::getline(stream, option, ',')) {
        if (option == "ro") flags |= MS_RDONLY;
        else if (option == "nosuid") flags |= MS_NOSUID;
        else if (option == "nodev") flags |= MS_NODEV;
        else if (option == "noexec") flags |= MS_NOEXEC;
        else if (option == "noatime") flags |= MS_NOATIME;
        else if (option == "nodiratime") flags |= MS_NODIRATIME;
        else if (option == "relatime") flags |= MS_RELATIME;
        else if (option == "strictatime") flags |= MS_STRICTATIME;
    }
    return flags;
}

bool is_within(const std::string& path, const std::string& root) {
    if (root == "/") return true;
    return path == root || (path.compare(0, root.size(), root) == 0 && path[root.size()] == '/');
}

class PathHandle {
public:
    explicit PathHandle(const std::string& path)
        : fd_(open(path.c_str(), O_PATH | O_DIRECTORY | O_CLOEXEC)) {}
    ~PathHandle() {
        if (fd_ >= 0) close(fd_);
    }

    PathHandle(const PathHandle&) = delete;
    PathHandle& operator=(const PathHandle&) = delete;

    int get() const { return fd_; }

private:
    int fd_;
};

} // anonymous namespace

std::vector<NamespaceRuntime::HostMount> NamespaceRuntime::parse_mountinfo(const std::string& text) {
    std::vector<HostMount> mounts;
    std::stringstream lines(text);
    std::string line;
    while (std::getline(lines, line)) {
        std::stringstream fields(line);
        std::vector<std::string> parts;
        std::string field;
        while (parts.size() < 6 && fields >> field) {
            parts.push_back(field);
        }
        if (parts.size() < 6) continue;

        HostMount mount;
        mount.path = unescape_mount_path(parts[4]);
        mount.flags = mount_flags(parts[5]);
        mounts.push_back(mount);
    }
    return mounts;
}

std::vector<NamespaceRuntime::HostMount> NamespaceRuntime::read_only_targets(
    const std::vector<HostMount>& mounts) {
    std::vector<HostMount> targets;
    for (const auto& mount : mounts) {
        if (is_within(mount.path, "/proc") || is_within(mount.path, "/sys")) continue;
        targets.push_back(mount);
    }
    return targets;
}

unsigned long NamespaceRuntime::writable_flags_for(const std::vector<HostMount>& mounts,
                                                   const std::string& path) {
    const HostMount* holder = nullptr;
    for (const auto& mount : mounts) {
        if (!is_within(path, mount.path)) continue;
        // Later entries are stacked on top of earlier ones at the same point
        if (!holder || mount.path.size() >= holder->path.size()) {
            holder = &mount;
        }
    }
    return holder ? (holder->flags & ~static_cast<unsigned long>(MS_RDONLY)) : 0;
}

std::vector<std::string> NamespaceRuntime::path_prefixes(const std::string& path) {
    std::vector<std::string> prefixes;
    std::string current;
    std::stringstream stream(path);
    std::string component;
    while (std::getline(stream, component, '/')) {
        if (component.empty()) continue;
        current += "/" + component;
        prefixes.push_back(current);
    }
    return prefixes;
}

std::vector<std::string> NamespaceRuntime::rewrite_command(const SandboxSpec& spec) {
    std::vector<std::string> argv;
    const std::string& mount = spec.workspace_mount_point;
    for (const auto& arg : spec.command) {
        if (arg == mount) {
            argv.push_back(spec.workspace_host_path);
        } else if (arg.compare(0, mount.size() + 1, mount + "/") == 0) {
            argv.push_back(spec.workspace_host_path + arg.substr(mount.size()));
        } else {
            argv.push_back(arg);
        }
    }
    // Images ship "python"; hosts frequently only have python3
    if (!argv.empty() && argv[0] == "python") {
        argv[0] = "python3";
    }
    return argv;
}

bool NamespaceRuntime::is_supported() {
    // Test if we can create namespaces
    pid_t pid = fork();
    if (pid == 0) {
        int flags = CLONE_NEWNS | CLONE_NEWNET | CLONE_NEWPID;
        if (geteuid() != 0) flags |= CLONE_NEWUSER;
        _exit(unshare(flags) == 0 ? 0 : 1);
    } else if (pid > 0) {
        int status;
        waitpid(pid, &status, 0);
        return WIFEXITED(status) && WEXITSTATUS(status) == 0;
    }
    return false;
}

SandboxHandle NamespaceRuntime::create(const SandboxSpec& spec) {
    if (spec.command.empty()) {
        throw LaunchError("empty command");
    }
    std::error_code ec;
    if (!std::filesystem::is_directory(spec.workspace_host_path, ec)) {
        throw LaunchError("workspace " + spec.workspace_host_path + " does not exist");
    }

    SandboxHandle handle = "ns-" + FileUtils::random_hex(6);
    std::lock_guard<std::mutex> lock(mutex_);
    sandboxes_[handle] = spec;
    return handle;
}

SandboxRunResult NamespaceRuntime::run_with_timeout(const SandboxHandle& handle,
                                                    std::chrono::milliseconds timeout) {
    SandboxSpec spec;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = sandboxes_.find(handle);
        if (it == sandboxes_.end()) {
            throw LaunchError("unknown sandbox " + handle);
        }
        spec = it->second;
    }

    // The bind mount needs the real path; symlinks in it would dangle
    std::error_code ec;
    fs::path workspace = fs::canonical(spec.workspace_host_path, ec);
    if (ec) {
        throw LaunchError("workspace " + spec.workspace_host_path + ": " + ec.message());
    }
    if (!workspace.has_parent_path() || workspace.parent_path() == workspace.root_path()) {
        throw LaunchError("workspace " + workspace.string() + " has no session root to hide");
    }
    spec.workspace_host_path = workspace.string();

    std::ifstream mountinfo_file("/proc/self/mountinfo");
    std::stringstream mountinfo;
    mountinfo << mountinfo_file.rdbuf();
    std::vector<HostMount> mounts = parse_mountinfo(mountinfo.str());
    if (mounts.empty()) {
        throw LaunchError("cannot read /proc/self/mountinfo");
    }

    PathHandle workspace_handle(spec.workspace_host_path);
    if (workspace_handle.get() < 0) {
        throw LaunchError("cannot open workspace " + spec.workspace_host_path + ": " +
                          std::strerror(errno));
    }

    // Everything the child needs is resolved before fork
    ChildPlan plan;
    plan.spec = &spec;
    plan.identity = resolve_identity(spec.user);
    plan.namespaces = CLONE_NEWNS | CLONE_NEWPID | CLONE_NEWIPC | CLONE_NEWUTS;
    if (!spec.allow_network) plan.namespaces |= CLONE_NEWNET;
    if (geteuid() != 0) {
        plan.namespaces |= CLONE_NEWUSER;
        plan.map_user = true;
        plan.uid_map = std::to_string(geteuid()) + " " + std::to_string(geteuid()) + " 1";
        plan.gid_map = std::to_string(getegid()) + " " + std::to_string(getegid()) + " 1";
    }
    plan.read_only = read_only_targets(mounts);
    plan.session_root = workspace.parent_path().string();
    plan.session_root_prefixes = path_prefixes(plan.session_root);
    plan.workspace = spec.workspace_host_path;
    plan.workspace_source = "/proc/self/fd/" + std::to_string(workspace_handle.get());
    plan.workspace_flags = writable_flags_for(mounts, plan.workspace);
    plan.filter = compile_seccomp_filter(spec.allow_network);
    plan.program.len = static_cast<unsigned short>(plan.filter.size());
    plan.program.filter = plan.filter.data();

    std::vector<std::string> argv = rewrite_command(spec);

    std::map<std::string, std::string> env = spec.env;
    env["PATH"] = "/usr/local/bin:/usr/bin:/bin";
    env["HOME"] = spec.workspace_host_path;
    env["PYTHONDONTWRITEBYTECODE"] = "1";
    std::vector<std::string> environment;
    for (const auto& [key, value] : env) {
        environment.push_back(key + "=" + value);
    }

    ProcessOptions options;
    options.working_directory = spec.workspace_host_path;
    options.timeout = timeout;
    options.environment = std::move(environment);
    options.child_setup = [&plan]() -> int {
        return enter_sandbox(plan);
    };

    ProcessResult process = run_process(argv, options);

    if (process.exit_code == SETUP_FAILURE_EXIT &&
        process.stderr_output.find(SETUP_FAILURE_MARKER) != std::string::npos) {
        throw LaunchError(process.stderr_output);
    }

    SandboxRunResult result;
    result.exit_code = process.exit_code;
    result.stdout_output = std::move(process.stdout_output);
    result.stderr_output = std::move(process.stderr_output);
    result.timed_out = process.timed_out;
    return result;
}

void NamespaceRuntime::kill(const SandboxHandle& handle) {
    // run_process already SIGKILLed the process group on timeout
    std::cout << "[NamespaceRuntime] " << handle << " killed" << std::endl;
}

void NamespaceRuntime::remove(const SandboxHandle& handle) {
    std::lock_guard<std::mutex> lock(mutex_);
    sandboxes_.erase(handle);
}

} // namespace pyexec
