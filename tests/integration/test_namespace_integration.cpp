/**
 * Namespace runtime integration tests
 *
 * Runs real python3 processes inside fresh namespaces with the seccomp
 * filter loaded. Skipped on hosts that cannot unshare or have no python3.
 */

#include <gtest/gtest.h>
#include "namespace_runtime.h"
#include "sandbox_executor.h"
#include "local_storage.h"
#include "process.h"
#include "errors.h"

#include <filesystem>
#include <fstream>
#include <thread>
#include <unistd.h>

namespace fs = std::filesystem;
using namespace pyexec;

class NamespaceIntegrationTest : public ::testing::Test {
protected:
    void SetUp() override {
        if (!NamespaceRuntime::is_supported()) {
            GTEST_SKIP() << "Cannot create namespaces here";
        }
        try {
            if (run_process({"python3", "-c", "pass"}).exit_code != 0) {
                GTEST_SKIP() << "python3 not available";
            }
        } catch (const LaunchError&) {
            GTEST_SKIP() << "python3 not available";
        }

        base_dir = fs::temp_directory_path() / ("pyexec_ns_" + std::to_string(::getpid()));
        fs::remove_all(base_dir);
        fs::create_directories(base_dir);
        // The sandbox user must be able to write its workspace
        fs::permissions(base_dir, fs::perms::all);

        storage = std::make_unique<LocalStorageBackend>(base_dir.string());
        sessions = std::make_unique<SessionManager>(base_dir.string(), *storage, slots,
                                                    std::chrono::seconds(5));
        ExecutorSettings settings;
        settings.user = "nobody";
        settings.memory_limit_mb = 512;
        settings.execute_timeout = std::chrono::seconds(3);
        executor = std::make_unique<SandboxExecutor>(runtime, *sessions, settings);
    }

    void TearDown() override {
        if (!base_dir.empty()) fs::remove_all(base_dir);
        if (!outside_dir.empty()) fs::remove_all(outside_dir);
    }

    // A host directory outside the session root and /tmp, writable by anyone
    fs::path make_outside_dir() {
        outside_dir = fs::current_path() / ("pyexec_ns_outside_" + std::to_string(::getpid()));
        fs::remove_all(outside_dir);
        fs::create_directories(outside_dir);
        fs::permissions(outside_dir, fs::perms::all);
        return outside_dir;
    }

    ExecutionOutcome execute(const std::string& code,
                             const std::map<std::string, std::string>& env = {}) {
        Session session = sessions->resolve_or_create("s1");
        fs::permissions(session.local_path, fs::perms::all);

        Task task;
        task.task_id = "exec-s1-0000abcd";
        task.kind = TaskKind::EXECUTE;
        task.session_id = "s1";
        task.code = code;
        task.env = env;
        return executor->run(task, session);
    }

    fs::path base_dir;
    fs::path outside_dir;
    SessionSlots slots;
    std::unique_ptr<LocalStorageBackend> storage;
    std::unique_ptr<SessionManager> sessions;
    NamespaceRuntime runtime;
    std::unique_ptr<SandboxExecutor> executor;
};

TEST_F(NamespaceIntegrationTest, RunsPythonAndCapturesOutput) {
    ExecutionOutcome outcome = execute("import sys\nprint(6*7)\nprint('oops', file=sys.stderr)");

    ASSERT_TRUE(outcome.succeeded()) << outcome.message << outcome.error_output;
    EXPECT_EQ(outcome.output, "42\n");
    EXPECT_EQ(outcome.error_output, "oops\n");
}

TEST_F(NamespaceIntegrationTest, WritesLandInWorkspace) {
    ExecutionOutcome outcome = execute("open('result.txt', 'w').write('done')");

    ASSERT_TRUE(outcome.succeeded()) << outcome.error_output;
    std::ifstream in(base_dir / "s1" / "result.txt");
    std::string content;
    std::getline(in, content);
    EXPECT_EQ(content, "done");
}

TEST_F(NamespaceIntegrationTest, NonZeroExitIsReported) {
    ExecutionOutcome outcome = execute("raise SystemExit(4)");

    EXPECT_EQ(outcome.reason, FailureReason::NON_ZERO_EXIT);
    ASSERT_TRUE(outcome.exit_code.has_value());
    EXPECT_EQ(*outcome.exit_code, 4);
}

TEST_F(NamespaceIntegrationTest, NetworkIsUnreachable) {
    ExecutionOutcome outcome = execute(
        "import socket\n"
        "s = socket.socket(socket.AF_INET, socket.SOCK_STREAM)\n"
        "s.settimeout(2)\n"
        "s.connect(('1.1.1.1', 80))\n");

    EXPECT_EQ(outcome.reason, FailureReason::NON_ZERO_EXIT);
    EXPECT_NE(outcome.error_output.find("Error"), std::string::npos);
}

TEST_F(NamespaceIntegrationTest, EnvironmentIsPassedAndScrubbed) {
    ::setenv("PYEXEC_HOST_ONLY", "leak", 1);
    ExecutionOutcome outcome = execute(
        "import os\nprint(os.environ.get('MODE'), os.environ.get('PYEXEC_HOST_ONLY'))",
        {{"MODE", "test"}});
    ::unsetenv("PYEXEC_HOST_ONLY");

    ASSERT_TRUE(outcome.succeeded()) << outcome.error_output;
    EXPECT_EQ(outcome.output, "test None\n");
}

TEST_F(NamespaceIntegrationTest, TimeoutKillsRunaway) {
    auto start = std::chrono::steady_clock::now();
    ExecutionOutcome outcome = execute("while True: pass");
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_EQ(outcome.reason, FailureReason::TIMEOUT);
    EXPECT_LT(elapsed, std::chrono::seconds(10));
}

// ============================================================================
// Test Contract: The workspace is the only writable surface
// ============================================================================

TEST_F(NamespaceIntegrationTest, OtherSessionsAreHidden) {
    // Given: Another session's data next to this one
    fs::create_directories(base_dir / "s2");
    std::ofstream(base_dir / "s2" / "data.csv") << "secret";
    fs::permissions(base_dir / "s2", fs::perms::all);
    fs::permissions(base_dir / "s2" / "data.csv", fs::perms::all);

    // When: Code reaches for it by absolute path
    ExecutionOutcome outcome = execute(
        "import os\n"
        "print(sorted(os.listdir('" + base_dir.string() + "')))\n"
        "open('" + (base_dir / "s2" / "data.csv").string() + "', 'w').write('clobbered')\n");

    // Then: Only its own workspace is visible and the other file is untouched
    EXPECT_EQ(outcome.reason, FailureReason::NON_ZERO_EXIT) << outcome.output;
    EXPECT_EQ(outcome.output, "['s1']\n");
    std::ifstream in(base_dir / "s2" / "data.csv");
    std::string content;
    std::getline(in, content);
    EXPECT_EQ(content, "secret");
}

TEST_F(NamespaceIntegrationTest, HostFilesystemIsReadOnly) {
    fs::path outside = make_outside_dir();

    ExecutionOutcome outcome = execute(
        "open('" + (outside / "planted.txt").string() + "', 'w').write('x')\n");

    EXPECT_EQ(outcome.reason, FailureReason::NON_ZERO_EXIT);
    EXPECT_FALSE(fs::exists(outside / "planted.txt"));
}

TEST_F(NamespaceIntegrationTest, TmpIsPrivateScratch) {
    ExecutionOutcome outcome = execute(
        "open('/tmp/pyexec-scratch.txt', 'w').write('x')\n"
        "print(open('/tmp/pyexec-scratch.txt').read())\n");

    ASSERT_TRUE(outcome.succeeded()) << outcome.error_output;
    EXPECT_EQ(outcome.output, "x\n");
    EXPECT_FALSE(fs::exists("/tmp/pyexec-scratch.txt"));
}

TEST_F(NamespaceIntegrationTest, ProgramRunsAsInitOfItsOwnPidNamespace) {
    ExecutionOutcome outcome = execute("import os\nprint(os.getpid())");

    ASSERT_TRUE(outcome.succeeded()) << outcome.error_output;
    EXPECT_EQ(outcome.output, "1\n");
}

TEST_F(NamespaceIntegrationTest, DetachedChildDoesNotOutliveTask) {
    // Given: Code that leaves a new-session child behind and exits
    ExecutionOutcome outcome = execute(
        "import os, time\n"
        "if os.fork() == 0:\n"
        "    os.setsid()\n"
        "    time.sleep(1)\n"
        "    open('late.txt', 'w').write('still here')\n"
        "    os._exit(0)\n"
        "print('parent done')\n");
    ASSERT_TRUE(outcome.succeeded()) << outcome.error_output;

    // Then: The child died with the namespace and never wrote
    std::this_thread::sleep_for(std::chrono::milliseconds(1500));
    EXPECT_FALSE(fs::exists(base_dir / "s1" / "late.txt"));
}
