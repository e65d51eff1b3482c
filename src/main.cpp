/*
 * pyexec - session-scoped Python execution service
 * Install packages and run code in per-session sandboxes
 */

#include "backend_factory.h"
#include "config.h"
#include "errors.h"
#include "gateway.h"
#include "http_server.h"
#include "sandbox_executor.h"
#include "session_manager.h"
#include "session_slots.h"
#include "task_coordinator.h"

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <mutex>
#include <pthread.h>
#include <thread>

using namespace pyexec;

namespace {

// Periodic idle-session collection; wakes early on shutdown
class IdleCollector {
public:
    IdleCollector(SessionManager& sessions, std::chrono::seconds max_idle)
        : sessions_(sessions), max_idle_(max_idle) {}

    void start() {
        thread_ = std::thread([this]() { loop(); });
    }

    void stop() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            stopping_ = true;
        }
        cv_.notify_all();
        if (thread_.joinable()) thread_.join();
    }

private:
    void loop() {
        // Check at a tenth of the TTL, at least once a second
        auto interval = std::max(std::chrono::seconds(1), max_idle_ / 10);
        std::unique_lock<std::mutex> lock(mutex_);
        while (!cv_.wait_for(lock, interval, [this]() { return stopping_; })) {
            lock.unlock();
            try {
                size_t removed = sessions_.collect_idle(max_idle_);
                if (removed > 0) {
                    std::cout << "[IdleCollector] Removed " << removed << " idle session(s)" << std::endl;
                }
            } catch (const std::exception& e) {
                std::cerr << "[IdleCollector] " << e.what() << std::endl;
            }
            lock.lock();
        }
    }

    SessionManager& sessions_;
    std::chrono::seconds max_idle_;
    std::mutex mutex_;
    std::condition_variable cv_;
    bool stopping_ = false;
    std::thread thread_;
};

} // anonymous namespace

int main(int argc, char* argv[]) {
    Config config;
    try {
        config = Config::from_environment();
    } catch (const ConfigError& e) {
        std::cerr << "❌ " << e.what() << std::endl;
        return 1;
    }

    // Parse command line
    for (int i = 1; i < argc; i++) {
        if (std::string(argv[i]) == "--port" && i + 1 < argc) {
            config.port = std::atoi(argv[++i]);
        }
    }

    // Client disconnects must not kill the process
    std::signal(SIGPIPE, SIG_IGN);

    // SIGINT/SIGTERM are taken by a dedicated thread; block them before any
    // other thread starts so every thread inherits the mask
    sigset_t shutdown_signals;
    sigemptyset(&shutdown_signals);
    sigaddset(&shutdown_signals, SIGINT);
    sigaddset(&shutdown_signals, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &shutdown_signals, nullptr);

    std::cout << "🐍 pyexec - Session-Scoped Python Execution" << std::endl;
    std::cout << "   Install • Execute • Sandboxed" << std::endl;
    std::cout << "------------------------------------------------" << std::endl;

    std::unique_ptr<StatusBackend> status;
    std::unique_ptr<StorageBackend> storage;
    std::unique_ptr<SandboxRuntime> runtime;
    std::unique_ptr<SlotLock> slot_lock;
    try {
        status = make_status_backend(config);
        storage = make_storage_backend(config);
        runtime = make_sandbox_runtime(config);
        slot_lock = make_slot_lock(config);
    } catch (const std::exception& e) {
        std::cerr << "❌ Failed to initialize backends: " << e.what() << std::endl;
        return 1;
    }
    std::cout << "------------------------------------------------" << std::endl;

    SessionSlots slots(std::move(slot_lock));
    SessionManager sessions(config.base_session_path, *storage, slots, config.terminate_wait);

    ExecutorSettings executor_settings;
    executor_settings.image = config.base_image_name;
    executor_settings.user = config.sandbox_user;
    executor_settings.memory_limit_mb = config.sandbox_memory_mb;
    executor_settings.cpu_shares = config.sandbox_cpu_shares;
    executor_settings.execute_timeout = config.execute_timeout;
    executor_settings.install_timeout = config.install_timeout;
    SandboxExecutor executor(*runtime, sessions, executor_settings);

    CoordinatorSettings coordinator_settings;
    coordinator_settings.worker_count = config.worker_count;
    coordinator_settings.slot_wait = config.slot_wait;
    coordinator_settings.requeue_backoff = config.requeue_backoff;
    coordinator_settings.requeue_backoff_max = config.requeue_backoff_max;
    TaskCoordinator coordinator(*status, sessions, slots, executor, coordinator_settings);

    Gateway gateway(config.api_key, config.api_key_name, coordinator, sessions, {
        {"storage", storage->name()},
        {"runtime", runtime->name()},
        {"status_backend", config.status_backend() == StatusBackendKind::REDIS ? "redis" : "memory"},
    });

    HttpServer server(config.port);
    gateway.register_routes(server);

    try {
        server.listen();
    } catch (const std::exception& e) {
        std::cerr << "❌ " << e.what() << std::endl;
        return 1;
    }

    coordinator.start();

    IdleCollector collector(sessions, config.session_idle_ttl);
    if (config.session_idle_ttl.count() > 0) {
        collector.start();
    }

    std::thread signal_thread([&server, shutdown_signals]() {
        int sig = 0;
        if (sigwait(&shutdown_signals, &sig) == 0) {
            std::cout << "Received " << strsignal(sig) << ", shutting down..." << std::endl;
        }
        server.stop();
    });

    std::cout << "API endpoints:" << std::endl;
    std::cout << "  POST /install                  - Install packages into a session" << std::endl;
    std::cout << "  POST /execute                  - Run code in a session" << std::endl;
    std::cout << "  GET  /status/{type}/{task_id}  - Check task status" << std::endl;
    std::cout << "  POST /upload                   - Upload a file to a session" << std::endl;
    std::cout << "  GET  /download                 - Download a file from a session" << std::endl;
    std::cout << "  POST /terminate                - Delete a session" << std::endl;
    std::cout << "  GET  /health                   - Liveness and queue stats" << std::endl;
    std::cout << std::endl;

    // Blocks until the signal thread calls stop()
    server.serve();
    signal_thread.join();

    collector.stop();
    coordinator.stop();
    return 0;
}
