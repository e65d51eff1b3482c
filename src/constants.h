#pragma once

#include <cstddef>  // for size_t

namespace pyexec {

// Sandbox limits
constexpr size_t DEFAULT_SANDBOX_MEMORY_MB = 256;                // Hard memory ceiling
constexpr size_t DEFAULT_SANDBOX_CPU_SHARES = 512;               // Relative CPU weight
constexpr size_t MAX_PROCESSES_PER_SANDBOX = 64;                 // Max threads/processes
constexpr size_t MAX_OUTPUT_SIZE = 10 * 1024 * 1024;             // 10MB per captured stream
constexpr size_t MAX_REQUEST_SIZE = 100 * 1024 * 1024;           // 100MB max request

// Time limits
constexpr int DEFAULT_EXECUTE_TIMEOUT_SECONDS = 30;
constexpr int DEFAULT_INSTALL_TIMEOUT_SECONDS = 600;
constexpr int DEFAULT_TERMINATE_WAIT_SECONDS = 900;
constexpr int DEFAULT_TASK_TTL_SECONDS = 3600;                   // Status record retention
constexpr int TEARDOWN_ATTEMPTS = 3;                             // remove() retries
constexpr int TEARDOWN_RETRY_DELAY_MS = 200;

// Dispatch
constexpr size_t DEFAULT_WORKER_COUNT = 4;
constexpr int DEFAULT_SLOT_WAIT_MS = 50;                         // Before re-queueing
constexpr int DEFAULT_REQUEUE_BACKOFF_MS = 100;
constexpr int DEFAULT_REQUEUE_BACKOFF_MAX_MS = 2000;

// Sessions
constexpr size_t MAX_SESSION_ID_LENGTH = 128;
constexpr const char* VENV_DIR = "venv";
constexpr const char* WORKSPACE_MOUNT_POINT = "/app";
constexpr const char* RESERVED_FILE_PREFIX = ".pyexec-";        // Transient scripts, archives
constexpr const char* ENVIRONMENT_ARCHIVE = ".pyexec-venv.tar.gz"; // venv/ in object storage
constexpr int ENVIRONMENT_ARCHIVE_TIMEOUT_SECONDS = 300;

// Buffer sizes
constexpr size_t PIPE_BUFFER_SIZE = 4096;                        // Read buffer size
constexpr size_t INITIAL_HTTP_BUFFER = 8192;                     // Initial HTTP buffer

// Network
constexpr int DEFAULT_PORT = 8000;                               // Default gateway port
constexpr int LISTEN_BACKLOG = 64;                               // Socket listen backlog
constexpr int DEFAULT_REDIS_PORT = 6379;

} // namespace pyexec
