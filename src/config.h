#pragma once

#include "constants.h"

#include <chrono>
#include <functional>
#include <optional>
#include <string>

namespace pyexec {

enum class StatusBackendKind { MEMORY, REDIS };
enum class StorageBackendKind { LOCAL, S3 };
enum class SandboxRuntimeKind { DOCKER, NAMESPACE };

struct S3Settings {
    std::string bucket;
    std::string access_key_id;
    std::string secret_access_key;
    std::string region = "us-east-1";
    std::string endpoint;          // empty = https://<bucket>.s3.<region>.amazonaws.com
};

// Every recognized setting, resolved once at startup
struct Config {
    // Gateway
    std::string api_key;
    std::string api_key_name = "X-API-Key";
    int port = DEFAULT_PORT;

    // Sandbox
    std::string base_session_path = "/tmp/sessions";
    std::string base_image_name = "pyexec-base";
    SandboxRuntimeKind sandbox_runtime = SandboxRuntimeKind::DOCKER;
    std::string docker_binary = "docker";
    std::string sandbox_user = "appuser";
    size_t sandbox_memory_mb = DEFAULT_SANDBOX_MEMORY_MB;
    size_t sandbox_cpu_shares = DEFAULT_SANDBOX_CPU_SHARES;
    std::chrono::seconds execute_timeout{DEFAULT_EXECUTE_TIMEOUT_SECONDS};
    std::chrono::seconds install_timeout{DEFAULT_INSTALL_TIMEOUT_SECONDS};

    // Dispatch
    size_t worker_count = DEFAULT_WORKER_COUNT;
    std::chrono::milliseconds slot_wait{DEFAULT_SLOT_WAIT_MS};
    std::chrono::milliseconds requeue_backoff{DEFAULT_REQUEUE_BACKOFF_MS};
    std::chrono::milliseconds requeue_backoff_max{DEFAULT_REQUEUE_BACKOFF_MAX_MS};
    std::chrono::seconds terminate_wait{DEFAULT_TERMINATE_WAIT_SECONDS};

    // Retention
    std::chrono::seconds task_ttl{DEFAULT_TASK_TTL_SECONDS};
    std::chrono::seconds session_idle_ttl{0};      // 0 = never collect

    // Optional distributed backends
    std::optional<std::string> redis_url;
    std::optional<S3Settings> s3;

    StatusBackendKind status_backend() const {
        return redis_url ? StatusBackendKind::REDIS : StatusBackendKind::MEMORY;
    }

    StorageBackendKind storage_backend() const {
        return s3 ? StorageBackendKind::S3 : StorageBackendKind::LOCAL;
    }

    // Lookup returns nullopt for unset keys
    using Lookup = std::function<std::optional<std::string>(const std::string&)>;

    // Throws ConfigError on missing API_KEY, malformed numbers, unknown
    // runtime names or an S3 bucket without credentials
    static Config from_lookup(const Lookup& lookup);
    static Config from_environment();
};

} // namespace pyexec
