#include "backend_factory.h"
#include "constants.h"
#include "docker_runtime.h"
#include "local_storage.h"
#include "memory_status_backend.h"
#include "namespace_runtime.h"
#include "redis_slot_lock.h"
#include "redis_status_backend.h"
#include "s3_storage.h"

#include <algorithm>
#include <iostream>

namespace pyexec {

std::unique_ptr<StatusBackend> make_status_backend(const Config& config) {
    if (config.status_backend() == StatusBackendKind::REDIS) {
        RedisEndpoint endpoint = RedisEndpoint::parse(*config.redis_url);
        std::cout << "[Config] Status backend: redis at " << endpoint.host << ":"
                  << endpoint.port << "/" << endpoint.db << std::endl;
        return std::make_unique<RedisStatusBackend>(
            std::make_unique<RedisClient>(endpoint), config.task_ttl);
    }
    std::cout << "[Config] Status backend: in-memory" << std::endl;
    return std::make_unique<MemoryStatusBackend>(config.task_ttl);
}

std::unique_ptr<SlotLock> make_slot_lock(const Config& config) {
    if (config.status_backend() != StatusBackendKind::REDIS) {
        return nullptr;
    }
    // Outlives the longest task: sync, the install run, environment archiving
    auto ttl = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::max(config.install_timeout, config.execute_timeout) +
        std::chrono::seconds(2 * ENVIRONMENT_ARCHIVE_TIMEOUT_SECONDS + 120));
    std::cout << "[Config] Session slots: shared through redis (lease "
              << ttl.count() / 1000 << "s)" << std::endl;
    return std::make_unique<RedisSlotLock>(
        std::make_unique<RedisClient>(RedisEndpoint::parse(*config.redis_url)), ttl);
}

std::unique_ptr<StorageBackend> make_storage_backend(const Config& config) {
    if (config.storage_backend() == StorageBackendKind::S3) {
        std::cout << "[Config] Storage backend: s3 bucket " << config.s3->bucket << std::endl;
        return std::make_unique<S3StorageBackend>(*config.s3);
    }
    std::cout << "[Config] Storage backend: local " << config.base_session_path << std::endl;
    return std::make_unique<LocalStorageBackend>(config.base_session_path);
}

std::unique_ptr<SandboxRuntime> make_sandbox_runtime(const Config& config) {
    if (config.sandbox_runtime == SandboxRuntimeKind::NAMESPACE) {
        if (!NamespaceRuntime::is_supported()) {
            std::cerr << "[Config] Warning: namespaces unavailable, sandbox launches will fail"
                      << std::endl;
        }
        std::cout << "[Config] Sandbox runtime: namespace" << std::endl;
        return std::make_unique<NamespaceRuntime>();
    }

    auto runtime = std::make_unique<DockerRuntime>(config.docker_binary);
    if (!runtime->is_available()) {
        std::cerr << "[Config] Warning: docker daemon not reachable via "
                  << config.docker_binary << std::endl;
    }
    std::cout << "[Config] Sandbox runtime: docker (image " << config.base_image_name << ")"
              << std::endl;
    return runtime;
}

} // namespace pyexec
