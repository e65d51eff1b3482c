#include "config.h"
#include "errors.h"

#include <cstdlib>

namespace pyexec {

namespace {

std::optional<std::string> non_empty(const Config::Lookup& lookup, const std::string& key) {
    auto value = lookup(key);
    if (!value || value->empty()) return std::nullopt;
    return value;
}

long long parse_number(const Config::Lookup& lookup, const std::string& key,
                       long long fallback, long long min_value) {
    auto value = non_empty(lookup, key);
    if (!value) return fallback;

    long long n = 0;
    try {
        size_t used = 0;
        n = std::stoll(*value, &used);
        if (used != value->size()) {
            throw ConfigError(key + " must be an integer, got '" + *value + "'");
        }
    } catch (const std::logic_error&) {
        throw ConfigError(key + " must be an integer, got '" + *value + "'");
    }
    if (n < min_value) {
        throw ConfigError(key + " must be >= " + std::to_string(min_value));
    }
    return n;
}

} // namespace

Config Config::from_lookup(const Lookup& lookup) {
    Config config;

    auto api_key = non_empty(lookup, "API_KEY");
    if (!api_key) {
        throw ConfigError("API_KEY is required");
    }
    config.api_key = *api_key;
    config.api_key_name = non_empty(lookup, "API_KEY_NAME").value_or(config.api_key_name);
    config.port = static_cast<int>(parse_number(lookup, "PORT", config.port, 1));

    config.base_session_path = non_empty(lookup, "BASE_SESSION_PATH").value_or(config.base_session_path);
    config.base_image_name = non_empty(lookup, "BASE_IMAGE_NAME").value_or(config.base_image_name);
    config.docker_binary = non_empty(lookup, "DOCKER_BINARY").value_or(config.docker_binary);
    config.sandbox_user = non_empty(lookup, "SANDBOX_USER").value_or(config.sandbox_user);

    std::string runtime = non_empty(lookup, "SANDBOX_RUNTIME").value_or("docker");
    if (runtime == "docker") {
        config.sandbox_runtime = SandboxRuntimeKind::DOCKER;
    } else if (runtime == "namespace") {
        config.sandbox_runtime = SandboxRuntimeKind::NAMESPACE;
    } else {
        throw ConfigError("SANDBOX_RUNTIME must be 'docker' or 'namespace', got '" + runtime + "'");
    }

    config.sandbox_memory_mb = static_cast<size_t>(
        parse_number(lookup, "SANDBOX_MEMORY_MB", config.sandbox_memory_mb, 16));
    config.sandbox_cpu_shares = static_cast<size_t>(
        parse_number(lookup, "SANDBOX_CPU_SHARES", config.sandbox_cpu_shares, 2));
    config.execute_timeout = std::chrono::seconds(
        parse_number(lookup, "EXECUTE_TIMEOUT_SECONDS", config.execute_timeout.count(), 1));
    config.install_timeout = std::chrono::seconds(
        parse_number(lookup, "INSTALL_TIMEOUT_SECONDS", config.install_timeout.count(), 1));

    config.worker_count = static_cast<size_t>(
        parse_number(lookup, "WORKER_COUNT", config.worker_count, 1));
    config.slot_wait = std::chrono::milliseconds(
        parse_number(lookup, "SLOT_WAIT_MS", config.slot_wait.count(), 0));
    config.requeue_backoff = std::chrono::milliseconds(
        parse_number(lookup, "REQUEUE_BACKOFF_MS", config.requeue_backoff.count(), 1));
    config.requeue_backoff_max = std::chrono::milliseconds(
        parse_number(lookup, "REQUEUE_BACKOFF_MAX_MS", config.requeue_backoff_max.count(), 1));
    if (config.requeue_backoff_max < config.requeue_backoff) {
        throw ConfigError("REQUEUE_BACKOFF_MAX_MS must be >= REQUEUE_BACKOFF_MS");
    }
    config.terminate_wait = std::chrono::seconds(
        parse_number(lookup, "TERMINATE_WAIT_SECONDS", config.terminate_wait.count(), 1));

    config.task_ttl = std::chrono::seconds(
        parse_number(lookup, "TASK_TTL_SECONDS", config.task_ttl.count(), 1));
    config.session_idle_ttl = std::chrono::seconds(
        parse_number(lookup, "SESSION_IDLE_TTL_SECONDS", 0, 0));

    config.redis_url = non_empty(lookup, "REDIS_URL");

    if (auto bucket = non_empty(lookup, "S3_BUCKET_NAME")) {
        S3Settings s3;
        s3.bucket = *bucket;
        auto access_key = non_empty(lookup, "AWS_ACCESS_KEY_ID");
        auto secret_key = non_empty(lookup, "AWS_SECRET_ACCESS_KEY");
        if (!access_key || !secret_key) {
            throw ConfigError("S3_BUCKET_NAME requires AWS_ACCESS_KEY_ID and AWS_SECRET_ACCESS_KEY");
        }
        s3.access_key_id = *access_key;
        s3.secret_access_key = *secret_key;
        s3.region = non_empty(lookup, "AWS_REGION").value_or(s3.region);
        s3.endpoint = non_empty(lookup, "S3_ENDPOINT").value_or("");
        config.s3 = s3;
    }

    return config;
}

Config Config::from_environment() {
    return from_lookup([](const std::string& key) -> std::optional<std::string> {
        const char* value = std::getenv(key.c_str());
        if (!value) return std::nullopt;
        return std::string(value);
    });
}

} // namespace pyexec
