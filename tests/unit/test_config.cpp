#include <gtest/gtest.h>
#include "config.h"
#include "backend_factory.h"
#include "errors.h"

#include <filesystem>
#include <map>

namespace pyexec {
namespace {

class ConfigTest : public ::testing::Test {
protected:
    Config load() {
        return Config::from_lookup([this](const std::string& key) -> std::optional<std::string> {
            auto it = env.find(key);
            if (it == env.end()) return std::nullopt;
            return it->second;
        });
    }

    std::map<std::string, std::string> env{{"API_KEY", "secret"}};
};

TEST_F(ConfigTest, DefaultsWithOnlyApiKey) {
    Config config = load();

    EXPECT_EQ(config.api_key, "secret");
    EXPECT_EQ(config.api_key_name, "X-API-Key");
    EXPECT_EQ(config.port, 8000);
    EXPECT_EQ(config.base_session_path, "/tmp/sessions");
    EXPECT_EQ(config.sandbox_runtime, SandboxRuntimeKind::DOCKER);
    EXPECT_EQ(config.execute_timeout, std::chrono::seconds(30));
    EXPECT_EQ(config.install_timeout, std::chrono::seconds(600));
    EXPECT_EQ(config.session_idle_ttl, std::chrono::seconds(0));
    EXPECT_EQ(config.status_backend(), StatusBackendKind::MEMORY);
    EXPECT_EQ(config.storage_backend(), StorageBackendKind::LOCAL);
}

TEST_F(ConfigTest, MissingOrEmptyApiKeyIsFatal) {
    env.clear();
    EXPECT_THROW(load(), ConfigError);
    env["API_KEY"] = "";
    EXPECT_THROW(load(), ConfigError);
}

TEST_F(ConfigTest, OverridesAreApplied) {
    env["API_KEY_NAME"] = "X-Token";
    env["PORT"] = "9100";
    env["BASE_SESSION_PATH"] = "/srv/sessions";
    env["SANDBOX_RUNTIME"] = "namespace";
    env["EXECUTE_TIMEOUT_SECONDS"] = "5";
    env["WORKER_COUNT"] = "8";
    env["SESSION_IDLE_TTL_SECONDS"] = "600";

    Config config = load();

    EXPECT_EQ(config.api_key_name, "X-Token");
    EXPECT_EQ(config.port, 9100);
    EXPECT_EQ(config.base_session_path, "/srv/sessions");
    EXPECT_EQ(config.sandbox_runtime, SandboxRuntimeKind::NAMESPACE);
    EXPECT_EQ(config.execute_timeout, std::chrono::seconds(5));
    EXPECT_EQ(config.worker_count, 8u);
    EXPECT_EQ(config.session_idle_ttl, std::chrono::seconds(600));
}

TEST_F(ConfigTest, EmptyValuesFallBackToDefaults) {
    env["PORT"] = "";
    env["BASE_IMAGE_NAME"] = "";
    Config config = load();
    EXPECT_EQ(config.port, 8000);
    EXPECT_EQ(config.base_image_name, "pyexec-base");
}

TEST_F(ConfigTest, RejectsMalformedNumbers) {
    env["PORT"] = "80a";
    EXPECT_THROW(load(), ConfigError);
    env["PORT"] = "0";
    EXPECT_THROW(load(), ConfigError) << "Below minimum";
    env["PORT"] = "8000";
    env["WORKER_COUNT"] = "many";
    EXPECT_THROW(load(), ConfigError);
}

TEST_F(ConfigTest, RejectsUnknownRuntime) {
    env["SANDBOX_RUNTIME"] = "firecracker";
    EXPECT_THROW(load(), ConfigError);
}

TEST_F(ConfigTest, BackoffCeilingBelowFloorIsRejected) {
    env["REQUEUE_BACKOFF_MS"] = "500";
    env["REQUEUE_BACKOFF_MAX_MS"] = "100";
    EXPECT_THROW(load(), ConfigError);
}

TEST_F(ConfigTest, RedisUrlSelectsRedisBackend) {
    env["REDIS_URL"] = "redis://cache:6379/0";
    Config config = load();
    EXPECT_EQ(config.status_backend(), StatusBackendKind::REDIS);
    EXPECT_EQ(*config.redis_url, "redis://cache:6379/0");
}

TEST_F(ConfigTest, S3BucketRequiresCredentials) {
    env["S3_BUCKET_NAME"] = "sessions";
    EXPECT_THROW(load(), ConfigError);

    env["AWS_ACCESS_KEY_ID"] = "AKID";
    env["AWS_SECRET_ACCESS_KEY"] = "SECRET";
    env["AWS_REGION"] = "eu-west-1";
    Config config = load();

    EXPECT_EQ(config.storage_backend(), StorageBackendKind::S3);
    ASSERT_TRUE(config.s3.has_value());
    EXPECT_EQ(config.s3->bucket, "sessions");
    EXPECT_EQ(config.s3->region, "eu-west-1");
    EXPECT_TRUE(config.s3->endpoint.empty());
}

TEST_F(ConfigTest, FactoryBuildsDefaultBackends) {
    env["BASE_SESSION_PATH"] = std::filesystem::temp_directory_path().string();
    env["DOCKER_BINARY"] = "/nonexistent/docker";
    Config config = load();

    EXPECT_EQ(make_status_backend(config)->name(), "memory");
    EXPECT_EQ(make_storage_backend(config)->name(), "local");
    EXPECT_EQ(make_sandbox_runtime(config)->name(), "docker") << "Unreachable daemon only warns";

    env["SANDBOX_RUNTIME"] = "namespace";
    EXPECT_EQ(make_sandbox_runtime(load())->name(), "namespace");
}

TEST_F(ConfigTest, FactoryRejectsMalformedRedisUrl) {
    env["REDIS_URL"] = "tcp://cache";
    EXPECT_THROW(make_status_backend(load()), ConfigError);
}

} // namespace
} // namespace pyexec
