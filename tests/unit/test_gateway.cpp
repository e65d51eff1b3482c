/**
 * Unit tests for Gateway
 *
 * Handlers are called directly with hand-built requests. The engine behind
 * them is real (coordinator, session manager, executor) over a fake runtime.
 */

#include <gtest/gtest.h>
#include "gateway.h"
#include "json_util.h"
#include "local_storage.h"
#include "memory_status_backend.h"
#include "errors.h"
#include "fake_runtime.h"

#include <filesystem>
#include <regex>
#include <thread>
#include <unistd.h>

namespace fs = std::filesystem;
using namespace pyexec;
using namespace pyexec::testing_support;

namespace {

const char* API_KEY = "test-key";

// Status store that is always down
class UnreachableStatusBackend : public StatusBackend {
public:
    void put(const Task&) override { throw RedisError("connection refused"); }
    bool create(const Task&) override { throw RedisError("connection refused"); }
    bool compare_and_set(const std::string&, TaskState, const Task&) override {
        throw RedisError("connection refused");
    }
    std::optional<Task> get(const std::string&) override { throw RedisError("connection refused"); }
    bool compare_and_set_alias(const std::string&, const std::optional<std::string>&,
                               const std::string&) override {
        throw RedisError("connection refused");
    }
    std::optional<std::string> resolve_alias(const std::string&) override {
        throw RedisError("connection refused");
    }
    std::string name() const override { return "unreachable"; }
};

std::string multipart_body(const std::string& boundary, const std::string& session_id,
                           const std::string& filename, const std::string& content) {
    return "--" + boundary + "\r\n"
           "Content-Disposition: form-data; name=\"session_id\"\r\n\r\n" +
           session_id + "\r\n"
           "--" + boundary + "\r\n"
           "Content-Disposition: form-data; name=\"file\"; filename=\"" + filename + "\"\r\n"
           "Content-Type: application/octet-stream\r\n\r\n" +
           content + "\r\n"
           "--" + boundary + "--\r\n";
}

} // anonymous namespace

// ============================================================================
// Test Fixture
// ============================================================================

class GatewayTest : public ::testing::Test {
protected:
    void SetUp() override {
        base_dir = fs::temp_directory_path() /
                   ("pyexec_gateway_" + std::to_string(::getpid()) + "_" +
                    ::testing::UnitTest::GetInstance()->current_test_info()->name());
        fs::remove_all(base_dir);
        fs::create_directories(base_dir);

        storage = std::make_unique<LocalStorageBackend>(base_dir.string());
        sessions = std::make_unique<SessionManager>(base_dir.string(), *storage, slots,
                                                    std::chrono::seconds(1));
        runtime.on_run = python_emulator();

        ExecutorSettings executor_settings;
        executor_settings.execute_timeout = std::chrono::seconds(1);
        executor = std::make_unique<SandboxExecutor>(runtime, *sessions, executor_settings);

        CoordinatorSettings settings;
        settings.worker_count = 2;
        settings.slot_wait = std::chrono::milliseconds(5);
        settings.requeue_backoff = std::chrono::milliseconds(5);
        settings.requeue_backoff_max = std::chrono::milliseconds(20);
        coordinator = std::make_unique<TaskCoordinator>(status, *sessions, slots, *executor, settings);
        coordinator->start();

        gateway = std::make_unique<Gateway>(API_KEY, "X-API-Key", *coordinator, *sessions,
                                            std::map<std::string, std::string>{{"runtime", "fake"}});
    }

    void TearDown() override {
        coordinator->stop();
        fs::remove_all(base_dir);
    }

    HttpRequest request(const std::string& method, const std::string& path,
                        const std::string& body = "", bool with_key = true) {
        HttpRequest req;
        req.method = method;
        req.path = path;
        req.body = body;
        req.client_ip = "127.0.0.1";
        if (with_key) req.headers["x-api-key"] = API_KEY;
        return req;
    }

    Json::Value json_of(const HttpResponse& resp) {
        return parse_json(resp.body);
    }

    Json::Value wait_for_status(const std::string& url) {
        auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(10);
        while (std::chrono::steady_clock::now() < deadline) {
            HttpResponse resp = gateway->handle_status(request("GET", url));
            if (resp.status_code == 200) {
                Json::Value body = json_of(resp);
                std::string state = get_string(body, "status").value_or("");
                if (state == "success" || state == "failed") return body;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
        ADD_FAILURE() << url << " did not reach a terminal state";
        return Json::Value();
    }

    fs::path base_dir;
    MemoryStatusBackend status;
    SessionSlots slots;
    std::unique_ptr<LocalStorageBackend> storage;
    std::unique_ptr<SessionManager> sessions;
    FakeRuntime runtime;
    std::unique_ptr<SandboxExecutor> executor;
    std::unique_ptr<TaskCoordinator> coordinator;
    std::unique_ptr<Gateway> gateway;
};

// ============================================================================
// Test Contract: Authentication
// ============================================================================

TEST_F(GatewayTest, MissingOrWrongKeyIs403) {
    HttpRequest no_key = request("POST", "/execute", R"({"session_id":"s1","code":"x"})", false);
    HttpResponse resp = gateway->handle_execute(no_key);
    EXPECT_EQ(resp.status_code, 403);
    EXPECT_EQ(resp.body, "{\"error\":\"Could not validate credentials\"}");

    HttpRequest wrong = no_key;
    wrong.headers["x-api-key"] = "test-kez";
    EXPECT_EQ(gateway->handle_execute(wrong).status_code, 403);

    HttpRequest prefix = no_key;
    prefix.headers["x-api-key"] = "test";
    EXPECT_EQ(gateway->handle_install(prefix).status_code, 403);

    EXPECT_EQ(runtime.created(), 0) << "Nothing runs for a rejected caller";
}

TEST_F(GatewayTest, EveryProtectedRouteChecksTheKey) {
    EXPECT_EQ(gateway->handle_status(request("GET", "/status/execute/x", "", false)).status_code, 403);
    EXPECT_EQ(gateway->handle_upload(request("POST", "/upload", "", false)).status_code, 403);
    EXPECT_EQ(gateway->handle_download(request("GET", "/download", "", false)).status_code, 403);
    EXPECT_EQ(gateway->handle_terminate(request("POST", "/terminate", "", false)).status_code, 403);
}

TEST_F(GatewayTest, HealthNeedsNoKey) {
    HttpResponse resp = gateway->handle_health(request("GET", "/health", "", false));

    ASSERT_EQ(resp.status_code, 200);
    Json::Value body = json_of(resp);
    EXPECT_EQ(get_string(body, "status"), "ok");
    EXPECT_EQ(get_int(body, "workers"), 2);
    EXPECT_EQ(get_string(body, "runtime"), "fake");
}

// ============================================================================
// Test Contract: Submission
// ============================================================================

TEST_F(GatewayTest, ExecuteIsAcceptedAndCompletes) {
    HttpResponse resp = gateway->handle_execute(
        request("POST", "/execute", R"json({"session_id":"s1","code":"print(1+1)"})json"));

    ASSERT_EQ(resp.status_code, 202) << resp.body;
    Json::Value body = json_of(resp);
    EXPECT_EQ(get_string(body, "status"), "execute_queued");
    std::string task_id = *get_string(body, "task_id");
    EXPECT_TRUE(std::regex_match(task_id, std::regex("^exec-s1-[0-9a-f]{8}$")));
    EXPECT_EQ(get_string(body, "status_url"), "/status/execute/" + task_id);

    Json::Value final_state = wait_for_status(*get_string(body, "status_url"));
    EXPECT_EQ(get_string(final_state, "status"), "success");
    EXPECT_EQ(get_string(final_state, "output"), "2\n");
    EXPECT_EQ(get_string(final_state, "errors"), "");
    EXPECT_EQ(get_int(final_state, "exit_code"), 0);
    EXPECT_EQ(get_string(final_state, "task_type"), "execute");
    EXPECT_FALSE(get_string(final_state, "error").has_value());
}

TEST_F(GatewayTest, InstallIsAccepted) {
    HttpResponse resp = gateway->handle_install(
        request("POST", "/install", R"({"session_id":"s1","packages":["numpy"]})"));

    ASSERT_EQ(resp.status_code, 202) << resp.body;
    Json::Value body = json_of(resp);
    EXPECT_EQ(get_string(body, "status"), "install_queued");
    EXPECT_EQ(get_string(body, "session_id"), "s1");
    EXPECT_EQ(get_string(body, "task_id"), "install-s1");
    EXPECT_EQ(get_string(body, "status_url"), "/status/install/install-s1");

    Json::Value final_state = wait_for_status("/status/install/install-s1");
    EXPECT_EQ(get_string(final_state, "status"), "success");
    EXPECT_NE(get_string(final_state, "output")->find("Successfully installed numpy"), std::string::npos);
}

TEST_F(GatewayTest, FailedScriptReportsErrorsAndExitCode) {
    HttpResponse resp = gateway->handle_execute(
        request("POST", "/execute", R"json({"session_id":"s1","code":"raise ValueError('boom')"})json"));
    ASSERT_EQ(resp.status_code, 202);

    Json::Value final_state = wait_for_status(*get_string(json_of(resp), "status_url"));
    EXPECT_EQ(get_string(final_state, "status"), "failed");
    EXPECT_EQ(get_int(final_state, "exit_code"), 1);
    EXPECT_EQ(get_string(final_state, "reason"), "non_zero_exit");
    EXPECT_NE(get_string(final_state, "errors")->find("Traceback"), std::string::npos);
}

TEST_F(GatewayTest, MalformedBodiesAre400) {
    EXPECT_EQ(gateway->handle_execute(request("POST", "/execute", "{not json")).status_code, 400);
    EXPECT_EQ(gateway->handle_execute(request("POST", "/execute", "[]")).status_code, 400);
    EXPECT_EQ(gateway->handle_execute(request("POST", "/execute", R"({"session_id":"s1"})")).status_code, 400);
    EXPECT_EQ(gateway->handle_execute(
        request("POST", "/execute", R"({"session_id":"s1","code":5})")).status_code, 400);
    EXPECT_EQ(gateway->handle_install(request("POST", "/install", R"({"session_id":"s1"})")).status_code, 400);
    EXPECT_EQ(gateway->handle_install(
        request("POST", "/install", R"({"session_id":"../x","packages":["numpy"]})")).status_code, 400);
    EXPECT_EQ(runtime.created(), 0);
}

TEST_F(GatewayTest, StatusStoreOutageIs503) {
    UnreachableStatusBackend down;
    CoordinatorSettings settings;
    settings.worker_count = 1;
    TaskCoordinator broken(down, *sessions, slots, *executor, settings);
    Gateway degraded(API_KEY, "X-API-Key", broken, *sessions);

    HttpResponse submit = degraded.handle_execute(
        request("POST", "/execute", R"json({"session_id":"s1","code":"print(1)"})json"));
    EXPECT_EQ(submit.status_code, 503);
    EXPECT_EQ(submit.body, "{\"error\":\"Status store unavailable\"}");

    EXPECT_EQ(degraded.handle_status(request("GET", "/status/execute/exec-s1-00000000")).status_code, 503);
}

// ============================================================================
// Test Contract: Status Lookup
// ============================================================================

TEST_F(GatewayTest, StatusRejectsMalformedPaths) {
    EXPECT_EQ(gateway->handle_status(request("GET", "/status/execute")).status_code, 400);
    EXPECT_EQ(gateway->handle_status(request("GET", "/status/execute/")).status_code, 400);
    EXPECT_EQ(gateway->handle_status(request("GET", "/status/build/abc")).status_code, 400);
}

TEST_F(GatewayTest, UnknownTaskIs404) {
    HttpResponse resp = gateway->handle_status(request("GET", "/status/execute/exec-s1-ffffffff"));
    EXPECT_EQ(resp.status_code, 404);
    EXPECT_EQ(resp.body, "{\"error\":\"Task not found.\"}");
}

TEST_F(GatewayTest, StatusJsonShapeForQueuedTask) {
    Task task;
    task.task_id = "install-s1";
    task.kind = TaskKind::INSTALL;
    task.state = TaskState::QUEUED;

    Json::Value body = parse_json(Gateway::task_to_status_json(task));
    EXPECT_EQ(get_string(body, "status"), "queued");
    EXPECT_EQ(get_string(body, "reason"), "none");
    EXPECT_FALSE(get_int(body, "exit_code").has_value());
    EXPECT_TRUE(body.isMember("exit_code"));
    EXPECT_TRUE(body["exit_code"].isNull());
}

// ============================================================================
// Test Contract: Files and Sessions
// ============================================================================

TEST_F(GatewayTest, UploadThenDownload) {
    std::string boundary = "----pyexec";
    HttpRequest upload = request("POST", "/upload", multipart_body(boundary, "s1", "data.csv", "a,b\n1,2\n"));
    upload.headers["content-type"] = "multipart/form-data; boundary=" + boundary;

    HttpResponse stored = gateway->handle_upload(upload);
    ASSERT_EQ(stored.status_code, 200) << stored.body;
    EXPECT_EQ(get_string(json_of(stored), "filename"), "data.csv");
    EXPECT_EQ(get_string(json_of(stored), "storage"), "local");
    EXPECT_TRUE(fs::exists(base_dir / "s1" / "data.csv"));

    HttpRequest download = request("GET", "/download");
    download.query = {{"session_id", "s1"}, {"filename", "data.csv"}};
    HttpResponse resp = gateway->handle_download(download);

    ASSERT_EQ(resp.status_code, 200);
    EXPECT_EQ(resp.body, "a,b\n1,2\n");
    EXPECT_EQ(resp.headers["Content-Type"], "text/csv");
    EXPECT_EQ(resp.headers["Content-Disposition"], "attachment; filename=\"data.csv\"");
}

TEST_F(GatewayTest, UploadWithoutFileIs400) {
    std::string boundary = "----pyexec";
    std::string body = "--" + boundary + "\r\n"
                       "Content-Disposition: form-data; name=\"session_id\"\r\n\r\ns1\r\n"
                       "--" + boundary + "--\r\n";
    HttpRequest upload = request("POST", "/upload", body);
    upload.headers["content-type"] = "multipart/form-data; boundary=" + boundary;

    EXPECT_EQ(gateway->handle_upload(upload).status_code, 400);
}

TEST_F(GatewayTest, UploadRejectsTraversalFilename) {
    std::string boundary = "----pyexec";
    HttpRequest upload = request("POST", "/upload", multipart_body(boundary, "s1", "../evil.py", "x"));
    upload.headers["content-type"] = "multipart/form-data; boundary=" + boundary;

    EXPECT_EQ(gateway->handle_upload(upload).status_code, 400);
    EXPECT_FALSE(fs::exists(base_dir / "evil.py"));
}

TEST_F(GatewayTest, DownloadErrors) {
    HttpRequest missing_params = request("GET", "/download");
    missing_params.query = {{"session_id", "s1"}};
    EXPECT_EQ(gateway->handle_download(missing_params).status_code, 400);

    HttpRequest absent = request("GET", "/download");
    absent.query = {{"session_id", "s1"}, {"filename", "nope.txt"}};
    HttpResponse resp = gateway->handle_download(absent);
    EXPECT_EQ(resp.status_code, 404);
    EXPECT_EQ(resp.body, "{\"error\":\"File not found\"}");
}

TEST_F(GatewayTest, TerminateReportsWhetherSessionExisted) {
    sessions->resolve_or_create("s1");

    HttpResponse resp = gateway->handle_terminate(request("POST", "/terminate", R"({"session_id":"s1"})"));
    ASSERT_EQ(resp.status_code, 200);
    EXPECT_EQ(get_string(json_of(resp), "status"), "success");
    EXPECT_EQ(get_string(json_of(resp), "message"), "Session s1 terminated successfully.");
    EXPECT_FALSE(fs::exists(base_dir / "s1"));

    HttpResponse again = gateway->handle_terminate(request("POST", "/terminate", R"({"session_id":"s1"})"));
    ASSERT_EQ(again.status_code, 200);
    EXPECT_EQ(get_string(json_of(again), "message"), "Session s1 not found.");
}

TEST_F(GatewayTest, TerminateBusySessionIs409) {
    sessions->resolve_or_create("s1");
    auto lease = slots.try_acquire("s1", std::chrono::milliseconds(0));
    ASSERT_TRUE(lease.has_value());

    // terminate_wait is 1s in this fixture
    HttpResponse resp = gateway->handle_terminate(request("POST", "/terminate", R"({"session_id":"s1"})"));
    EXPECT_EQ(resp.status_code, 409);
    EXPECT_TRUE(fs::exists(base_dir / "s1"));
}

TEST_F(GatewayTest, TerminateRejectsBadIds) {
    EXPECT_EQ(gateway->handle_terminate(
        request("POST", "/terminate", R"({"session_id":"../.."})")).status_code, 400);
    EXPECT_EQ(gateway->handle_terminate(request("POST", "/terminate", "{}")).status_code, 400);
}

TEST_F(GatewayTest, RoutesAreRegistered) {
    HttpServer server(0);
    gateway->register_routes(server);

    HttpRequest health = request("GET", "/health", "", false);
    EXPECT_EQ(server.dispatch(health).status_code, 200);
    EXPECT_EQ(server.dispatch(request("GET", "/status/execute/unknown")).status_code, 404);
    EXPECT_EQ(server.dispatch(request("GET", "/nowhere")).status_code, 404);
}
