#include "gateway.h"
#include "errors.h"
#include "file_utils.h"
#include "json_util.h"
#include "multipart.h"

#include <openssl/crypto.h>

#include <filesystem>
#include <iostream>

namespace fs = std::filesystem;

namespace pyexec {

namespace {

HttpResponse error_response(int status, const std::string& message) {
    Json::Value body;
    body["error"] = message;
    return HttpResponse::json(status, write_json(body));
}

// Engine errors → HTTP status. Anything unrecognized is rethrown so the
// server's dispatch turns it into a 500.
template <typename Handler>
HttpResponse guarded(const char* route, Handler&& handler) {
    try {
        return handler();
    } catch (const JsonParseError& e) {
        return error_response(400, e.what());
    } catch (const InvalidSessionId& e) {
        return error_response(400, e.what());
    } catch (const InvalidRequest& e) {
        return error_response(400, e.what());
    } catch (const SessionBusy& e) {
        return error_response(409, e.what());
    } catch (const FileNotFound&) {
        return error_response(404, "File not found");
    } catch (const StorageError& e) {
        std::cerr << "[Gateway] " << route << ": " << e.what() << std::endl;
        return error_response(500, e.what());
    } catch (const RedisError& e) {
        std::cerr << "[Gateway] " << route << ": " << e.what() << std::endl;
        return error_response(503, "Status store unavailable");
    }
}

Json::Value parse_object(const std::string& body) {
    Json::Value root = parse_json(body);
    if (!root.isObject()) {
        throw InvalidRequest("Request body must be a JSON object");
    }
    return root;
}

std::string require_string(const Json::Value& root, const std::string& key) {
    auto value = get_string(root, key);
    if (!value) {
        throw InvalidRequest("Missing field: " + key);
    }
    return *value;
}

std::string status_url(TaskKind kind, const std::string& task_id) {
    return "/status/" + to_string(kind) + "/" + task_id;
}

} // anonymous namespace

Gateway::Gateway(const std::string& api_key,
                 const std::string& api_key_name,
                 TaskCoordinator& coordinator,
                 SessionManager& sessions,
                 std::map<std::string, std::string> health_details)
    : api_key_(api_key),
      api_key_name_(api_key_name),
      coordinator_(coordinator),
      sessions_(sessions),
      health_details_(std::move(health_details)) {}

void Gateway::register_routes(HttpServer& server) {
    server.route("POST", "/install", [this](const HttpRequest& req) { return handle_install(req); });
    server.route("POST", "/execute", [this](const HttpRequest& req) { return handle_execute(req); });
    server.route("GET", "/status/", [this](const HttpRequest& req) { return handle_status(req); });
    server.route("POST", "/upload", [this](const HttpRequest& req) { return handle_upload(req); });
    server.route("GET", "/download", [this](const HttpRequest& req) { return handle_download(req); });
    server.route("POST", "/terminate", [this](const HttpRequest& req) { return handle_terminate(req); });
    server.route("GET", "/health", [this](const HttpRequest& req) { return handle_health(req); });
}

bool Gateway::authorized(const HttpRequest& req) const {
    std::string presented = req.header(api_key_name_);
    if (presented.size() != api_key_.size() || api_key_.empty()) {
        return false;
    }
    return CRYPTO_memcmp(presented.data(), api_key_.data(), api_key_.size()) == 0;
}

// POST /install {session_id, packages[]}
HttpResponse Gateway::handle_install(const HttpRequest& req) {
    if (!authorized(req)) return error_response(403, "Could not validate credentials");

    return guarded("install", [&]() {
        Json::Value root = parse_object(req.body);
        std::string session_id = require_string(root, "session_id");
        auto packages = get_string_array(root, "packages");
        if (!packages) {
            throw InvalidRequest("Missing field: packages");
        }

        std::string task_id = coordinator_.submit_install(session_id, *packages);

        Json::Value json;
        json["status"] = "install_queued";
        json["session_id"] = session_id;
        json["task_id"] = task_id;
        json["status_url"] = status_url(TaskKind::INSTALL, task_id);
        return HttpResponse::json(202, write_json(json));
    });
}

// POST /execute {session_id, code, env?}
HttpResponse Gateway::handle_execute(const HttpRequest& req) {
    if (!authorized(req)) return error_response(403, "Could not validate credentials");

    return guarded("execute", [&]() {
        Json::Value root = parse_object(req.body);
        std::string session_id = require_string(root, "session_id");
        std::string code = require_string(root, "code");
        auto env = get_string_map(root, "env");

        std::string task_id = coordinator_.submit_execute(
            session_id, code, env ? *env : std::map<std::string, std::string>{});

        Json::Value json;
        json["status"] = "execute_queued";
        json["task_id"] = task_id;
        json["status_url"] = status_url(TaskKind::EXECUTE, task_id);
        return HttpResponse::json(202, write_json(json));
    });
}

// GET /status/{task_type}/{task_id}
HttpResponse Gateway::handle_status(const HttpRequest& req) {
    if (!authorized(req)) return error_response(403, "Could not validate credentials");

    return guarded("status", [&]() {
        std::string rest = req.path.substr(std::string("/status/").size());
        size_t slash = rest.find('/');
        if (slash == std::string::npos || slash + 1 >= rest.size()) {
            return error_response(400, "Expected /status/{task_type}/{task_id}");
        }

        std::string task_type = rest.substr(0, slash);
        std::string task_id = rest.substr(slash + 1);
        if (!parse_task_kind(task_type)) {
            return error_response(400, "Unknown task type: " + task_type);
        }

        auto task = coordinator_.get_status(task_id);
        if (!task) {
            return error_response(404, "Task not found.");
        }
        return HttpResponse::json(200, task_to_status_json(*task));
    });
}

// POST /upload, multipart fields session_id and file
HttpResponse Gateway::handle_upload(const HttpRequest& req) {
    if (!authorized(req)) return error_response(403, "Could not validate credentials");

    return guarded("upload", [&]() {
        auto parts = MultipartParser::parse(req.header("Content-Type"), req.body);
        const MultipartPart* session_part = MultipartParser::find(parts, "session_id");
        const MultipartPart* file_part = MultipartParser::find(parts, "file");
        if (!session_part || !file_part || file_part->filename.empty()) {
            return error_response(400, "Expected multipart fields session_id and file");
        }

        sessions_.store_file(session_part->data, file_part->filename, file_part->data);
        std::cout << "[Gateway] Stored " << file_part->filename << " ("
                  << FileUtils::format_file_size(file_part->data.size()) << ") for session "
                  << session_part->data << std::endl;

        Json::Value json;
        json["filename"] = file_part->filename;
        json["storage"] = sessions_.storage().name();
        return HttpResponse::json(200, write_json(json));
    });
}

// GET /download?session_id=&filename=
HttpResponse Gateway::handle_download(const HttpRequest& req) {
    if (!authorized(req)) return error_response(403, "Could not validate credentials");

    return guarded("download", [&]() {
        auto session_it = req.query.find("session_id");
        auto file_it = req.query.find("filename");
        if (session_it == req.query.end() || file_it == req.query.end()) {
            return error_response(400, "Expected query parameters session_id and filename");
        }

        std::string bytes = sessions_.load_file(session_it->second, file_it->second);

        HttpResponse resp;
        resp.headers["Content-Type"] = FileUtils::get_mime_type(file_it->second);
        resp.headers["Content-Disposition"] =
            "attachment; filename=\"" + fs::path(file_it->second).filename().string() + "\"";
        resp.body = std::move(bytes);
        return resp;
    });
}

// POST /terminate {session_id}
HttpResponse Gateway::handle_terminate(const HttpRequest& req) {
    if (!authorized(req)) return error_response(403, "Could not validate credentials");

    return guarded("terminate", [&]() {
        Json::Value root = parse_object(req.body);
        std::string session_id = require_string(root, "session_id");
        SessionManager::validate_session_id(session_id);

        bool existed = sessions_.get(session_id).has_value() ||
                       fs::exists(sessions_.local_path_for(session_id));
        sessions_.terminate(session_id);

        std::string message = existed
            ? "Session " + session_id + " terminated successfully."
            : "Session " + session_id + " not found.";
        Json::Value json;
        json["status"] = "success";
        json["message"] = message;
        return HttpResponse::json(200, write_json(json));
    });
}

// GET /health, unauthenticated
HttpResponse Gateway::handle_health(const HttpRequest&) {
    auto stats = coordinator_.stats();

    Json::Value json;
    json["status"] = "ok";
    json["workers"] = static_cast<Json::UInt64>(stats.worker_count);
    json["queue_depth"] = static_cast<Json::UInt64>(stats.queue_depth);
    json["active"] = static_cast<Json::UInt64>(stats.active);
    for (const auto& [key, value] : health_details_) {
        json[key] = value;
    }
    return HttpResponse::json(200, write_json(json));
}

std::string Gateway::task_to_status_json(const Task& task) {
    Json::Value json;
    json["task_id"] = task.task_id;
    json["task_type"] = to_string(task.kind);
    json["status"] = to_string(task.state);
    json["output"] = task.output;
    json["errors"] = task.error_output;
    json["exit_code"] = task.exit_code ? Json::Value(*task.exit_code) : Json::Value(Json::nullValue);
    json["reason"] = to_string(task.failure_reason);
    json["error"] = task.error.empty() ? Json::Value(Json::nullValue) : Json::Value(task.error);
    return write_json(json);
}

} // namespace pyexec
