#pragma once

#include "http_server.h"
#include "session_manager.h"
#include "task_coordinator.h"

#include <map>
#include <string>

namespace pyexec {

// HTTP adapter over the engine: authentication, payload shape, and the
// mapping from engine results and errors to responses
class Gateway {
public:
    Gateway(const std::string& api_key,
            const std::string& api_key_name,
            TaskCoordinator& coordinator,
            SessionManager& sessions,
            std::map<std::string, std::string> health_details = {});

    void register_routes(HttpServer& server);

    HttpResponse handle_install(const HttpRequest& req);
    HttpResponse handle_execute(const HttpRequest& req);
    HttpResponse handle_status(const HttpRequest& req);
    HttpResponse handle_upload(const HttpRequest& req);
    HttpResponse handle_download(const HttpRequest& req);
    HttpResponse handle_terminate(const HttpRequest& req);
    HttpResponse handle_health(const HttpRequest& req);

    bool authorized(const HttpRequest& req) const;

    static std::string task_to_status_json(const Task& task);

private:
    std::string api_key_;
    std::string api_key_name_;
    TaskCoordinator& coordinator_;
    SessionManager& sessions_;
    std::map<std::string, std::string> health_details_;
};

} // namespace pyexec
