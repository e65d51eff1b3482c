#pragma once

#include <atomic>
#include <functional>
#include <map>
#include <string>

namespace pyexec {

// Simple HTTP request
struct HttpRequest {
    std::string method;
    std::string path;                              // without the query string
    std::map<std::string, std::string> query;      // decoded query parameters
    std::map<std::string, std::string> headers;    // names lowercased
    std::string body;
    std::string client_ip;

    // Case-insensitive header lookup; empty when absent
    std::string header(const std::string& name) const;
};

// Simple HTTP response
struct HttpResponse {
    int status_code = 200;
    std::map<std::string, std::string> headers;
    std::string body;

    HttpResponse() {
        headers["Content-Type"] = "application/json";
    }

    static HttpResponse json(int status, const std::string& body);
};

// Request handler function type
using HandlerFunc = std::function<HttpResponse(const HttpRequest&)>;

// Minimal HTTP/1.1 server, one thread per connection
class HttpServer {
public:
    explicit HttpServer(int port = 8000);
    ~HttpServer();

    // Register route handlers. A path ending in '/' also matches every
    // path below it.
    void route(const std::string& method, const std::string& path, HandlerFunc handler);

    // Bind and listen; port 0 picks a free port. Throws on failure.
    void listen();

    // Accept loop (blocks until stop)
    void serve();

    // listen() + serve()
    void start();

    void stop();

    int port() const { return port_; }
    bool is_running() const { return running_; }

    // Wire helpers, exposed for tests
    static HttpRequest parse_request(const std::string& raw);
    static std::string build_response(const HttpResponse& resp);
    static std::string url_decode(const std::string& value);

    HttpResponse dispatch(const HttpRequest& req) const;

private:
    int port_;
    int server_fd_;
    std::atomic<bool> running_;
    std::map<std::string, HandlerFunc> routes_;

    void handle_client(int client_fd, const std::string& client_ip);
};

} // namespace pyexec
