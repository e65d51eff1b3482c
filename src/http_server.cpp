#include "http_server.h"
#include "constants.h"
#include "json_util.h"

#include <sys/socket.h>
#include <sys/time.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <unistd.h>
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <sstream>
#include <iostream>
#include <stdexcept>
#include <thread>

namespace pyexec {

namespace {

std::string to_lower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

void write_all(int fd, const std::string& data) {
    size_t sent = 0;
    while (sent < data.size()) {
        ssize_t n = send(fd, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
        if (n <= 0) return;    // client went away
        sent += static_cast<size_t>(n);
    }
}

const char* status_text(int code) {
    switch (code) {
        case 200: return "OK";
        case 202: return "Accepted";
        case 400: return "Bad Request";
        case 403: return "Forbidden";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 409: return "Conflict";
        case 413: return "Payload Too Large";
        case 500: return "Internal Server Error";
        case 503: return "Service Unavailable";
        default:  return "Unknown";
    }
}

} // anonymous namespace

std::string HttpRequest::header(const std::string& name) const {
    auto it = headers.find(to_lower(name));
    return it == headers.end() ? "" : it->second;
}

HttpResponse HttpResponse::json(int status, const std::string& body) {
    HttpResponse resp;
    resp.status_code = status;
    resp.body = body;
    return resp;
}

HttpServer::HttpServer(int port) : port_(port), server_fd_(-1), running_(false) {}

HttpServer::~HttpServer() {
    stop();
}

void HttpServer::route(const std::string& method, const std::string& path, HandlerFunc handler) {
    routes_[method + " " + path] = handler;
}

void HttpServer::listen() {
    // Create socket
    server_fd_ = socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (server_fd_ < 0) {
        throw std::runtime_error("Failed to create socket");
    }

    // Allow reuse
    int opt = 1;
    setsockopt(server_fd_, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

    // Bind
    struct sockaddr_in addr;
    std::memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = INADDR_ANY;
    addr.sin_port = htons(port_);

    if (bind(server_fd_, (struct sockaddr*)&addr, sizeof(addr)) < 0) {
        close(server_fd_);
        server_fd_ = -1;
        throw std::runtime_error("Failed to bind to port " + std::to_string(port_));
    }

    // Listen
    if (::listen(server_fd_, LISTEN_BACKLOG) < 0) {
        close(server_fd_);
        server_fd_ = -1;
        throw std::runtime_error("Failed to listen");
    }

    socklen_t len = sizeof(addr);
    if (getsockname(server_fd_, (struct sockaddr*)&addr, &len) == 0) {
        port_ = ntohs(addr.sin_port);
    }

    running_ = true;
    std::cout << "[HttpServer] Listening on port " << port_ << std::endl;
}

void HttpServer::serve() {
    // Accept connections
    while (running_) {
        struct sockaddr_in client_addr;
        socklen_t client_len = sizeof(client_addr);

        int client_fd = accept4(server_fd_, (struct sockaddr*)&client_addr, &client_len, SOCK_CLOEXEC);
        if (client_fd < 0) {
            if (running_ && errno == EINTR) continue;
            if (running_) {
                std::cerr << "[HttpServer] accept failed: " << std::strerror(errno) << std::endl;
                continue;
            }
            break;
        }

        // Get client IP
        char ip[INET_ADDRSTRLEN] = {0};
        inet_ntop(AF_INET, &client_addr.sin_addr, ip, sizeof(ip));
        std::string client_ip = ip;

        struct timeval tv;
        tv.tv_sec = 30;
        tv.tv_usec = 0;
        setsockopt(client_fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));

        // Handle in new thread (simple concurrency)
        std::thread([this, client_fd, client_ip]() {
            handle_client(client_fd, client_ip);
            close(client_fd);
        }).detach();
    }
}

void HttpServer::start() {
    listen();
    serve();
}

void HttpServer::stop() {
    bool was_running = running_.exchange(false);
    if (server_fd_ >= 0) {
        // shutdown() wakes a thread blocked in accept()
        shutdown(server_fd_, SHUT_RDWR);
        close(server_fd_);
        server_fd_ = -1;
    }
    if (was_running) {
        std::cout << "[HttpServer] Stopped" << std::endl;
    }
}

void HttpServer::handle_client(int client_fd, const std::string& client_ip) {
    const std::string too_large =
        HttpServer::build_response(HttpResponse::json(413, "{\"error\":\"Request exceeds 100MB limit\"}"));

    // Read request with size limit
    std::string request_data;
    request_data.reserve(INITIAL_HTTP_BUFFER);

    char buffer[PIPE_BUFFER_SIZE];
    ssize_t bytes_read;
    size_t expected_size = 0;

    while ((bytes_read = read(client_fd, buffer, sizeof(buffer))) > 0) {
        request_data.append(buffer, bytes_read);
        if (request_data.size() > MAX_REQUEST_SIZE) {
            write_all(client_fd, too_large);
            return;
        }

        // Check if we've received the complete headers
        size_t header_end = request_data.find("\r\n\r\n");
        if (header_end == std::string::npos) continue;

        if (expected_size == 0) {
            HttpRequest head = parse_request(request_data.substr(0, header_end + 4));
            size_t content_length = 0;
            std::string length_str = head.header("Content-Length");
            if (!length_str.empty()) {
                try {
                    content_length = std::stoul(length_str);
                } catch (const std::logic_error&) {
                    write_all(client_fd, build_response(
                        HttpResponse::json(400, "{\"error\":\"Invalid Content-Length\"}")));
                    return;
                }
            }
            expected_size = header_end + 4 + content_length;
            if (expected_size > MAX_REQUEST_SIZE) {
                write_all(client_fd, too_large);
                return;
            }
        }
        if (request_data.size() >= expected_size) break;
    }

    if (request_data.empty()) return;

    // Parse request
    HttpRequest req = parse_request(request_data);
    req.client_ip = client_ip;

    HttpResponse resp = dispatch(req);

    // Send response
    write_all(client_fd, build_response(resp));
}

HttpResponse HttpServer::dispatch(const HttpRequest& req) const {
    HandlerFunc handler;

    // Check for exact match
    auto it = routes_.find(req.method + " " + req.path);
    if (it != routes_.end()) {
        handler = it->second;
    } else {
        // Prefix routes (for /status/{type}/{id} style paths)
        for (const auto& [pattern, candidate] : routes_) {
            size_t space_pos = pattern.find(' ');
            std::string method = pattern.substr(0, space_pos);
            std::string path_pattern = pattern.substr(space_pos + 1);

            if (method == req.method && !path_pattern.empty() && path_pattern.back() == '/' &&
                req.path.compare(0, path_pattern.size(), path_pattern) == 0) {
                handler = candidate;
                break;
            }
        }
    }

    if (!handler) {
        return HttpResponse::json(404, "{\"error\":\"Not found\"}");
    }

    try {
        return handler(req);
    } catch (const std::exception& e) {
        std::cerr << "[HttpServer] " << req.method << " " << req.path << ": " << e.what() << std::endl;
        Json::Value body;
        body["error"] = e.what();
        return HttpResponse::json(500, write_json(body));
    }
}

std::string HttpServer::url_decode(const std::string& value) {
    std::string out;
    out.reserve(value.size());
    for (size_t i = 0; i < value.size(); i++) {
        if (value[i] == '+') {
            out += ' ';
        } else if (value[i] == '%' && i + 2 < value.size() &&
                   std::isxdigit(static_cast<unsigned char>(value[i + 1])) &&
                   std::isxdigit(static_cast<unsigned char>(value[i + 2]))) {
            out += static_cast<char>(std::stoi(value.substr(i + 1, 2), nullptr, 16));
            i += 2;
        } else {
            out += value[i];
        }
    }
    return out;
}

HttpRequest HttpServer::parse_request(const std::string& raw) {
    HttpRequest req;

    size_t header_end = raw.find("\r\n\r\n");
    std::string head = header_end == std::string::npos ? raw : raw.substr(0, header_end);
    std::istringstream stream(head);

    // Parse request line
    std::string line;
    std::getline(stream, line);
    if (!line.empty() && line.back() == '\r') line.pop_back();

    size_t space1 = line.find(' ');
    size_t space2 = line.find(' ', space1 + 1);

    if (space1 != std::string::npos && space2 != std::string::npos) {
        req.method = line.substr(0, space1);
        std::string target = line.substr(space1 + 1, space2 - space1 - 1);

        size_t question = target.find('?');
        req.path = target.substr(0, question);
        if (question != std::string::npos) {
            std::istringstream params(target.substr(question + 1));
            std::string pair;
            while (std::getline(params, pair, '&')) {
                if (pair.empty()) continue;
                size_t eq = pair.find('=');
                std::string key = url_decode(pair.substr(0, eq));
                std::string value = eq == std::string::npos ? "" : url_decode(pair.substr(eq + 1));
                req.query[key] = value;
            }
        }
    }

    // Parse headers
    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty()) break;

        size_t colon = line.find(':');
        if (colon != std::string::npos) {
            std::string key = to_lower(line.substr(0, colon));
            size_t value_start = line.find_first_not_of(' ', colon + 1);
            req.headers[key] = value_start == std::string::npos ? "" : line.substr(value_start);
        }
    }

    // Rest is body, byte for byte
    if (header_end != std::string::npos) {
        req.body = raw.substr(header_end + 4);
    }

    return req;
}

std::string HttpServer::build_response(const HttpResponse& resp) {
    std::ostringstream out;

    // Status line
    out << "HTTP/1.1 " << resp.status_code << " " << status_text(resp.status_code) << "\r\n";

    // Headers
    for (const auto& [key, value] : resp.headers) {
        out << key << ": " << value << "\r\n";
    }

    // Content length
    out << "Content-Length: " << resp.body.length() << "\r\n";
    out << "Connection: close\r\n";
    out << "\r\n";

    // Body
    out << resp.body;

    return out.str();
}

} // namespace pyexec
