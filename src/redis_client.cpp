#include "redis_client.h"
#include "constants.h"
#include "errors.h"

#include <cerrno>
#include <cstring>
#include <iostream>

#include <netdb.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

namespace pyexec {

RedisEndpoint RedisEndpoint::parse(const std::string& url) {
    const std::string scheme = "redis://";
    if (url.compare(0, scheme.size(), scheme) != 0) {
        throw ConfigError("REDIS_URL must start with redis:// (got '" + url + "')");
    }

    RedisEndpoint endpoint;
    std::string rest = url.substr(scheme.size());

    // Credentials
    size_t at = rest.rfind('@');
    if (at != std::string::npos) {
        std::string userinfo = rest.substr(0, at);
        rest = rest.substr(at + 1);
        size_t colon = userinfo.find(':');
        if (colon == std::string::npos) {
            endpoint.password = userinfo;
        } else {
            endpoint.username = userinfo.substr(0, colon);
            endpoint.password = userinfo.substr(colon + 1);
        }
    }

    // Database index
    size_t slash = rest.find('/');
    if (slash != std::string::npos) {
        std::string db = rest.substr(slash + 1);
        rest = rest.substr(0, slash);
        if (!db.empty()) {
            try {
                endpoint.db = std::stoi(db);
            } catch (const std::logic_error&) {
                throw ConfigError("invalid database index in REDIS_URL: " + db);
            }
        }
    }

    size_t colon = rest.rfind(':');
    if (colon != std::string::npos) {
        try {
            endpoint.port = std::stoi(rest.substr(colon + 1));
        } catch (const std::logic_error&) {
            throw ConfigError("invalid port in REDIS_URL: " + rest.substr(colon + 1));
        }
        rest = rest.substr(0, colon);
    } else {
        endpoint.port = DEFAULT_REDIS_PORT;
    }

    if (!rest.empty()) endpoint.host = rest;
    return endpoint;
}

RedisClient::RedisClient(const RedisEndpoint& endpoint) : endpoint_(endpoint) {}

RedisClient::~RedisClient() {
    std::lock_guard<std::mutex> lock(mutex_);
    disconnect_locked();
}

std::string RedisClient::encode_command(const std::vector<std::string>& args) {
    std::string out = "*" + std::to_string(args.size()) + "\r\n";
    for (const auto& arg : args) {
        out += "$" + std::to_string(arg.size()) + "\r\n";
        out += arg;
        out += "\r\n";
    }
    return out;
}

std::optional<RedisReply> RedisClient::parse_reply(const std::string& buffer, size_t& pos) {
    size_t cursor = pos;
    if (cursor >= buffer.size()) return std::nullopt;

    size_t line_end = buffer.find("\r\n", cursor);
    if (line_end == std::string::npos) return std::nullopt;

    char prefix = buffer[cursor];
    std::string line = buffer.substr(cursor + 1, line_end - cursor - 1);
    cursor = line_end + 2;

    auto to_integer = [&](const std::string& text) -> long long {
        try {
            return std::stoll(text);
        } catch (const std::logic_error&) {
            throw RedisError("protocol error: bad integer '" + text + "'");
        }
    };

    RedisReply reply;
    switch (prefix) {
        case '+':
            reply.type = RedisReply::Type::STATUS;
            reply.str = line;
            break;
        case '-':
            reply.type = RedisReply::Type::ERROR;
            reply.str = line;
            break;
        case ':':
            reply.type = RedisReply::Type::INTEGER;
            reply.integer = to_integer(line);
            break;
        case '$': {
            long long len = to_integer(line);
            if (len < 0) {
                reply.type = RedisReply::Type::NIL;
                break;
            }
            size_t need = static_cast<size_t>(len) + 2;
            if (buffer.size() - cursor < need) return std::nullopt;
            reply.type = RedisReply::Type::STRING;
            reply.str = buffer.substr(cursor, static_cast<size_t>(len));
            cursor += need;
            break;
        }
        case '*': {
            long long count = to_integer(line);
            if (count < 0) {
                reply.type = RedisReply::Type::NIL;
                break;
            }
            reply.type = RedisReply::Type::ARRAY;
            for (long long i = 0; i < count; i++) {
                auto element = parse_reply(buffer, cursor);
                if (!element) return std::nullopt;
                reply.elements.push_back(std::move(*element));
            }
            break;
        }
        default:
            throw RedisError(std::string("protocol error: unexpected prefix '") + prefix + "'");
    }

    pos = cursor;
    return reply;
}

void RedisClient::connect_locked() {
    struct addrinfo hints;
    std::memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    struct addrinfo* results = nullptr;
    std::string port = std::to_string(endpoint_.port);
    int rc = getaddrinfo(endpoint_.host.c_str(), port.c_str(), &hints, &results);
    if (rc != 0) {
        throw RedisError("cannot resolve " + endpoint_.host + ": " + gai_strerror(rc));
    }

    int fd = -1;
    for (struct addrinfo* ai = results; ai != nullptr; ai = ai->ai_next) {
        fd = socket(ai->ai_family, ai->ai_socktype | SOCK_CLOEXEC, ai->ai_protocol);
        if (fd < 0) continue;
        if (connect(fd, ai->ai_addr, ai->ai_addrlen) == 0) break;
        close(fd);
        fd = -1;
    }
    freeaddrinfo(results);

    if (fd < 0) {
        throw RedisError("cannot connect to " + endpoint_.host + ":" + port);
    }

    struct timeval tv;
    tv.tv_sec = 5;
    tv.tv_usec = 0;
    setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
    setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
    fd_ = fd;

    std::cout << "[Redis] Connected to " << endpoint_.host << ":" << endpoint_.port << std::endl;

    if (!endpoint_.password.empty()) {
        std::vector<std::string> auth = {"AUTH"};
        if (!endpoint_.username.empty()) auth.push_back(endpoint_.username);
        auth.push_back(endpoint_.password);
        RedisReply reply = roundtrip_locked(encode_command(auth));
        if (reply.type == RedisReply::Type::ERROR) {
            disconnect_locked();
            throw RedisError("AUTH rejected: " + reply.str);
        }
    }
    if (endpoint_.db != 0) {
        RedisReply reply = roundtrip_locked(encode_command({"SELECT", std::to_string(endpoint_.db)}));
        if (reply.type == RedisReply::Type::ERROR) {
            disconnect_locked();
            throw RedisError("SELECT rejected: " + reply.str);
        }
    }
}

void RedisClient::disconnect_locked() {
    if (fd_ >= 0) {
        close(fd_);
        fd_ = -1;
    }
}

RedisReply RedisClient::roundtrip_locked(const std::string& payload) {
    size_t sent = 0;
    while (sent < payload.size()) {
        ssize_t n = send(fd_, payload.data() + sent, payload.size() - sent, MSG_NOSIGNAL);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) {
            disconnect_locked();
            throw RedisError(std::string("send failed: ") + std::strerror(errno));
        }
        sent += static_cast<size_t>(n);
    }

    std::string buffer;
    char chunk[PIPE_BUFFER_SIZE];
    while (true) {
        size_t pos = 0;
        if (auto reply = parse_reply(buffer, pos)) {
            return *reply;
        }
        ssize_t n = recv(fd_, chunk, sizeof(chunk), 0);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) {
            disconnect_locked();
            throw RedisError(n == 0 ? "connection closed by server"
                                    : std::string("recv failed: ") + std::strerror(errno));
        }
        buffer.append(chunk, static_cast<size_t>(n));
    }
}

RedisReply RedisClient::command(const std::vector<std::string>& args) {
    std::lock_guard<std::mutex> lock(mutex_);

    // A reused connection may have been closed by the server while idle;
    // retry exactly once on a fresh connection in that case.
    bool reused = fd_ >= 0;
    if (!reused) connect_locked();

    std::string payload = encode_command(args);
    try {
        return roundtrip_locked(payload);
    } catch (const RedisError& e) {
        if (!reused) throw;
        std::cerr << "[Redis] " << e.what() << ", reconnecting" << std::endl;
    }
    connect_locked();
    return roundtrip_locked(payload);
}

} // namespace pyexec
