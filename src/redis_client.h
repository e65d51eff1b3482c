#pragma once

#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace pyexec {

struct RedisReply {
    enum class Type { STATUS, ERROR, INTEGER, STRING, NIL, ARRAY };

    Type type = Type::NIL;
    std::string str;                    // STATUS, ERROR, STRING
    long long integer = 0;              // INTEGER
    std::vector<RedisReply> elements;   // ARRAY

    bool is_nil() const { return type == Type::NIL; }
    bool is_ok() const { return type == Type::STATUS && str == "OK"; }
};

struct RedisEndpoint {
    std::string host = "127.0.0.1";
    int port = 6379;
    std::string username;
    std::string password;
    int db = 0;

    // redis://[[user]:password@]host[:port][/db]
    static RedisEndpoint parse(const std::string& url);
};

// Minimal RESP2 client over a TCP socket. One connection, serialized by a
// mutex, reconnected lazily after any I/O failure.
class RedisClient {
public:
    explicit RedisClient(const RedisEndpoint& endpoint);
    ~RedisClient();

    RedisClient(const RedisClient&) = delete;
    RedisClient& operator=(const RedisClient&) = delete;

    // Send one command and wait for its reply. Server error replies are
    // returned as Type::ERROR; transport failures throw RedisError.
    RedisReply command(const std::vector<std::string>& args);

    // Wire helpers, exposed for tests
    static std::string encode_command(const std::vector<std::string>& args);

    // Parse one reply starting at pos. Returns nullopt if the buffer does not
    // yet hold a complete reply; throws RedisError on a protocol violation.
    static std::optional<RedisReply> parse_reply(const std::string& buffer, size_t& pos);

private:
    void connect_locked();
    void disconnect_locked();
    RedisReply roundtrip_locked(const std::string& payload);

    RedisEndpoint endpoint_;
    std::mutex mutex_;
    int fd_ = -1;
};

} // namespace pyexec
