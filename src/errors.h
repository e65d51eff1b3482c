#pragma once

#include <stdexcept>
#include <string>

namespace pyexec {

class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& message)
        : std::runtime_error("Configuration error: " + message) {}
};

class InvalidSessionId : public std::runtime_error {
public:
    explicit InvalidSessionId(const std::string& message)
        : std::runtime_error("Invalid session id: " + message) {}
};

// Malformed submission (bad package list, empty code, unsafe path, ...)
class InvalidRequest : public std::runtime_error {
public:
    explicit InvalidRequest(const std::string& message)
        : std::runtime_error(message) {}
};

// Session slot could not be acquired in time
class SessionBusy : public std::runtime_error {
public:
    explicit SessionBusy(const std::string& session_id)
        : std::runtime_error("Session busy: " + session_id) {}
};

class StorageError : public std::runtime_error {
public:
    explicit StorageError(const std::string& message)
        : std::runtime_error("Storage error: " + message) {}
};

class FileNotFound : public StorageError {
public:
    explicit FileNotFound(const std::string& path)
        : StorageError("file not found: " + path) {}
};

// Sandbox runtime unreachable, misconfigured or over quota
class LaunchError : public std::runtime_error {
public:
    explicit LaunchError(const std::string& message)
        : std::runtime_error("Sandbox launch failed: " + message) {}
};

class TeardownError : public std::runtime_error {
public:
    explicit TeardownError(const std::string& message)
        : std::runtime_error("Sandbox teardown failed: " + message) {}
};

class RedisError : public std::runtime_error {
public:
    explicit RedisError(const std::string& message)
        : std::runtime_error("Redis: " + message) {}
};

} // namespace pyexec
