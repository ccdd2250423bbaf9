#pragma once

#include <string>
#include <vector>
#include <cstdint>

// Result type for operations that can fail
template <typename T>
struct Result {
    bool success;
    T value;
    std::string error;

    static Result<T> Ok(T val) {
        return {true, std::move(val), ""};
    }

    static Result<T> Err(const std::string& err) {
        return {false, T{}, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Specialization for void
template <>
struct Result<void> {
    bool success;
    std::string error;

    static Result<void> Ok() {
        return {true, ""};
    }

    static Result<void> Err(const std::string& err) {
        return {false, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Configuration structures
struct ConnectionConfig {
    std::string host;
    std::uint16_t port = 22;
    std::string user;
    std::string password;
    int timeout = 30;               // connect + per-call timeout, seconds
    int sftp_version = 8;           // requested protocol version
};

struct EndpointConfig {
    std::string name;               // session id
    ConnectionConfig connection;
};

struct RestartPolicy {
    int max_restarts = 10;          // consecutive failed restarts before giving up
    int initial_backoff_ms = 200;
    int max_backoff_ms = 5000;
};
