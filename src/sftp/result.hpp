#pragma once

#include <string>
#include <utility>

// Error tags for SFTP operations. None means success.
enum class SftpErrc {
    None,
    ConnectFailed,       // transport/auth/subsystem setup failed
    ChannelClosed,       // the live channel went away; transient
    Remote,              // server-side SFTP status (no such file, denied, ...)
    Timeout,             // remote call or caller wait exceeded its bound
    SessionUnavailable,  // session stopped, restarting, given up, or unknown
};

inline const char* errc_name(SftpErrc code) {
    switch (code) {
        case SftpErrc::None:               return "ok";
        case SftpErrc::ConnectFailed:      return "connect_failed";
        case SftpErrc::ChannelClosed:      return "channel_closed";
        case SftpErrc::Remote:             return "remote";
        case SftpErrc::Timeout:            return "timeout";
        case SftpErrc::SessionUnavailable: return "session_unavailable";
    }
    return "unknown";
}

// Tagged result for SFTP operations
template <typename T>
struct SftpResult {
    SftpErrc code;
    T value;
    std::string error;

    static SftpResult<T> Ok(T val) {
        return {SftpErrc::None, std::move(val), ""};
    }

    static SftpResult<T> Err(SftpErrc code, const std::string& err) {
        return {code, T{}, err};
    }

    bool is_ok() const { return code == SftpErrc::None; }
    bool is_err() const { return code != SftpErrc::None; }
    bool channel_closed() const { return code == SftpErrc::ChannelClosed; }

    // Re-tag this error for a result of another value type
    template <typename U>
    SftpResult<U> error_as() const {
        return SftpResult<U>::Err(code, error);
    }
};

// Specialization for void
template <>
struct SftpResult<void> {
    SftpErrc code;
    std::string error;

    static SftpResult<void> Ok() {
        return {SftpErrc::None, ""};
    }

    static SftpResult<void> Err(SftpErrc code, const std::string& err) {
        return {code, err};
    }

    bool is_ok() const { return code == SftpErrc::None; }
    bool is_err() const { return code != SftpErrc::None; }
    bool channel_closed() const { return code == SftpErrc::ChannelClosed; }

    template <typename U>
    SftpResult<U> error_as() const {
        return SftpResult<U>::Err(code, error);
    }
};
