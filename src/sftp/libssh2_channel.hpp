#pragma once

#include <cstdint>
#include <string>
#include <unordered_map>
#include <platform/socket_util.hpp>
#include "channel.hpp"

// libssh2 forward declarations
typedef struct _LIBSSH2_SESSION LIBSSH2_SESSION;
typedef struct _LIBSSH2_SFTP LIBSSH2_SFTP;
typedef struct _LIBSSH2_SFTP_HANDLE LIBSSH2_SFTP_HANDLE;

// SftpChannel over libssh2 in blocking mode, bounded by the config timeout.
//
// Host keys are NOT verified: the server key is accepted unconditionally
// and only its fingerprint is logged (trust-on-first-use relaxation).
class Libssh2Channel : public SftpChannel {
public:
    ~Libssh2Channel() override;

    Libssh2Channel(const Libssh2Channel&) = delete;
    Libssh2Channel& operator=(const Libssh2Channel&) = delete;

    // TCP connect, SSH handshake, password auth, SFTP subsystem.
    static SftpResult<std::unique_ptr<SftpChannel>> open_channel(const ConnectionConfig& config);

    SftpResult<std::vector<std::string>> list_dir(const std::string& path) override;
    SftpResult<FileHandle> open(const std::string& path, OpenMode mode) override;
    SftpResult<RawAttributes> stat(const std::string& path) override;
    SftpResult<Chunk> read(FileHandle handle, std::size_t max_bytes) override;
    SftpResult<void> close(FileHandle handle) override;
    bool is_open() const override { return open_; }

private:
    explicit Libssh2Channel(const ConnectionConfig& config);

    ConnectionConfig config_;
    socket_t sock_ = SFTPOOL_INVALID_SOCKET;
    LIBSSH2_SESSION* session_ = nullptr;
    LIBSSH2_SFTP* sftp_ = nullptr;
    bool open_ = false;
    std::unordered_map<std::uint64_t, LIBSSH2_SFTP_HANDLE*> handles_;

    SftpResult<void> establish();
    SftpResult<void> authenticate();
    void log_host_fingerprint();
    void teardown();

    // Turn a libssh2 return code into a tagged error; marks the channel
    // closed on transport-level failures.
    SftpErrc classify(int rc, std::string& message);

    template <typename T>
    SftpResult<T> fail(int rc, const std::string& what);
};

class Libssh2ChannelFactory : public ChannelFactory {
public:
    SftpResult<std::unique_ptr<SftpChannel>> connect(const ConnectionConfig& config) override;
};
