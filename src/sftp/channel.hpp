#pragma once

#include <memory>
#include <string>
#include <vector>
#include <core/types.hpp>
#include "result.hpp"
#include "file_types.hpp"

// SftpChannel: one live SSH transport + SFTP subsystem against one endpoint.
//
// Not thread-safe. A ConnectionSession owns exactly one channel and drives
// it from its worker thread only. Once a call reports ChannelClosed the
// channel stays closed; recovery means building a new channel.
class SftpChannel {
public:
    virtual ~SftpChannel() = default;

    // Entry names in server order, without "." and "..".
    virtual SftpResult<std::vector<std::string>> list_dir(const std::string& path) = 0;

    virtual SftpResult<FileHandle> open(const std::string& path, OpenMode mode) = 0;

    virtual SftpResult<RawAttributes> stat(const std::string& path) = 0;

    // Read up to max_bytes. Only returns a short Data chunk when the file
    // ends inside it; an exhausted handle yields an Eof chunk.
    virtual SftpResult<Chunk> read(FileHandle handle, std::size_t max_bytes) = 0;

    virtual SftpResult<void> close(FileHandle handle) = 0;

    virtual bool is_open() const = 0;
};

// Builds connected channels. Implementations must be safe to call from
// several session threads at once.
class ChannelFactory {
public:
    virtual ~ChannelFactory() = default;

    virtual SftpResult<std::unique_ptr<SftpChannel>> connect(const ConnectionConfig& config) = 0;
};
