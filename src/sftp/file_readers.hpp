#pragma once

#include <memory>
#include <optional>
#include <string>
#include "connection_session.hpp"

// Open path in {binary, read} mode and read chunks until end-of-stream.
// Returns the concatenation of every chunk, in arrival order.
SftpResult<std::string> get_whole_file(ConnectionSession& session, const std::string& path);

// FileStream: lazy, forward-only, non-restartable sequence of chunks.
//
//   Unopened --open ok--> Open --data--> Open
//   Open --eof--> Closed          (handle already closed by the session)
//   Open --error--> Failed
//   Unopened --open error--> Failed
//
// next() returns nullopt once the stream reaches Closed or Failed; state()
// and error() tell the two apart. A stream destroyed while still Open
// closes its handle through the session.
class FileStream {
public:
    enum class State { Unopened, Open, Closed, Failed };

    FileStream(std::shared_ptr<ConnectionSession> session, std::string path);
    ~FileStream();

    FileStream(FileStream&& other) noexcept;
    FileStream& operator=(FileStream&& other) noexcept;
    FileStream(const FileStream&) = delete;
    FileStream& operator=(const FileStream&) = delete;

    // Next chunk of data, or nullopt at the end of the sequence.
    std::optional<std::string> next();

    State state() const { return state_; }
    bool failed() const { return state_ == State::Failed; }
    SftpErrc error_code() const { return error_code_; }
    const std::string& error() const { return error_; }
    const std::string& path() const { return path_; }

private:
    std::shared_ptr<ConnectionSession> session_;
    std::string path_;
    State state_ = State::Unopened;
    FileHandle handle_;
    SftpErrc error_code_ = SftpErrc::None;
    std::string error_;

    bool acquire();
    void fail(SftpErrc code, const std::string& error);
    void release();
};

const char* stream_state_name(FileStream::State state);
