#include "file_readers.hpp"
#include <core/log.hpp>
#include <utility>

SftpResult<std::string> get_whole_file(ConnectionSession& session, const std::string& path) {
    auto handle = session.open_file(path, OpenMode::Binary | OpenMode::Read);
    if (handle.is_err()) {
        return handle.error_as<std::string>();
    }

    std::string contents;
    while (true) {
        auto chunk = session.read_chunk(handle.value);
        if (chunk.is_err()) {
            auto closed = session.close_handle(handle.value);
            if (closed.is_err()) {
                sftpool_logf("get_whole_file {}: close after read error failed: {}",
                             path, closed.error);
            }
            return chunk.error_as<std::string>();
        }
        if (chunk.value.eof()) break;
        contents += chunk.value.data;
    }
    return SftpResult<std::string>::Ok(std::move(contents));
}

// ── FileStream ──────────────────────────────────────────────

FileStream::FileStream(std::shared_ptr<ConnectionSession> session, std::string path)
    : session_(std::move(session)), path_(std::move(path)) {}

FileStream::~FileStream() {
    release();
}

FileStream::FileStream(FileStream&& other) noexcept
    : session_(std::move(other.session_)),
      path_(std::move(other.path_)),
      state_(other.state_),
      handle_(other.handle_),
      error_code_(other.error_code_),
      error_(std::move(other.error_)) {
    // The moved-from stream no longer owns the handle
    other.state_ = State::Closed;
    other.handle_ = FileHandle{};
}

FileStream& FileStream::operator=(FileStream&& other) noexcept {
    if (this != &other) {
        release();
        session_ = std::move(other.session_);
        path_ = std::move(other.path_);
        state_ = other.state_;
        handle_ = other.handle_;
        error_code_ = other.error_code_;
        error_ = std::move(other.error_);
        other.state_ = State::Closed;
        other.handle_ = FileHandle{};
    }
    return *this;
}

std::optional<std::string> FileStream::next() {
    if (state_ == State::Unopened && !acquire()) {
        return std::nullopt;
    }
    if (state_ != State::Open) {
        return std::nullopt;
    }

    auto chunk = session_->read_chunk(handle_);
    if (chunk.is_err()) {
        fail(chunk.code, chunk.error);
        return std::nullopt;
    }
    if (chunk.value.eof()) {
        state_ = State::Closed;
        handle_ = FileHandle{};
        return std::nullopt;
    }
    return std::move(chunk.value.data);
}

bool FileStream::acquire() {
    if (!session_) {
        fail(SftpErrc::SessionUnavailable, "no session");
        return false;
    }

    auto handle = session_->open_file(path_, OpenMode::Binary | OpenMode::Read);
    if (handle.is_err()) {
        fail(handle.code, handle.error);
        return false;
    }
    handle_ = handle.value;
    state_ = State::Open;
    return true;
}

void FileStream::fail(SftpErrc code, const std::string& error) {
    // The handle may still be open on the server after a read error
    release();
    state_ = State::Failed;
    error_code_ = code;
    error_ = error;
    sftpool_logf("stream {}: failed ({}): {}", path_, errc_name(code), error);
}

void FileStream::release() {
    if (state_ != State::Open || !handle_.valid() || !session_) return;

    auto closed = session_->close_handle(handle_);
    if (closed.is_err()) {
        sftpool_logf("stream {}: close failed: {}", path_, closed.error);
    }
    handle_ = FileHandle{};
    state_ = State::Closed;
}

const char* stream_state_name(FileStream::State state) {
    switch (state) {
        case FileStream::State::Unopened: return "unopened";
        case FileStream::State::Open:     return "open";
        case FileStream::State::Closed:   return "closed";
        case FileStream::State::Failed:   return "failed";
    }
    return "unknown";
}
