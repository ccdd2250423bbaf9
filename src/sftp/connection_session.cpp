#include "connection_session.hpp"
#include <core/log.hpp>
#include <fmt/format.h>
#include <future>

// ── Construction / Destruction ──────────────────────────────

ConnectionSession::ConnectionSession(EndpointConfig endpoint, ChannelFactory& factory,
                                     std::chrono::seconds request_timeout)
    : endpoint_(std::move(endpoint)), factory_(factory), request_timeout_(request_timeout) {}

ConnectionSession::~ConnectionSession() {
    stop();
}

// ── Lifecycle ───────────────────────────────────────────────

SftpResult<void> ConnectionSession::start() {
    if (running_) return SftpResult<void>::Ok();
    if (worker_.joinable()) worker_.join();

    const auto& cfg = endpoint_.connection;
    sftpool_logf("session[{}]: connecting to {}@{}:{}", name(), cfg.user, cfg.host, cfg.port);

    auto state = connect_state(cfg);
    if (state.is_err()) {
        sftpool_logf("session[{}]: start failed: {}", name(), state.error);
        return state.error_as<void>();
    }
    state_ = std::move(state.value);
    crashed_ = false;
    crash_reason_.clear();

    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        accepting_ = true;
        stop_requested_ = false;
    }
    running_ = true;
    worker_ = std::thread(&ConnectionSession::worker_loop, this);
    sftpool_logf("session[{}]: started", name());
    return SftpResult<void>::Ok();
}

void ConnectionSession::stop() {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        stop_requested_ = true;
        accepting_ = false;
    }
    queue_cv_.notify_all();

    if (worker_.joinable()) {
        if (worker_.get_id() == std::this_thread::get_id()) {
            worker_.detach();
        } else {
            worker_.join();
        }
    }
    drain_queue();
}

void ConnectionSession::drain_queue() {
    std::deque<Task> pending;
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        pending.swap(queue_);
    }
    for (auto& task : pending) {
        task.cancel();
    }
}

// ── Worker loop ─────────────────────────────────────────────

void ConnectionSession::worker_loop() {
    while (true) {
        Task task;
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            queue_cv_.wait(lock, [this] { return stop_requested_ || !queue_.empty(); });
            if (stop_requested_) break;
            task = std::move(queue_.front());
            queue_.pop_front();
        }

        task.run();
        if (crashed_) break;
    }

    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        accepting_ = false;
    }
    drain_queue();
    state_.reset();
    running_ = false;

    if (!crashed_) {
        sftpool_logf("session[{}]: stopped", name());
        return;
    }

    sftpool_logf("session[{}]: terminated: {}", name(), crash_reason_);
    // Locals only from here on: the callback may release this session.
    ExitCallback cb = on_exit_;
    std::string session_name = endpoint_.name;
    std::string reason = crash_reason_;
    if (cb) cb(session_name, reason);
}

// ── Channel state ───────────────────────────────────────────

SftpResult<std::unique_ptr<ConnectionSession::ConnectionState>>
ConnectionSession::connect_state(const ConnectionConfig& config) {
    using R = SftpResult<std::unique_ptr<ConnectionState>>;

    auto channel = factory_.connect(config);
    if (channel.is_err()) {
        return R::Err(SftpErrc::ConnectFailed, "Could not establish connection: " + channel.error);
    }

    auto state = std::make_unique<ConnectionState>();
    state->config = config;
    state->channel = std::move(channel.value);
    return R::Ok(std::move(state));
}

SftpResult<void> ConnectionSession::reconnect() {
    ++reconnects_;
    ConnectionConfig config = state_->config;

    // Discard the stale channel before dialing again
    state_.reset();

    auto fresh = connect_state(config);
    if (fresh.is_err()) {
        return fresh.error_as<void>();
    }
    state_ = std::move(fresh.value);
    sftpool_logf("session[{}]: reconnected", name());
    return SftpResult<void>::Ok();
}

// ── Request plumbing ────────────────────────────────────────

template <typename T>
SftpResult<T> ConnectionSession::call(std::function<SftpResult<T>()> op,
                                      std::function<void(SftpResult<T>&)> discard) {
    auto promise = std::make_shared<std::promise<SftpResult<T>>>();
    auto future = promise->get_future();
    // Whoever flips this first owns the reply: the worker delivering it,
    // or the caller giving up on it.
    auto claimed = std::make_shared<std::atomic<bool>>(false);

    Task task;
    task.run = [promise, claimed, op = std::move(op), discard = std::move(discard)] {
        auto result = op();
        if (claimed->exchange(true)) {
            if (discard) discard(result);
            return;
        }
        promise->set_value(std::move(result));
    };
    task.cancel = [promise, claimed, session_name = endpoint_.name] {
        if (claimed->exchange(true)) return;
        promise->set_value(SftpResult<T>::Err(SftpErrc::SessionUnavailable,
                                              "session " + session_name + " stopped"));
    };

    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (!accepting_) {
            return SftpResult<T>::Err(SftpErrc::SessionUnavailable,
                                      "session " + endpoint_.name + " is not running");
        }
        queue_.push_back(std::move(task));
    }
    queue_cv_.notify_one();

    if (future.wait_for(request_timeout_) != std::future_status::ready &&
        !claimed->exchange(true)) {
        sftpool_logf("session[{}]: request timed out after {}s", name(), request_timeout_.count());
        return SftpResult<T>::Err(SftpErrc::Timeout,
                                  fmt::format("no reply from session {} within {}s",
                                              endpoint_.name, request_timeout_.count()));
    }
    // Either ready, or claimed by the worker and about to be set
    return future.get();
}

template <typename T>
SftpResult<T> ConnectionSession::with_reconnect(
        const std::string& what,
        const std::function<SftpResult<T>(SftpChannel&)>& op) {
    auto result = op(*state_->channel);
    if (!result.channel_closed()) return result;

    sftpool_logf("session[{}]: {}: channel closed, reconnecting", name(), what);
    auto rc = reconnect();
    if (rc.is_err()) {
        crashed_ = true;
        crash_reason_ = rc.error;
        return SftpResult<T>::Err(SftpErrc::ConnectFailed, rc.error);
    }

    // Exactly one retry; a second ChannelClosed goes back to the caller.
    sftpool_logf("session[{}]: {}: retrying", name(), what);
    return op(*state_->channel);
}

// ── Operations ──────────────────────────────────────────────

SftpResult<std::vector<std::string>> ConnectionSession::list_dir(const std::string& path) {
    using Names = std::vector<std::string>;
    return call<Names>([this, path] {
        return with_reconnect<Names>("list_dir " + path,
                                     [&path](SftpChannel& ch) { return ch.list_dir(path); });
    });
}

SftpResult<FileHandle> ConnectionSession::open_file(const std::string& path, OpenMode mode) {
    return call<FileHandle>(
        [this, path, mode] {
            return with_reconnect<FileHandle>("open " + path,
                                              [&path, mode](SftpChannel& ch) { return ch.open(path, mode); });
        },
        // Nobody will ever close a handle opened for a caller that timed out
        [this, path](SftpResult<FileHandle>& opened) {
            if (opened.is_err() || !state_) return;
            sftpool_logf("session[{}]: closing {} opened after its caller timed out", name(), path);
            auto closed = state_->channel->close(opened.value);
            if (closed.is_err()) {
                sftpool_logf("session[{}]: close of abandoned handle failed: {}", name(), closed.error);
            }
        });
}

SftpResult<FileInfo> ConnectionSession::file_info(const std::string& path) {
    return call<FileInfo>([this, path] {
        // No reconnect on ChannelClosed here, unlike list_dir/open_file.
        // TODO: decide with consumers whether file_info should share the retry policy.
        auto attrs = state_->channel->stat(path);
        if (attrs.is_err()) return attrs.error_as<FileInfo>();
        return SftpResult<FileInfo>::Ok(to_file_info(attrs.value));
    });
}

SftpResult<Chunk> ConnectionSession::read_chunk(FileHandle handle) {
    return call<Chunk>([this, handle] {
        auto chunk = state_->channel->read(handle, SFTP_CHUNK_SIZE);
        if (chunk.is_ok() && chunk.value.eof()) {
            auto closed = state_->channel->close(handle);
            if (closed.is_err()) {
                sftpool_logf("session[{}]: close after eof failed: {}", name(), closed.error);
            }
        }
        return chunk;
    });
}

SftpResult<void> ConnectionSession::close_handle(FileHandle handle) {
    return call<void>([this, handle] {
        return state_->channel->close(handle);
    });
}
