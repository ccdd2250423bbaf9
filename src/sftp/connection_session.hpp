#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include <core/constants.hpp>
#include <core/types.hpp>
#include "channel.hpp"

// ConnectionSession: the single owner of one endpoint's channel.
//
// Every operation is queued to a dedicated worker thread and executed
// strictly one at a time, in submission order. Callers block until the
// worker replies or the request timeout expires. The channel is never
// reachable from outside the worker. A handle opened after its caller
// timed out is closed by the worker.
//
// Recovery:
//   - list_dir / open_file: on ChannelClosed, reconnect once with the same
//     config and retry the identical call once. A failed reconnect is
//     fatal: the caller gets ConnectFailed and the session stops.
//   - file_info / read_chunk / close_handle: no retry, errors as-is.
class ConnectionSession {
public:
    // Invoked from the worker thread after a fatal stop.
    using ExitCallback = std::function<void(const std::string& name, const std::string& reason)>;

    ConnectionSession(EndpointConfig endpoint, ChannelFactory& factory,
                      std::chrono::seconds request_timeout = std::chrono::seconds(REQUEST_TIMEOUT_SECS));
    ~ConnectionSession();

    ConnectionSession(const ConnectionSession&) = delete;
    ConnectionSession& operator=(const ConnectionSession&) = delete;

    // Must be set before start().
    void set_exit_callback(ExitCallback cb) { on_exit_ = std::move(cb); }

    // Connect and launch the worker. A connect failure is returned and the
    // session never runs.
    SftpResult<void> start();

    // Stop the worker; queued requests fail with SessionUnavailable.
    void stop();

    bool is_running() const { return running_; }
    const std::string& name() const { return endpoint_.name; }

    // ── Operations ─────────────────────────────────────────────

    SftpResult<std::vector<std::string>> list_dir(const std::string& path);
    SftpResult<FileHandle> open_file(const std::string& path, OpenMode mode = OpenMode::Read);
    SftpResult<FileInfo> file_info(const std::string& path);

    // Read the next SFTP_CHUNK_SIZE bytes. On end-of-stream the handle is
    // closed server-side before Eof is reported.
    SftpResult<Chunk> read_chunk(FileHandle handle);

    SftpResult<void> close_handle(FileHandle handle);

    // Number of reconnects performed (diagnostics)
    int reconnect_count() const { return reconnects_; }

private:
    // Replaced wholesale on reconnect, never patched.
    struct ConnectionState {
        ConnectionConfig config;
        std::unique_ptr<SftpChannel> channel;
    };

    struct Task {
        std::function<void()> run;
        std::function<void()> cancel;
    };

    EndpointConfig endpoint_;
    ChannelFactory& factory_;
    std::chrono::seconds request_timeout_;
    ExitCallback on_exit_;

    // Worker-owned after start()
    std::unique_ptr<ConnectionState> state_;
    bool crashed_ = false;
    std::string crash_reason_;

    std::thread worker_;
    std::mutex queue_mutex_;
    std::condition_variable queue_cv_;
    std::deque<Task> queue_;
    bool accepting_ = false;
    bool stop_requested_ = false;
    std::atomic<bool> running_{false};
    std::atomic<int> reconnects_{0};

    void worker_loop();
    void drain_queue();

    SftpResult<std::unique_ptr<ConnectionState>> connect_state(const ConnectionConfig& config);
    SftpResult<void> reconnect();

    // Submit op to the worker and wait for its reply. If the caller has
    // already timed out when op finishes, discard runs on the worker with
    // the unclaimed result.
    template <typename T>
    SftpResult<T> call(std::function<SftpResult<T>()> op,
                       std::function<void(SftpResult<T>&)> discard = nullptr);

    // Run op against the channel; on ChannelClosed reconnect once and retry once.
    template <typename T>
    SftpResult<T> with_reconnect(const std::string& what,
                                 const std::function<SftpResult<T>(SftpChannel&)>& op);
};
