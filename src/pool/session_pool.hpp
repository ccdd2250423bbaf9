#pragma once

#include <chrono>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include <core/constants.hpp>
#include <core/types.hpp>
#include <sftp/connection_session.hpp>
#include <sftp/file_readers.hpp>
#include "backoff.hpp"

enum class EndpointStatus {
    Stopped,
    Running,
    Restarting,
    GivenUp,
};

const char* endpoint_status_name(EndpointStatus status);

// SessionPool: one supervised ConnectionSession per endpoint.
//
// A session that stops fatally is replaced one-for-one by the supervisor
// thread after a backoff delay; its siblings keep running. An endpoint
// whose restarts keep failing is given up after RestartPolicy::max_restarts
// consecutive attempts. Operations are routed by endpoint name.
class SessionPool {
public:
    // Throws std::runtime_error on duplicate or empty endpoint names.
    SessionPool(std::vector<EndpointConfig> endpoints, ChannelFactory& factory,
                RestartPolicy policy = {},
                std::chrono::seconds request_timeout = std::chrono::seconds(REQUEST_TIMEOUT_SECS));
    ~SessionPool();

    SessionPool(const SessionPool&) = delete;
    SessionPool& operator=(const SessionPool&) = delete;

    // Start every session and the supervisor. Startup failures are
    // scheduled for restart; the pool itself always starts.
    void start();
    void stop();

    // ── Introspection ──────────────────────────────────────────

    std::vector<std::string> names() const;
    EndpointStatus status(const std::string& name) const;
    int restart_count(const std::string& name) const;

    // Live session for name, or null while restarting / given up / unknown.
    std::shared_ptr<ConnectionSession> session(const std::string& name) const;

    // ── Routed operations ──────────────────────────────────────

    SftpResult<std::vector<std::string>> list_dir(const std::string& name, const std::string& path);
    SftpResult<FileHandle> open_file(const std::string& name, const std::string& path,
                                     OpenMode mode = OpenMode::Read);
    SftpResult<FileInfo> file_info(const std::string& name, const std::string& path);
    SftpResult<Chunk> read_chunk(const std::string& name, FileHandle handle);
    SftpResult<void> close_handle(const std::string& name, FileHandle handle);
    SftpResult<std::string> get_whole_file(const std::string& name, const std::string& path);
    FileStream stream_file(const std::string& name, const std::string& path);

private:
    using Clock = std::chrono::steady_clock;

    struct Slot {
        EndpointConfig config;
        std::shared_ptr<ConnectionSession> session;
        EndpointStatus status = EndpointStatus::Stopped;
        RestartBackoff backoff;
        int failed_restarts = 0;
        int restarts = 0;
        Clock::time_point next_attempt;
    };

    ChannelFactory& factory_;
    RestartPolicy policy_;
    std::chrono::seconds request_timeout_;
    std::vector<std::string> order_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::map<std::string, Slot> slots_;
    std::vector<std::string> crashed_;
    std::vector<std::shared_ptr<ConnectionSession>> retired_;
    bool started_ = false;
    bool stopping_ = false;
    std::thread supervisor_;

    std::shared_ptr<ConnectionSession> make_session(const EndpointConfig& config);
    void on_session_exit(const std::string& name, const std::string& reason);
    void supervisor_loop();
    void handle_crashes(std::unique_lock<std::mutex>& lock);
    void attempt_restarts(std::unique_lock<std::mutex>& lock);
    void schedule_restart(Slot& slot);

    // Session for name, or null with the reason in err.
    std::shared_ptr<ConnectionSession> lookup(const std::string& name, std::string& err) const;
};
