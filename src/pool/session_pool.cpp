#include "session_pool.hpp"
#include <core/log.hpp>
#include <fmt/format.h>
#include <stdexcept>

const char* endpoint_status_name(EndpointStatus status) {
    switch (status) {
        case EndpointStatus::Stopped:    return "stopped";
        case EndpointStatus::Running:    return "running";
        case EndpointStatus::Restarting: return "restarting";
        case EndpointStatus::GivenUp:    return "given up";
    }
    return "unknown";
}

// ── Construction / Destruction ──────────────────────────────

SessionPool::SessionPool(std::vector<EndpointConfig> endpoints, ChannelFactory& factory,
                         RestartPolicy policy, std::chrono::seconds request_timeout)
    : factory_(factory), policy_(policy), request_timeout_(request_timeout) {
    for (auto& ep : endpoints) {
        if (ep.name.empty()) {
            throw std::runtime_error("endpoint with empty name");
        }
        if (slots_.count(ep.name)) {
            throw std::runtime_error(fmt::format("duplicate endpoint name '{}'", ep.name));
        }
        order_.push_back(ep.name);
        Slot slot;
        slot.config = std::move(ep);
        slot.backoff = RestartBackoff(policy_);
        slots_.emplace(slot.config.name, std::move(slot));
    }
}

SessionPool::~SessionPool() {
    stop();
}

// ── Lifecycle ───────────────────────────────────────────────

void SessionPool::start() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (started_) return;
        started_ = true;
        stopping_ = false;
        crashed_.clear();
    }

    for (const auto& name : order_) {
        EndpointConfig config;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            config = slots_.at(name).config;
        }

        auto session = make_session(config);
        auto rc = session->start();

        std::lock_guard<std::mutex> lock(mutex_);
        auto& slot = slots_.at(name);
        slot.failed_restarts = 0;
        slot.backoff.reset();
        if (rc.is_ok()) {
            slot.session = std::move(session);
            slot.status = EndpointStatus::Running;
        } else {
            sftpool_logf("pool: {} failed to start: {}", name, rc.error);
            schedule_restart(slot);
        }
    }

    supervisor_ = std::thread(&SessionPool::supervisor_loop, this);
    sftpool_logf("pool: started with {} endpoint(s)", order_.size());
}

void SessionPool::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!started_) return;
        started_ = false;
        stopping_ = true;
    }
    cv_.notify_all();
    if (supervisor_.joinable()) {
        supervisor_.join();
    }

    std::vector<std::shared_ptr<ConnectionSession>> sessions;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& [name, slot] : slots_) {
            if (slot.session) sessions.push_back(std::move(slot.session));
            slot.session.reset();
            slot.status = EndpointStatus::Stopped;
        }
        for (auto& s : retired_) sessions.push_back(std::move(s));
        retired_.clear();
        crashed_.clear();
    }

    // Outside the lock: a worker may be reporting its exit right now
    for (auto& s : sessions) {
        s->stop();
    }
    sftpool_log("pool: stopped");
}

std::shared_ptr<ConnectionSession> SessionPool::make_session(const EndpointConfig& config) {
    auto session = std::make_shared<ConnectionSession>(config, factory_, request_timeout_);
    session->set_exit_callback([this](const std::string& name, const std::string& reason) {
        on_session_exit(name, reason);
    });
    return session;
}

// Runs on the crashed session's worker thread.
void SessionPool::on_session_exit(const std::string& name, const std::string& reason) {
    sftpool_logf("pool: {} exited: {}", name, reason);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        crashed_.push_back(name);
    }
    cv_.notify_all();
}

// ── Supervisor loop ─────────────────────────────────────────

void SessionPool::supervisor_loop() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (!stopping_) {
        cv_.wait_for(lock, std::chrono::milliseconds(SUPERVISOR_TICK_MS),
                     [this] { return stopping_ || !crashed_.empty(); });
        if (stopping_) break;

        handle_crashes(lock);
        attempt_restarts(lock);

        // Join crashed sessions here, never on their own worker thread
        std::vector<std::shared_ptr<ConnectionSession>> dead;
        dead.swap(retired_);
        if (!dead.empty()) {
            lock.unlock();
            for (auto& s : dead) s->stop();
            dead.clear();
            lock.lock();
        }
    }
}

void SessionPool::handle_crashes(std::unique_lock<std::mutex>&) {
    std::vector<std::string> names;
    names.swap(crashed_);

    for (const auto& name : names) {
        auto it = slots_.find(name);
        if (it == slots_.end()) continue;
        auto& slot = it->second;
        if (slot.status != EndpointStatus::Running) continue;

        if (slot.session) retired_.push_back(std::move(slot.session));
        slot.session.reset();
        slot.failed_restarts = 0;
        slot.backoff.reset();
        schedule_restart(slot);
    }
}

void SessionPool::attempt_restarts(std::unique_lock<std::mutex>& lock) {
    auto now = Clock::now();
    std::vector<std::string> due;
    for (const auto& name : order_) {
        const auto& slot = slots_.at(name);
        if (slot.status == EndpointStatus::Restarting && slot.next_attempt <= now) {
            due.push_back(name);
        }
    }

    for (const auto& name : due) {
        if (stopping_) return;

        EndpointConfig config = slots_.at(name).config;
        int attempt = ++slots_.at(name).restarts;
        sftpool_logf("pool: restarting {} (attempt {})", name, attempt);

        // Connecting blocks; don't hold the lock across it
        lock.unlock();
        auto session = make_session(config);
        auto rc = session->start();
        lock.lock();

        auto& slot = slots_.at(name);
        if (rc.is_ok()) {
            slot.session = std::move(session);
            slot.status = EndpointStatus::Running;
            slot.failed_restarts = 0;
            slot.backoff.reset();
            sftpool_logf("pool: {} restarted", name);
            continue;
        }

        slot.failed_restarts++;
        if (slot.failed_restarts >= policy_.max_restarts) {
            slot.status = EndpointStatus::GivenUp;
            sftpool_logf("pool: giving up on {} after {} failed restart(s): {}",
                         name, slot.failed_restarts, rc.error);
            continue;
        }
        sftpool_logf("pool: restart of {} failed: {}", name, rc.error);
        schedule_restart(slot);
    }
}

void SessionPool::schedule_restart(Slot& slot) {
    int delay = slot.backoff.next();
    slot.status = EndpointStatus::Restarting;
    slot.next_attempt = Clock::now() + std::chrono::milliseconds(delay);
    sftpool_logf("pool: {} restart scheduled in {}ms", slot.config.name, delay);
}

// ── Introspection ───────────────────────────────────────────

std::vector<std::string> SessionPool::names() const {
    return order_;
}

EndpointStatus SessionPool::status(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = slots_.find(name);
    return it == slots_.end() ? EndpointStatus::Stopped : it->second.status;
}

int SessionPool::restart_count(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = slots_.find(name);
    return it == slots_.end() ? 0 : it->second.restarts;
}

std::shared_ptr<ConnectionSession> SessionPool::session(const std::string& name) const {
    std::string err;
    return lookup(name, err);
}

std::shared_ptr<ConnectionSession> SessionPool::lookup(const std::string& name, std::string& err) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = slots_.find(name);
    if (it == slots_.end()) {
        err = fmt::format("unknown session '{}'", name);
        return nullptr;
    }
    if (!it->second.session) {
        err = fmt::format("session '{}' is {}", name, endpoint_status_name(it->second.status));
        return nullptr;
    }
    return it->second.session;
}

// ── Routed operations ───────────────────────────────────────

SftpResult<std::vector<std::string>> SessionPool::list_dir(const std::string& name,
                                                           const std::string& path) {
    std::string err;
    auto s = lookup(name, err);
    if (!s) return SftpResult<std::vector<std::string>>::Err(SftpErrc::SessionUnavailable, err);
    return s->list_dir(path);
}

SftpResult<FileHandle> SessionPool::open_file(const std::string& name, const std::string& path,
                                              OpenMode mode) {
    std::string err;
    auto s = lookup(name, err);
    if (!s) return SftpResult<FileHandle>::Err(SftpErrc::SessionUnavailable, err);
    return s->open_file(path, mode);
}

SftpResult<FileInfo> SessionPool::file_info(const std::string& name, const std::string& path) {
    std::string err;
    auto s = lookup(name, err);
    if (!s) return SftpResult<FileInfo>::Err(SftpErrc::SessionUnavailable, err);
    return s->file_info(path);
}

SftpResult<Chunk> SessionPool::read_chunk(const std::string& name, FileHandle handle) {
    std::string err;
    auto s = lookup(name, err);
    if (!s) return SftpResult<Chunk>::Err(SftpErrc::SessionUnavailable, err);
    return s->read_chunk(handle);
}

SftpResult<void> SessionPool::close_handle(const std::string& name, FileHandle handle) {
    std::string err;
    auto s = lookup(name, err);
    if (!s) return SftpResult<void>::Err(SftpErrc::SessionUnavailable, err);
    return s->close_handle(handle);
}

SftpResult<std::string> SessionPool::get_whole_file(const std::string& name, const std::string& path) {
    std::string err;
    auto s = lookup(name, err);
    if (!s) return SftpResult<std::string>::Err(SftpErrc::SessionUnavailable, err);
    return ::get_whole_file(*s, path);
}

FileStream SessionPool::stream_file(const std::string& name, const std::string& path) {
    std::string err;
    auto s = lookup(name, err);
    if (!s) {
        sftpool_logf("pool: stream {} on {}: {}", path, name, err);
    }
    return FileStream(std::move(s), path);
}
