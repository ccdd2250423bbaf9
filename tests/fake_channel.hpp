#pragma once

// In-memory SFTP server for tests. Channels built by FakeChannelFactory
// read from a shared FakeServer, which can drop channels, refuse
// connects and fail reads on demand.

#include <atomic>
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include <sftp/channel.hpp>

struct FakeServer {
    std::mutex mu;

    std::map<std::string, std::string> files;                  // path -> contents
    std::map<std::string, std::vector<std::string>> dirs;      // path -> names, server order
    std::map<std::string, std::uint32_t> permissions;          // path -> mode, default 0644

    // Failure injection
    int generation = 0;            // channels from older generations are dead
    int closed_failures = 0;       // next N calls report ChannelClosed
    bool refuse_connects = false;
    int reads_before_error = -1;   // successful reads left before a Remote error; -1 = never
    int delay_ms = 0;              // per-call latency

    // Counters
    int connects = 0;
    int list_calls = 0;
    int open_calls = 0;
    int stat_calls = 0;
    int read_calls = 0;
    int close_calls = 0;
    int open_handles = 0;

    void add_file(const std::string& path, std::string contents) {
        std::lock_guard<std::mutex> lock(mu);
        files[path] = std::move(contents);
    }

    void add_dir(const std::string& path, std::vector<std::string> names) {
        std::lock_guard<std::mutex> lock(mu);
        dirs[path] = std::move(names);
    }

    // Every live channel reports ChannelClosed from now on
    void kill_channels() {
        std::lock_guard<std::mutex> lock(mu);
        generation++;
    }

    template <typename F>
    auto with_lock(F fn) -> decltype(fn()) {
        std::lock_guard<std::mutex> lock(mu);
        return fn();
    }
};

class FakeChannel : public SftpChannel {
public:
    FakeChannel(std::shared_ptr<FakeServer> server, int generation)
        : server_(std::move(server)), generation_(generation) {}

    ~FakeChannel() override {
        std::lock_guard<std::mutex> lock(server_->mu);
        server_->open_handles -= static_cast<int>(handles_.size());
    }

    SftpResult<std::vector<std::string>> list_dir(const std::string& path) override {
        using R = SftpResult<std::vector<std::string>>;
        auto lock = enter();
        server_->list_calls++;
        if (dead()) return R::Err(SftpErrc::ChannelClosed, "channel closed");

        auto it = server_->dirs.find(path);
        if (it == server_->dirs.end()) return R::Err(SftpErrc::Remote, "no such file");
        return R::Ok(it->second);
    }

    SftpResult<FileHandle> open(const std::string& path, OpenMode) override {
        using R = SftpResult<FileHandle>;
        auto lock = enter();
        server_->open_calls++;
        if (dead()) return R::Err(SftpErrc::ChannelClosed, "channel closed");

        if (!server_->files.count(path)) return R::Err(SftpErrc::Remote, "no such file");
        FileHandle h{next_id()};
        handles_[h.id] = {path, 0};
        server_->open_handles++;
        return R::Ok(h);
    }

    SftpResult<RawAttributes> stat(const std::string& path) override {
        using R = SftpResult<RawAttributes>;
        auto lock = enter();
        server_->stat_calls++;
        if (dead()) return R::Err(SftpErrc::ChannelClosed, "channel closed");

        auto it = server_->files.find(path);
        if (it == server_->files.end()) return R::Err(SftpErrc::Remote, "no such file");

        RawAttributes attrs;
        attrs.has_size = true;
        attrs.size = it->second.size();
        attrs.has_permissions = true;
        auto perm = server_->permissions.find(path);
        attrs.permissions = perm == server_->permissions.end() ? 0100644 : perm->second;
        attrs.has_times = true;
        attrs.atime = 1700000000;
        attrs.mtime = 1600000000;
        return R::Ok(attrs);
    }

    SftpResult<Chunk> read(FileHandle handle, std::size_t max_bytes) override {
        using R = SftpResult<Chunk>;
        auto lock = enter();
        server_->read_calls++;
        if (dead()) return R::Err(SftpErrc::ChannelClosed, "channel closed");

        auto it = handles_.find(handle.id);
        if (it == handles_.end()) return R::Err(SftpErrc::Remote, "unknown handle");

        if (server_->reads_before_error == 0) return R::Err(SftpErrc::Remote, "failure");
        if (server_->reads_before_error > 0) server_->reads_before_error--;

        const std::string& contents = server_->files[it->second.path];
        std::size_t& offset = it->second.offset;
        if (offset >= contents.size()) return R::Ok(Chunk::end());

        std::string data = contents.substr(offset, max_bytes);
        offset += data.size();
        return R::Ok(Chunk::of(std::move(data)));
    }

    SftpResult<void> close(FileHandle handle) override {
        using R = SftpResult<void>;
        auto lock = enter();
        server_->close_calls++;
        if (dead()) return R::Err(SftpErrc::ChannelClosed, "channel closed");

        if (!handles_.erase(handle.id)) return R::Err(SftpErrc::Remote, "unknown handle");
        server_->open_handles--;
        return R::Ok();
    }

    bool is_open() const override { return !closed_; }

private:
    struct OpenFile {
        std::string path;
        std::size_t offset = 0;
    };

    std::shared_ptr<FakeServer> server_;
    int generation_;
    bool closed_ = false;
    std::map<std::uint64_t, OpenFile> handles_;

    std::unique_lock<std::mutex> enter() {
        int delay = 0;
        {
            std::lock_guard<std::mutex> lock(server_->mu);
            delay = server_->delay_ms;
        }
        if (delay > 0) std::this_thread::sleep_for(std::chrono::milliseconds(delay));
        return std::unique_lock<std::mutex>(server_->mu);
    }

    // Caller holds server_->mu
    bool dead() {
        if (generation_ != server_->generation) closed_ = true;
        if (!closed_ && server_->closed_failures > 0) {
            server_->closed_failures--;
            closed_ = true;
        }
        return closed_;
    }

    static std::uint64_t next_id() {
        static std::atomic<std::uint64_t> counter{0};
        return ++counter;
    }
};

// Routes connects to a FakeServer by host name.
class FakeChannelFactory : public ChannelFactory {
public:
    std::shared_ptr<FakeServer> server(const std::string& host) {
        std::lock_guard<std::mutex> lock(mu_);
        auto& s = servers_[host];
        if (!s) s = std::make_shared<FakeServer>();
        return s;
    }

    SftpResult<std::unique_ptr<SftpChannel>> connect(const ConnectionConfig& config) override {
        using R = SftpResult<std::unique_ptr<SftpChannel>>;
        auto srv = server(config.host);

        std::lock_guard<std::mutex> lock(srv->mu);
        srv->connects++;
        if (srv->refuse_connects) {
            return R::Err(SftpErrc::ConnectFailed, "connection refused");
        }
        return R::Ok(std::make_unique<FakeChannel>(srv, srv->generation));
    }

private:
    std::mutex mu_;
    std::map<std::string, std::shared_ptr<FakeServer>> servers_;
};

inline EndpointConfig make_endpoint(const std::string& name, const std::string& host) {
    EndpointConfig ep;
    ep.name = name;
    ep.connection.host = host;
    ep.connection.user = "u";
    ep.connection.password = "p";
    return ep;
}

// Poll pred until it holds or the timeout expires
inline bool wait_until(const std::function<bool()>& pred,
                       std::chrono::milliseconds timeout = std::chrono::milliseconds(5000)) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return pred();
}
