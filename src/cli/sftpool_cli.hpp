#pragma once

#include <string>
#include <map>
#include <memory>
#include <functional>
#include <optional>
#include <vector>
#include <core/config.hpp>
#include <pool/session_pool.hpp>

// One-shot command runner: loads the pool config, brings up the session
// for the requested endpoint and runs a single command against it.
class SftpoolCLI {
public:
    explicit SftpoolCLI(ChannelFactory& factory);

    using Args = std::vector<std::string>;
    using CommandHandler = std::function<int(SftpoolCLI&, const Args&)>;

    void add_command(const std::string& name,
                     CommandHandler handler,
                     const std::string& usage,
                     const std::string& help,
                     bool needs_endpoint = true);

    // Empty path means the default location
    bool load_config(const std::string& path = "");
    bool require_endpoint(const std::string& name);

    bool has_command(const std::string& command) const { return commands_.count(command) > 0; }
    bool needs_endpoint(const std::string& command) const;

    // Returns the process exit code
    int execute_command(const std::string& command, const Args& args);
    void print_help() const;

    // Public state
    std::optional<PoolConfig> config;
    std::unique_ptr<SessionPool> pool;
    std::string endpoint;

private:
    struct Command {
        CommandHandler handler;
        std::string usage;
        std::string help;
        bool needs_endpoint = true;
    };

    ChannelFactory& factory_;
    std::map<std::string, Command> commands_;

    void register_all_commands();
};
