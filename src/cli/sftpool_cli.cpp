#include "sftpool_cli.hpp"
#include "theme.hpp"
#include <iostream>
#include <fstream>
#include <fmt/format.h>
#include <core/log.hpp>
#include <core/utils.hpp>

SftpoolCLI::SftpoolCLI(ChannelFactory& factory) : factory_(factory) {
    register_all_commands();
}

void SftpoolCLI::add_command(const std::string& name,
                             CommandHandler handler,
                             const std::string& usage,
                             const std::string& help,
                             bool needs_endpoint) {
    commands_[name] = {std::move(handler), usage, help, needs_endpoint};
}

bool SftpoolCLI::needs_endpoint(const std::string& command) const {
    auto it = commands_.find(command);
    return it == commands_.end() || it->second.needs_endpoint;
}

bool SftpoolCLI::load_config(const std::string& path) {
    auto result = path.empty() ? PoolConfig::load() : PoolConfig::load(path);
    if (result.is_err()) {
        std::cerr << theme::fail(result.error);
        return false;
    }
    config = std::move(result.value);
    return true;
}

bool SftpoolCLI::require_endpoint(const std::string& name) {
    if (!config.has_value()) {
        std::cerr << theme::fail("No configuration loaded.");
        return false;
    }
    const EndpointConfig* ep = config->find(name);
    if (!ep) {
        std::cerr << theme::fail(fmt::format("Unknown endpoint '{}'.", name));
        std::cerr << theme::step("Run 'sftpool endpoints' to list configured endpoints.");
        return false;
    }

    endpoint = name;
    pool = std::make_unique<SessionPool>(std::vector<EndpointConfig>{*ep}, factory_,
                                         config->restart(),
                                         std::chrono::seconds(config->request_timeout()));
    pool->start();

    if (!pool->session(name)) {
        std::cerr << theme::fail(fmt::format("Could not connect to {} ({}@{}:{}).", name,
                                             ep->connection.user, ep->connection.host,
                                             ep->connection.port));
        std::cerr << theme::step("See " + sftpool_log_path() + " for details.");
        return false;
    }
    return true;
}

int SftpoolCLI::execute_command(const std::string& command, const Args& args) {
    auto it = commands_.find(command);
    if (it == commands_.end()) {
        std::cerr << theme::fail("Unknown command: " + command);
        std::cerr << theme::step("Run 'sftpool --help' for available commands.");
        return 1;
    }

    try {
        return it->second.handler(*this, args);
    } catch (const std::exception& e) {
        std::cerr << theme::fail(std::string(e.what()));
        return 1;
    }
}

void SftpoolCLI::print_help() const {
    std::cout << theme::section("Commands");
    for (const auto& [name, cmd] : commands_) {
        std::cout << theme::color::BLUE
                  << fmt::format("    {:<24}", cmd.usage)
                  << theme::color::RESET
                  << theme::color::DIM
                  << cmd.help
                  << theme::color::RESET << "\n";
    }
    std::cout << "\n";
}

// ── Commands ────────────────────────────────────────────────

static bool check_args(const SftpoolCLI::Args& args, size_t n, const std::string& usage) {
    if (args.size() == n) return true;
    std::cerr << theme::fail("Usage: sftpool <endpoint> " + usage);
    return false;
}

static int report(SftpErrc code, const std::string& error) {
    std::cerr << theme::fail(fmt::format("{} ({})", error, errc_name(code)));
    return 1;
}

void SftpoolCLI::register_all_commands() {
    add_command("init", [](SftpoolCLI&, const Args& args) {
        fs::path path = args.empty() ? PoolConfig::get_default_path() : fs::path(args[0]);
        if (fs::exists(path)) {
            std::cout << theme::step("Config already exists at " + path.string());
            return 0;
        }
        auto result = create_default_config(path);
        if (result.is_err()) {
            std::cerr << theme::fail(result.error);
            return 1;
        }
        std::cout << theme::ok("Wrote example config to " + path.string());
        return 0;
    }, "init [path]", "Write an example config", false);

    add_command("endpoints", [](SftpoolCLI& cli, const Args&) {
        for (const auto& ep : cli.config->endpoints()) {
            std::cout << fmt::format("{}  {}@{}:{}\n", ep.name, ep.connection.user,
                                     ep.connection.host, ep.connection.port);
        }
        return 0;
    }, "endpoints", "List configured endpoints", false);

    add_command("ls", [](SftpoolCLI& cli, const Args& args) {
        if (!check_args(args, 1, "ls <dir>")) return 1;
        auto result = cli.pool->list_dir(cli.endpoint, args[0]);
        if (result.is_err()) return report(result.code, result.error);
        for (const auto& name : result.value) {
            std::cout << name << "\n";
        }
        return 0;
    }, "ls <dir>", "List a remote directory");

    add_command("stat", [](SftpoolCLI& cli, const Args& args) {
        if (!check_args(args, 1, "stat <path>")) return 1;
        auto result = cli.pool->file_info(cli.endpoint, args[0]);
        if (result.is_err()) return report(result.code, result.error);
        const auto& info = result.value;
        std::cout << theme::kv("size", fmt::format("{} ({})", info.size, format_bytes(info.size)));
        std::cout << theme::kv("access", access_name(info.access));
        std::cout << theme::kv("read", format_epoch(info.last_read));
        std::cout << theme::kv("write", format_epoch(info.last_write));
        return 0;
    }, "stat <path>", "Show size, access and timestamps");

    add_command("get", [](SftpoolCLI& cli, const Args& args) {
        if (!check_args(args, 2, "get <remote> <local>")) return 1;
        auto result = cli.pool->get_whole_file(cli.endpoint, args[0]);
        if (result.is_err()) return report(result.code, result.error);

        std::ofstream out(args[1], std::ios::binary | std::ios::trunc);
        if (!out) {
            std::cerr << theme::fail("Cannot write " + args[1]);
            return 1;
        }
        out.write(result.value.data(), static_cast<std::streamsize>(result.value.size()));
        if (!out) {
            std::cerr << theme::fail("Write failed: " + args[1]);
            return 1;
        }
        std::cout << theme::ok(fmt::format("{} -> {} ({})", args[0], args[1],
                                           format_bytes(result.value.size())));
        return 0;
    }, "get <remote> <local>", "Download a whole file");

    add_command("cat", [](SftpoolCLI& cli, const Args& args) {
        if (!check_args(args, 1, "cat <path>")) return 1;
        auto stream = cli.pool->stream_file(cli.endpoint, args[0]);
        while (auto chunk = stream.next()) {
            std::cout.write(chunk->data(), static_cast<std::streamsize>(chunk->size()));
        }
        std::cout.flush();
        if (stream.failed()) {
            return report(stream.error_code(),
                          fmt::format("{}: stream {} ({})", stream.path(),
                                      stream_state_name(stream.state()), stream.error()));
        }
        return 0;
    }, "cat <path>", "Stream a file to stdout");
}
