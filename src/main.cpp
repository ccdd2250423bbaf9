#include <iostream>
#include <vector>
#include <string>
#include "cli/sftpool_cli.hpp"
#include "cli/theme.hpp"
#include <sftp/libssh2_channel.hpp>

static const char* SFTPOOL_VERSION = "0.1.0";

void print_usage(const SftpoolCLI& cli) {
    std::cout << theme::section("Usage");
    std::cout << theme::color::BLUE << "    sftpool "
              << theme::color::RESET << theme::color::BROWN << "[--config PATH] <endpoint> <command> [args]"
              << theme::color::RESET << "\n";
    cli.print_help();
    std::cout << theme::color::DIM
              << "    sftpool --version        Show version\n"
              << "    sftpool --help           Show this help"
              << theme::color::RESET << "\n\n";
}

int main(int argc, char** argv) {
    try {
        Libssh2ChannelFactory factory;
        SftpoolCLI cli(factory);

        std::vector<std::string> args(argv + 1, argv + argc);
        std::string config_path;

        if (args.size() >= 2 && args[0] == "--config") {
            config_path = args[1];
            args.erase(args.begin(), args.begin() + 2);
        }

        if (args.empty()) {
            print_usage(cli);
            return 1;
        }

        if (args[0] == "--version") {
            std::cout << theme::color::BROWN << theme::color::BOLD << "sftpool"
                      << theme::color::RESET << theme::color::DIM
                      << " version " << SFTPOOL_VERSION << theme::color::RESET << "\n";
            return 0;
        } else if (args[0] == "--help") {
            print_usage(cli);
            return 0;
        }

        // Endpoint-free commands: sftpool <command> [args]
        if (cli.has_command(args[0]) && !cli.needs_endpoint(args[0])) {
            std::string cmd = args[0];
            args.erase(args.begin());
            if (cmd == "init") {
                if (args.empty() && !config_path.empty()) args.push_back(config_path);
            } else if (!cli.load_config(config_path)) {
                return 1;
            }
            return cli.execute_command(cmd, args);
        }

        if (args.size() < 2) {
            std::cout << theme::fail("Missing command.");
            print_usage(cli);
            return 1;
        }

        std::string endpoint = args[0];
        std::string cmd = args[1];
        args.erase(args.begin(), args.begin() + 2);

        if (!cli.has_command(cmd)) {
            std::cout << theme::fail("Unknown command: " + cmd);
            print_usage(cli);
            return 1;
        }
        if (!cli.load_config(config_path)) return 1;
        if (!cli.require_endpoint(endpoint)) return 1;
        return cli.execute_command(cmd, args);
    } catch (const std::exception& e) {
        std::cout << theme::fail(std::string(e.what()));
        return 1;
    }
}
