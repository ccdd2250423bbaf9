#include "config.hpp"
#include <platform/platform.hpp>
#include <yaml-cpp/yaml.h>
#include <fmt/format.h>
#include <fstream>
#include <set>

namespace fs = std::filesystem;

fs::path get_config_dir() {
    return platform::home_dir() / ".sftpool";
}

fs::path PoolConfig::get_default_path() {
    return get_config_dir() / "config.yaml";
}

const EndpointConfig* PoolConfig::find(const std::string& name) const {
    for (const auto& ep : endpoints_) {
        if (ep.name == name) return &ep;
    }
    return nullptr;
}

Result<void> create_default_config(const fs::path& path) {
    // Don't overwrite existing config
    if (fs::exists(path)) {
        return Result<void>::Ok();
    }

    fs::create_directories(path.parent_path());

    const char* default_config = R"(# sftpool configuration
# One session is started per entry under `connections`.

# Seconds a caller waits for a session to reply
request_timeout: 120

# Supervisor restart policy for crashed sessions
restart:
  max_restarts: 10
  initial_backoff_ms: 200
  max_backoff_ms: 5000

connections: []
#  - name: hm_sftp
#    host: "example.com"
#    port: 22
#    user: ""
#    password: ""
#    timeout: 30
)";

    try {
        std::ofstream out(path);
        if (!out) {
            return Result<void>::Err("Failed to create config file at " + path.string());
        }
        out << default_config;
        out.close();
        return Result<void>::Ok();
    } catch (const std::exception& e) {
        return Result<void>::Err("Failed to write config file: " + std::string(e.what()));
    }
}

class PoolConfigParser {
public:
    static Result<PoolConfig> build(const YAML::Node& root) {
        PoolConfig config;

        config.request_timeout_ = root["request_timeout"].as<int>(REQUEST_TIMEOUT_SECS);
        if (config.request_timeout_ <= 0) {
            return Result<PoolConfig>::Err("request_timeout must be positive");
        }

        auto restart = parse_restart(root["restart"] ? root["restart"] : YAML::Node());
        if (restart.is_err()) return Result<PoolConfig>::Err(restart.error);
        config.restart_ = restart.value;

        const YAML::Node& conns = root["connections"];
        if (!conns || !conns.IsSequence()) {
            return Result<PoolConfig>::Err("'connections' must be a list");
        }

        std::set<std::string> seen;
        for (std::size_t i = 0; i < conns.size(); ++i) {
            auto ep = parse_endpoint(conns[i], i);
            if (ep.is_err()) return Result<PoolConfig>::Err(ep.error);
            if (!seen.insert(ep.value.name).second) {
                return Result<PoolConfig>::Err(
                    fmt::format("duplicate connection name '{}'", ep.value.name));
            }
            config.endpoints_.push_back(std::move(ep.value));
        }

        return Result<PoolConfig>::Ok(std::move(config));
    }

private:
    static Result<RestartPolicy> parse_restart(const YAML::Node& node) {
        RestartPolicy policy;
        policy.max_restarts = node["max_restarts"].as<int>(RESTART_MAX_ATTEMPTS);
        policy.initial_backoff_ms = node["initial_backoff_ms"].as<int>(RESTART_INITIAL_BACKOFF_MS);
        policy.max_backoff_ms = node["max_backoff_ms"].as<int>(RESTART_MAX_BACKOFF_MS);

        if (policy.max_restarts <= 0 || policy.initial_backoff_ms <= 0 ||
            policy.max_backoff_ms <= 0) {
            return Result<RestartPolicy>::Err("restart values must be positive");
        }
        if (policy.max_backoff_ms < policy.initial_backoff_ms) {
            return Result<RestartPolicy>::Err(
                "restart.max_backoff_ms must be >= restart.initial_backoff_ms");
        }
        return Result<RestartPolicy>::Ok(policy);
    }

    static Result<EndpointConfig> parse_endpoint(const YAML::Node& node, std::size_t index) {
        if (!node.IsMap()) {
            return Result<EndpointConfig>::Err(
                fmt::format("connections[{}] must be a map", index));
        }

        EndpointConfig ep;
        ep.name = node["name"].as<std::string>("");
        ep.connection.host = node["host"].as<std::string>("");
        ep.connection.user = node["user"].as<std::string>("");
        ep.connection.password = node["password"].as<std::string>("");
        ep.connection.timeout = node["timeout"].as<int>(SSH_CONNECT_TIMEOUT_SECS);
        ep.connection.sftp_version = SFTP_PROTOCOL_VERSION;

        if (ep.name.empty()) {
            return Result<EndpointConfig>::Err(
                fmt::format("connections[{}] is missing 'name'", index));
        }
        if (ep.connection.host.empty()) {
            return Result<EndpointConfig>::Err(
                fmt::format("connection '{}' is missing 'host'", ep.name));
        }
        if (ep.connection.user.empty()) {
            return Result<EndpointConfig>::Err(
                fmt::format("connection '{}' is missing 'user'", ep.name));
        }

        int port = node["port"].as<int>(SFTP_DEFAULT_PORT);
        if (port < 1 || port > 65535) {
            return Result<EndpointConfig>::Err(
                fmt::format("connection '{}' has invalid port {}", ep.name, port));
        }
        ep.connection.port = static_cast<std::uint16_t>(port);

        if (ep.connection.timeout <= 0) {
            return Result<EndpointConfig>::Err(
                fmt::format("connection '{}' timeout must be positive", ep.name));
        }
        if (ep.connection.timeout > SSH_MAX_TIMEOUT_SECS) {
            return Result<EndpointConfig>::Err(
                fmt::format("connection '{}' timeout exceeds {}s", ep.name, SSH_MAX_TIMEOUT_SECS));
        }

        return Result<EndpointConfig>::Ok(std::move(ep));
    }
};

Result<PoolConfig> PoolConfig::load(const fs::path& path) {
    if (!fs::exists(path)) {
        return Result<PoolConfig>::Err("Config not found at " + path.string());
    }

    try {
        YAML::Node root = YAML::LoadFile(path.string());
        return PoolConfigParser::build(root);
    } catch (const std::exception& e) {
        return Result<PoolConfig>::Err(std::string("Failed to parse config: ") + e.what());
    }
}

Result<PoolConfig> PoolConfig::parse(const std::string& yaml_text) {
    try {
        YAML::Node root = YAML::Load(yaml_text);
        return PoolConfigParser::build(root);
    } catch (const std::exception& e) {
        return Result<PoolConfig>::Err(std::string("Failed to parse config: ") + e.what());
    }
}
