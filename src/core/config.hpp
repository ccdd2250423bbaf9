#pragma once

#include <string>
#include <vector>
#include <filesystem>
#include "types.hpp"
#include "constants.hpp"

namespace fs = std::filesystem;

class PoolConfig {
public:
    // Load pool config from a YAML file (default ~/.sftpool/config.yaml)
    static Result<PoolConfig> load(const fs::path& path = get_default_path());

    // Parse pool config from YAML text
    static Result<PoolConfig> parse(const std::string& yaml_text);

    static fs::path get_default_path();

    // Accessors
    const std::vector<EndpointConfig>& endpoints() const { return endpoints_; }
    const RestartPolicy& restart() const { return restart_; }
    int request_timeout() const { return request_timeout_; }

    const EndpointConfig* find(const std::string& name) const;

public:
    PoolConfig() = default;

private:
    std::vector<EndpointConfig> endpoints_;
    RestartPolicy restart_;
    int request_timeout_ = REQUEST_TIMEOUT_SECS;

    friend class PoolConfigParser;
};

// Get paths
fs::path get_config_dir();

// Create a commented example config if none exists
Result<void> create_default_config(const fs::path& path = PoolConfig::get_default_path());
