#pragma once

#include <string>
#include <filesystem>
#include <yaml-cpp/yaml.h>
#include "types.hpp"
#include "constants.hpp"
#include "log.hpp"

namespace fs = std::filesystem;

struct FleetSettings {
    int max_concurrent = DEFAULT_MAX_CONCURRENT;
    int command_timeout = NO_COMMAND_TIMEOUT;              // seconds, 0 = none
    int max_tunnel_connections = UNLIMITED_TUNNEL_CONNECTIONS;
    int monitor_interval = DEFAULT_MONITOR_INTERVAL_SECS;
    std::string log_file;                                  // empty = default location
    LogLevel log_level = LogLevel::INFO;
    bool log_stderr = false;
};

class Config {
public:
    Config() = default;

    // Load settings and hosts from a YAML file. A missing or unparsable file
    // is an error; missing keys take defaults.
    static Result<Config> load(const fs::path& path);

    // Same, from YAML text.
    static Result<Config> parse(const std::string& yaml_text);

    const FleetSettings& settings() const { return settings_; }
    FleetSettings& settings() { return settings_; }
    const Inventory& hosts() const { return hosts_; }
    const fs::path& source() const { return source_; }

    // Point the process log at settings().log_file / log_level / log_stderr.
    void apply_logging() const;

private:
    static Result<Config> from_node(const YAML::Node& root);

    FleetSettings settings_;
    Inventory hosts_;
    fs::path source_;
};

// Read only the `hosts:` mapping of an inventory file. Entries that fail
// validation are omitted with a warning.
Result<Inventory> load_inventory(const fs::path& path);
