#include "config.hpp"
#include "host.hpp"
#include <platform/platform.hpp>
#include <yaml-cpp/yaml.h>
#include <fmt/format.h>

static FleetSettings parse_settings(const YAML::Node& node) {
    FleetSettings s;
    s.max_concurrent = node["max_concurrent"].as<int>(DEFAULT_MAX_CONCURRENT);
    s.command_timeout = node["command_timeout"].as<int>(NO_COMMAND_TIMEOUT);
    s.max_tunnel_connections = node["max_tunnel_connections"].as<int>(UNLIMITED_TUNNEL_CONNECTIONS);
    s.monitor_interval = node["monitor_interval"].as<int>(DEFAULT_MONITOR_INTERVAL_SECS);
    s.log_file = node["log_file"].as<std::string>("");
    s.log_level = parse_log_level(node["log_level"].as<std::string>("info"));
    s.log_stderr = node["log_stderr"].as<bool>(false);

    if (s.max_concurrent < 1) s.max_concurrent = 1;
    if (s.command_timeout < 0) s.command_timeout = NO_COMMAND_TIMEOUT;
    if (s.max_tunnel_connections < 0) s.max_tunnel_connections = UNLIMITED_TUNNEL_CONNECTIONS;
    if (s.monitor_interval < 1) s.monitor_interval = 1;
    return s;
}

static Result<HostIdentity> parse_host(const YAML::Node& node) {
    if (!node.IsMap()) {
        return Result<HostIdentity>::Err("entry is not a mapping");
    }

    std::optional<std::string> password;
    std::optional<std::string> key_filename;
    if (node["password"]) password = node["password"].as<std::string>();
    if (node["key_filename"]) key_filename = node["key_filename"].as<std::string>();

    std::vector<std::string> tags;
    if (node["tags"]) {
        if (node["tags"].IsSequence()) {
            tags = node["tags"].as<std::vector<std::string>>();
        } else if (node["tags"].IsScalar()) {
            tags.push_back(node["tags"].as<std::string>());
        }
    }

    return make_host_identity(node["hostname"].as<std::string>(""),
                              node["username"].as<std::string>(""),
                              password, key_filename,
                              node["port"].as<int>(DEFAULT_SSH_PORT),
                              node["timeout"].as<int>(DEFAULT_CONNECT_TIMEOUT_SECS),
                              std::move(tags));
}

static Inventory parse_hosts(const YAML::Node& node) {
    Inventory hosts;
    if (!node) return hosts;
    if (!node.IsMap()) {
        log_warn("Inventory: 'hosts' is not a mapping, ignoring");
        return hosts;
    }

    for (const auto& kv : node) {
        std::string label = kv.first.as<std::string>("");
        Result<HostIdentity> host = Result<HostIdentity>::Err("");
        try {
            host = parse_host(kv.second);
        } catch (const YAML::Exception& e) {
            host = Result<HostIdentity>::Err(e.what());
        }
        if (host.is_err()) {
            log_warn(fmt::format("Inventory: skipping host '{}': {}", label, host.error));
            continue;
        }
        hosts[label] = host.value;
    }
    return hosts;
}

Result<Config> Config::from_node(const YAML::Node& root) {
    Config cfg;
    if (!root || root.IsNull()) return Result<Config>::Ok(cfg);
    if (!root.IsMap()) {
        return Result<Config>::Err("Configuration root must be a mapping");
    }

    try {
        if (root["settings"]) {
            cfg.settings_ = parse_settings(root["settings"]);
        }
    } catch (const YAML::Exception& e) {
        return Result<Config>::Err(fmt::format("Invalid settings: {}", e.what()));
    }
    cfg.hosts_ = parse_hosts(root["hosts"]);
    return Result<Config>::Ok(cfg);
}

Result<Config> Config::parse(const std::string& yaml_text) {
    try {
        return from_node(YAML::Load(yaml_text));
    } catch (const YAML::Exception& e) {
        return Result<Config>::Err(fmt::format("Invalid YAML: {}", e.what()));
    }
}

Result<Config> Config::load(const fs::path& path) {
    if (!fs::exists(path)) {
        return Result<Config>::Err(fmt::format("Config file not found: {}", path.string()));
    }

    YAML::Node root;
    try {
        root = YAML::LoadFile(path.string());
    } catch (const YAML::Exception& e) {
        return Result<Config>::Err(fmt::format("Failed to read {}: {}", path.string(), e.what()));
    }

    auto cfg = from_node(root);
    if (cfg.is_err()) {
        return Result<Config>::Err(fmt::format("{}: {}", path.string(), cfg.error));
    }
    cfg.value.source_ = path;
    return cfg;
}

void Config::apply_logging() const {
    fs::path path = settings_.log_file.empty()
        ? platform::temp_dir() / "sshfleet.log"
        : platform::expand_user(settings_.log_file);
    log_configure(path, settings_.log_level, settings_.log_stderr);
}

Result<Inventory> load_inventory(const fs::path& path) {
    auto cfg = Config::load(path);
    if (cfg.is_err()) return Result<Inventory>::Err(cfg.error);
    return Result<Inventory>::Ok(cfg.value.hosts());
}
