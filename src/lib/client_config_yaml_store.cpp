#include "batchnet/config/client_config_yaml_store.h"
#include "batchnet/core/logging.h"

#include <fstream>
#include <sstream>
#include <stdexcept>
#include <utility>

#include <yaml-cpp/yaml.h>

namespace batchnet::config {

static constexpr const char* TAG = "config";

// ---------- tiny helpers ----------

template<typename T>
static T get_or(const YAML::Node& obj, const char* key, T def)
{
    auto n = obj[key];
    return n ? n.as<T>() : def;
}

// ---------- from_yaml helpers ----------

static void from_yaml(const YAML::Node& node, RequestDefaults& out)
{
    out.allowRedirects    = get_or<bool>(node, "allow_redirects", out.allowRedirects);
    out.maxRedirects      = get_or<int>(node, "max_redirects", out.maxRedirects);
    out.timeoutMs         = get_or<long>(node, "timeout_ms", out.timeoutMs);
    out.verify            = get_or<bool>(node, "verify", out.verify);
    out.proxy             = get_or<std::string>(node, "proxy", out.proxy);
    out.usePushedResponse = get_or<bool>(node, "use_pushed_response", out.usePushedResponse);
}

static void from_yaml(const YAML::Node& node, EngineConfig& out)
{
    out.maxIdleHandles     = get_or<std::size_t>(node, "max_idle_handles", out.maxIdleHandles);
    out.serverPush         = get_or<bool>(node, "server_push", out.serverPush);
    out.maxHostConnections = get_or<long>(node, "max_host_connections", out.maxHostConnections);
    out.waitTimeoutMs      = get_or<int>(node, "wait_timeout_ms", out.waitTimeoutMs);
}

static void from_yaml(const YAML::Node& node, LoggingConfig& out)
{
    if (auto n = node["level"]) {
        const std::string name = n.as<std::string>();
        auto level = log::parse_level(name);
        if (!level) {
            throw std::runtime_error("unknown log level '" + name + "'");
        }
        out.level = *level;
    }
}

static void from_yaml(const YAML::Node& root, ClientConfig& cfg)
{
    if (auto n = root["client"]) {
        from_yaml(n, cfg.defaults);
    }
    if (auto n = root["engine"]) {
        from_yaml(n, cfg.engine);
    }
    if (auto n = root["logging"]) {
        from_yaml(n, cfg.logging);
    }
}

// ---------- to_yaml ----------

static void to_yaml(YAML::Emitter& out, const ClientConfig& cfg)
{
    out << YAML::BeginMap;

    // client:
    out << YAML::Key << "client" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "allow_redirects"     << YAML::Value << cfg.defaults.allowRedirects;
    out << YAML::Key << "max_redirects"       << YAML::Value << cfg.defaults.maxRedirects;
    out << YAML::Key << "timeout_ms"          << YAML::Value << cfg.defaults.timeoutMs;
    out << YAML::Key << "verify"              << YAML::Value << cfg.defaults.verify;
    out << YAML::Key << "proxy"               << YAML::Value << cfg.defaults.proxy;
    out << YAML::Key << "use_pushed_response" << YAML::Value << cfg.defaults.usePushedResponse;
    out << YAML::EndMap;

    // engine:
    out << YAML::Key << "engine" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "max_idle_handles"     << YAML::Value << cfg.engine.maxIdleHandles;
    out << YAML::Key << "server_push"          << YAML::Value << cfg.engine.serverPush;
    out << YAML::Key << "max_host_connections" << YAML::Value << cfg.engine.maxHostConnections;
    out << YAML::Key << "wait_timeout_ms"      << YAML::Value << cfg.engine.waitTimeoutMs;
    out << YAML::EndMap;

    // logging:
    out << YAML::Key << "logging" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "level" << YAML::Value << log::level_name(cfg.logging.level);
    out << YAML::EndMap;

    out << YAML::EndMap; // root
}

ClientConfig load_client_config_from_string(const std::string& yaml)
{
    ClientConfig cfg{};
    YAML::Node root = YAML::Load(yaml);
    if (root && root.IsMap()) {
        from_yaml(root, cfg);
    }
    return cfg;
}

std::string client_config_to_yaml(const ClientConfig& cfg)
{
    YAML::Emitter out;
    to_yaml(out, cfg);
    return std::string(out.c_str());
}

// ---------- YamlClientConfigStore methods ----------

YamlClientConfigStore::YamlClientConfigStore(std::string path)
    : _path(std::move(path))
{
}

ClientConfig YamlClientConfigStore::load()
{
    std::ifstream in(_path);
    if (!in) {
        BN_LOGW(TAG, "Config '%s' not found; using defaults", _path.c_str());
        return ClientConfig{};
    }

    std::stringstream ss;
    ss << in.rdbuf();

    ClientConfig cfg = load_client_config_from_string(ss.str());
    BN_LOGI(TAG, "Loaded config from '%s'", _path.c_str());
    return cfg;
}

void YamlClientConfigStore::save(const ClientConfig& cfg)
{
    std::ofstream out(_path, std::ios::trunc);
    if (!out) {
        throw std::runtime_error("unable to open '" + _path + "' for writing");
    }

    out << client_config_to_yaml(cfg) << '\n';
    if (!out) {
        throw std::runtime_error("short write while saving config '" + _path + "'");
    }
}

} // namespace batchnet::config
