#include "citadel/config.hpp"
#include "citadel/error.hpp"
#include <fstream>
#include <sstream>

namespace citadel {

namespace {

nlohmann::json read_json_file(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw ConfigError("Cannot open config file: " + path);
    }
    std::stringstream ss;
    ss << in.rdbuf();
    try {
        return nlohmann::json::parse(ss.str());
    } catch (const nlohmann::json::parse_error& e) {
        throw ConfigError("Invalid JSON in " + path + ": " + e.what());
    }
}

} // anonymous namespace

void to_json(nlohmann::json& j, const HttpConfig& c) {
    j = nlohmann::json{
        {"enabled", c.enabled},
        {"host", c.host},
        {"port", c.port},
        {"path", c.path},
        {"allowed_origins", c.allowed_origins},
        {"session_timeout_secs", c.session_timeout_secs}
    };
}

void from_json(const nlohmann::json& j, HttpConfig& c) {
    HttpConfig d;
    c.enabled = j.value("enabled", d.enabled);
    c.host = j.value("host", d.host);
    c.port = j.value("port", d.port);
    c.path = j.value("path", d.path);
    c.allowed_origins = j.value("allowed_origins", d.allowed_origins);
    c.session_timeout_secs = j.value("session_timeout_secs", d.session_timeout_secs);
}

void to_json(nlohmann::json& j, const GatewayConfig& c) {
    j = nlohmann::json{
        {"socket_path", c.socket_path},
        {"socket_outbound_limit_bytes", c.socket_outbound_limit_bytes},
        {"log_level", c.log_level},
        {"log_file", c.log_file},
        {"servers_config", c.servers_config},
        {"http", c.http},
        {"handshake_timeout_ms", c.handshake_timeout_ms},
        {"call_timeout_ms", c.call_timeout_ms},
        {"sweep_interval_ms", c.sweep_interval_ms},
        {"notification_policy", c.notification_policy}
    };
}

void from_json(const nlohmann::json& j, GatewayConfig& c) {
    GatewayConfig d;
    c.socket_path = j.value("socket_path", d.socket_path);
    c.socket_outbound_limit_bytes =
        j.value("socket_outbound_limit_bytes", d.socket_outbound_limit_bytes);
    c.log_level = j.value("log_level", d.log_level);
    c.log_file = j.value("log_file", d.log_file);
    c.servers_config = j.value("servers_config", d.servers_config);
    c.http = j.value("http", d.http);
    c.handshake_timeout_ms = j.value("handshake_timeout_ms", d.handshake_timeout_ms);
    c.call_timeout_ms = j.value("call_timeout_ms", d.call_timeout_ms);
    c.sweep_interval_ms = j.value("sweep_interval_ms", d.sweep_interval_ms);
    c.notification_policy = j.value("notification_policy", d.notification_policy);
}

GatewayConfig load_gateway_config(const std::string& path) {
    auto doc = read_json_file(path);
    if (!doc.is_object()) {
        throw ConfigError("Gateway config must be a JSON object: " + path);
    }
    try {
        return doc.get<GatewayConfig>();
    } catch (const nlohmann::json::exception& e) {
        throw ConfigError("Invalid gateway config " + path + ": " + e.what());
    }
}

std::vector<ServerDefinition> parse_server_definitions(const nlohmann::json& doc) {
    auto servers = doc.find("mcpServers");
    if (servers == doc.end() || !servers->is_object()) {
        throw ConfigError("Missing 'mcpServers' object");
    }

    std::vector<ServerDefinition> defs;
    for (const auto& [name, def] : servers->items()) {
        if (!def.is_object() || !def.contains("command") || !def.at("command").is_string()) {
            throw ConfigError("Server '" + name + "' has no command");
        }
        try {
            ServerDefinition sd;
            sd.name = name;
            sd.command = def.at("command").get<std::string>();
            sd.args = def.value("args", std::vector<std::string>{});
            sd.env = def.value("env", std::map<std::string, std::string>{});
            defs.push_back(std::move(sd));
        } catch (const nlohmann::json::exception& e) {
            throw ConfigError("Invalid definition for server '" + name + "': " + e.what());
        }
    }
    return defs;
}

std::vector<ServerDefinition> load_server_definitions(const std::string& path) {
    return parse_server_definitions(read_json_file(path));
}

} // namespace citadel
