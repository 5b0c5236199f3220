#pragma once
#include <chrono>
#include <cstdint>
#include <map>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace citadel {

/// How notifications a backend sends on its own are handled.
enum class NotificationPolicy {
    Broadcast,  // to every active session bound to that backend
    Drop,
};

NLOHMANN_JSON_SERIALIZE_ENUM(NotificationPolicy, {
    {NotificationPolicy::Broadcast, "broadcast"},
    {NotificationPolicy::Drop, "drop"},
})

/// A named backend MCP server and how to launch it.
struct ServerDefinition {
    std::string name;
    std::string command;
    std::vector<std::string> args;
    std::map<std::string, std::string> env;
};

struct HttpConfig {
    bool enabled = false;
    std::string host = "127.0.0.1";
    uint16_t port = 3000;
    std::string path = "/mcp";
    std::vector<std::string> allowed_origins;
    uint64_t session_timeout_secs = 3600;
};

struct GatewayConfig {
    std::string socket_path = "/tmp/mcp-citadel.sock";
    uint64_t socket_outbound_limit_bytes = 8 * 1024 * 1024;
    std::string log_level = "info";
    std::string log_file;
    std::string servers_config;
    HttpConfig http;
    uint64_t handshake_timeout_ms = 10000;
    uint64_t call_timeout_ms = 60000;
    uint64_t sweep_interval_ms = 1000;
    NotificationPolicy notification_policy = NotificationPolicy::Broadcast;

    std::chrono::milliseconds handshake_timeout() const {
        return std::chrono::milliseconds(handshake_timeout_ms);
    }
    std::chrono::milliseconds call_timeout() const {
        return std::chrono::milliseconds(call_timeout_ms);
    }
    std::chrono::milliseconds sweep_interval() const {
        return std::chrono::milliseconds(sweep_interval_ms);
    }
    std::chrono::milliseconds session_timeout() const {
        return std::chrono::seconds(http.session_timeout_secs);
    }
};

void to_json(nlohmann::json& j, const HttpConfig& c);
void from_json(const nlohmann::json& j, HttpConfig& c);
void to_json(nlohmann::json& j, const GatewayConfig& c);
void from_json(const nlohmann::json& j, GatewayConfig& c);

/// Load the gateway configuration from a JSON file. Missing keys keep their
/// defaults. Throws ConfigError.
GatewayConfig load_gateway_config(const std::string& path);

/// Parse backend definitions from a Claude Desktop style document:
/// {"mcpServers": {"<name>": {"command": ..., "args": [...], "env": {...}}}}
/// Throws ConfigError.
std::vector<ServerDefinition> parse_server_definitions(const nlohmann::json& doc);

std::vector<ServerDefinition> load_server_definitions(const std::string& path);

} // namespace citadel
