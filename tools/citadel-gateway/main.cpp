/// citadel-gateway: one process fronting many stdio MCP servers.
/// Usage: citadel-gateway --servers claude_desktop_config.json [--enable-http]

#include <citadel/citadel.hpp>

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>

#include <atomic>
#include <csignal>
#include <iostream>

namespace {

std::atomic<bool> g_running{true};

void signal_handler(int) {
    g_running = false;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    CLI::App app{"MCP Citadel - shared gateway for MCP servers"};

    std::string config_path;
    std::string servers_path;
    std::string socket_path;
    bool enable_http = false;
    std::string http_host;
    uint16_t http_port = 0;
    std::string log_level;
    std::string log_file;
    bool list_servers = false;

    app.add_option("-c,--config", config_path, "Gateway configuration file (JSON)")
        ->check(CLI::ExistingFile);
    app.add_option("-s,--servers", servers_path,
                   "Backend definitions ({\"mcpServers\": {...}} JSON)")
        ->check(CLI::ExistingFile);
    app.add_option("--socket", socket_path, "Unix socket path");
    app.add_flag("--enable-http", enable_http, "Serve the HTTP transport");
    app.add_option("--http-host", http_host, "HTTP bind address");
    app.add_option("--http-port", http_port, "HTTP port");
    app.add_option("-l,--log-level", log_level, "Log level (trace, debug, info, warn, error)")
        ->check(CLI::IsMember({"trace", "debug", "info", "warn", "error", "critical", "off"}));
    app.add_option("--log-file", log_file, "Log file path (optional)");
    app.add_flag("--list-servers", list_servers, "Print the configured backends and exit");
    app.set_version_flag("--version", std::string(citadel::LIBRARY_VERSION));
    CLI11_PARSE(app, argc, argv);

    citadel::GatewayConfig config;
    std::vector<citadel::ServerDefinition> servers;
    try {
        if (!config_path.empty()) config = citadel::load_gateway_config(config_path);
        if (!socket_path.empty()) config.socket_path = socket_path;
        if (enable_http) config.http.enabled = true;
        if (!http_host.empty()) config.http.host = http_host;
        if (http_port != 0) config.http.port = http_port;
        if (!log_level.empty()) config.log_level = log_level;
        if (!log_file.empty()) config.log_file = log_file;
        if (!servers_path.empty()) config.servers_config = servers_path;

        citadel::log::init(config.log_level, config.log_file);

        if (config.servers_config.empty()) {
            throw citadel::ConfigError("No backend definitions; pass --servers or set servers_config");
        }
        servers = citadel::load_server_definitions(config.servers_config);
    } catch (const citadel::ConfigError& e) {
        std::cerr << "citadel-gateway: " << e.what() << std::endl;
        return 2;
    }

    if (list_servers) {
        for (const auto& def : servers) {
            std::cout << def.name << "\t" << def.command;
            for (const auto& a : def.args) std::cout << " " << a;
            std::cout << "\n";
        }
        return 0;
    }

    spdlog::info("{} v{} (protocol {})", citadel::GATEWAY_NAME, citadel::LIBRARY_VERSION,
                 citadel::PROTOCOL_VERSION);

    // Writes to a vanished client or backend must fail with EPIPE, not kill us.
    std::signal(SIGPIPE, SIG_IGN);
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    try {
        citadel::Gateway gateway(config, std::move(servers));
        gateway.start();
        if (!config.socket_path.empty()) spdlog::info("unix socket: {}", config.socket_path);
        if (config.http.enabled) {
            spdlog::info("http: http://{}:{}{}", config.http.host, gateway.http_port(),
                         config.http.path);
        }
        spdlog::info("Press Ctrl+C to stop");

        while (g_running) {
            if (gateway.wait_for(std::chrono::milliseconds(500))) break;
        }

        spdlog::info("Shutting down gateway...");
        gateway.stop();
    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
    return 0;
}
