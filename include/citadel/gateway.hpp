#pragma once
#include "backend.hpp"
#include "config.hpp"
#include "registry.hpp"
#include "router.hpp"
#include "session.hpp"
#include "stats.hpp"
#include "transport/http_adapter.hpp"
#include "transport/unix_socket_adapter.hpp"
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

namespace citadel {

/// The assembled gateway: registry, sessions, router, the configured client
/// adapters, and the sweeper that expires calls and evicts idle sessions.
class Gateway {
public:
    Gateway(GatewayConfig config, std::vector<ServerDefinition> servers,
            std::shared_ptr<BackendConnector> connector = std::make_shared<ProcessConnector>());
    ~Gateway();

    Gateway(const Gateway&) = delete;
    Gateway& operator=(const Gateway&) = delete;

    /// Open the listeners and start serving in the background.
    /// Throws TransportError if a listener cannot be opened.
    void start();

    /// Stop serving: adapters first, then sessions, then backends.
    void stop();

    /// Wait until stop() has been called or `timeout` elapses. Returns true
    /// once stopped.
    bool wait_for(std::chrono::milliseconds timeout);

    /// One sweeper pass: expire overdue calls, evict idle sessions.
    void sweep();

    [[nodiscard]] Router& router() { return router_; }
    [[nodiscard]] SessionManager& sessions() { return sessions_; }
    [[nodiscard]] BackendRegistry& registry() { return registry_; }
    [[nodiscard]] const GatewayStats& stats() const { return stats_; }
    [[nodiscard]] const GatewayConfig& config() const { return config_; }

    /// Bound HTTP port, or 0 when HTTP is disabled.
    [[nodiscard]] uint16_t http_port() const;

private:
    void sweeper_loop();
    void request_stop();

    GatewayConfig config_;
    GatewayStats stats_;
    SessionManager sessions_;
    BackendRegistry registry_;
    Router router_;

    std::unique_ptr<UnixSocketAdapter> unix_;
    std::unique_ptr<HttpAdapter> http_;
    std::vector<std::thread> adapter_threads_;
    std::thread sweeper_thread_;

    std::mutex mutex_;
    std::condition_variable cv_;
    bool started_{false};
    bool stop_requested_{false};
    bool stopped_{false};
};

} // namespace citadel
