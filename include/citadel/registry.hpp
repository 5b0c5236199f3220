#pragma once
#include "backend.hpp"
#include "config.hpp"
#include "stats.hpp"
#include <atomic>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace citadel {

/// Maps backend names to their single live BackendConnection.
///
/// Connections are established lazily on first use. Concurrent first callers
/// for the same name share one establishment (one connect, one handshake) and
/// all observe its outcome. A connection that closes is dropped, so the next
/// get() reconnects.
class BackendRegistry {
public:
    BackendRegistry(std::vector<ServerDefinition> servers,
                    std::shared_ptr<BackendConnector> connector,
                    BackendOptions opts = {},
                    GatewayStats* stats = nullptr);
    ~BackendRegistry();

    BackendRegistry(const BackendRegistry&) = delete;
    BackendRegistry& operator=(const BackendRegistry&) = delete;

    [[nodiscard]] bool contains(const std::string& server) const;
    [[nodiscard]] std::vector<std::string> server_names() const;

    /// Live connection for `server`, establishing it if needed.
    /// Throws GatewayError: ServerNotFound (no connection attempted),
    /// BackendUnreachable, BackendHandshakeFailed.
    [[nodiscard]] std::shared_ptr<BackendConnection> get(const std::string& server);

    /// Live connection if one exists; never connects.
    [[nodiscard]] std::shared_ptr<BackendConnection> find_live(const std::string& server) const;

    [[nodiscard]] std::vector<std::shared_ptr<BackendConnection>> live_connections() const;

    /// Forget `conn` if it is still the registered connection for its name.
    void remove(const BackendConnection& conn);

    /// Expire timed out calls on every connection. Returns how many expired.
    size_t expire_calls();

    /// Abandon a closed session's calls on every connection.
    size_t cancel_session(const std::string& session_id);

    void set_notification_handler(BackendNotificationHandler handler);

    /// Close every connection and wait for their readers.
    void shutdown();

    /// Establishment attempts so far (stats and tests).
    [[nodiscard]] uint64_t connect_attempts() const { return connect_attempts_; }

private:
    using ConnectionFuture = std::shared_future<std::shared_ptr<BackendConnection>>;

    struct Slot {
        std::shared_ptr<BackendConnection> conn;
        ConnectionFuture pending;  // valid while an establishment is running
    };

    std::shared_ptr<BackendConnection> establish(const ServerDefinition& def);
    void on_backend_notification(const std::string& server, const Notification& notif);

    std::map<std::string, ServerDefinition> servers_;
    std::shared_ptr<BackendConnector> connector_;
    BackendOptions opts_;
    GatewayStats* stats_;

    mutable std::mutex mutex_;
    std::map<std::string, Slot> slots_;
    bool shut_down_{false};

    std::mutex handler_mutex_;
    BackendNotificationHandler notification_handler_;

    std::atomic<uint64_t> connect_attempts_{0};
};

} // namespace citadel
