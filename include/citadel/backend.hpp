#pragma once
#include "call_table.hpp"
#include "config.hpp"
#include "json_rpc.hpp"
#include "transport/transport.hpp"
#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace citadel {

/// Opens the transport to a named backend.
class BackendConnector {
public:
    virtual ~BackendConnector() = default;

    /// Throws on failure; the registry reports it as BackendUnreachable.
    [[nodiscard]] virtual std::unique_ptr<ITransport> connect(const ServerDefinition& def) = 0;
};

/// Spawns the backend's command and talks to it over its stdin/stdout.
class ProcessConnector : public BackendConnector {
public:
    [[nodiscard]] std::unique_ptr<ITransport> connect(const ServerDefinition& def) override;
};

enum class HandshakeState {
    NotStarted,
    InFlight,
    Done,
    Closed
};

struct BackendOptions {
    std::chrono::milliseconds handshake_timeout{10000};
    std::chrono::milliseconds call_timeout{60000};
};

class BackendConnection;

using BackendNotificationHandler =
    std::function<void(const std::string& server, const Notification& notif)>;
using BackendClosedHandler = std::function<void(const BackendConnection& conn)>;

/// The gateway's single shared link to one backend server.
///
/// Calls from many sessions are multiplexed on one stream: every forwarded
/// request is re-numbered with a gateway id from the connection's CallTable,
/// and responses are matched back through it. A reader thread owns the
/// inbound side. When the stream ends, every outstanding call resolves to
/// BackendUnavailable and the closed handler fires once.
class BackendConnection : public std::enable_shared_from_this<BackendConnection> {
public:
    [[nodiscard]] static std::shared_ptr<BackendConnection> create(
        std::string server_name,
        std::unique_ptr<ITransport> transport,
        BackendOptions opts,
        BackendNotificationHandler on_notification = nullptr,
        BackendClosedHandler on_closed = nullptr);

    ~BackendConnection();

    BackendConnection(const BackendConnection&) = delete;
    BackendConnection& operator=(const BackendConnection&) = delete;

    /// Start the reader thread.
    void start();

    /// Run initialize / notifications/initialized with the backend.
    /// Throws GatewayError(BackendHandshakeFailed).
    void handshake();

    /// Send a call on behalf of a session. The record's completion fires
    /// exactly once, possibly before forward() returns.
    /// Throws GatewayError(BackendUnreachable) if the connection is dead.
    GatewayId forward(CallRecord record, const std::string& method,
                      const std::optional<nlohmann::json>& params);

    /// Resolve calls older than the call timeout to BackendTimeout.
    size_t expire_calls();

    /// Abandon a closed session's calls and tell the backend to cancel them.
    size_t cancel_session(const std::string& session_id);

    /// Relay a client's cancellation of one of its calls.
    bool cancel_call(const std::string& session_id, const RequestId& client_id,
                     const std::string& reason);

    /// Tear the connection down; outstanding calls get BackendUnavailable.
    void close(const std::string& reason);

    /// Join the reader thread (no-op from the reader thread itself).
    void wait_closed();

    [[nodiscard]] const std::string& server_name() const { return server_name_; }
    [[nodiscard]] HandshakeState handshake_state() const;
    [[nodiscard]] bool is_live() const;
    [[nodiscard]] nlohmann::json initialize_result() const;
    [[nodiscard]] size_t pending_calls() const { return calls_.size(); }

private:
    BackendConnection(std::string server_name,
                      std::unique_ptr<ITransport> transport,
                      BackendOptions opts,
                      BackendNotificationHandler on_notification,
                      BackendClosedHandler on_closed);

    void on_message(Envelope env);
    void on_backend_request(const Request& req);
    void send_cancel(GatewayId id, const std::string& reason);
    void teardown(const std::string& reason);

    std::string server_name_;
    std::unique_ptr<ITransport> transport_;
    BackendOptions opts_;
    BackendNotificationHandler on_notification_;
    BackendClosedHandler on_closed_;

    CallTable calls_;
    std::thread reader_thread_;

    mutable std::mutex state_mutex_;
    HandshakeState state_{HandshakeState::NotStarted};
    nlohmann::json initialize_result_;
};

} // namespace citadel
