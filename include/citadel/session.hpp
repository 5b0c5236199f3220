#pragma once
#include "json_rpc.hpp"
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace citadel {

enum class SessionState {
    Uninitialized,
    AwaitingInitializedNotification,
    Active,
    Closed
};

std::string_view to_string(SessionState s);

struct ClientInfo {
    std::string name;
    std::string version;
};

void from_json(const nlohmann::json& j, ClientInfo& c);

/// Delivers server-initiated envelopes (backend notifications) to a client.
using PushSink = std::function<void(const Envelope&)>;

/// Copy of a session's state at one instant.
struct SessionSnapshot {
    std::string id;
    std::string protocol_version;
    ClientInfo client_info;
    std::string bound_server;
    std::string transport;
    SessionState state{SessionState::Uninitialized};
    std::chrono::steady_clock::time_point last_activity;
};

/// Called with the id of every session that closes, whatever the cause.
using SessionCloseListener = std::function<void(const SessionSnapshot&)>;

/// Owns every client session and enforces the handshake order.
///
/// All methods are thread-safe. Listeners and push sinks are invoked without
/// the manager's lock held.
class SessionManager {
public:
    using Clock = std::chrono::steady_clock;

    SessionManager();

    /// Create a session in Uninitialized state.
    /// Throws GatewayError(UnsupportedProtocolVersion).
    SessionSnapshot create_session(const ClientInfo& client_info,
                                   const std::string& protocol_version,
                                   const std::string& server,
                                   const std::string& transport);

    /// Uninitialized -> AwaitingInitializedNotification, once the initialize
    /// result has been produced for the client.
    void await_initialized(const std::string& id);

    /// AwaitingInitializedNotification -> Active. A no-op on an Active session.
    /// Throws SessionNotFound or HandshakeNotComplete.
    void complete_handshake(const std::string& id);

    /// Throws GatewayError(SessionNotFound) for unknown or closed ids.
    [[nodiscard]] SessionSnapshot lookup(const std::string& id) const;

    /// Lookup that additionally requires the Active state.
    [[nodiscard]] SessionSnapshot require_active(const std::string& id) const;

    [[nodiscard]] bool is_open(const std::string& id) const;

    void touch(const std::string& id);

    void set_push_sink(const std::string& id, PushSink sink);

    /// Close a session from any state. Returns false if it was not open.
    bool close(const std::string& id);

    /// Close every session idle for longer than `max_idle`. A non-empty
    /// `transport` limits the sweep to sessions opened over that transport.
    std::vector<std::string> evict_idle(std::chrono::milliseconds max_idle,
                                        const std::string& transport = {});

    /// Deliver `env` to every Active session bound to `server` that has a
    /// push sink. Returns the number of sessions reached.
    size_t push_to_bound(const std::string& server, const Envelope& env);

    void add_close_listener(SessionCloseListener listener);

    [[nodiscard]] size_t size() const;
    [[nodiscard]] std::vector<std::string> ids() const;

    /// Close every session.
    void close_all();

private:
    struct Entry {
        SessionSnapshot data;
        PushSink sink;
    };

    [[nodiscard]] static std::string generate_id();
    void notify_closed(const std::vector<SessionSnapshot>& closed);

    mutable std::mutex mutex_;
    std::map<std::string, Entry> sessions_;
    std::vector<SessionCloseListener> listeners_;
};

} // namespace citadel
