#pragma once
#include "json_rpc.hpp"
#include "registry.hpp"
#include "session.hpp"
#include "stats.hpp"
#include <functional>
#include <optional>
#include <string>

namespace citadel {

/// Receives the response to a forwarded call, with the client's own id.
using ReplyCallback = std::function<void(Response)>;

struct RouterOptions {
    NotificationPolicy notification_policy = NotificationPolicy::Broadcast;
};

struct InitializeOutcome {
    std::string session_id;
    Response response;
};

/// Routes client traffic between sessions and backend connections.
///
/// Sessions are bound to one backend at initialize. Requests may repeat
/// params.server but must name the bound backend; it is stripped before the
/// call is forwarded under a gateway id. Replies come back with the client's
/// id restored, and are discarded if the session closed in the meantime.
class Router {
public:
    Router(SessionManager& sessions, BackendRegistry& registry,
           RouterOptions opts = {}, GatewayStats* stats = nullptr);
    ~Router();

    Router(const Router&) = delete;
    Router& operator=(const Router&) = delete;

    /// Handle a client's initialize: create the session, establish (or reuse)
    /// the backend, and produce the InitializeResult. `sink`, if given,
    /// receives backend notifications once the session is active.
    /// Throws GatewayError.
    InitializeOutcome initialize(const Request& req, const std::string& transport,
                                 PushSink sink = nullptr);

    /// Handle a client notification within a session.
    /// Throws GatewayError(SessionNotFound, HandshakeNotComplete).
    void notify(const std::string& session_id, const Notification& notif);

    /// Forward a client request. Failures detected before the call reaches
    /// the backend are thrown as GatewayError; everything after that arrives
    /// through `reply`, exactly once.
    void call(const std::string& session_id, const Request& req, ReplyCallback reply);

    /// Close a session; its outstanding calls are cancelled at the backend.
    bool close_session(const std::string& session_id);

    [[nodiscard]] SessionManager& sessions() { return sessions_; }
    [[nodiscard]] BackendRegistry& registry() { return registry_; }

private:
    std::string resolve_server(const SessionSnapshot& session,
                               const std::optional<nlohmann::json>& params) const;
    void cancel(const SessionSnapshot& session, const Notification& notif);

    SessionManager& sessions_;
    BackendRegistry& registry_;
    RouterOptions opts_;
    GatewayStats* stats_;
};

} // namespace citadel
