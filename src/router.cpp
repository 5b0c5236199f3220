#include "citadel/router.hpp"
#include "citadel/error.hpp"
#include "citadel/method.hpp"
#include "citadel/version.hpp"
#include <spdlog/spdlog.h>

namespace citadel {

namespace {

nlohmann::json params_object(const std::optional<nlohmann::json>& params) {
    if (!params) return nlohmann::json::object();
    if (!params->is_object()) {
        throw GatewayError(Errc::Malformed, "params must be an object");
    }
    return *params;
}

} // anonymous namespace

Router::Router(SessionManager& sessions, BackendRegistry& registry,
               RouterOptions opts, GatewayStats* stats)
    : sessions_(sessions), registry_(registry), opts_(opts), stats_(stats) {
    // Captures only collaborators that outlive the router's users.
    sessions_.add_close_listener([&registry, stats](const SessionSnapshot& s) {
        if (stats) GatewayStats::bump(stats->sessions_closed);
        size_t n = registry.cancel_session(s.id);
        if (n > 0) {
            spdlog::debug("session {} closed with {} call(s) in flight; cancelled", s.id, n);
        }
    });

    if (opts_.notification_policy == NotificationPolicy::Broadcast) {
        registry_.set_notification_handler(
            [&sessions](const std::string& server, const Notification& notif) {
                size_t n = sessions.push_to_bound(server, notif);
                spdlog::debug("backend '{}' {} pushed to {} session(s)", server, notif.method, n);
            });
    } else {
        registry_.set_notification_handler(
            [](const std::string& server, const Notification& notif) {
                spdlog::debug("backend '{}' {} dropped by policy", server, notif.method);
            });
    }
}

Router::~Router() {
    registry_.set_notification_handler(nullptr);
}

InitializeOutcome Router::initialize(const Request& req, const std::string& transport,
                                     PushSink sink) {
    auto params = params_object(req.params);

    auto server_it = params.find("server");
    if (server_it == params.end() || !server_it->is_string() ||
        server_it->get<std::string>().empty()) {
        throw GatewayError(Errc::MissingServerParameter,
                           "initialize requires params.server naming a backend");
    }
    std::string server = server_it->get<std::string>();
    if (!registry_.contains(server)) {
        throw GatewayError(Errc::ServerNotFound, "Server not found: " + server, server);
    }

    std::string version(PROTOCOL_VERSION);
    if (auto v = params.find("protocolVersion"); v != params.end()) {
        if (!v->is_string()) {
            throw GatewayError(Errc::Malformed, "protocolVersion must be a string", server);
        }
        version = v->get<std::string>();
    }

    ClientInfo client_info;
    if (auto ci = params.find("clientInfo"); ci != params.end() && ci->is_object()) {
        client_info = ci->get<ClientInfo>();
    }

    auto session = sessions_.create_session(client_info, version, server, transport);
    if (stats_) GatewayStats::bump(stats_->sessions_created);

    std::shared_ptr<BackendConnection> conn;
    try {
        conn = registry_.get(server);
    } catch (const std::exception&) {
        sessions_.close(session.id);
        throw;
    }

    nlohmann::json result = conn->initialize_result();
    auto backend_version = result.value("protocolVersion", std::string());
    if (backend_version != version) {
        spdlog::warn("session {}: client negotiated protocol {} but '{}' speaks {}",
                     session.id, version, server, backend_version);
    }
    result["protocolVersion"] = version;

    if (sink) sessions_.set_push_sink(session.id, std::move(sink));
    sessions_.await_initialized(session.id);

    spdlog::info("session {} initialized against '{}' ({}, protocol {})",
                 session.id, server, transport, version);
    return InitializeOutcome{session.id, Response{req.id, std::move(result), std::nullopt}};
}

void Router::notify(const std::string& session_id, const Notification& notif) {
    switch (classify(notif.method)) {
        case MethodKind::Initialized:
            sessions_.complete_handshake(session_id);
            return;
        case MethodKind::Cancelled: {
            auto session = sessions_.require_active(session_id);
            sessions_.touch(session_id);
            cancel(session, notif);
            return;
        }
        case MethodKind::Initialize:
        case MethodKind::Forward:
            break;
    }
    // Backend connections are shared, so a client notification has no
    // unambiguous meaning there.
    (void)sessions_.lookup(session_id);
    spdlog::debug("session {}: notification {} not relayed", session_id, notif.method);
}

void Router::cancel(const SessionSnapshot& session, const Notification& notif) {
    if (!notif.params || !notif.params->is_object() || !notif.params->contains("requestId")) {
        spdlog::debug("session {}: cancellation without requestId ignored", session.id);
        return;
    }
    RequestId client_id;
    try {
        citadel::from_json(notif.params->at("requestId"), client_id);
    } catch (const ParseError& e) {
        spdlog::debug("session {}: cancellation ignored: {}", session.id, e.what());
        return;
    }
    std::string reason = notif.params->value("reason", "cancelled by client");

    auto conn = registry_.find_live(session.bound_server);
    if (!conn || !conn->cancel_call(session.id, client_id, reason)) {
        spdlog::debug("session {}: nothing to cancel for id {}", session.id, to_string(client_id));
    }
}

std::string Router::resolve_server(const SessionSnapshot& session,
                                   const std::optional<nlohmann::json>& params) const {
    if (!params || !params->is_object()) return session.bound_server;
    auto it = params->find("server");
    if (it == params->end()) return session.bound_server;
    if (!it->is_string()) {
        throw GatewayError(Errc::Malformed, "params.server must be a string");
    }
    auto named = it->get<std::string>();
    if (!registry_.contains(named)) {
        throw GatewayError(Errc::ServerNotFound, "Server not found: " + named, named);
    }
    if (named != session.bound_server) {
        throw GatewayError(Errc::InvalidServerBinding,
                           "Session " + session.id + " is bound to '" + session.bound_server +
                           "', not '" + named + "'",
                           named);
    }
    return named;
}

void Router::call(const std::string& session_id, const Request& req, ReplyCallback reply) {
    switch (classify(req.method)) {
        case MethodKind::Forward:
            break;
        case MethodKind::Initialize:
            throw GatewayError(Errc::Malformed, "initialize cannot be sent within a session");
        case MethodKind::Initialized:
        case MethodKind::Cancelled:
            throw GatewayError(Errc::Malformed, req.method + " must be sent as a notification");
    }

    auto session = sessions_.require_active(session_id);
    auto server = resolve_server(session, req.params);
    sessions_.touch(session_id);

    auto conn = registry_.get(server);

    std::optional<nlohmann::json> params = req.params;
    if (params && params->is_object()) params->erase("server");

    CallRecord rec;
    rec.session_id = session_id;
    rec.client_id = req.id;
    rec.method = req.method;
    rec.created_at = CallTable::Clock::now();
    rec.on_complete = [&sessions = sessions_, stats = stats_, session_id,
                       client_id = req.id, reply = std::move(reply)](Response resp) {
        resp.id = client_id;
        if (stats) {
            GatewayStats::bump(resp.error ? stats->calls_failed : stats->calls_completed);
        }
        if (!sessions.is_open(session_id)) {
            spdlog::debug("session {} gone; reply to {} discarded", session_id, to_string(client_id));
            return;
        }
        sessions.touch(session_id);
        reply(std::move(resp));
    };

    try {
        auto gw = conn->forward(std::move(rec), req.method, params);
        if (stats_) GatewayStats::bump(stats_->calls_forwarded);
        spdlog::debug("session {}: {} id {} -> '{}' #{}",
                      session_id, req.method, to_string(req.id), server, gw);
    } catch (const GatewayError& e) {
        if (e.kind == Errc::BackendUnreachable) registry_.remove(*conn);
        throw;
    }
}

bool Router::close_session(const std::string& session_id) {
    return sessions_.close(session_id);
}

} // namespace citadel
