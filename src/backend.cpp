#include "citadel/backend.hpp"
#include "citadel/error.hpp"
#include "citadel/method.hpp"
#include "citadel/version.hpp"
#include "citadel/transport/process_transport.hpp"
#include <spdlog/spdlog.h>
#include <future>

namespace citadel {

namespace {

void deliver(const std::string& server, CallRecord& rec, Response resp) {
    if (!rec.on_complete) return;
    try {
        rec.on_complete(std::move(resp));
    } catch (const std::exception& e) {
        spdlog::error("backend '{}': delivering {} reply to session {} failed: {}",
                      server, rec.method, rec.session_id, e.what());
    }
}

} // anonymous namespace

std::unique_ptr<ITransport> ProcessConnector::connect(const ServerDefinition& def) {
    return ProcessTransport::spawn(def);
}

std::shared_ptr<BackendConnection> BackendConnection::create(
    std::string server_name,
    std::unique_ptr<ITransport> transport,
    BackendOptions opts,
    BackendNotificationHandler on_notification,
    BackendClosedHandler on_closed) {
    return std::shared_ptr<BackendConnection>(new BackendConnection(
        std::move(server_name), std::move(transport), opts,
        std::move(on_notification), std::move(on_closed)));
}

BackendConnection::BackendConnection(std::string server_name,
                                     std::unique_ptr<ITransport> transport,
                                     BackendOptions opts,
                                     BackendNotificationHandler on_notification,
                                     BackendClosedHandler on_closed)
    : server_name_(std::move(server_name))
    , transport_(std::move(transport))
    , opts_(opts)
    , on_notification_(std::move(on_notification))
    , on_closed_(std::move(on_closed)) {
}

BackendConnection::~BackendConnection() {
    if (reader_thread_.joinable()) {
        // The last reference may be dropped by the reader thread itself.
        if (reader_thread_.get_id() == std::this_thread::get_id()) {
            reader_thread_.detach();
        } else {
            reader_thread_.join();
        }
    }
}

void BackendConnection::start() {
    // The reader keeps the connection alive until the stream ends.
    auto self = shared_from_this();
    reader_thread_ = std::thread([self]() {
        const std::string& name = self->server_name_;
        self->transport_->start(
            [raw = self.get()](Envelope env) { raw->on_message(std::move(env)); },
            [&name](std::exception_ptr ep) {
                try {
                    std::rethrow_exception(ep);
                } catch (const ParseError& e) {
                    spdlog::warn("backend '{}' sent a malformed frame: {}", name, e.what());
                } catch (const std::exception& e) {
                    spdlog::error("backend '{}' transport error: {}", name, e.what());
                }
            });
        self->teardown("stream ended");
    });
}

void BackendConnection::handshake() {
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (state_ != HandshakeState::NotStarted) {
            throw GatewayError(Errc::BackendHandshakeFailed,
                               "Handshake with '" + server_name_ + "' already attempted",
                               server_name_);
        }
        state_ = HandshakeState::InFlight;
    }

    auto promise = std::make_shared<std::promise<Response>>();
    auto fut = promise->get_future();

    CallRecord rec;
    rec.client_id = RequestId{int64_t{0}};
    rec.method = std::string(method::Initialize);
    rec.created_at = CallTable::Clock::now();
    rec.on_complete = [promise](Response r) { promise->set_value(std::move(r)); };

    nlohmann::json params = {
        {"protocolVersion", std::string(PROTOCOL_VERSION)},
        {"capabilities", nlohmann::json::object()},
        {"clientInfo", {{"name", std::string(GATEWAY_NAME)},
                        {"version", std::string(LIBRARY_VERSION)}}}
    };

    GatewayId id = calls_.insert(std::move(rec));
    spdlog::debug("backend '{}': initialize sent as #{}", server_name_, id);
    try {
        transport_->send(Request{RequestId{id}, std::string(method::Initialize), params});
    } catch (const TransportError& e) {
        (void)calls_.resolve(id);
        throw GatewayError(Errc::BackendHandshakeFailed,
                           "Cannot send initialize to '" + server_name_ + "': " + e.what(),
                           server_name_);
    }

    if (fut.wait_for(opts_.handshake_timeout) == std::future_status::timeout) {
        (void)calls_.resolve(id);
        throw GatewayError(Errc::BackendHandshakeFailed,
                           "Backend '" + server_name_ + "' did not answer initialize within " +
                           std::to_string(opts_.handshake_timeout.count()) + " ms",
                           server_name_);
    }

    Response resp = fut.get();
    if (resp.error) {
        throw GatewayError(Errc::BackendHandshakeFailed,
                           "Backend '" + server_name_ + "' rejected initialize: " +
                           resp.error->message,
                           server_name_);
    }
    if (!resp.result || !resp.result->is_object()) {
        throw GatewayError(Errc::BackendHandshakeFailed,
                           "Backend '" + server_name_ + "' returned an invalid InitializeResult",
                           server_name_);
    }

    auto version = resp.result->find("protocolVersion");
    if (version == resp.result->end() || !version->is_string() ||
        !is_supported_protocol_version(version->get<std::string>())) {
        std::string got = version != resp.result->end() ? version->dump() : "none";
        throw GatewayError(Errc::BackendHandshakeFailed,
                           "Backend '" + server_name_ + "' speaks an unsupported protocol version: " +
                           got,
                           server_name_);
    }

    try {
        transport_->send(Notification{std::string(method::Initialized), std::nullopt});
    } catch (const TransportError& e) {
        throw GatewayError(Errc::BackendHandshakeFailed,
                           "Cannot acknowledge initialize on '" + server_name_ + "': " + e.what(),
                           server_name_);
    }

    std::lock_guard<std::mutex> lock(state_mutex_);
    if (state_ == HandshakeState::Closed) {
        throw GatewayError(Errc::BackendHandshakeFailed,
                           "Backend '" + server_name_ + "' closed during handshake",
                           server_name_);
    }
    initialize_result_ = std::move(*resp.result);
    state_ = HandshakeState::Done;
    auto info = initialize_result_.value("serverInfo", nlohmann::json::object());
    if (!info.is_object()) info = nlohmann::json::object();
    spdlog::info("backend '{}' ready ({} {})", server_name_,
                 info.value("name", "unknown"), info.value("version", ""));
}

GatewayId BackendConnection::forward(CallRecord record, const std::string& method,
                                     const std::optional<nlohmann::json>& params) {
    if (!is_live()) {
        throw GatewayError(Errc::BackendUnreachable,
                           "Backend '" + server_name_ + "' is not connected", server_name_);
    }

    GatewayId id;
    try {
        id = calls_.insert(std::move(record));
    } catch (const InvariantError& e) {
        spdlog::error("backend '{}': {}", server_name_, e.what());
        teardown(e.what());
        throw GatewayError(Errc::BackendUnavailable,
                           "Backend '" + server_name_ + "' connection reset", server_name_);
    }

    try {
        transport_->send(Request{RequestId{id}, method, params});
    } catch (const TransportError& e) {
        // If teardown already drained the record, its completion carried the
        // error; reporting it again here would resolve the call twice.
        if (calls_.resolve(id)) {
            teardown(e.what());
            throw GatewayError(Errc::BackendUnreachable,
                               "Backend '" + server_name_ + "' went away: " + e.what(),
                               server_name_);
        }
    }
    return id;
}

void BackendConnection::on_message(Envelope env) {
    if (auto* resp = std::get_if<Response>(&env)) {
        std::optional<CallRecord> rec;
        if (const auto* id = std::get_if<int64_t>(&resp->id)) {
            rec = calls_.resolve(*id);
        }
        if (!rec) {
            spdlog::warn("backend '{}' answered unknown id {}; dropped",
                         server_name_, to_string(resp->id));
            return;
        }
        if (rec->abandoned) {
            spdlog::debug("backend '{}': reply {} for closed session {} discarded",
                          server_name_, to_string(resp->id), rec->session_id);
            return;
        }
        deliver(server_name_, *rec, std::move(*resp));
    } else if (auto* notif = std::get_if<Notification>(&env)) {
        if (on_notification_) {
            on_notification_(server_name_, *notif);
        }
    } else if (auto* req = std::get_if<Request>(&env)) {
        on_backend_request(*req);
    }
}

void BackendConnection::on_backend_request(const Request& req) {
    Response resp;
    resp.id = req.id;
    if (req.method == "ping") {
        resp.result = nlohmann::json::object();
    } else {
        // The connection is shared, so there is no single client to ask.
        spdlog::debug("backend '{}' requested {}; refused", server_name_, req.method);
        resp.error = RpcError{error::MethodNotFound,
                              "Gateway does not relay backend requests: " + req.method,
                              std::nullopt};
    }
    try {
        transport_->send(resp);
    } catch (const TransportError& e) {
        spdlog::debug("backend '{}': cannot answer {}: {}", server_name_, req.method, e.what());
    }
}

void BackendConnection::send_cancel(GatewayId id, const std::string& reason) {
    if (!is_live()) return;
    Notification notif;
    notif.method = std::string(method::Cancelled);
    notif.params = nlohmann::json{{"requestId", id}, {"reason", reason}};
    try {
        transport_->send(notif);
    } catch (const TransportError& e) {
        spdlog::debug("backend '{}': cancel for #{} not sent: {}", server_name_, id, e.what());
    }
}

size_t BackendConnection::expire_calls() {
    auto expired = calls_.expire(opts_.call_timeout);
    for (auto& [id, rec] : expired) {
        send_cancel(id, "timed out");
        if (rec.abandoned) continue;
        spdlog::warn("backend '{}': {} #{} from session {} timed out",
                     server_name_, rec.method, id, rec.session_id);
        deliver(server_name_, rec, make_error_response(
            RequestId{id}, Errc::BackendTimeout,
            "Backend '" + server_name_ + "' did not answer " + rec.method + " within " +
            std::to_string(opts_.call_timeout.count()) + " ms",
            server_name_));
    }
    return expired.size();
}

size_t BackendConnection::cancel_session(const std::string& session_id) {
    auto ids = calls_.abandon_session(session_id);
    for (auto id : ids) {
        send_cancel(id, "client session closed");
    }
    return ids.size();
}

bool BackendConnection::cancel_call(const std::string& session_id, const RequestId& client_id,
                                    const std::string& reason) {
    auto id = calls_.find(session_id, client_id);
    if (!id || !calls_.abandon(*id)) return false;
    send_cancel(*id, reason);
    return true;
}

void BackendConnection::close(const std::string& reason) {
    teardown(reason);
}

void BackendConnection::wait_closed() {
    if (reader_thread_.joinable() && reader_thread_.get_id() != std::this_thread::get_id()) {
        reader_thread_.join();
    }
}

void BackendConnection::teardown(const std::string& reason) {
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (state_ == HandshakeState::Closed) return;
        state_ = HandshakeState::Closed;
    }
    spdlog::warn("backend '{}' connection closed: {}", server_name_, reason);
    transport_->shutdown();

    auto drained = calls_.drain();
    for (auto& [id, rec] : drained) {
        if (rec.abandoned) continue;
        deliver(server_name_, rec, make_error_response(
            RequestId{id}, Errc::BackendUnavailable,
            "Backend '" + server_name_ + "' connection lost: " + reason,
            server_name_));
    }
    if (on_closed_) on_closed_(*this);
}

HandshakeState BackendConnection::handshake_state() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return state_;
}

bool BackendConnection::is_live() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return state_ == HandshakeState::Done;
}

nlohmann::json BackendConnection::initialize_result() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return initialize_result_;
}

} // namespace citadel
