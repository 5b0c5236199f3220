#include "citadel/transport/http_adapter.hpp"
#include "citadel/codec.hpp"
#include "citadel/error.hpp"
#include "citadel/method.hpp"
#include "citadel/router.hpp"
#include "citadel/version.hpp"

#include <httplib.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <condition_variable>
#include <deque>
#include <future>
#include <map>
#include <mutex>
#include <stdexcept>
#include <vector>

namespace citadel {

namespace {

constexpr const char* kJson = "application/json";
constexpr const char* kSessionHeader = "Mcp-Session-Id";
constexpr const char* kVersionHeader = "MCP-Protocol-Version";
constexpr const char* kLastEventHeader = "Last-Event-ID";
constexpr const char* kEventStream = "text/event-stream";

void reply_json(httplib::Response& res, int status, const nlohmann::json& body) {
    res.status = status;
    res.set_content(body.dump(), kJson);
}

void reply_envelope(httplib::Response& res, const Response& resp) {
    nlohmann::json j;
    to_json(j, resp);
    reply_json(res, 200, j);
}

/// Error for a request whose id is known. Backend-side kinds travel as a
/// 200 carrying a JSON-RPC error; the rest map to an HTTP status.
void reply_error(httplib::Response& res, const RequestId& id, const GatewayError& e) {
    nlohmann::json j;
    to_json(j, make_error_response(id, e.kind, e.what(), e.server));
    reply_json(res, http_status(e.kind), j);
}

void reply_null_id_error(httplib::Response& res, Errc kind, const std::string& msg,
                         const std::string& server = {}) {
    reply_json(res, http_status(kind), make_null_id_error(kind, msg, server));
}

void reply_internal_error(httplib::Response& res, const char* what) {
    nlohmann::json j = {
        {"jsonrpc", std::string(JSONRPC_VERSION)},
        {"id", nullptr},
        {"error", {{"code", error::InternalError}, {"message", what}}}
    };
    reply_json(res, 500, j);
}

} // anonymous namespace

// ---------- EventLog ----------

/// Server-sent events of one HTTP session. The newest events are kept so a
/// client can resume a dropped stream.
class HttpAdapter::EventLog {
public:
    struct Event {
        uint64_t id;
        std::string data;
    };

    explicit EventLog(size_t capacity) : capacity_(std::max<size_t>(capacity, 1)) {}

    void publish(const Envelope& env) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_) return;
            events_.push_back(Event{next_id_++, Codec::encode(env)});
            if (events_.size() > capacity_) events_.pop_front();
        }
        cv_.notify_all();
    }

    /// Buffered events with an id above `after`, waiting up to `timeout` for
    /// the first. Empty on timeout and once closed.
    std::vector<Event> wait_after(uint64_t after, std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait_for(lock, timeout, [&] {
            return closed_ || (!events_.empty() && events_.back().id > after);
        });
        std::vector<Event> out;
        if (closed_) return out;
        for (const auto& e : events_) {
            if (e.id > after) out.push_back(e);
        }
        if (!out.empty() && out.front().id > after + 1) {
            spdlog::debug("http: {} event(s) after #{} no longer buffered",
                          out.front().id - after - 1, after);
        }
        return out;
    }

    /// Highest id written to any stream; a stream opened without
    /// Last-Event-ID resumes from here.
    [[nodiscard]] uint64_t delivered() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return delivered_;
    }

    void mark_delivered(uint64_t id) {
        std::lock_guard<std::mutex> lock(mutex_);
        delivered_ = std::max(delivered_, id);
    }

    void close() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
        }
        cv_.notify_all();
    }

    [[nodiscard]] bool closed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

private:
    size_t capacity_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<Event> events_;
    uint64_t next_id_{1};
    uint64_t delivered_{0};
    bool closed_{false};
};

/// Event logs by session id. Shared with the session close listener, which
/// may outlive the adapter.
struct HttpAdapter::EventLogs {
    std::mutex mutex;
    std::map<std::string, std::shared_ptr<EventLog>> by_session;

    std::shared_ptr<EventLog> find(const std::string& session_id) {
        std::lock_guard<std::mutex> lock(mutex);
        auto it = by_session.find(session_id);
        return it == by_session.end() ? nullptr : it->second;
    }

    void close(const std::string& session_id) {
        std::shared_ptr<EventLog> log;
        {
            std::lock_guard<std::mutex> lock(mutex);
            auto it = by_session.find(session_id);
            if (it == by_session.end()) return;
            log = std::move(it->second);
            by_session.erase(it);
        }
        log->close();
    }

    void close_all() {
        std::map<std::string, std::shared_ptr<EventLog>> logs;
        {
            std::lock_guard<std::mutex> lock(mutex);
            logs.swap(by_session);
        }
        for (auto& [id, log] : logs) log->close();
    }
};

// ---------- HttpAdapter ----------

HttpAdapter::HttpAdapter(Router& router, Options opts, const GatewayStats* stats)
    : router_(router)
    , opts_(std::move(opts))
    , stats_(stats)
    , streams_(std::make_shared<EventLogs>())
    , server_(std::make_unique<httplib::Server>())
    , port_(opts_.port) {
    std::weak_ptr<EventLogs> weak = streams_;
    router_.sessions().add_close_listener([weak](const SessionSnapshot& s) {
        if (auto streams = weak.lock()) streams->close(s.id);
    });
    setup_routes();
}

HttpAdapter::~HttpAdapter() {
    shutdown();
}

bool HttpAdapter::validate_origin(const std::string& origin) const {
    if (opts_.allowed_origins.empty()) return true;
    for (const auto& allowed : opts_.allowed_origins) {
        if (origin == allowed) return true;
    }
    return false;
}

void HttpAdapter::setup_routes() {
    const std::string path = opts_.path;

    server_->Post(path, [this](const httplib::Request& req, httplib::Response& res) {
        handle_post(req, res);
    });

    server_->Get(path, [this](const httplib::Request& req, httplib::Response& res) {
        auto origin = req.get_header_value("Origin");
        if (!origin.empty() && !validate_origin(origin)) {
            reply_json(res, 403, {{"error", "Invalid origin"}});
            return;
        }
        handle_get(req, res);
    });

    server_->Delete(path, [this](const httplib::Request& req, httplib::Response& res) {
        handle_delete(req, res);
    });
}

void HttpAdapter::handle_post(const httplib::Request& req, httplib::Response& res) {
    // Validate Origin header for DNS rebinding protection
    auto origin = req.get_header_value("Origin");
    if (!origin.empty() && !validate_origin(origin)) {
        reply_json(res, 403, {{"error", "Invalid origin"}});
        return;
    }

    auto proto_ver = req.get_header_value(kVersionHeader);
    if (!proto_ver.empty() && !is_supported_protocol_version(proto_ver)) {
        reply_null_id_error(res, Errc::UnsupportedProtocolVersion,
                            "Unsupported protocol version: " + proto_ver);
        return;
    }

    auto first = req.body.find_first_not_of(" \t\r\n");
    if (first != std::string::npos && req.body[first] == '[') {
        reply_null_id_error(res, Errc::Malformed, "Batch requests are not supported");
        return;
    }

    Envelope env;
    try {
        env = Codec::decode(req.body);
    } catch (const ParseError& e) {
        spdlog::debug("http: malformed body: {}", e.what());
        reply_null_id_error(res, Errc::Malformed, e.what());
        return;
    }

    std::string session_id = req.get_header_value(kSessionHeader);
    try {
        if (auto* rpc = std::get_if<Request>(&env)) {
            handle_request(*rpc, session_id, res);
        } else if (auto* notif = std::get_if<Notification>(&env)) {
            handle_notification(*notif, session_id, res);
        } else {
            // Backend requests are never relayed, so there is nothing to answer.
            spdlog::debug("http: unsolicited response envelope ignored");
            res.status = 202;
        }
    } catch (const std::exception& e) {
        spdlog::error("http: request failed: {}", e.what());
        reply_internal_error(res, e.what());
    }
}

void HttpAdapter::handle_request(const Request& rpc, const std::string& session_id,
                                 httplib::Response& res) {
    if (classify(rpc.method) == MethodKind::Initialize) {
        try {
            auto log = std::make_shared<EventLog>(opts_.event_buffer);
            PushSink sink = [log](const Envelope& env) { log->publish(env); };
            auto outcome = router_.initialize(rpc, "http", std::move(sink));
            {
                std::lock_guard<std::mutex> lock(streams_->mutex);
                streams_->by_session[outcome.session_id] = log;
            }
            // The close listener may already have run for this id.
            if (!router_.sessions().is_open(outcome.session_id)) {
                streams_->close(outcome.session_id);
            }
            res.set_header(kSessionHeader, outcome.session_id);
            reply_envelope(res, outcome.response);
        } catch (const GatewayError& e) {
            spdlog::info("http: initialize failed ({}): {}", to_string(e.kind), e.what());
            reply_error(res, rpc.id, e);
        }
        return;
    }

    if (session_id.empty()) {
        reply_error(res, rpc.id, GatewayError(Errc::HandshakeNotComplete,
            std::string(kSessionHeader) + " header required; send initialize first"));
        return;
    }

    auto promise = std::make_shared<std::promise<Response>>();
    auto reply = promise->get_future();
    try {
        router_.call(session_id, rpc, [promise](Response r) {
            promise->set_value(std::move(r));
        });
    } catch (const GatewayError& e) {
        if (e.kind != Errc::SessionNotFound) res.set_header(kSessionHeader, session_id);
        reply_error(res, rpc.id, e);
        return;
    }

    res.set_header(kSessionHeader, session_id);
    if (reply.wait_for(opts_.reply_timeout) == std::future_status::timeout) {
        reply_error(res, rpc.id, GatewayError(Errc::BackendTimeout,
            "No reply to " + rpc.method + " within " +
            std::to_string(opts_.reply_timeout.count()) + " ms"));
        return;
    }
    reply_envelope(res, reply.get());
}

void HttpAdapter::handle_notification(const Notification& notif, const std::string& session_id,
                                      httplib::Response& res) {
    if (session_id.empty()) {
        reply_null_id_error(res, Errc::HandshakeNotComplete,
            std::string(kSessionHeader) + " header required; send initialize first");
        return;
    }
    try {
        router_.notify(session_id, notif);
    } catch (const GatewayError& e) {
        reply_null_id_error(res, e.kind, e.what(), e.server);
        return;
    }
    res.set_header(kSessionHeader, session_id);
    res.status = 202;
}

void HttpAdapter::handle_get(const httplib::Request& req, httplib::Response& res) {
    std::string session_id = req.get_header_value(kSessionHeader);
    if (session_id.empty()) {
        handle_status(res);
        return;
    }

    auto log = streams_->find(session_id);
    if (!log || !router_.sessions().is_open(session_id)) {
        reply_null_id_error(res, Errc::SessionNotFound, "Unknown session " + session_id);
        return;
    }

    uint64_t cursor = log->delivered();
    auto last_event = req.get_header_value(kLastEventHeader);
    if (!last_event.empty()) {
        try {
            size_t used = 0;
            cursor = std::stoull(last_event, &used);
            if (used != last_event.size()) throw std::invalid_argument(last_event);
        } catch (const std::exception&) {
            reply_null_id_error(res, Errc::Malformed, "Invalid Last-Event-ID: " + last_event);
            return;
        }
    }
    router_.sessions().touch(session_id);
    spdlog::debug("http: session {} opened its event stream after #{}", session_id, cursor);

    res.set_header(kSessionHeader, session_id);
    res.set_header("Cache-Control", "no-cache");
    SessionManager& sessions = router_.sessions();
    res.set_chunked_content_provider(kEventStream,
        [log, cursor, session_id, &sessions, keepalive = opts_.keepalive](
            size_t /*offset*/, httplib::DataSink& sink) mutable -> bool {
            auto events = log->wait_after(cursor, keepalive);
            if (log->closed()) {
                sink.done();
                return true;
            }
            if (events.empty()) {
                static const std::string ping = ": keepalive\n\n";
                return sink.write(ping.data(), ping.size());
            }
            for (const auto& e : events) {
                std::string frame = "id: " + std::to_string(e.id) + "\ndata: " + e.data + "\n\n";
                if (!sink.write(frame.data(), frame.size())) return false;
                cursor = e.id;
                log->mark_delivered(e.id);
            }
            sessions.touch(session_id);
            return true;
        });
}

void HttpAdapter::handle_status(httplib::Response& res) {
    nlohmann::json backends = nlohmann::json::array();
    for (const auto& conn : router_.registry().live_connections()) {
        backends.push_back(conn->server_name());
    }
    nlohmann::json body = {
        {"status", "ok"},
        {"name", std::string(GATEWAY_NAME)},
        {"version", std::string(LIBRARY_VERSION)},
        {"sessions", router_.sessions().size()},
        {"servers", router_.registry().server_names()},
        {"backends", backends}
    };
    if (stats_) to_json(body["stats"], *stats_);
    reply_json(res, 200, body);
}

void HttpAdapter::handle_delete(const httplib::Request& req, httplib::Response& res) {
    std::string session_id = req.get_header_value(kSessionHeader);
    if (session_id.empty()) {
        res.status = 400;
        return;
    }
    res.status = router_.close_session(session_id) ? 200 : 404;
}

uint16_t HttpAdapter::bind() {
    if (bound_) return port_;
    if (opts_.port == 0) {
        int port = server_->bind_to_any_port(opts_.host);
        if (port < 0) {
            throw TransportError("Failed to bind HTTP server on " + opts_.host);
        }
        port_ = static_cast<uint16_t>(port);
    } else if (!server_->bind_to_port(opts_.host, opts_.port)) {
        throw TransportError("Failed to bind HTTP server on " + opts_.host + ":" +
                             std::to_string(opts_.port));
    }
    bound_ = true;
    return port_;
}

void HttpAdapter::start() {
    if (running_.exchange(true)) return;
    try {
        bind();
    } catch (const TransportError&) {
        running_ = false;
        throw;
    }
    spdlog::info("http: listening on {}:{}{}", opts_.host, port_, opts_.path);
    if (!server_->listen_after_bind() && running_) {
        running_ = false;
        throw TransportError("HTTP server on " + opts_.host + ":" +
                             std::to_string(port_) + " stopped unexpectedly");
    }
    running_ = false;
}

void HttpAdapter::shutdown() {
    // Open event streams hold server workers until their log closes.
    streams_->close_all();
    running_ = false;
    server_->stop();
}

} // namespace citadel
