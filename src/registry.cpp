#include "citadel/registry.hpp"
#include "citadel/error.hpp"
#include <spdlog/spdlog.h>

namespace citadel {

BackendRegistry::BackendRegistry(std::vector<ServerDefinition> servers,
                                 std::shared_ptr<BackendConnector> connector,
                                 BackendOptions opts,
                                 GatewayStats* stats)
    : connector_(std::move(connector)), opts_(opts), stats_(stats) {
    for (auto& def : servers) {
        std::string name = def.name;
        servers_.emplace(std::move(name), std::move(def));
    }
}

BackendRegistry::~BackendRegistry() {
    shutdown();
}

bool BackendRegistry::contains(const std::string& server) const {
    return servers_.count(server) > 0;
}

std::vector<std::string> BackendRegistry::server_names() const {
    std::vector<std::string> names;
    names.reserve(servers_.size());
    for (const auto& [name, def] : servers_) names.push_back(name);
    return names;
}

std::shared_ptr<BackendConnection> BackendRegistry::get(const std::string& server) {
    auto def = servers_.find(server);
    if (def == servers_.end()) {
        throw GatewayError(Errc::ServerNotFound, "Server not found: " + server, server);
    }

    std::promise<std::shared_ptr<BackendConnection>> promise;
    {
        std::unique_lock<std::mutex> lock(mutex_);
        if (shut_down_) {
            throw GatewayError(Errc::BackendUnreachable, "Gateway is shutting down", server);
        }
        auto& slot = slots_[server];
        if (slot.conn && slot.conn->is_live()) {
            return slot.conn;
        }
        if (slot.pending.valid()) {
            auto pending = slot.pending;
            lock.unlock();
            return pending.get();  // rethrows the establisher's failure
        }
        slot.conn.reset();
        slot.pending = promise.get_future().share();
    }

    std::shared_ptr<BackendConnection> conn;
    try {
        conn = establish(def->second);
    } catch (const std::exception&) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            slots_.erase(server);
        }
        promise.set_exception(std::current_exception());
        throw;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& slot = slots_[server];
        slot.conn = conn;
        slot.pending = ConnectionFuture{};
    }
    promise.set_value(conn);
    return conn;
}

std::shared_ptr<BackendConnection> BackendRegistry::establish(const ServerDefinition& def) {
    ++connect_attempts_;
    if (stats_) GatewayStats::bump(stats_->backend_connects);
    spdlog::info("connecting to backend '{}'", def.name);

    std::unique_ptr<ITransport> transport;
    try {
        transport = connector_->connect(def);
    } catch (const std::exception& e) {
        spdlog::error("backend '{}' unreachable: {}", def.name, e.what());
        throw GatewayError(Errc::BackendUnreachable,
                           "Cannot reach backend '" + def.name + "': " + e.what(), def.name);
    }

    auto conn = BackendConnection::create(
        def.name, std::move(transport), opts_,
        [this](const std::string& server, const Notification& notif) {
            on_backend_notification(server, notif);
        },
        [this](const BackendConnection& closed) { remove(closed); });
    conn->start();

    try {
        conn->handshake();
    } catch (const GatewayError& e) {
        spdlog::error("backend '{}' handshake failed: {}", def.name, e.what());
        conn->close("handshake failed");
        throw;
    }
    if (stats_) GatewayStats::bump(stats_->backend_handshakes);
    return conn;
}

std::shared_ptr<BackendConnection> BackendRegistry::find_live(const std::string& server) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = slots_.find(server);
    if (it == slots_.end() || !it->second.conn || !it->second.conn->is_live()) return nullptr;
    return it->second.conn;
}

std::vector<std::shared_ptr<BackendConnection>> BackendRegistry::live_connections() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::shared_ptr<BackendConnection>> out;
    for (const auto& [name, slot] : slots_) {
        if (slot.conn && slot.conn->is_live()) out.push_back(slot.conn);
    }
    return out;
}

void BackendRegistry::remove(const BackendConnection& conn) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = slots_.find(conn.server_name());
    if (it == slots_.end() || it->second.conn.get() != &conn) return;
    if (stats_) GatewayStats::bump(stats_->backend_teardowns);
    if (it->second.pending.valid()) {
        it->second.conn.reset();
    } else {
        slots_.erase(it);
    }
    spdlog::info("backend '{}' removed from registry; next use reconnects", conn.server_name());
}

size_t BackendRegistry::expire_calls() {
    size_t n = 0;
    for (const auto& conn : live_connections()) {
        n += conn->expire_calls();
    }
    return n;
}

size_t BackendRegistry::cancel_session(const std::string& session_id) {
    size_t n = 0;
    for (const auto& conn : live_connections()) {
        n += conn->cancel_session(session_id);
    }
    return n;
}

void BackendRegistry::set_notification_handler(BackendNotificationHandler handler) {
    std::lock_guard<std::mutex> lock(handler_mutex_);
    notification_handler_ = std::move(handler);
}

void BackendRegistry::on_backend_notification(const std::string& server, const Notification& notif) {
    BackendNotificationHandler handler;
    {
        std::lock_guard<std::mutex> lock(handler_mutex_);
        handler = notification_handler_;
    }
    if (handler) {
        handler(server, notif);
    } else {
        spdlog::debug("backend '{}' notification {} dropped", server, notif.method);
    }
}

void BackendRegistry::shutdown() {
    std::vector<std::shared_ptr<BackendConnection>> conns;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        shut_down_ = true;
        for (auto& [name, slot] : slots_) {
            if (slot.conn) conns.push_back(slot.conn);
        }
    }
    for (const auto& conn : conns) conn->close("gateway shutting down");
    for (const auto& conn : conns) conn->wait_closed();
}

} // namespace citadel
