#include "citadel/session.hpp"
#include "citadel/error.hpp"
#include "citadel/version.hpp"
#include <spdlog/spdlog.h>
#include <iomanip>
#include <random>
#include <sstream>

namespace citadel {

std::string_view to_string(SessionState s) {
    switch (s) {
        case SessionState::Uninitialized:                   return "uninitialized";
        case SessionState::AwaitingInitializedNotification: return "awaiting_initialized";
        case SessionState::Active:                          return "active";
        case SessionState::Closed:                          return "closed";
    }
    return "unknown";
}

void from_json(const nlohmann::json& j, ClientInfo& c) {
    c.name = j.value("name", "");
    c.version = j.value("version", "");
}

SessionManager::SessionManager() = default;

// Session ids are UUID v4 formatted and drawn from std::random_device, which
// reads the kernel CSPRNG on Linux. They are never derived from a seeded PRNG.
std::string SessionManager::generate_id() {
    std::random_device rd;
    auto draw64 = [&rd]() {
        return (static_cast<uint64_t>(rd()) << 32) | static_cast<uint64_t>(rd());
    };
    uint64_t a = draw64(), b = draw64();
    a = (a & 0xFFFFFFFFFFFF0FFFull) | 0x0000000000004000ull;
    b = (b & 0x3FFFFFFFFFFFFFFFull) | 0x8000000000000000ull;
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    oss << std::setw(8)  << (a >> 32);
    oss << "-" << std::setw(4) << ((a >> 16) & 0xFFFF);
    oss << "-" << std::setw(4) << (a & 0xFFFF);
    oss << "-" << std::setw(4) << (b >> 48);
    oss << "-" << std::setw(12) << (b & 0xFFFFFFFFFFFFull);
    return oss.str();
}

SessionSnapshot SessionManager::create_session(const ClientInfo& client_info,
                                               const std::string& protocol_version,
                                               const std::string& server,
                                               const std::string& transport) {
    if (!is_supported_protocol_version(protocol_version)) {
        throw GatewayError(Errc::UnsupportedProtocolVersion,
                           "Unsupported protocol version: " + protocol_version, server);
    }

    Entry entry;
    entry.data.protocol_version = protocol_version;
    entry.data.client_info = client_info;
    entry.data.bound_server = server;
    entry.data.transport = transport;
    entry.data.state = SessionState::Uninitialized;
    entry.data.last_activity = Clock::now();

    std::lock_guard<std::mutex> lock(mutex_);
    std::string id;
    do {
        id = generate_id();
    } while (sessions_.count(id) > 0);
    entry.data.id = id;
    auto snapshot = entry.data;
    sessions_.emplace(id, std::move(entry));
    spdlog::debug("session {} created for server '{}' over {} (client {} {})",
                  id, server, transport, client_info.name, client_info.version);
    return snapshot;
}

void SessionManager::await_initialized(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(id);
    if (it == sessions_.end()) {
        throw GatewayError(Errc::SessionNotFound, "Session not found: " + id);
    }
    if (it->second.data.state == SessionState::Uninitialized) {
        it->second.data.state = SessionState::AwaitingInitializedNotification;
        it->second.data.last_activity = Clock::now();
    }
}

void SessionManager::complete_handshake(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(id);
    if (it == sessions_.end()) {
        throw GatewayError(Errc::SessionNotFound, "Session not found: " + id);
    }
    auto& data = it->second.data;
    switch (data.state) {
        case SessionState::AwaitingInitializedNotification:
            data.state = SessionState::Active;
            data.last_activity = Clock::now();
            spdlog::debug("session {} active", id);
            return;
        case SessionState::Active:
            data.last_activity = Clock::now();
            return;
        case SessionState::Uninitialized:
        case SessionState::Closed:
            break;
    }
    throw GatewayError(Errc::HandshakeNotComplete,
                       "Initialize result not yet delivered for session " + id,
                       data.bound_server);
}

SessionSnapshot SessionManager::lookup(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(id);
    if (it == sessions_.end()) {
        throw GatewayError(Errc::SessionNotFound, "Session not found: " + id);
    }
    return it->second.data;
}

SessionSnapshot SessionManager::require_active(const std::string& id) const {
    auto snapshot = lookup(id);
    if (snapshot.state != SessionState::Active) {
        throw GatewayError(Errc::HandshakeNotComplete,
                           "Session " + id + " has not sent notifications/initialized",
                           snapshot.bound_server);
    }
    return snapshot;
}

bool SessionManager::is_open(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.count(id) > 0;
}

void SessionManager::touch(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(id);
    if (it != sessions_.end()) {
        it->second.data.last_activity = Clock::now();
    }
}

void SessionManager::set_push_sink(const std::string& id, PushSink sink) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(id);
    if (it != sessions_.end()) {
        it->second.sink = std::move(sink);
    }
}

bool SessionManager::close(const std::string& id) {
    std::vector<SessionSnapshot> closed;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = sessions_.find(id);
        if (it == sessions_.end()) return false;
        it->second.data.state = SessionState::Closed;
        closed.push_back(std::move(it->second.data));
        sessions_.erase(it);
    }
    spdlog::debug("session {} closed", id);
    notify_closed(closed);
    return true;
}

std::vector<std::string> SessionManager::evict_idle(std::chrono::milliseconds max_idle,
                                                    const std::string& transport) {
    std::vector<SessionSnapshot> closed;
    auto now = Clock::now();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto it = sessions_.begin(); it != sessions_.end(); ) {
            const auto& data = it->second.data;
            if ((transport.empty() || data.transport == transport) &&
                now - data.last_activity > max_idle) {
                it->second.data.state = SessionState::Closed;
                closed.push_back(std::move(it->second.data));
                it = sessions_.erase(it);
            } else {
                ++it;
            }
        }
    }
    std::vector<std::string> ids;
    ids.reserve(closed.size());
    for (const auto& s : closed) {
        spdlog::info("session {} evicted after idling on '{}'", s.id, s.bound_server);
        ids.push_back(s.id);
    }
    notify_closed(closed);
    return ids;
}

size_t SessionManager::push_to_bound(const std::string& server, const Envelope& env) {
    std::vector<PushSink> sinks;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [id, entry] : sessions_) {
            if (entry.data.bound_server == server &&
                entry.data.state == SessionState::Active && entry.sink) {
                sinks.push_back(entry.sink);
            }
        }
    }
    for (const auto& sink : sinks) {
        sink(env);
    }
    return sinks.size();
}

void SessionManager::add_close_listener(SessionCloseListener listener) {
    std::lock_guard<std::mutex> lock(mutex_);
    listeners_.push_back(std::move(listener));
}

size_t SessionManager::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.size();
}

std::vector<std::string> SessionManager::ids() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> out;
    out.reserve(sessions_.size());
    for (const auto& [id, entry] : sessions_) out.push_back(id);
    return out;
}

void SessionManager::close_all() {
    std::vector<SessionSnapshot> closed;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& [id, entry] : sessions_) {
            entry.data.state = SessionState::Closed;
            closed.push_back(std::move(entry.data));
        }
        sessions_.clear();
    }
    notify_closed(closed);
}

void SessionManager::notify_closed(const std::vector<SessionSnapshot>& closed) {
    if (closed.empty()) return;
    std::vector<SessionCloseListener> listeners;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        listeners = listeners_;
    }
    for (const auto& s : closed) {
        for (const auto& l : listeners) l(s);
    }
}

} // namespace citadel
