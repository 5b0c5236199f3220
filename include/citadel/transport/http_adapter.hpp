#pragma once
#include "adapter.hpp"
#include "../json_rpc.hpp"
#include "../stats.hpp"
#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

// Forward declarations to avoid including heavy httplib header
namespace httplib {
    class Server;
    struct Request;
    struct Response;
}

namespace citadel {

class Router;

/// HTTP front end. Every POST carries one envelope; sessions are correlated
/// through the Mcp-Session-Id header. A GET with that header opens the
/// session's server-sent event stream, resumable with Last-Event-ID; a GET
/// without it reports gateway status.
class HttpAdapter : public ClientAdapter {
public:
    struct Options {
        std::string host = "127.0.0.1";
        uint16_t port = 3000;
        std::string path = "/mcp";
        std::vector<std::string> allowed_origins;
        /// Upper bound a request worker waits for a forwarded reply. Should
        /// exceed the call timeout so the backend timeout is what clients see.
        std::chrono::milliseconds reply_timeout{65000};
        /// Events kept per session for Last-Event-ID replay.
        size_t event_buffer = 100;
        /// Idle event streams get a comment line this often.
        std::chrono::milliseconds keepalive{15000};
    };

    HttpAdapter(Router& router, Options opts, const GatewayStats* stats = nullptr);
    ~HttpAdapter() override;

    /// Bind the listening socket ahead of start(). Returns the bound port,
    /// which differs from Options::port when that is 0.
    uint16_t bind();

    void start() override;
    void shutdown() override;
    [[nodiscard]] bool is_running() const override { return running_; }

    [[nodiscard]] uint16_t port() const { return port_; }

private:
    class EventLog;
    struct EventLogs;

    void setup_routes();
    [[nodiscard]] bool validate_origin(const std::string& origin) const;

    void handle_post(const httplib::Request& req, httplib::Response& res);
    void handle_get(const httplib::Request& req, httplib::Response& res);
    void handle_status(httplib::Response& res);
    void handle_delete(const httplib::Request& req, httplib::Response& res);

    void handle_request(const Request& rpc, const std::string& session_id,
                        httplib::Response& res);
    void handle_notification(const Notification& notif, const std::string& session_id,
                             httplib::Response& res);

    Router& router_;
    Options opts_;
    const GatewayStats* stats_;
    std::shared_ptr<EventLogs> streams_;
    std::unique_ptr<httplib::Server> server_;
    uint16_t port_;
    bool bound_{false};
    std::atomic<bool> running_{false};
};

} // namespace citadel
