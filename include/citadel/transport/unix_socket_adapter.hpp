#pragma once
#include "adapter.hpp"
#include "../json_rpc.hpp"
#include <atomic>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace citadel {

class Router;

/// Persistent newline-delimited JSON-RPC over a Unix-domain socket.
///
/// Each accepted connection carries at most one session at a time and gets
/// its own reader and writer threads. Responses are queued as backends resolve
/// them, so neither a slow call nor a client that stops reading can hold up
/// the backend connection they share. Every failure is
/// reported as a JSON-RPC error envelope. Closing the connection closes the
/// session.
class UnixSocketAdapter : public ClientAdapter {
public:
    struct Options {
        std::string path = "/tmp/mcp-citadel.sock";
        int backlog = 64;
        /// Bytes a connection may have queued for writing before it is
        /// dropped as a client that stopped reading.
        size_t outbound_limit_bytes = 8 * 1024 * 1024;
    };

    UnixSocketAdapter(Router& router, Options opts);
    ~UnixSocketAdapter() override;

    UnixSocketAdapter(const UnixSocketAdapter&) = delete;
    UnixSocketAdapter& operator=(const UnixSocketAdapter&) = delete;

    /// Create the socket file (mode 0600), replacing a stale one. Called by
    /// start() if needed. Throws TransportError, including when another
    /// process is already serving on the path.
    void listen();

    void start() override;
    void shutdown() override;
    [[nodiscard]] bool is_running() const override { return running_; }

private:
    class Connection;

    void accept_loop();
    void reap_finished();
    void close_listener();

    Router& router_;
    Options opts_;

    int listen_fd_{-1};
    int wakeup_pipe_[2]{-1, -1};  // interrupts poll() in the accept loop
    std::atomic<bool> running_{false};
    std::atomic<bool> shutdown_requested_{false};

    mutable std::mutex conns_mutex_;
    std::map<uint64_t, std::shared_ptr<Connection>> conns_;
    uint64_t next_conn_id_{1};
};

} // namespace citadel
