#include "citadel/transport/unix_socket_adapter.hpp"
#include "citadel/codec.hpp"
#include "citadel/error.hpp"
#include "citadel/method.hpp"
#include "citadel/router.hpp"
#include "citadel/version.hpp"

#include <spdlog/spdlog.h>

#include <sys/socket.h>
#include <sys/stat.h>
#include <sys/un.h>
#include <fcntl.h>
#include <poll.h>
#include <unistd.h>
#include <cerrno>
#include <condition_variable>
#include <cstring>
#include <deque>
#include <vector>

namespace citadel {

namespace {

std::string errno_text(const std::string& what) {
    return what + ": " + std::strerror(errno);
}

sockaddr_un make_address(const std::string& path) {
    sockaddr_un addr{};
    addr.sun_family = AF_UNIX;
    if (path.empty() || path.size() >= sizeof(addr.sun_path)) {
        throw TransportError("Invalid socket path: '" + path + "'");
    }
    std::memcpy(addr.sun_path, path.c_str(), path.size() + 1);
    return addr;
}

/// Unlink a leftover socket file. Refuses to touch anything that is not a
/// socket, or a socket somebody is still accepting on.
void remove_stale_socket(const std::string& path) {
    struct stat st{};
    if (::lstat(path.c_str(), &st) < 0) {
        if (errno == ENOENT) return;
        throw TransportError(errno_text("Cannot stat " + path));
    }
    if (!S_ISSOCK(st.st_mode)) {
        throw TransportError(path + " exists and is not a socket");
    }

    int peer = ::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (peer < 0) throw TransportError(errno_text("socket"));
    auto addr = make_address(path);
    int rc = ::connect(peer, reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
    ::close(peer);
    if (rc == 0) {
        throw TransportError("Another gateway is already listening on " + path);
    }

    spdlog::info("unix: removing stale socket {}", path);
    if (::unlink(path.c_str()) < 0 && errno != ENOENT) {
        throw TransportError(errno_text("Cannot remove " + path));
    }
}

} // anonymous namespace

// ---------- Connection ----------

class UnixSocketAdapter::Connection : public std::enable_shared_from_this<Connection> {
public:
    Connection(Router& router, int fd, uint64_t id, size_t outbound_limit)
        : router_(router), fd_(fd), id_(id), outbound_limit_(outbound_limit) {}

    ~Connection() {
        if (reader_thread_.joinable()) reader_thread_.detach();
        if (writer_thread_.joinable()) writer_thread_.detach();
        ::close(fd_);
    }

    void start() {
        auto self = shared_from_this();
        writer_thread_ = std::thread([self]() { self->write_loop(); });
        reader_thread_ = std::thread([self]() { self->run(); });
    }

    /// Make the reader's read() and the writer's send() return.
    void interrupt() { ::shutdown(fd_, SHUT_RDWR); }

    void join() {
        if (reader_thread_.joinable()) reader_thread_.join();
        if (writer_thread_.joinable()) writer_thread_.join();
    }

    [[nodiscard]] bool finished() const { return finished_; }

    void write(const Envelope& env) {
        write_frame(Codec::encode(env));
    }

    /// Queue one frame for the writer thread. Never blocks on the socket, so
    /// backend readers and the sweeper can call it. A client that lets more
    /// than the outbound limit pile up is disconnected.
    void write_frame(std::string frame) {
        frame += '\n';
        {
            std::lock_guard<std::mutex> lock(write_mutex_);
            if (closing_) return;
            if (outbox_.empty() || outbox_bytes_ + frame.size() <= outbound_limit_) {
                outbox_bytes_ += frame.size();
                outbox_.push_back(std::move(frame));
                write_cv_.notify_one();
                return;
            }
            spdlog::warn("unix: connection {} is not reading; {} byte(s) queued, disconnecting",
                         id_, outbox_bytes_);
        }
        stop_writer();
        interrupt();
    }

private:
    void write_loop() {
        while (true) {
            std::string frame;
            {
                std::unique_lock<std::mutex> lock(write_mutex_);
                write_cv_.wait(lock, [this] { return closing_ || !outbox_.empty(); });
                if (closing_) return;
                frame = std::move(outbox_.front());
                outbox_.pop_front();
                outbox_bytes_ -= frame.size();
            }
            if (!send_all(frame)) {
                stop_writer();
                interrupt();
                return;
            }
        }
    }

    bool send_all(const std::string& frame) {
        const char* data = frame.data();
        size_t remaining = frame.size();
        while (remaining > 0) {
            ssize_t n = ::send(fd_, data, remaining, MSG_NOSIGNAL);
            if (n < 0) {
                if (errno == EINTR) continue;
                spdlog::debug("unix: connection {} write failed: {}", id_, std::strerror(errno));
                return false;
            }
            data += n;
            remaining -= static_cast<size_t>(n);
        }
        return true;
    }

    void stop_writer() {
        {
            std::lock_guard<std::mutex> lock(write_mutex_);
            closing_ = true;
            outbox_.clear();
            outbox_bytes_ = 0;
        }
        write_cv_.notify_one();
    }

    void run() {
        std::string buffer;
        char chunk[4096];
        while (true) {
            ssize_t n = ::read(fd_, chunk, sizeof(chunk));
            if (n < 0) {
                if (errno == EINTR) continue;
                spdlog::debug("unix: connection {} read failed: {}", id_, std::strerror(errno));
                break;
            }
            if (n == 0) break;
            buffer.append(chunk, static_cast<size_t>(n));

            size_t pos = 0;
            while (true) {
                size_t nl = buffer.find('\n', pos);
                if (nl == std::string::npos) break;
                std::string_view line(buffer.data() + pos, nl - pos);
                pos = nl + 1;
                if (line.empty() || line == "\r") continue;
                handle_line(line);
            }
            if (pos > 0) buffer.erase(0, pos);
        }

        stop_writer();
        std::string session = current_session();
        if (!session.empty() && router_.close_session(session)) {
            spdlog::info("unix: connection {} closed; session {} ended", id_, session);
        }
        finished_ = true;
    }

    void handle_line(std::string_view line) {
        Envelope env;
        try {
            env = Codec::decode_line(line);
        } catch (const ParseError& e) {
            spdlog::debug("unix: connection {} sent a malformed frame: {}", id_, e.what());
            write_frame(make_null_id_error(Errc::Malformed, e.what()).dump());
            return;
        }

        try {
            if (auto* req = std::get_if<Request>(&env)) {
                handle_request(*req);
            } else if (auto* notif = std::get_if<Notification>(&env)) {
                handle_notification(*notif);
            } else {
                spdlog::debug("unix: connection {}: unsolicited response ignored", id_);
            }
        } catch (const std::exception& e) {
            spdlog::error("unix: connection {}: {}", id_, e.what());
            nlohmann::json err = {
                {"jsonrpc", std::string(JSONRPC_VERSION)},
                {"id", nullptr},
                {"error", {{"code", error::InternalError}, {"message", e.what()}}}
            };
            if (auto* req = std::get_if<Request>(&env)) to_json(err["id"], req->id);
            write_frame(err.dump());
        }
    }

    void handle_request(const Request& req) {
        if (classify(req.method) == MethodKind::Initialize) {
            initialize(req);
            return;
        }

        std::string session = current_session();
        if (session.empty()) {
            write(make_error_response(req.id, Errc::HandshakeNotComplete,
                                      "Send initialize before " + req.method));
            return;
        }
        try {
            std::weak_ptr<Connection> weak = shared_from_this();
            router_.call(session, req, [weak](Response resp) {
                if (auto conn = weak.lock()) conn->write(resp);
            });
        } catch (const GatewayError& e) {
            write(make_error_response(req.id, e.kind, e.what(), e.server));
        }
    }

    void initialize(const Request& req) {
        // A new initialize replaces the connection's current session.
        std::string previous = current_session();
        if (!previous.empty()) {
            router_.close_session(previous);
            set_session({});
            spdlog::info("unix: connection {} re-initialized; session {} closed", id_, previous);
        }

        std::weak_ptr<Connection> weak = shared_from_this();
        PushSink sink = [weak](const Envelope& env) {
            if (auto conn = weak.lock()) conn->write(env);
        };
        try {
            auto outcome = router_.initialize(req, "unix", std::move(sink));
            set_session(outcome.session_id);
            write(outcome.response);
        } catch (const GatewayError& e) {
            spdlog::info("unix: connection {} initialize failed ({}): {}",
                         id_, to_string(e.kind), e.what());
            write(make_error_response(req.id, e.kind, e.what(), e.server));
        }
    }

    void handle_notification(const Notification& notif) {
        std::string session = current_session();
        if (session.empty()) {
            write_frame(make_null_id_error(Errc::HandshakeNotComplete,
                                           "Send initialize before " + notif.method).dump());
            return;
        }
        try {
            router_.notify(session, notif);
        } catch (const GatewayError& e) {
            write_frame(make_null_id_error(e.kind, e.what(), e.server).dump());
        }
    }

    std::string current_session() const {
        std::lock_guard<std::mutex> lock(session_mutex_);
        return session_id_;
    }

    void set_session(std::string id) {
        std::lock_guard<std::mutex> lock(session_mutex_);
        session_id_ = std::move(id);
    }

    Router& router_;
    int fd_;
    uint64_t id_;
    size_t outbound_limit_;
    std::thread reader_thread_;
    std::thread writer_thread_;
    std::atomic<bool> finished_{false};

    std::mutex write_mutex_;
    std::condition_variable write_cv_;
    std::deque<std::string> outbox_;
    size_t outbox_bytes_{0};
    bool closing_{false};

    mutable std::mutex session_mutex_;
    std::string session_id_;
};

// ---------- UnixSocketAdapter ----------

UnixSocketAdapter::UnixSocketAdapter(Router& router, Options opts)
    : router_(router), opts_(std::move(opts)) {
    if (::pipe2(wakeup_pipe_, O_CLOEXEC | O_NONBLOCK) < 0) {
        throw TransportError(errno_text("Failed to create wakeup pipe"));
    }
}

UnixSocketAdapter::~UnixSocketAdapter() {
    shutdown();
    close_listener();
    if (wakeup_pipe_[0] >= 0) ::close(wakeup_pipe_[0]);
    if (wakeup_pipe_[1] >= 0) ::close(wakeup_pipe_[1]);
}

void UnixSocketAdapter::listen() {
    if (listen_fd_ >= 0) return;
    auto addr = make_address(opts_.path);
    remove_stale_socket(opts_.path);

    int fd = ::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd < 0) throw TransportError(errno_text("socket"));

    if (::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        auto msg = errno_text("Cannot bind " + opts_.path);
        ::close(fd);
        throw TransportError(msg);
    }
    if (::chmod(opts_.path.c_str(), 0600) < 0) {
        auto msg = errno_text("Cannot chmod " + opts_.path);
        ::close(fd);
        ::unlink(opts_.path.c_str());
        throw TransportError(msg);
    }
    if (::listen(fd, opts_.backlog) < 0) {
        auto msg = errno_text("Cannot listen on " + opts_.path);
        ::close(fd);
        ::unlink(opts_.path.c_str());
        throw TransportError(msg);
    }
    listen_fd_ = fd;
    spdlog::info("unix: listening on {}", opts_.path);
}

void UnixSocketAdapter::start() {
    if (shutdown_requested_) return;
    if (running_.exchange(true)) return;
    try {
        listen();
    } catch (const TransportError&) {
        running_ = false;
        throw;
    }
    accept_loop();
    close_listener();
    running_ = false;
}

void UnixSocketAdapter::accept_loop() {
    while (!shutdown_requested_) {
        struct pollfd fds[2];
        fds[0].fd = listen_fd_;
        fds[0].events = POLLIN;
        fds[0].revents = 0;
        fds[1].fd = wakeup_pipe_[0];
        fds[1].events = POLLIN;
        fds[1].revents = 0;

        // Wake up now and then to join readers of closed connections.
        int ret = ::poll(fds, 2, 1000);
        if (ret < 0) {
            if (errno == EINTR) continue;
            spdlog::error("unix: poll failed: {}", std::strerror(errno));
            break;
        }
        reap_finished();
        if (fds[1].revents & POLLIN) break;
        if (!(fds[0].revents & POLLIN)) continue;

        int fd = ::accept4(listen_fd_, nullptr, nullptr, SOCK_CLOEXEC);
        if (fd < 0) {
            if (errno == EINTR || errno == EAGAIN || errno == ECONNABORTED) continue;
            spdlog::error("unix: accept failed: {}", std::strerror(errno));
            continue;
        }

        std::lock_guard<std::mutex> lock(conns_mutex_);
        if (shutdown_requested_) {
            ::close(fd);
            break;
        }
        uint64_t id = next_conn_id_++;
        auto conn = std::make_shared<Connection>(router_, fd, id, opts_.outbound_limit_bytes);
        conns_.emplace(id, conn);
        conn->start();
        spdlog::debug("unix: connection {} accepted", id);
    }
}

void UnixSocketAdapter::reap_finished() {
    std::vector<std::shared_ptr<Connection>> done;
    {
        std::lock_guard<std::mutex> lock(conns_mutex_);
        for (auto it = conns_.begin(); it != conns_.end(); ) {
            if (it->second->finished()) {
                done.push_back(std::move(it->second));
                it = conns_.erase(it);
            } else {
                ++it;
            }
        }
    }
    for (auto& conn : done) conn->join();
}

void UnixSocketAdapter::close_listener() {
    if (listen_fd_ < 0) return;
    ::close(listen_fd_);
    listen_fd_ = -1;
    ::unlink(opts_.path.c_str());
}

void UnixSocketAdapter::shutdown() {
    if (shutdown_requested_.exchange(true)) return;
    char b = 1;
    ssize_t n = ::write(wakeup_pipe_[1], &b, 1);
    (void)n;  // a full pipe already wakes the accept loop

    std::map<uint64_t, std::shared_ptr<Connection>> conns;
    {
        std::lock_guard<std::mutex> lock(conns_mutex_);
        conns.swap(conns_);
    }
    for (auto& [id, conn] : conns) conn->interrupt();
    for (auto& [id, conn] : conns) conn->join();
    spdlog::info("unix: stopped; {} connection(s) closed", conns.size());
}

} // namespace citadel
