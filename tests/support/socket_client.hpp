#pragma once
#include <nlohmann/json.hpp>
#include <sys/socket.h>
#include <sys/un.h>
#include <poll.h>
#include <unistd.h>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <optional>
#include <stdexcept>
#include <string>

namespace citadel::testing {

/// Blocking line-oriented client for the gateway's Unix socket.
class SocketClient {
public:
    explicit SocketClient(const std::string& path) {
        fd_ = ::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
        if (fd_ < 0) throw std::runtime_error("socket failed");
        sockaddr_un addr{};
        addr.sun_family = AF_UNIX;
        std::strncpy(addr.sun_path, path.c_str(), sizeof(addr.sun_path) - 1);
        if (::connect(fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
            ::close(fd_);
            throw std::runtime_error("connect to " + path + " failed: " + std::strerror(errno));
        }
    }

    ~SocketClient() { close(); }

    SocketClient(const SocketClient&) = delete;
    SocketClient& operator=(const SocketClient&) = delete;

    void send_raw(std::string line) {
        line += '\n';
        const char* p = line.data();
        size_t left = line.size();
        while (left > 0) {
            ssize_t n = ::send(fd_, p, left, MSG_NOSIGNAL);
            if (n < 0) {
                if (errno == EINTR) continue;
                throw std::runtime_error("send failed");
            }
            p += n;
            left -= static_cast<size_t>(n);
        }
    }

    void send(const nlohmann::json& j) { send_raw(j.dump()); }

    /// Next frame, or nullopt on timeout or EOF.
    std::optional<nlohmann::json> receive(
        std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
        auto deadline = std::chrono::steady_clock::now() + timeout;
        while (true) {
            auto nl = buffer_.find('\n');
            if (nl != std::string::npos) {
                auto line = buffer_.substr(0, nl);
                buffer_.erase(0, nl + 1);
                return nlohmann::json::parse(line);
            }
            auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - std::chrono::steady_clock::now());
            if (left.count() <= 0) return std::nullopt;

            pollfd pfd{fd_, POLLIN, 0};
            int rc = ::poll(&pfd, 1, static_cast<int>(left.count()));
            if (rc < 0 && errno == EINTR) continue;
            if (rc <= 0) return std::nullopt;

            char chunk[4096];
            ssize_t n = ::read(fd_, chunk, sizeof(chunk));
            if (n <= 0) return std::nullopt;
            buffer_.append(chunk, static_cast<size_t>(n));
        }
    }

    /// Send a request and wait for the frame answering it, skipping others.
    std::optional<nlohmann::json> call(const nlohmann::json& request) {
        send(request);
        while (auto frame = receive()) {
            if (frame->contains("id") && (*frame)["id"] == request["id"]) return frame;
        }
        return std::nullopt;
    }

    void close() {
        if (fd_ >= 0) {
            ::close(fd_);
            fd_ = -1;
        }
    }

private:
    int fd_{-1};
    std::string buffer_;
};

inline nlohmann::json initialize_message(const std::string& server, nlohmann::json id = 0) {
    nlohmann::json params = {
        {"protocolVersion", "2025-06-18"},
        {"capabilities", nlohmann::json::object()},
        {"clientInfo", {{"name", "integration-test"}, {"version", "1.0"}}}
    };
    if (!server.empty()) params["server"] = server;
    return {{"jsonrpc", "2.0"}, {"id", id}, {"method", "initialize"}, {"params", params}};
}

inline nlohmann::json initialized_message() {
    return {{"jsonrpc", "2.0"}, {"method", "notifications/initialized"}};
}

inline nlohmann::json request_message(nlohmann::json id, const std::string& method,
                                      nlohmann::json params = nlohmann::json::object()) {
    return {{"jsonrpc", "2.0"}, {"id", id}, {"method", method}, {"params", params}};
}

inline std::string unique_socket_path(const std::string& tag) {
    return "/tmp/citadel-test-" + tag + "-" + std::to_string(::getpid()) + ".sock";
}

} // namespace citadel::testing
