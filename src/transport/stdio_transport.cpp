#include "citadel/transport/stdio_transport.hpp"
#include "citadel/error.hpp"
#include <spdlog/spdlog.h>
#include <unistd.h>
#include <fcntl.h>
#include <poll.h>
#include <cerrno>
#include <cstring>

namespace citadel {

StdioTransport::StdioTransport(int read_fd, int write_fd)
    : read_fd_(read_fd), write_fd_(write_fd) {
    if (::pipe(wakeup_pipe_) < 0) {
        throw TransportError(std::string("Failed to create wakeup pipe: ") + std::strerror(errno));
    }
    int flags = ::fcntl(wakeup_pipe_[1], F_GETFL, 0);
    ::fcntl(wakeup_pipe_[1], F_SETFL, flags | O_NONBLOCK);
}

StdioTransport::~StdioTransport() {
    shutdown();
    if (writer_thread_.joinable()) writer_thread_.join();
    if (read_fd_ >= 0)  ::close(read_fd_);
    if (write_fd_ >= 0) ::close(write_fd_);
    if (wakeup_pipe_[0] >= 0) ::close(wakeup_pipe_[0]);
    if (wakeup_pipe_[1] >= 0) ::close(wakeup_pipe_[1]);
}

void StdioTransport::start(MessageCallback on_message, ErrorCallback on_error) {
    if (shutdown_requested_.load()) return;
    if (running_.exchange(true)) return;
    connected_ = true;

    writer_thread_ = std::thread([this, on_error]() { write_loop(on_error); });
    read_loop(on_message, on_error);

    // The peer is gone or we were asked to stop; release the writer either way.
    connected_ = false;
    running_ = false;
    write_cv_.notify_all();
}

void StdioTransport::wake_reader() {
    if (wakeup_pipe_[1] >= 0) {
        char b = 1;
        ssize_t n = ::write(wakeup_pipe_[1], &b, 1);
        (void)n;  // a full pipe already wakes the reader
    }
}

void StdioTransport::read_loop(const MessageCallback& on_message, const ErrorCallback& on_error) {
    std::string buffer;
    buffer.reserve(4096);
    char chunk[4096];

    while (running_) {
        struct pollfd fds[2];
        fds[0].fd = read_fd_;
        fds[0].events = POLLIN;
        fds[0].revents = 0;
        fds[1].fd = wakeup_pipe_[0];
        fds[1].events = POLLIN;
        fds[1].revents = 0;

        int ret = ::poll(fds, 2, -1);
        if (ret < 0) {
            if (errno == EINTR) continue;
            break;
        }
        if (fds[1].revents & POLLIN) break;
        if (!(fds[0].revents & (POLLIN | POLLHUP | POLLERR))) continue;

        ssize_t n = ::read(read_fd_, chunk, sizeof(chunk));
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) continue;
            if (on_error) {
                on_error(std::make_exception_ptr(
                    TransportError(std::string("Read error: ") + std::strerror(errno))));
            }
            break;
        }
        if (n == 0) break;  // EOF

        buffer.append(chunk, static_cast<size_t>(n));

        size_t pos = 0;
        while (true) {
            size_t nl = buffer.find('\n', pos);
            if (nl == std::string::npos) break;
            std::string_view line(buffer.data() + pos, nl - pos);
            pos = nl + 1;
            if (line.empty() || line == "\r") continue;

            try {
                on_message(Codec::decode_line(line));
            } catch (const ParseError& e) {
                if (on_error) on_error(std::current_exception());
                else spdlog::warn("dropping malformed frame: {}", e.what());
            }
        }
        if (pos > 0) buffer.erase(0, pos);
    }
}

void StdioTransport::write_loop(ErrorCallback on_error) {
    while (true) {
        std::string frame;
        {
            std::unique_lock<std::mutex> lock(write_mutex_);
            write_cv_.wait(lock, [this] {
                return !write_queue_.empty() || !running_;
            });
            if (!running_) break;  // unsent frames are dropped on close
            frame = std::move(write_queue_.front());
            write_queue_.pop();
        }

        frame += '\n';
        const char* data = frame.data();
        size_t remaining = frame.size();
        while (remaining > 0) {
            ssize_t written = ::write(write_fd_, data, remaining);
            if (written < 0) {
                if (errno == EINTR) continue;
                connected_ = false;
                if (on_error) {
                    on_error(std::make_exception_ptr(
                        TransportError(std::string("Write error: ") + std::strerror(errno))));
                }
                // A dead write side means a dead peer; stop reading too.
                wake_reader();
                return;
            }
            data += written;
            remaining -= static_cast<size_t>(written);
        }
    }
}

void StdioTransport::send(const Envelope& env) {
    if (shutdown_requested_.load() || (running_.load() && !connected_.load())) {
        throw TransportError("Transport closed");
    }
    std::string frame = Codec::encode(env);
    {
        std::lock_guard<std::mutex> lock(write_mutex_);
        write_queue_.push(std::move(frame));
    }
    write_cv_.notify_one();
}

void StdioTransport::shutdown() {
    shutdown_requested_ = true;
    connected_ = false;
    bool was_running = running_.exchange(false);
    write_cv_.notify_all();
    if (was_running) wake_reader();
}

bool StdioTransport::is_connected() const {
    return connected_;
}

} // namespace citadel
