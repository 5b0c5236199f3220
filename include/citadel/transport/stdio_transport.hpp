#pragma once
#include "transport.hpp"
#include "../codec.hpp"
#include <atomic>
#include <thread>
#include <mutex>
#include <queue>
#include <condition_variable>

namespace citadel {

/// Newline-delimited JSON-RPC over a pair of file descriptors, typically the
/// stdin/stdout pipes of a backend process. start() runs the read loop on the
/// calling thread; writes go through a queue drained by a writer thread.
class StdioTransport : public ITransport {
public:
    /// Takes ownership of both descriptors.
    StdioTransport(int read_fd, int write_fd);

    ~StdioTransport() override;

    StdioTransport(const StdioTransport&) = delete;
    StdioTransport& operator=(const StdioTransport&) = delete;

    void start(MessageCallback on_message, ErrorCallback on_error = nullptr) override;
    void send(const Envelope& env) override;
    void shutdown() override;
    bool is_connected() const override;

private:
    void read_loop(const MessageCallback& on_message, const ErrorCallback& on_error);
    void write_loop(ErrorCallback on_error);
    void wake_reader();

    int read_fd_;
    int write_fd_;

    std::atomic<bool> running_{false};
    std::atomic<bool> connected_{false};
    std::atomic<bool> shutdown_requested_{false};

    std::thread writer_thread_;

    std::mutex write_mutex_;
    std::queue<std::string> write_queue_;
    std::condition_variable write_cv_;

    int wakeup_pipe_[2]{-1, -1};  // interrupts poll() in the read loop
};

} // namespace citadel
