#pragma once
#include "stdio_transport.hpp"
#include "../config.hpp"
#include <memory>
#include <mutex>
#include <sys/types.h>

namespace citadel {

/// A backend child process spoken to over its stdin/stdout.
/// The child is terminated and reaped when the transport is destroyed.
class ProcessTransport : public ITransport {
public:
    /// Fork and exec `def.command`. The child inherits the gateway's
    /// environment merged with `def.env`. Throws TransportError if the
    /// command cannot be executed.
    [[nodiscard]] static std::unique_ptr<ProcessTransport> spawn(const ServerDefinition& def);

    ~ProcessTransport() override;

    void start(MessageCallback on_message, ErrorCallback on_error = nullptr) override;
    void send(const Envelope& env) override;
    void shutdown() override;
    bool is_connected() const override;

    [[nodiscard]] pid_t pid() const { return pid_; }

private:
    ProcessTransport(pid_t pid, int read_fd, int write_fd);

    void terminate();

    pid_t pid_;
    StdioTransport stdio_;
    std::once_flag reaped_;
};

} // namespace citadel
