#pragma once

namespace citadel {

/// A client-facing listener that feeds traffic into the Router.
class ClientAdapter {
public:
    virtual ~ClientAdapter() = default;

    /// Serve until shutdown(). Blocks. Throws TransportError if the listener
    /// cannot be opened.
    virtual void start() = 0;

    /// Stop serving and close client connections; makes start() return.
    virtual void shutdown() = 0;

    [[nodiscard]] virtual bool is_running() const = 0;
};

} // namespace citadel
