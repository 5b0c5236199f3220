#pragma once
#include "../json_rpc.hpp"
#include <exception>
#include <functional>

namespace citadel {

/// Callback for incoming envelopes
using MessageCallback = std::function<void(Envelope)>;
using ErrorCallback = std::function<void(std::exception_ptr)>;

/// A framed, bidirectional envelope stream to one peer.
class ITransport {
public:
    virtual ~ITransport() = default;

    /// Run the read loop. Blocks until the peer closes the stream or
    /// shutdown() is called.
    virtual void start(MessageCallback on_message,
                       ErrorCallback on_error = nullptr) = 0;

    /// Queue an envelope for the peer. Throws TransportError once closed.
    virtual void send(const Envelope& env) = 0;

    /// Graceful shutdown; makes start() return.
    virtual void shutdown() = 0;

    [[nodiscard]] virtual bool is_connected() const = 0;
};

} // namespace citadel
