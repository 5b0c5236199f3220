#pragma once
#include <stdexcept>
#include <string>
#include <string_view>

namespace citadel {

class CitadelError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// Raised by the codec on invalid JSON or a malformed envelope.
class ParseError : public CitadelError {
public:
    using CitadelError::CitadelError;
};

class TransportError : public CitadelError {
public:
    using CitadelError::CitadelError;
};

/// A broken internal invariant. Fatal to the owning backend connection only.
class InvariantError : public CitadelError {
public:
    using CitadelError::CitadelError;
};

class ConfigError : public CitadelError {
public:
    using CitadelError::CitadelError;
};

/// Gateway error taxonomy. Every kind is recoverable per request.
enum class Errc {
    Malformed,
    MissingServerParameter,
    ServerNotFound,
    UnsupportedProtocolVersion,
    HandshakeNotComplete,
    InvalidServerBinding,
    SessionNotFound,
    BackendUnreachable,
    BackendHandshakeFailed,
    BackendTimeout,
    BackendUnavailable,
};

class GatewayError : public CitadelError {
public:
    GatewayError(Errc kind, const std::string& msg, std::string server = {})
        : CitadelError(msg), kind(kind), server(std::move(server)) {}

    Errc kind;
    std::string server;
};

namespace error {
    constexpr int ParseError             = -32700;
    constexpr int InvalidRequest         = -32600;
    constexpr int MethodNotFound         = -32601;
    constexpr int InvalidParams          = -32602;
    constexpr int InternalError          = -32603;
    constexpr int ServerNotFound         = -32001;
    constexpr int BackendTimeout         = -32002;
    constexpr int BackendUnavailable     = -32003;
    constexpr int BackendUnreachable     = -32004;
    constexpr int BackendHandshakeFailed = -32005;
    constexpr int SessionNotFound        = -32006;
} // namespace error

/// snake_case name used in error.data.type and in logs.
std::string_view to_string(Errc kind);

/// JSON-RPC error code reported for a kind.
int jsonrpc_code(Errc kind);

/// HTTP status the HTTP adapter answers with for a kind.
int http_status(Errc kind);

} // namespace citadel
