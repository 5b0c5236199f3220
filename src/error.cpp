#include "citadel/error.hpp"

namespace citadel {

std::string_view to_string(Errc kind) {
    switch (kind) {
        case Errc::Malformed:                  return "malformed";
        case Errc::MissingServerParameter:     return "missing_server_parameter";
        case Errc::ServerNotFound:             return "server_not_found";
        case Errc::UnsupportedProtocolVersion: return "unsupported_protocol_version";
        case Errc::HandshakeNotComplete:       return "handshake_not_complete";
        case Errc::InvalidServerBinding:       return "invalid_server_binding";
        case Errc::SessionNotFound:            return "session_not_found";
        case Errc::BackendUnreachable:         return "backend_unreachable";
        case Errc::BackendHandshakeFailed:     return "backend_handshake_failed";
        case Errc::BackendTimeout:             return "backend_timeout";
        case Errc::BackendUnavailable:         return "backend_unavailable";
    }
    return "unknown";
}

int jsonrpc_code(Errc kind) {
    switch (kind) {
        case Errc::Malformed:                  return error::ParseError;
        case Errc::MissingServerParameter:     return error::InvalidParams;
        case Errc::UnsupportedProtocolVersion:
        case Errc::HandshakeNotComplete:
        case Errc::InvalidServerBinding:       return error::InvalidRequest;
        case Errc::ServerNotFound:             return error::ServerNotFound;
        case Errc::SessionNotFound:            return error::SessionNotFound;
        case Errc::BackendUnreachable:         return error::BackendUnreachable;
        case Errc::BackendHandshakeFailed:     return error::BackendHandshakeFailed;
        case Errc::BackendTimeout:             return error::BackendTimeout;
        case Errc::BackendUnavailable:         return error::BackendUnavailable;
    }
    return error::InternalError;
}

int http_status(Errc kind) {
    switch (kind) {
        case Errc::Malformed:
        case Errc::MissingServerParameter:
        case Errc::UnsupportedProtocolVersion:
        case Errc::HandshakeNotComplete:
        case Errc::InvalidServerBinding:
            return 400;
        case Errc::SessionNotFound:
            return 404;
        // Backend side failures travel as JSON-RPC errors in a 200 envelope.
        case Errc::ServerNotFound:
        case Errc::BackendUnreachable:
        case Errc::BackendHandshakeFailed:
        case Errc::BackendTimeout:
        case Errc::BackendUnavailable:
            return 200;
    }
    return 500;
}

} // namespace citadel
