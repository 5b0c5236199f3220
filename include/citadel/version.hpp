#pragma once
#include <array>
#include <string_view>

namespace citadel {

constexpr std::string_view LIBRARY_VERSION     = "0.4.0";
constexpr std::string_view GATEWAY_NAME        = "mcp-citadel";
constexpr std::string_view PROTOCOL_VERSION    = "2025-06-18";
constexpr std::string_view JSONRPC_VERSION     = "2.0";

/// Protocol versions a client may negotiate. The first entry is the default.
constexpr std::array<std::string_view, 2> SUPPORTED_PROTOCOL_VERSIONS = {
    "2025-06-18",
    "2025-03-26",
};

inline bool is_supported_protocol_version(std::string_view v) {
    for (auto s : SUPPORTED_PROTOCOL_VERSIONS) {
        if (s == v) return true;
    }
    return false;
}

} // namespace citadel
