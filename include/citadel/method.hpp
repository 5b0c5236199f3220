#pragma once
#include <string_view>

namespace citadel {

/// The methods the gateway treats specially. Everything else is forwarded.
enum class MethodKind {
    Initialize,
    Initialized,
    Cancelled,
    Forward,
};

namespace method {
    constexpr std::string_view Initialize  = "initialize";
    constexpr std::string_view Initialized = "notifications/initialized";
    constexpr std::string_view Cancelled   = "notifications/cancelled";
} // namespace method

constexpr MethodKind classify(std::string_view m) {
    if (m == method::Initialize) return MethodKind::Initialize;
    if (m == method::Initialized) return MethodKind::Initialized;
    if (m == method::Cancelled) return MethodKind::Cancelled;
    return MethodKind::Forward;
}

} // namespace citadel
