#pragma once
#include <atomic>
#include <cstdint>
#include <nlohmann/json.hpp>

namespace citadel {

/// Process-wide gateway counters. Relaxed atomics; values are informational.
struct GatewayStats {
    std::atomic<uint64_t> sessions_created{0};
    std::atomic<uint64_t> sessions_closed{0};
    std::atomic<uint64_t> sessions_evicted{0};
    std::atomic<uint64_t> calls_forwarded{0};
    std::atomic<uint64_t> calls_completed{0};
    std::atomic<uint64_t> calls_failed{0};
    std::atomic<uint64_t> backend_connects{0};
    std::atomic<uint64_t> backend_handshakes{0};
    std::atomic<uint64_t> backend_teardowns{0};

    static void bump(std::atomic<uint64_t>& counter) {
        counter.fetch_add(1, std::memory_order_relaxed);
    }
};

inline void to_json(nlohmann::json& j, const GatewayStats& s) {
    auto load = [](const std::atomic<uint64_t>& c) { return c.load(std::memory_order_relaxed); };
    j = nlohmann::json{
        {"sessions", {{"created", load(s.sessions_created)},
                      {"closed", load(s.sessions_closed)},
                      {"evicted", load(s.sessions_evicted)}}},
        {"calls", {{"forwarded", load(s.calls_forwarded)},
                   {"completed", load(s.calls_completed)},
                   {"failed", load(s.calls_failed)}}},
        {"backends", {{"connects", load(s.backend_connects)},
                      {"handshakes", load(s.backend_handshakes)},
                      {"teardowns", load(s.backend_teardowns)}}}
    };
}

} // namespace citadel
