#pragma once
#include "json_rpc.hpp"
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace citadel {

using GatewayId = int64_t;

/// Completion for a forwarded call. Receives the backend response (or a
/// synthetic error) with the gateway id still in place.
using CallCompletion = std::function<void(Response)>;

/// One forwarded call awaiting its backend response.
struct CallRecord {
    std::string session_id;
    RequestId client_id;
    std::string method;
    std::chrono::steady_clock::time_point created_at;
    CallCompletion on_complete;
    /// Set once the owning session closed. The reply is still consumed but
    /// never delivered.
    bool abandoned{false};
};

/// Correlation table of one backend connection: gatewayId -> CallRecord.
///
/// Gateway ids are assigned monotonically and never reused, so ids that
/// clients pick independently can never collide on the shared backend
/// stream. Every record leaves the table exactly once: by resolve(),
/// expire() or drain(). Thread-safe.
class CallTable {
public:
    using Clock = std::chrono::steady_clock;
    using Entry = std::pair<GatewayId, CallRecord>;

    explicit CallTable(GatewayId first_id = 1);

    /// Store a record under a fresh gateway id.
    /// Throws InvariantError if the id is already in use.
    GatewayId insert(CallRecord record);

    /// Remove and return the record for a backend response.
    std::optional<CallRecord> resolve(GatewayId id);

    /// Gateway id of a session's outstanding call, if any.
    [[nodiscard]] std::optional<GatewayId> find(const std::string& session_id,
                                                const RequestId& client_id) const;

    /// Mark one record abandoned. Returns false if it is not outstanding.
    bool abandon(GatewayId id);

    /// Mark every record of a session abandoned; returns their gateway ids.
    std::vector<GatewayId> abandon_session(const std::string& session_id);

    /// Remove and return records created more than `timeout` before `now`.
    std::vector<Entry> expire(std::chrono::milliseconds timeout,
                              Clock::time_point now = Clock::now());

    /// Remove and return every record.
    std::vector<Entry> drain();

    [[nodiscard]] size_t size() const;

    /// Outstanding calls per session (stats and tests).
    [[nodiscard]] size_t count_for_session(const std::string& session_id) const;

private:
    mutable std::mutex mutex_;
    std::map<GatewayId, CallRecord> records_;
    GatewayId next_id_;
};

} // namespace citadel
