#include "citadel/call_table.hpp"
#include "citadel/error.hpp"

namespace citadel {

CallTable::CallTable(GatewayId first_id) : next_id_(first_id) {}

GatewayId CallTable::insert(CallRecord record) {
    std::lock_guard<std::mutex> lock(mutex_);
    GatewayId id = next_id_++;
    auto [it, inserted] = records_.emplace(id, std::move(record));
    (void)it;
    if (!inserted) {
        throw InvariantError("gateway id " + std::to_string(id) + " already outstanding");
    }
    return id;
}

std::optional<CallRecord> CallTable::resolve(GatewayId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = records_.find(id);
    if (it == records_.end()) return std::nullopt;
    CallRecord rec = std::move(it->second);
    records_.erase(it);
    return rec;
}

std::optional<GatewayId> CallTable::find(const std::string& session_id,
                                         const RequestId& client_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& [id, rec] : records_) {
        if (!rec.abandoned && rec.session_id == session_id && rec.client_id == client_id) {
            return id;
        }
    }
    return std::nullopt;
}

bool CallTable::abandon(GatewayId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = records_.find(id);
    if (it == records_.end()) return false;
    it->second.abandoned = true;
    return true;
}

std::vector<GatewayId> CallTable::abandon_session(const std::string& session_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<GatewayId> ids;
    for (auto& [id, rec] : records_) {
        if (rec.session_id == session_id && !rec.abandoned) {
            rec.abandoned = true;
            ids.push_back(id);
        }
    }
    return ids;
}

std::vector<CallTable::Entry> CallTable::expire(std::chrono::milliseconds timeout,
                                                Clock::time_point now) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Entry> expired;
    for (auto it = records_.begin(); it != records_.end(); ) {
        if (now - it->second.created_at > timeout) {
            expired.emplace_back(it->first, std::move(it->second));
            it = records_.erase(it);
        } else {
            ++it;
        }
    }
    return expired;
}

std::vector<CallTable::Entry> CallTable::drain() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Entry> all;
    all.reserve(records_.size());
    for (auto& [id, rec] : records_) {
        all.emplace_back(id, std::move(rec));
    }
    records_.clear();
    return all;
}

size_t CallTable::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return records_.size();
}

size_t CallTable::count_for_session(const std::string& session_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t n = 0;
    for (const auto& [id, rec] : records_) {
        if (rec.session_id == session_id) ++n;
    }
    return n;
}

} // namespace citadel
