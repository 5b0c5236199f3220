#pragma once
#include "citadel/backend.hpp"
#include "citadel/error.hpp"
#include "citadel/transport/transport.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

namespace citadel::testing {

/// Scripted behaviour of an in-memory backend.
struct FakeBehavior {
    enum class Initialize { Accept, Reject, Ignore };
    Initialize initialize = Initialize::Accept;
    /// Answer forwarded requests automatically. Otherwise tests reply by hand.
    bool auto_reply = true;
    std::string server_name = "fake";
    std::string protocol_version = "2025-06-18";
};

/// The backend end of an in-memory stream. Envelopes the gateway sends are
/// recorded; replies are queued and delivered on the gateway's reader thread,
/// as a real backend's would be.
class FakeBackend {
public:
    explicit FakeBackend(FakeBehavior behavior) : behavior_(std::move(behavior)) {}

    /// Deliver an envelope to the gateway.
    void push(Envelope env) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_) return;
            inbox_.push_back(std::move(env));
        }
        cv_.notify_all();
    }

    void reply(int64_t gateway_id, nlohmann::json result) {
        push(Response{RequestId{gateway_id}, std::move(result), std::nullopt});
    }

    /// Simulate the backend process going away.
    void drop() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
        }
        cv_.notify_all();
    }

    [[nodiscard]] bool closed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

    /// Requests received with `method`, in arrival order.
    [[nodiscard]] std::vector<Request> requests(const std::string& method) const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<Request> out;
        for (const auto& env : received_) {
            if (auto* r = std::get_if<Request>(&env); r && r->method == method) out.push_back(*r);
        }
        return out;
    }

    [[nodiscard]] std::vector<Notification> notifications(const std::string& method) const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<Notification> out;
        for (const auto& env : received_) {
            if (auto* n = std::get_if<Notification>(&env); n && n->method == method) {
                out.push_back(*n);
            }
        }
        return out;
    }

    /// Responses the gateway sent to requests this backend made.
    [[nodiscard]] std::vector<Response> responses() const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<Response> out;
        for (const auto& env : received_) {
            if (auto* r = std::get_if<Response>(&env)) out.push_back(*r);
        }
        return out;
    }

    /// Wait until at least `count` requests with `method` have arrived.
    bool wait_for_requests(const std::string& method, size_t count,
                           std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, timeout, [&] { return count_locked(method) >= count; });
    }

    bool wait_for_notification(const std::string& method,
                               std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, timeout, [&] {
            for (const auto& env : received_) {
                if (auto* n = std::get_if<Notification>(&env); n && n->method == method) {
                    return true;
                }
            }
            return false;
        });
    }

    // ITransport side, used by FakeTransport.

    void run(const MessageCallback& on_message) {
        while (true) {
            Envelope env;
            {
                std::unique_lock<std::mutex> lock(mutex_);
                cv_.wait(lock, [this] { return closed_ || !inbox_.empty(); });
                if (closed_) return;
                env = std::move(inbox_.front());
                inbox_.pop_front();
            }
            on_message(std::move(env));
        }
    }

    void receive(const Envelope& env) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_) throw TransportError("fake backend closed");
            received_.push_back(env);
        }
        cv_.notify_all();
        if (auto* req = std::get_if<Request>(&env)) answer(*req);
    }

private:
    size_t count_locked(const std::string& method) const {
        size_t n = 0;
        for (const auto& env : received_) {
            if (auto* r = std::get_if<Request>(&env); r && r->method == method) ++n;
        }
        return n;
    }

    void answer(const Request& req) {
        if (req.method == "initialize") {
            switch (behavior_.initialize) {
                case FakeBehavior::Initialize::Accept:
                    push(Response{req.id, nlohmann::json{
                        {"protocolVersion", behavior_.protocol_version},
                        {"capabilities", {{"tools", nlohmann::json::object()}}},
                        {"serverInfo", {{"name", behavior_.server_name}, {"version", "1.0.0"}}}
                    }, std::nullopt});
                    break;
                case FakeBehavior::Initialize::Reject:
                    push(Response{req.id, std::nullopt,
                                  RpcError{error::InternalError, "not today", std::nullopt}});
                    break;
                case FakeBehavior::Initialize::Ignore:
                    break;
            }
            return;
        }
        if (!behavior_.auto_reply) return;
        if (req.method == "tools/list") {
            push(Response{req.id, nlohmann::json{{"tools", {
                {{"name", "search"}, {"description", "Search"}},
                {{"name", "fetch"}, {"description", "Fetch"}}
            }}}, std::nullopt});
        } else {
            push(Response{req.id, nlohmann::json{
                {"method", req.method},
                {"params", req.params.value_or(nlohmann::json())}
            }, std::nullopt});
        }
    }

    FakeBehavior behavior_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<Envelope> inbox_;
    std::vector<Envelope> received_;
    bool closed_{false};
};

class FakeTransport : public ITransport {
public:
    explicit FakeTransport(std::shared_ptr<FakeBackend> backend) : backend_(std::move(backend)) {}

    void start(MessageCallback on_message, ErrorCallback /*on_error*/) override {
        connected_ = true;
        backend_->run(on_message);
        connected_ = false;
    }

    void send(const Envelope& env) override {
        if (shut_down_) throw TransportError("transport shut down");
        backend_->receive(env);
    }

    void shutdown() override {
        shut_down_ = true;
        backend_->drop();
    }

    bool is_connected() const override { return connected_; }

private:
    std::shared_ptr<FakeBackend> backend_;
    std::atomic<bool> connected_{false};
    std::atomic<bool> shut_down_{false};
};

/// Connector handing out FakeBackends. Every connect() makes a new one.
class FakeConnector : public BackendConnector {
public:
    std::unique_ptr<ITransport> connect(const ServerDefinition& def) override {
        std::function<void()> hook;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            ++connects_[def.name];
            if (unreachable_.count(def.name)) {
                throw TransportError("cannot spawn " + def.command);
            }
            hook = connect_hook_;
        }
        if (hook) hook();

        FakeBehavior behavior;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = behaviors_.find(def.name);
            if (it != behaviors_.end()) behavior = it->second;
        }
        behavior.server_name = def.name;
        auto backend = std::make_shared<FakeBackend>(behavior);
        {
            std::lock_guard<std::mutex> lock(mutex_);
            backends_[def.name].push_back(backend);
        }
        return std::make_unique<FakeTransport>(backend);
    }

    void set_behavior(const std::string& name, FakeBehavior b) {
        std::lock_guard<std::mutex> lock(mutex_);
        behaviors_[name] = std::move(b);
    }

    void set_unreachable(const std::string& name) {
        std::lock_guard<std::mutex> lock(mutex_);
        unreachable_.insert({name, true});
    }

    /// Runs inside every connect(), e.g. to widen a race window.
    void set_connect_hook(std::function<void()> hook) {
        std::lock_guard<std::mutex> lock(mutex_);
        connect_hook_ = std::move(hook);
    }

    [[nodiscard]] int connects(const std::string& name) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = connects_.find(name);
        return it == connects_.end() ? 0 : it->second;
    }

    /// Most recent backend created for `name`.
    [[nodiscard]] std::shared_ptr<FakeBackend> latest(const std::string& name) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = backends_.find(name);
        if (it == backends_.end() || it->second.empty()) return nullptr;
        return it->second.back();
    }

    [[nodiscard]] size_t backend_count(const std::string& name) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = backends_.find(name);
        return it == backends_.end() ? 0 : it->second.size();
    }

private:
    mutable std::mutex mutex_;
    std::map<std::string, int> connects_;
    std::map<std::string, bool> unreachable_;
    std::map<std::string, FakeBehavior> behaviors_;
    std::map<std::string, std::vector<std::shared_ptr<FakeBackend>>> backends_;
    std::function<void()> connect_hook_;
};

inline std::vector<ServerDefinition> fake_servers(std::initializer_list<const char*> names) {
    std::vector<ServerDefinition> defs;
    for (const char* n : names) defs.push_back(ServerDefinition{n, std::string("fake-") + n, {}, {}});
    return defs;
}

/// Polls `pred` until it holds or `timeout` passes.
template <typename Pred>
bool eventually(Pred pred, std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return pred();
}

} // namespace citadel::testing
