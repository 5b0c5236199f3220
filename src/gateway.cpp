#include "citadel/gateway.hpp"
#include "citadel/error.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/fmt/ranges.h>

namespace citadel {

namespace {

BackendOptions backend_options(const GatewayConfig& c) {
    BackendOptions opts;
    opts.handshake_timeout = c.handshake_timeout();
    opts.call_timeout = c.call_timeout();
    return opts;
}

} // anonymous namespace

Gateway::Gateway(GatewayConfig config, std::vector<ServerDefinition> servers,
                 std::shared_ptr<BackendConnector> connector)
    : config_(std::move(config))
    , registry_(std::move(servers), std::move(connector), backend_options(config_), &stats_)
    , router_(sessions_, registry_, RouterOptions{config_.notification_policy}, &stats_) {
    if (!config_.socket_path.empty()) {
        UnixSocketAdapter::Options opts;
        opts.path = config_.socket_path;
        opts.outbound_limit_bytes = static_cast<size_t>(config_.socket_outbound_limit_bytes);
        unix_ = std::make_unique<UnixSocketAdapter>(router_, opts);
    }
    if (config_.http.enabled) {
        HttpAdapter::Options opts;
        opts.host = config_.http.host;
        opts.port = config_.http.port;
        opts.path = config_.http.path;
        opts.allowed_origins = config_.http.allowed_origins;
        opts.reply_timeout = config_.call_timeout() + std::chrono::seconds(5);
        http_ = std::make_unique<HttpAdapter>(router_, opts, &stats_);
    }
}

Gateway::~Gateway() {
    stop();
}

void Gateway::start() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (started_) return;
        started_ = true;
    }

    // Bind synchronously so that configuration problems surface here.
    if (unix_) unix_->listen();
    if (http_) http_->bind();

    auto serve = [this](ClientAdapter* adapter, const char* name) {
        try {
            adapter->start();
        } catch (const TransportError& e) {
            spdlog::error("{} adapter failed: {}", name, e.what());
            request_stop();
        }
    };
    if (unix_) adapter_threads_.emplace_back(serve, unix_.get(), "unix");
    if (http_) adapter_threads_.emplace_back(serve, http_.get(), "http");
    sweeper_thread_ = std::thread([this]() { sweeper_loop(); });

    spdlog::info("gateway started with {} backend(s): {}", registry_.server_names().size(),
                 fmt::join(registry_.server_names(), ", "));
}

void Gateway::request_stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_requested_ = true;
    }
    cv_.notify_all();
}

bool Gateway::wait_for(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, timeout, [this] { return stop_requested_; });
}

void Gateway::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopped_) return;
        stopped_ = true;
        stop_requested_ = true;
    }
    cv_.notify_all();

    if (unix_) unix_->shutdown();
    if (http_) http_->shutdown();
    for (auto& t : adapter_threads_) {
        if (t.joinable()) t.join();
    }
    adapter_threads_.clear();

    sessions_.close_all();
    registry_.shutdown();
    if (sweeper_thread_.joinable()) sweeper_thread_.join();

    nlohmann::json summary;
    to_json(summary, stats_);
    spdlog::info("gateway stopped: {}", summary.dump());
}

void Gateway::sweep() {
    size_t expired = registry_.expire_calls();
    if (expired > 0) {
        spdlog::debug("sweeper: {} call(s) timed out", expired);
    }
    // A Unix-socket session ends with its connection, never by idling.
    auto evicted = sessions_.evict_idle(config_.session_timeout(), "http");
    for (size_t i = 0; i < evicted.size(); ++i) {
        GatewayStats::bump(stats_.sessions_evicted);
    }
}

void Gateway::sweeper_loop() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (!stop_requested_) {
        if (cv_.wait_for(lock, config_.sweep_interval(), [this] { return stop_requested_; })) {
            break;
        }
        lock.unlock();
        sweep();
        lock.lock();
    }
}

uint16_t Gateway::http_port() const {
    return http_ ? http_->port() : 0;
}

} // namespace citadel
