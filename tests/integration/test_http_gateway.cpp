#include <gtest/gtest.h>
#include <httplib.h>
#include "citadel/gateway.hpp"
#include "support/fake_backend.hpp"
#include <algorithm>
#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

using namespace citadel;
using namespace citadel::testing;
using namespace std::chrono_literals;

namespace {

constexpr const char* kJson = "application/json";

nlohmann::json initialize_body(const std::string& server, int id = 0) {
    nlohmann::json params = {
        {"protocolVersion", "2025-06-18"},
        {"capabilities", nlohmann::json::object()},
        {"clientInfo", {{"name", "http-test-client"}, {"version", "1.0"}}}
    };
    if (!server.empty()) params["server"] = server;
    return {{"jsonrpc", "2.0"}, {"id", id}, {"method", "initialize"}, {"params", params}};
}

nlohmann::json request_body(int id, const std::string& method,
                            nlohmann::json params = nlohmann::json::object()) {
    return {{"jsonrpc", "2.0"}, {"id", id}, {"method", method}, {"params", params}};
}

struct StreamEvent {
    uint64_t id = 0;
    nlohmann::json data;
};

/// Complete events in a text/event-stream body; comment lines are skipped.
std::vector<StreamEvent> parse_events(const std::string& body) {
    std::vector<StreamEvent> out;
    size_t pos = 0;
    while (true) {
        auto end = body.find("\n\n", pos);
        if (end == std::string::npos) break;
        StreamEvent event;
        bool has_data = false;
        size_t line_start = pos;
        while (line_start < end) {
            auto line_end = std::min(body.find('\n', line_start), end);
            auto line = body.substr(line_start, line_end - line_start);
            if (line.rfind("id: ", 0) == 0) {
                event.id = std::stoull(line.substr(4));
            } else if (line.rfind("data: ", 0) == 0) {
                event.data = nlohmann::json::parse(line.substr(6));
                has_data = true;
            }
            line_start = line_end + 1;
        }
        if (has_data) out.push_back(std::move(event));
        pos = end + 2;
    }
    return out;
}

} // anonymous namespace

class HttpGatewayTest : public ::testing::Test {
protected:
    void SetUp() override {
        GatewayConfig config;
        config.socket_path.clear();
        config.http.enabled = true;
        config.http.port = 0;
        config.http.allowed_origins = {"http://localhost"};
        config.handshake_timeout_ms = 1000;
        config.call_timeout_ms = 1000;
        gateway_ = std::make_unique<Gateway>(config, fake_servers({"github", "search"}),
                                             connector_);
        gateway_->start();
        ASSERT_NE(gateway_->http_port(), 0);

        client_ = std::make_unique<httplib::Client>("127.0.0.1", gateway_->http_port());
        client_->set_read_timeout(5, 0);
    }

    void TearDown() override {
        client_.reset();
        gateway_->stop();
    }

    httplib::Result post(const nlohmann::json& body, const std::string& session = {}) {
        return post_raw(body.dump(), session);
    }

    httplib::Result post_raw(const std::string& body, const std::string& session = {}) {
        httplib::Headers headers;
        if (!session.empty()) headers.emplace("Mcp-Session-Id", session);
        return client_->Post("/mcp", headers, body, kJson);
    }

    /// initialize + notifications/initialized; returns the session id.
    std::string open_session(const std::string& server) {
        auto res = post(initialize_body(server));
        EXPECT_TRUE(res);
        if (!res) return {};
        EXPECT_EQ(res->status, 200);
        auto session = res->get_header_value("Mcp-Session-Id");
        EXPECT_FALSE(session.empty());

        auto ack = post({{"jsonrpc", "2.0"}, {"method", "notifications/initialized"}}, session);
        EXPECT_TRUE(ack);
        if (ack) {
            EXPECT_EQ(ack->status, 202);
        }
        return session;
    }

    /// Open the session's event stream and read until `count` events arrive.
    std::vector<StreamEvent> read_events(const std::string& session, size_t count,
                                         const std::string& last_event = {}) {
        httplib::Client stream("127.0.0.1", gateway_->http_port());
        stream.set_read_timeout(5, 0);
        httplib::Headers headers{{"Mcp-Session-Id", session}};
        if (!last_event.empty()) headers.emplace("Last-Event-ID", last_event);
        std::string body;
        stream.Get("/mcp", headers, [&](const char* data, size_t len) {
            body.append(data, len);
            return parse_events(body).size() < count;
        });
        return parse_events(body);
    }

    void push_list_changed(const std::string& server, int n) {
        connector_->latest(server)->push(
            Notification{"notifications/tools/list_changed", nlohmann::json{{"n", n}}});
    }

    std::shared_ptr<FakeConnector> connector_ = std::make_shared<FakeConnector>();
    std::unique_ptr<Gateway> gateway_;
    std::unique_ptr<httplib::Client> client_;
};

TEST_F(HttpGatewayTest, InitializeThenListTools) {
    auto res = post(initialize_body("github"));
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 200);
    auto session = res->get_header_value("Mcp-Session-Id");
    ASSERT_FALSE(session.empty());

    auto init = nlohmann::json::parse(res->body);
    EXPECT_EQ(init["id"], 0);
    EXPECT_EQ(init["result"]["protocolVersion"], "2025-06-18");
    EXPECT_EQ(init["result"]["serverInfo"]["name"], "github");

    auto ack = post({{"jsonrpc", "2.0"}, {"method", "notifications/initialized"}}, session);
    ASSERT_TRUE(ack);
    EXPECT_EQ(ack->status, 202);

    auto list = post(request_body(1, "tools/list"), session);
    ASSERT_TRUE(list);
    EXPECT_EQ(list->status, 200);
    EXPECT_EQ(list->get_header_value("Mcp-Session-Id"), session);

    auto body = nlohmann::json::parse(list->body);
    EXPECT_EQ(body["id"], 1);
    ASSERT_TRUE(body["result"]["tools"].is_array());
    ASSERT_EQ(body["result"]["tools"].size(), 2u);
    EXPECT_EQ(body["result"]["tools"][0]["name"], "search");
    EXPECT_EQ(body["result"]["tools"][1]["name"], "fetch");
}

TEST_F(HttpGatewayTest, UnknownSessionIsNotFound) {
    auto res = post(request_body(1, "tools/list"), "never-issued");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 404);

    auto body = nlohmann::json::parse(res->body);
    EXPECT_EQ(body["id"], 1);
    EXPECT_EQ(body["error"]["code"], error::SessionNotFound);
    EXPECT_EQ(body["error"]["data"]["type"], "session_not_found");
}

TEST_F(HttpGatewayTest, MalformedBodyIsRejected) {
    auto res = post_raw("not json");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 400);

    auto body = nlohmann::json::parse(res->body);
    EXPECT_TRUE(body["id"].is_null());
    EXPECT_EQ(body["error"]["code"], error::ParseError);
    EXPECT_EQ(body["error"]["data"]["type"], "malformed");
}

TEST_F(HttpGatewayTest, BatchIsRejected) {
    auto res = post_raw("[" + request_body(1, "tools/list").dump() + "]");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 400);
}

TEST_F(HttpGatewayTest, MissingServerParameter) {
    auto res = post(initialize_body(""));
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 400);
    EXPECT_TRUE(res->get_header_value("Mcp-Session-Id").empty());

    auto body = nlohmann::json::parse(res->body);
    EXPECT_EQ(body["error"]["code"], error::InvalidParams);
    EXPECT_EQ(gateway_->sessions().size(), 0u);
}

TEST_F(HttpGatewayTest, UnknownServerIsJsonRpcError) {
    auto res = post(initialize_body("gitlab"));
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 200);

    auto body = nlohmann::json::parse(res->body);
    EXPECT_EQ(body["error"]["code"], error::ServerNotFound);
    EXPECT_EQ(body["error"]["data"]["server"], "gitlab");
    EXPECT_EQ(connector_->connects("gitlab"), 0);
}

TEST_F(HttpGatewayTest, UnsupportedProtocolHeader) {
    httplib::Headers headers{{"MCP-Protocol-Version", "1999-01-01"}};
    auto res = client_->Post("/mcp", headers, initialize_body("github").dump(), kJson);
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 400);
    EXPECT_EQ(connector_->connects("github"), 0);
}

TEST_F(HttpGatewayTest, ForeignOriginIsForbidden) {
    httplib::Headers headers{{"Origin", "http://evil.example"}};
    auto res = client_->Post("/mcp", headers, initialize_body("github").dump(), kJson);
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 403);

    httplib::Headers allowed{{"Origin", "http://localhost"}};
    auto ok = client_->Post("/mcp", allowed, initialize_body("github").dump(), kJson);
    ASSERT_TRUE(ok);
    EXPECT_EQ(ok->status, 200);
}

TEST_F(HttpGatewayTest, RequestWithoutSessionHeader) {
    auto res = post(request_body(3, "tools/list"));
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 400);
    auto body = nlohmann::json::parse(res->body);
    EXPECT_EQ(body["id"], 3);
    EXPECT_EQ(body["error"]["data"]["type"], "handshake_not_complete");
}

TEST_F(HttpGatewayTest, RequestBeforeInitializedNotification) {
    auto res = post(initialize_body("github"));
    ASSERT_TRUE(res);
    auto session = res->get_header_value("Mcp-Session-Id");

    auto early = post(request_body(1, "tools/list"), session);
    ASSERT_TRUE(early);
    EXPECT_EQ(early->status, 400);
    EXPECT_TRUE(connector_->latest("github")->requests("tools/list").empty());
}

TEST_F(HttpGatewayTest, ServerParameterIsStrippedBeforeForwarding) {
    auto session = open_session("github");
    auto res = post(request_body(7, "tools/call", {{"server", "github"}, {"name", "search"}}),
                    session);
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 200);

    auto body = nlohmann::json::parse(res->body);
    EXPECT_EQ(body["id"], 7);
    EXPECT_EQ(body["result"]["params"], nlohmann::json({{"name", "search"}}));
}

TEST_F(HttpGatewayTest, SessionsAreBoundToTheirServer) {
    auto session = open_session("github");
    auto res = post(request_body(2, "tools/call", {{"server", "search"}}), session);
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 400);
    auto body = nlohmann::json::parse(res->body);
    EXPECT_EQ(body["error"]["data"]["type"], "invalid_server_binding");
    EXPECT_EQ(connector_->connects("search"), 0);
}

TEST_F(HttpGatewayTest, TwoSessionsTwoServers) {
    auto github = open_session("github");
    auto search = open_session("search");
    EXPECT_NE(github, search);

    auto a = post(request_body(1, "resources/list"), github);
    auto b = post(request_body(1, "resources/list"), search);
    ASSERT_TRUE(a);
    ASSERT_TRUE(b);
    EXPECT_EQ(a->status, 200);
    EXPECT_EQ(b->status, 200);

    EXPECT_EQ(connector_->latest("github")->requests("resources/list").size(), 1u);
    EXPECT_EQ(connector_->latest("search")->requests("resources/list").size(), 1u);
}

TEST_F(HttpGatewayTest, DeleteClosesSession) {
    auto session = open_session("github");

    httplib::Headers headers{{"Mcp-Session-Id", session}};
    auto del = client_->Delete("/mcp", headers);
    ASSERT_TRUE(del);
    EXPECT_EQ(del->status, 200);

    auto again = client_->Delete("/mcp", headers);
    ASSERT_TRUE(again);
    EXPECT_EQ(again->status, 404);

    auto call = post(request_body(1, "tools/list"), session);
    ASSERT_TRUE(call);
    EXPECT_EQ(call->status, 404);
}

TEST_F(HttpGatewayTest, DeleteWithoutHeader) {
    auto del = client_->Delete("/mcp");
    ASSERT_TRUE(del);
    EXPECT_EQ(del->status, 400);
}

TEST_F(HttpGatewayTest, StatusEndpoint) {
    open_session("github");
    auto res = client_->Get("/mcp");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 200);

    auto body = nlohmann::json::parse(res->body);
    EXPECT_EQ(body["status"], "ok");
    EXPECT_EQ(body["sessions"], 1);
    EXPECT_EQ(body["servers"], nlohmann::json({"github", "search"}));
    EXPECT_EQ(body["backends"], nlohmann::json({"github"}));
    EXPECT_EQ(body["stats"]["sessions"]["created"], 1);
}

TEST_F(HttpGatewayTest, UnknownNotificationIsAccepted) {
    auto session = open_session("github");
    auto res = post({{"jsonrpc", "2.0"}, {"method", "notifications/roots/list_changed"}}, session);
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 202);
}

TEST_F(HttpGatewayTest, CancelledNotificationReachesBackend) {
    FakeBehavior manual;
    manual.auto_reply = false;
    connector_->set_behavior("github", manual);
    auto session = open_session("github");

    httplib::Client second("127.0.0.1", gateway_->http_port());
    second.set_read_timeout(15, 0);
    std::thread caller([&] {
        httplib::Headers headers{{"Mcp-Session-Id", session}};
        auto res = second.Post("/mcp", headers, request_body(9, "tools/call").dump(), kJson);
        ASSERT_TRUE(res);
        auto body = nlohmann::json::parse(res->body);
        EXPECT_EQ(body["id"], 9);
        EXPECT_EQ(body["error"]["code"], error::BackendTimeout);
    });

    auto backend = connector_->latest("github");
    ASSERT_TRUE(backend->wait_for_requests("tools/call", 1));
    auto gw_id = std::get<int64_t>(backend->requests("tools/call")[0].id);

    auto res = post({{"jsonrpc", "2.0"}, {"method", "notifications/cancelled"},
                     {"params", {{"requestId", 9}, {"reason", "user"}}}}, session);
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 202);
    ASSERT_TRUE(backend->wait_for_notification("notifications/cancelled"));
    auto cancel = backend->notifications("notifications/cancelled")[0];
    EXPECT_EQ((*cancel.params)["requestId"], gw_id);

    // A cancelled call gets no backend reply; the POST ends at the reply timeout.
    caller.join();
    EXPECT_EQ(gateway_->stats().calls_completed.load(), 0u);
}

TEST_F(HttpGatewayTest, EventStreamCarriesBackendNotifications) {
    auto github = open_session("github");
    auto search = open_session("search");
    push_list_changed("github", 1);

    auto events = read_events(github, 1);
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].id, 1u);
    EXPECT_EQ(events[0].data["method"], "notifications/tools/list_changed");
    EXPECT_EQ(events[0].data["params"]["n"], 1);

    // Nothing reaches a session bound elsewhere.
    httplib::Client other("127.0.0.1", gateway_->http_port());
    other.set_read_timeout(1, 0);
    std::string body;
    other.Get("/mcp", httplib::Headers{{"Mcp-Session-Id", search}},
              [&](const char* data, size_t len) {
                  body.append(data, len);
                  return parse_events(body).empty();
              });
    EXPECT_TRUE(parse_events(body).empty());
}

TEST_F(HttpGatewayTest, LastEventIdReplaysMissedEvents) {
    auto session = open_session("github");
    for (int n = 1; n <= 3; ++n) push_list_changed("github", n);

    auto first = read_events(session, 3);
    ASSERT_EQ(first.size(), 3u);
    EXPECT_EQ(first[2].id, 3u);

    auto replay = read_events(session, 2, "1");
    ASSERT_EQ(replay.size(), 2u);
    EXPECT_EQ(replay[0].id, 2u);
    EXPECT_EQ(replay[0].data["params"]["n"], 2);
    EXPECT_EQ(replay[1].id, 3u);

    push_list_changed("github", 4);
    auto next = read_events(session, 1, "3");
    ASSERT_EQ(next.size(), 1u);
    EXPECT_EQ(next[0].id, 4u);
    EXPECT_EQ(next[0].data["params"]["n"], 4);
}

TEST_F(HttpGatewayTest, EventStreamForUnknownSession) {
    auto res = client_->Get("/mcp", httplib::Headers{{"Mcp-Session-Id", "no-such-session"}});
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 404);
}

TEST_F(HttpGatewayTest, EventStreamRejectsBadLastEventId) {
    auto session = open_session("github");
    auto res = client_->Get("/mcp", httplib::Headers{{"Mcp-Session-Id", session},
                                                     {"Last-Event-ID", "seven"}});
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 400);
}

TEST_F(HttpGatewayTest, DeleteEndsOpenEventStream) {
    auto session = open_session("github");

    std::atomic<bool> finished{false};
    int status = 0;
    std::thread reader([&] {
        httplib::Client stream("127.0.0.1", gateway_->http_port());
        stream.set_read_timeout(10, 0);
        auto res = stream.Get("/mcp", httplib::Headers{{"Mcp-Session-Id", session}});
        if (res) status = res->status;
        finished = true;
    });
    std::this_thread::sleep_for(200ms);

    auto del = client_->Delete("/mcp", httplib::Headers{{"Mcp-Session-Id", session}});
    ASSERT_TRUE(del);
    EXPECT_EQ(del->status, 200);
    EXPECT_TRUE(eventually([&] { return finished.load(); }));
    reader.join();
    EXPECT_EQ(status, 200);
}
