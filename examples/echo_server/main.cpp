/// Echo server: a minimal stdio MCP backend for exercising the gateway.
/// Usage: ./citadel-echo-server
/// Speaks newline-delimited JSON-RPC on stdin/stdout.
///
/// Tools:
///   echo  {text}       returns the text
///   sleep {ms, text}   answers after `ms` milliseconds (replies may reorder)

#include <citadel/citadel.hpp>
#include <unistd.h>
#include <chrono>
#include <iostream>
#include <mutex>
#include <thread>
#include <vector>

namespace {

nlohmann::json tool_list() {
    return nlohmann::json::array({
        {
            {"name", "echo"},
            {"description", "Echo the input text back to the caller"},
            {"inputSchema", {
                {"type", "object"},
                {"properties", {{"text", {{"type", "string"}}}}},
                {"required", {"text"}}
            }}
        },
        {
            {"name", "sleep"},
            {"description", "Wait, then echo the input text"},
            {"inputSchema", {
                {"type", "object"},
                {"properties", {{"ms", {{"type", "integer"}}}, {"text", {{"type", "string"}}}}},
                {"required", {"ms"}}
            }}
        }
    });
}

nlohmann::json text_result(const std::string& text) {
    return {{"content", {{{"type", "text"}, {"text", text}}}}, {"isError", false}};
}

} // anonymous namespace

int main() {
    citadel::StdioTransport transport(STDIN_FILENO, STDOUT_FILENO);

    std::mutex workers_mutex;
    std::vector<std::thread> workers;

    auto reply = [&transport](const citadel::RequestId& id, nlohmann::json result) {
        try {
            transport.send(citadel::Response{id, std::move(result), std::nullopt});
        } catch (const citadel::TransportError& e) {
            std::cerr << "echo-server: " << e.what() << "\n";
        }
    };

    auto fail = [&transport](const citadel::RequestId& id, int code, const std::string& msg) {
        try {
            transport.send(citadel::Response{id, std::nullopt,
                                             citadel::RpcError{code, msg, std::nullopt}});
        } catch (const citadel::TransportError& e) {
            std::cerr << "echo-server: " << e.what() << "\n";
        }
    };

    transport.start([&](citadel::Envelope env) {
        auto* req = std::get_if<citadel::Request>(&env);
        if (!req) return;
        auto params = req->params.value_or(nlohmann::json::object());

        if (req->method == "initialize") {
            reply(req->id, {
                {"protocolVersion", params.value("protocolVersion",
                                                 std::string(citadel::PROTOCOL_VERSION))},
                {"capabilities", {{"tools", nlohmann::json::object()}}},
                {"serverInfo", {{"name", "echo-server"}, {"version", "1.0.0"}}},
                {"instructions", "Returns whatever you send it."}
            });
        } else if (req->method == "ping") {
            reply(req->id, nlohmann::json::object());
        } else if (req->method == "tools/list") {
            reply(req->id, {{"tools", tool_list()}});
        } else if (req->method == "tools/call") {
            auto name = params.value("name", "");
            auto args = params.value("arguments", nlohmann::json::object());
            if (name == "echo") {
                reply(req->id, text_result(args.value("text", "")));
            } else if (name == "sleep") {
                auto ms = args.value("ms", 0);
                auto text = args.value("text", "");
                std::lock_guard<std::mutex> lock(workers_mutex);
                workers.emplace_back([reply, id = req->id, ms, text]() {
                    std::this_thread::sleep_for(std::chrono::milliseconds(ms));
                    reply(id, text_result(text));
                });
            } else {
                fail(req->id, citadel::error::InvalidParams, "Unknown tool: " + name);
            }
        } else {
            fail(req->id, citadel::error::MethodNotFound, "Method not found: " + req->method);
        }
    });

    std::lock_guard<std::mutex> lock(workers_mutex);
    for (auto& w : workers) w.join();
    return 0;
}
