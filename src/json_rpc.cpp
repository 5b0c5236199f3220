#include "citadel/json_rpc.hpp"
#include "citadel/version.hpp"

namespace citadel {

std::string to_string(const RequestId& id) {
    if (const auto* i = std::get_if<int64_t>(&id)) return std::to_string(*i);
    return "\"" + std::get<std::string>(id) + "\"";
}

void to_json(nlohmann::json& j, const Request& r) {
    j = nlohmann::json::object();
    j["jsonrpc"] = std::string(JSONRPC_VERSION);
    to_json(j["id"], r.id);
    j["method"] = r.method;
    if (r.params) j["params"] = *r.params;
}

void to_json(nlohmann::json& j, const Response& r) {
    j = nlohmann::json::object();
    j["jsonrpc"] = std::string(JSONRPC_VERSION);
    to_json(j["id"], r.id);
    if (r.error) {
        j["error"] = *r.error;
    } else {
        j["result"] = r.result ? *r.result : nlohmann::json::object();
    }
}

void to_json(nlohmann::json& j, const Notification& n) {
    j = nlohmann::json::object();
    j["jsonrpc"] = std::string(JSONRPC_VERSION);
    j["method"] = n.method;
    if (n.params) j["params"] = *n.params;
}

void to_json(nlohmann::json& j, const Envelope& e) {
    std::visit([&j](const auto& v) { to_json(j, v); }, e);
}

RpcError make_rpc_error(Errc kind, const std::string& message, const std::string& server) {
    nlohmann::json data = {{"type", std::string(to_string(kind))}};
    if (!server.empty()) data["server"] = server;
    return RpcError{jsonrpc_code(kind), message, std::move(data)};
}

Response make_error_response(const RequestId& id, Errc kind,
                             const std::string& message, const std::string& server) {
    Response resp;
    resp.id = id;
    resp.error = make_rpc_error(kind, message, server);
    return resp;
}

nlohmann::json make_null_id_error(Errc kind, const std::string& message,
                                  const std::string& server) {
    return nlohmann::json{
        {"jsonrpc", std::string(JSONRPC_VERSION)},
        {"id", nullptr},
        {"error", make_rpc_error(kind, message, server)}
    };
}

} // namespace citadel
