#pragma once
#include "error.hpp"
#include <cstdint>
#include <string>
#include <variant>
#include <optional>
#include <nlohmann/json.hpp>

namespace citadel {

using RequestId = std::variant<int64_t, std::string>;

inline void to_json(nlohmann::json& j, const RequestId& id) {
    std::visit([&j](const auto& v) { j = v; }, id);
}

inline void from_json(const nlohmann::json& j, RequestId& id) {
    if (j.is_number_integer()) {
        id = j.get<int64_t>();
    } else if (j.is_string()) {
        id = j.get<std::string>();
    } else {
        throw ParseError("Request id must be an integer or a string");
    }
}

/// Printable form of an id, for logs.
std::string to_string(const RequestId& id);

struct RpcError {
    int code;
    std::string message;
    std::optional<nlohmann::json> data;

    bool operator==(const RpcError& o) const {
        return code == o.code && message == o.message && data == o.data;
    }
};

inline void to_json(nlohmann::json& j, const RpcError& e) {
    j = nlohmann::json{{"code", e.code}, {"message", e.message}};
    if (e.data) j["data"] = *e.data;
}

inline void from_json(const nlohmann::json& j, RpcError& e) {
    e.code = j.at("code").get<int>();
    e.message = j.at("message").get<std::string>();
    if (j.contains("data")) e.data = j.at("data");
}

struct Request {
    RequestId id;
    std::string method;
    std::optional<nlohmann::json> params;

    bool operator==(const Request& o) const {
        return id == o.id && method == o.method && params == o.params;
    }
};

struct Response {
    RequestId id;
    std::optional<nlohmann::json> result;
    std::optional<RpcError> error;

    bool operator==(const Response& o) const {
        return id == o.id && result == o.result && error == o.error;
    }
};

struct Notification {
    std::string method;
    std::optional<nlohmann::json> params;

    bool operator==(const Notification& o) const {
        return method == o.method && params == o.params;
    }
};

using Envelope = std::variant<Request, Response, Notification>;

void to_json(nlohmann::json& j, const Request& r);
void to_json(nlohmann::json& j, const Response& r);
void to_json(nlohmann::json& j, const Notification& n);
void to_json(nlohmann::json& j, const Envelope& e);

/// Builds the error object for a gateway error kind.
RpcError make_rpc_error(Errc kind, const std::string& message,
                        const std::string& server = {});

/// Builds an error response carrying `id`.
Response make_error_response(const RequestId& id, Errc kind,
                             const std::string& message,
                             const std::string& server = {});

/// Error envelope for failures where no request id is known (serialized with
/// "id": null).
nlohmann::json make_null_id_error(Errc kind, const std::string& message,
                                  const std::string& server = {});

} // namespace citadel
