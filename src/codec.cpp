#include "citadel/codec.hpp"
#include "citadel/error.hpp"
#include "citadel/version.hpp"
#include <nlohmann/json.hpp>
#include <simdjson.h>
#include <string>

namespace citadel {

namespace {

nlohmann::json to_nlohmann(simdjson::ondemand::value val) {
    switch (val.type()) {
        case simdjson::ondemand::json_type::object: {
            nlohmann::json obj = nlohmann::json::object();
            for (auto field : val.get_object()) {
                std::string_view key = field.unescaped_key();
                obj[std::string(key)] = to_nlohmann(field.value());
            }
            return obj;
        }
        case simdjson::ondemand::json_type::array: {
            nlohmann::json arr = nlohmann::json::array();
            for (auto elem : val.get_array()) {
                arr.push_back(to_nlohmann(elem.value()));
            }
            return arr;
        }
        case simdjson::ondemand::json_type::string: {
            std::string_view sv = val.get_string();
            return nlohmann::json(std::string(sv));
        }
        case simdjson::ondemand::json_type::number: {
            simdjson::ondemand::number num = val.get_number();
            switch (num.get_number_type()) {
                case simdjson::ondemand::number_type::signed_integer:
                    return nlohmann::json(num.get_int64());
                case simdjson::ondemand::number_type::unsigned_integer:
                    return nlohmann::json(num.get_uint64());
                default:
                    return nlohmann::json(num.get_double());
            }
        }
        case simdjson::ondemand::json_type::boolean:
            return nlohmann::json(val.get_bool().value());
        case simdjson::ondemand::json_type::null:
        default:
            return nlohmann::json(nullptr);
    }
}

} // anonymous namespace

nlohmann::json Codec::parse_json(std::string_view raw) {
    if (raw.empty()) {
        throw ParseError("Empty input");
    }

    simdjson::ondemand::parser parser;
    simdjson::padded_string padded(raw.data(), raw.size());

    simdjson::ondemand::document doc;
    auto err = parser.iterate(padded).get(doc);
    if (err) {
        throw ParseError(std::string("JSON parse error: ") + simdjson::error_message(err));
    }

    try {
        auto val = doc.get_value();
        if (val.error()) {
            throw ParseError(std::string("JSON parse error: ") + simdjson::error_message(val.error()));
        }
        nlohmann::json j = to_nlohmann(val.value());
        // On-demand parsing is lazy; trailing garbage only surfaces here.
        if (!doc.at_end()) {
            throw ParseError("JSON parse error: trailing content");
        }
        return j;
    } catch (const simdjson::simdjson_error& e) {
        throw ParseError(std::string("JSON parse error: ") + e.what());
    }
}

Envelope Codec::from_json(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw ParseError("Envelope must be a JSON object");
    }
    auto ver = j.find("jsonrpc");
    if (ver == j.end()) {
        throw ParseError("Missing 'jsonrpc' field");
    }
    if (!ver->is_string() || ver->get<std::string>() != JSONRPC_VERSION) {
        throw ParseError("Invalid jsonrpc version, expected '2.0'");
    }

    bool has_id = j.contains("id");
    auto m = j.find("method");
    bool has_method = m != j.end();
    if (has_method && !m->is_string()) {
        throw ParseError("'method' must be a string");
    }

    if (has_method && has_id) {
        if (j.at("id").is_null()) {
            throw ParseError("Request id must not be null");
        }
        Request req;
        citadel::from_json(j.at("id"), req.id);
        req.method = m->get<std::string>();
        if (j.contains("params")) req.params = j.at("params");
        return req;
    }
    if (has_method) {
        Notification notif;
        notif.method = m->get<std::string>();
        if (j.contains("params")) notif.params = j.at("params");
        return notif;
    }
    if (has_id) {
        if (j.at("id").is_null()) {
            throw ParseError("Response id must not be null");
        }
        bool has_result = j.contains("result");
        bool has_error = j.contains("error");
        if (!has_result && !has_error) {
            throw ParseError("Response carries neither 'result' nor 'error'");
        }
        Response resp;
        citadel::from_json(j.at("id"), resp.id);
        if (has_result) resp.result = j.at("result");
        if (has_error) {
            try {
                resp.error = j.at("error").get<RpcError>();
            } catch (const nlohmann::json::exception& e) {
                throw ParseError(std::string("Invalid error object: ") + e.what());
            }
        }
        return resp;
    }
    throw ParseError("Cannot determine envelope type: missing both 'id' and 'method'");
}

Envelope Codec::decode(std::string_view raw) {
    auto j = parse_json(raw);
    if (!j.is_object()) {
        throw ParseError("Envelope must be a JSON object");
    }
    return from_json(j);
}

Envelope Codec::decode_line(std::string_view line) {
    if (!line.empty() && line.back() == '\r') {
        line.remove_suffix(1);
    }
    return decode(line);
}

std::string Codec::encode(const Envelope& env) {
    nlohmann::json j;
    to_json(j, env);
    return j.dump();
}

} // namespace citadel
