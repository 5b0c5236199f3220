#pragma once
#include "json_rpc.hpp"
#include "error.hpp"
#include <string_view>

namespace citadel {

class Codec {
public:
    /// Decode one envelope.
    /// Throws ParseError on invalid JSON or a malformed envelope.
    [[nodiscard]] static Envelope decode(std::string_view raw);

    /// Decode one newline-framed line (a trailing '\r' is ignored).
    [[nodiscard]] static Envelope decode_line(std::string_view line);

    [[nodiscard]] static std::string encode(const Envelope& env);

    /// Structural validation of an already parsed object.
    [[nodiscard]] static Envelope from_json(const nlohmann::json& j);

private:
    [[nodiscard]] static nlohmann::json parse_json(std::string_view raw);
};

} // namespace citadel
