#pragma once
#include "json_rpc.hpp"
#include "error.hpp"
#include <string_view>

namespace mcpbridge {

class Codec {
public:
    /// Parse any JSON text into a document.
    /// Throws ParseError on malformed input or trailing garbage.
    [[nodiscard]] static nlohmann::json parse_value(std::string_view raw);

    /// Parse raw JSON bytes into a typed message.
    /// Throws ParseError on invalid JSON or missing required fields.
    [[nodiscard]] static JsonRpcMessage parse(std::string_view raw);

    /// Classify an already parsed object.
    [[nodiscard]] static JsonRpcMessage parse_object(const nlohmann::json& j);

    /// Serialize a message to a single-line JSON string.
    [[nodiscard]] static std::string serialize(const JsonRpcMessage& msg);
};

} // namespace mcpbridge
