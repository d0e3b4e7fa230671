#pragma once
#include "json_rpc.hpp"
#include "error.hpp"
#include <string_view>

namespace ambassador {

class Codec {
public:
    /// Parse one JSON-RPC 2.0 frame.
    /// Throws ParseError on invalid JSON, a non-object root, a missing or
    /// wrong "jsonrpc" field, or a null request id.
    [[nodiscard]] static JsonRpcMessage parse(std::string_view raw);

    /// Parse arbitrary JSON text into a DOM. Throws ParseError.
    [[nodiscard]] static nlohmann::json parse_json(std::string_view raw);

    /// Serialize a response to a single-line JSON string.
    [[nodiscard]] static std::string serialize(const JsonRpcResponse& msg);

private:
    static JsonRpcMessage parse_object(const nlohmann::json& j);
};

} // namespace ambassador
