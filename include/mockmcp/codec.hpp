#pragma once
#include "json_rpc.hpp"
#include "error.hpp"
#include <string>
#include <string_view>

namespace mockmcp {

class Codec {
public:
    /// Parse one line of raw JSON into a request.
    /// Throws McpParseError on invalid JSON or when the document is not an object.
    /// Any object is accepted; member validation is left to dispatch.
    [[nodiscard]] static JsonRpcRequest parse(std::string_view raw);

    /// Serialize a response to a single line of compact JSON (no trailing newline).
    [[nodiscard]] static std::string serialize(const JsonRpcResponse& resp);
};

} // namespace mockmcp
