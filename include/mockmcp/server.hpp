#pragma once
#include "types.hpp"
#include "json_rpc.hpp"
#include "tool_registry.hpp"
#include "version.hpp"
#include "transport/transport.hpp"
#include <chrono>
#include <iosfwd>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace mockmcp {

/// MCP test double: answers initialize, tools/list and tools/call for a fixed
/// catalog (echo, add, fail, slow), one request at a time.
class MockServer {
public:
    struct Options {
        Implementation server_info{std::string(SERVER_NAME), std::string(SERVER_VERSION)};
        std::string default_protocol_version{DEFAULT_PROTOCOL_VERSION};
        // Wait used by `slow` when delayMs is absent or unusable.
        std::chrono::milliseconds slow_default_delay{1000};
        LogLevel log_level = LogLevel::Warning;
        std::ostream* log_sink = nullptr;  // stderr when null
    };

    MockServer();
    explicit MockServer(Options opts);
    ~MockServer();

    // Non-copyable, non-movable
    MockServer(const MockServer&) = delete;
    MockServer& operator=(const MockServer&) = delete;

    /// Dispatch one decoded request. nullopt for notifications. Exceptions
    /// other than McpProtocolError escape; handle_line() turns them into a
    /// parse error response.
    [[nodiscard]] std::optional<JsonRpcResponse> handle(const JsonRpcRequest& req);

    /// Full per-line pipeline: decode, dispatch, encode. Blank lines and
    /// notifications yield nullopt; undecodable lines yield a parse error.
    [[nodiscard]] std::optional<std::string> handle_line(std::string_view line);

    /// The -32700 response sent for undecodable input.
    [[nodiscard]] static JsonRpcResponse parse_error(const std::string& detail);

    [[nodiscard]] const ToolRegistry& tools() const;

    // ---- Transport ----
    /// Blocks until the transport reaches end of input or shutdown() is called.
    void serve(std::unique_ptr<ITransport> transport);
    void serve_stdio();
    void shutdown();

    bool is_running() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace mockmcp
