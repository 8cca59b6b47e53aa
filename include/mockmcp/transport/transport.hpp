#pragma once
#include "../json_rpc.hpp"
#include <exception>
#include <functional>

namespace mockmcp {

/// Callback for incoming requests
using MessageCallback = std::function<void(JsonRpcRequest)>;
/// Receives McpParseError for undecodable input and McpTransportError for I/O failures.
using ErrorCallback = std::function<void(std::exception_ptr)>;

/// Abstract transport interface
class ITransport {
public:
    virtual ~ITransport() = default;

    /// Start the transport. Blocks until end of input or shutdown.
    /// Callbacks run on the calling thread, one message at a time.
    virtual void start(MessageCallback on_message,
                       ErrorCallback on_error = nullptr) = 0;

    /// Send a response to the remote peer. Throws McpTransportError on failure.
    virtual void send(const JsonRpcResponse& msg) = 0;

    /// Graceful shutdown.
    virtual void shutdown() = 0;

    /// Check if transport is connected.
    [[nodiscard]] virtual bool is_connected() const = 0;
};

} // namespace mockmcp
