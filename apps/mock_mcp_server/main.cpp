/// Mock MCP server — JSON-RPC 2.0 test double for MCP clients.
/// Usage: ./mock_mcp_server
/// Communicates over stdio (newline-delimited JSON-RPC) and exits when stdin closes.

#include <mockmcp/mockmcp.hpp>
#include <csignal>
#include <iostream>

int main() {
    // A vanished client must surface as a write error, not kill the process.
    std::signal(SIGPIPE, SIG_IGN);

    try {
        mockmcp::MockServer server;
        // Serve over stdio — blocks until end of input
        server.serve_stdio();
    } catch (const mockmcp::McpError& e) {
        std::cerr << "mock-mcp-server: " << e.what() << "\n";
    } catch (const std::exception& e) {
        std::cerr << "mock-mcp-server: fatal: " << e.what() << "\n";
    }
    return 0;
}
