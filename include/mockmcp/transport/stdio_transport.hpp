#pragma once
#include "transport.hpp"
#include "../codec.hpp"
#include <atomic>
#include <string>

namespace mockmcp {

/// StdioTransport reads newline-delimited JSON from stdin and writes to stdout.
/// Everything happens on the thread that calls start(): a line is decoded and
/// handed to the callback, and the next line is read only once it returns.
/// Responses are written straight to the descriptor, unbuffered.
class StdioTransport : public ITransport {
public:
    /// Create transport using system stdin/stdout.
    StdioTransport();

    /// Create transport using specified file descriptors (for testing).
    /// The transport takes ownership of both.
    StdioTransport(int read_fd, int write_fd);

    ~StdioTransport() override;

    StdioTransport(const StdioTransport&) = delete;
    StdioTransport& operator=(const StdioTransport&) = delete;

    void start(MessageCallback on_message, ErrorCallback on_error = nullptr) override;
    void send(const JsonRpcResponse& msg) override;
    /// Safe to call from any thread; interrupts a blocking read.
    void shutdown() override;
    bool is_connected() const override;

private:
    void read_loop(const MessageCallback& on_message, const ErrorCallback& on_error);
    void process_line(std::string line, const MessageCallback& on_message,
                      const ErrorCallback& on_error);
    void write_all(const std::string& data);
    void wake_reader();

    int read_fd_;
    int write_fd_;
    bool owns_fds_;

    std::atomic<bool> running_{false};
    std::atomic<bool> connected_{false};
    std::atomic<bool> shutdown_requested_{false};

    int wakeup_pipe_[2]{-1, -1};  // pipe for interrupting poll() on shutdown
};

} // namespace mockmcp
