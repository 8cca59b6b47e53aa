#include <gtest/gtest.h>
#include "mockmcp/transport/stdio_transport.hpp"
#include "mockmcp/codec.hpp"
#include "mockmcp/error.hpp"
#include <unistd.h>
#include <poll.h>
#include <csignal>
#include <chrono>
#include <memory>
#include <string>
#include <thread>
#include <vector>

using namespace mockmcp;

namespace {

// Pipes wired to a transport: the test writes to `in`, the transport reads it;
// the transport writes `out`, the test reads it. The transport owns its ends.
class TransportPipes {
public:
    TransportPipes() {
        if (pipe(in_) < 0 || pipe(out_) < 0) {
            throw std::runtime_error("pipe failed");
        }
        transport_ = std::make_unique<StdioTransport>(in_[0], out_[1]);
    }

    ~TransportPipes() {
        transport_.reset();
        close_input();
        if (out_[0] >= 0) close(out_[0]);
    }

    StdioTransport& transport() { return *transport_; }

    void write_input(const std::string& data) {
        ASSERT_EQ(write(in_[1], data.data(), data.size()), static_cast<ssize_t>(data.size()));
    }

    void close_input() {
        if (in_[1] >= 0) {
            close(in_[1]);
            in_[1] = -1;
        }
    }

    void close_output_reader() {
        if (out_[0] >= 0) {
            close(out_[0]);
            out_[0] = -1;
        }
    }

    // Reads until a newline arrives or the timeout expires.
    std::string read_output_line(int timeout_ms = 2000) {
        std::string line;
        char c;
        while (true) {
            struct pollfd pfd{out_[0], POLLIN, 0};
            if (poll(&pfd, 1, timeout_ms) <= 0) break;
            if (read(out_[0], &c, 1) != 1) break;
            if (c == '\n') break;
            line.push_back(c);
        }
        return line;
    }

private:
    int in_[2]{-1, -1};
    int out_[2]{-1, -1};
    std::unique_ptr<StdioTransport> transport_;
};

} // namespace

TEST(StdioTransport, DeliversRequestsInOrder) {
    TransportPipes pipes;
    pipes.write_input(R"({"jsonrpc":"2.0","id":1,"method":"initialize"})" "\n"
                      R"({"jsonrpc":"2.0","method":"notifications/initialized"})" "\n"
                      R"({"jsonrpc":"2.0","id":"b","method":"tools/list"})" "\n");
    pipes.close_input();

    std::vector<JsonRpcRequest> received;
    pipes.transport().start([&](JsonRpcRequest req) { received.push_back(std::move(req)); });

    ASSERT_EQ(received.size(), 3u);
    EXPECT_EQ(received[0].method_name(), "initialize");
    EXPECT_EQ(*received[0].id, 1);
    EXPECT_FALSE(received[1].has_id());
    EXPECT_EQ(received[2].method_name(), "tools/list");
    EXPECT_EQ(*received[2].id, "b");
}

TEST(StdioTransport, SkipsBlankLinesAndStripsCarriageReturns) {
    TransportPipes pipes;
    pipes.write_input("\n   \n\r\n{\"jsonrpc\":\"2.0\",\"id\":1,\"method\":\"tools/list\"}\r\n\t\n");
    pipes.close_input();

    int messages = 0;
    int errors = 0;
    pipes.transport().start([&](JsonRpcRequest) { ++messages; },
                            [&](std::exception_ptr) { ++errors; });
    EXPECT_EQ(messages, 1);
    EXPECT_EQ(errors, 0);
}

TEST(StdioTransport, ReportsUndecodableLines) {
    TransportPipes pipes;
    pipes.write_input("{bad json\n{\"jsonrpc\":\"2.0\",\"id\":2,\"method\":\"tools/list\"}\n");
    pipes.close_input();

    std::vector<std::string> parse_errors;
    int messages = 0;
    pipes.transport().start(
        [&](JsonRpcRequest) { ++messages; },
        [&](std::exception_ptr ep) {
            try {
                std::rethrow_exception(ep);
            } catch (const McpParseError& e) {
                parse_errors.emplace_back(e.what());
            }
        });

    ASSERT_EQ(parse_errors.size(), 1u);
    EXPECT_FALSE(parse_errors[0].empty());
    // The loop keeps going after a bad line.
    EXPECT_EQ(messages, 1);
}

TEST(StdioTransport, ProcessesUnterminatedLastLine) {
    TransportPipes pipes;
    pipes.write_input(R"({"jsonrpc":"2.0","id":9,"method":"tools/list"})");
    pipes.close_input();

    std::vector<JsonRpcRequest> received;
    pipes.transport().start([&](JsonRpcRequest req) { received.push_back(std::move(req)); });
    ASSERT_EQ(received.size(), 1u);
    EXPECT_EQ(*received[0].id, 9);
}

TEST(StdioTransport, LineSplitAcrossWrites) {
    TransportPipes pipes;
    std::vector<JsonRpcRequest> received;
    std::thread reader([&]() {
        pipes.transport().start([&](JsonRpcRequest req) { received.push_back(std::move(req)); });
    });

    pipes.write_input(R"({"jsonrpc":"2.0","id":1,)");
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    pipes.write_input(R"("method":"tools/list"})" "\n");
    pipes.close_input();
    reader.join();

    ASSERT_EQ(received.size(), 1u);
    EXPECT_EQ(received[0].method_name(), "tools/list");
}

TEST(StdioTransport, SendWritesOneLine) {
    TransportPipes pipes;
    pipes.transport().send(JsonRpcResponse::success(1, nlohmann::json{{"text", "a\nb"}}));

    auto line = pipes.read_output_line();
    auto j = nlohmann::json::parse(line);
    EXPECT_EQ(j["jsonrpc"], "2.0");
    EXPECT_EQ(j["id"], 1);
    EXPECT_EQ(j["result"]["text"], "a\nb");
}

TEST(StdioTransport, RespondsFromCallback) {
    TransportPipes pipes;
    pipes.write_input(R"({"jsonrpc":"2.0","id":5,"method":"x"})" "\n");
    pipes.close_input();

    pipes.transport().start([&](JsonRpcRequest req) {
        pipes.transport().send(JsonRpcResponse::success(*req.id, nlohmann::json::object()));
    });

    auto j = nlohmann::json::parse(pipes.read_output_line());
    EXPECT_EQ(j["id"], 5);
}

TEST(StdioTransport, WriteToClosedReaderThrows) {
    std::signal(SIGPIPE, SIG_IGN);
    TransportPipes pipes;
    pipes.close_output_reader();
    EXPECT_THROW(pipes.transport().send(JsonRpcResponse::success(1, nlohmann::json::object())),
                 McpTransportError);
    EXPECT_FALSE(pipes.transport().is_connected());
}

TEST(StdioTransport, ShutdownFromAnotherThreadUnblocksStart) {
    TransportPipes pipes;
    std::thread reader([&]() { pipes.transport().start([](JsonRpcRequest) {}); });

    // Wait until the read loop is up.
    for (int i = 0; i < 200 && !pipes.transport().is_connected(); ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    EXPECT_TRUE(pipes.transport().is_connected());

    pipes.transport().shutdown();
    reader.join();
    EXPECT_FALSE(pipes.transport().is_connected());
}

TEST(StdioTransport, ShutdownBeforeStartReturnsImmediately) {
    TransportPipes pipes;
    pipes.transport().shutdown();
    pipes.transport().start([](JsonRpcRequest) {});
    EXPECT_FALSE(pipes.transport().is_connected());
    EXPECT_THROW(pipes.transport().send(JsonRpcResponse::success(1, nullptr)), McpTransportError);
}

TEST(StdioTransport, NotConnectedUntilStarted) {
    TransportPipes pipes;
    EXPECT_FALSE(pipes.transport().is_connected());
}
