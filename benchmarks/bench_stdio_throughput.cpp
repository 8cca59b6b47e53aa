#include <benchmark/benchmark.h>
#include "mockmcp/server.hpp"
#include "mockmcp/transport/stdio_transport.hpp"
#include <unistd.h>
#include <sstream>
#include <string>
#include <thread>

using namespace mockmcp;

static std::string make_echo_request(int id) {
    return R"({"jsonrpc":"2.0","id":)" + std::to_string(id) +
           R"(,"method":"tools/call","params":{"name":"echo","arguments":{"message":"ping"}}})" "\n";
}

// Round trip of N echo calls through the pipe transport.
static void BM_StdioThroughput(benchmark::State& state) {
    const int n = static_cast<int>(state.range(0));

    int client_to_server[2], server_to_client[2];
    if (pipe(client_to_server) < 0 || pipe(server_to_client) < 0) {
        state.SkipWithError("pipe failed");
        return;
    }

    std::ostringstream log;
    MockServer::Options opts;
    opts.log_sink = &log;
    MockServer server{opts};

    auto transport = std::make_unique<StdioTransport>(client_to_server[0], server_to_client[1]);
    std::thread server_thread([&server, t = std::move(transport)]() mutable {
        server.serve(std::move(t));
    });

    std::string batch;
    for (int i = 1; i <= n; ++i) batch += make_echo_request(i);

    char buf[8192];
    for (auto _ : state) {
        // Pipe buffers hold the batch for modest N; the server answers as it reads.
        size_t off = 0;
        while (off < batch.size()) {
            ssize_t w = write(client_to_server[1], batch.data() + off, batch.size() - off);
            if (w < 0) break;
            off += static_cast<size_t>(w);
        }

        int lines = 0;
        while (lines < n) {
            ssize_t r = read(server_to_client[0], buf, sizeof(buf));
            if (r <= 0) break;
            for (ssize_t i = 0; i < r; ++i) {
                if (buf[i] == '\n') ++lines;
            }
        }
    }
    state.SetItemsProcessed(state.iterations() * n);

    close(client_to_server[1]);
    if (server_thread.joinable()) server_thread.join();
    close(server_to_client[0]);
}
BENCHMARK(BM_StdioThroughput)->Arg(10)->Arg(100);
