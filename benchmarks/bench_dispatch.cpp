#include <benchmark/benchmark.h>
#include "mockmcp/router.hpp"
#include "mockmcp/server.hpp"
#include <sstream>
#include <string>

using namespace mockmcp;

static void BM_RouterKnownMethod(benchmark::State& state) {
    Router router;
    router.on_request("tools/list", [](const nlohmann::json&) -> HandlerResult {
        return nlohmann::json{{"tools", nlohmann::json::array()}};
    });

    JsonRpcRequest req;
    req.id = 1;
    req.method = "tools/list";

    for (auto _ : state) {
        auto resp = router.dispatch(req);
        benchmark::DoNotOptimize(resp);
    }
}
BENCHMARK(BM_RouterKnownMethod);

static void BM_RouterUnknownMethod(benchmark::State& state) {
    Router router;
    JsonRpcRequest req;
    req.id = 1;
    req.method = "resources/list";

    for (auto _ : state) {
        auto resp = router.dispatch(req);
        benchmark::DoNotOptimize(resp);
    }
}
BENCHMARK(BM_RouterUnknownMethod);

// Whole line pipeline: decode, dispatch, tool call, encode.
static void BM_HandleLine(benchmark::State& state, const char* line) {
    std::ostringstream log;
    MockServer::Options opts;
    opts.log_sink = &log;
    MockServer server{opts};

    for (auto _ : state) {
        auto out = server.handle_line(line);
        benchmark::DoNotOptimize(out);
    }
}
BENCHMARK_CAPTURE(BM_HandleLine, initialize,
                  R"({"jsonrpc":"2.0","id":1,"method":"initialize","params":{}})");
BENCHMARK_CAPTURE(BM_HandleLine, tools_list,
                  R"({"jsonrpc":"2.0","id":2,"method":"tools/list"})");
BENCHMARK_CAPTURE(BM_HandleLine, echo,
                  R"({"jsonrpc":"2.0","id":3,"method":"tools/call","params":{"name":"echo","arguments":{"message":"hi"}}})");
BENCHMARK_CAPTURE(BM_HandleLine, add,
                  R"({"jsonrpc":"2.0","id":4,"method":"tools/call","params":{"name":"add","arguments":{"a":0.1,"b":0.2}}})");
BENCHMARK_CAPTURE(BM_HandleLine, parse_error, "{bad json");
