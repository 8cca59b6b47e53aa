#include <benchmark/benchmark.h>
#include "mockmcp/codec.hpp"
#include "mockmcp/json_rpc.hpp"
#include <string>

using namespace mockmcp;

static const std::string kInitializeRequest =
    R"({"jsonrpc":"2.0","id":1,"method":"initialize","params":{"protocolVersion":"2024-11-05","capabilities":{},"clientInfo":{"name":"bench","version":"1.0"}}})";

static const std::string kToolCallRequest =
    R"({"jsonrpc":"2.0","id":42,"method":"tools/call","params":{"name":"echo","arguments":{"message":"hello from the benchmark"}}})";

// ---- Parse benchmarks ----

static void BM_ParseInitialize(benchmark::State& state) {
    for (auto _ : state) {
        auto req = Codec::parse(kInitializeRequest);
        benchmark::DoNotOptimize(req);
    }
    state.SetBytesProcessed(state.iterations() * kInitializeRequest.size());
}
BENCHMARK(BM_ParseInitialize);

static void BM_ParseToolCall(benchmark::State& state) {
    for (auto _ : state) {
        auto req = Codec::parse(kToolCallRequest);
        benchmark::DoNotOptimize(req);
    }
    state.SetBytesProcessed(state.iterations() * kToolCallRequest.size());
}
BENCHMARK(BM_ParseToolCall);

static void BM_ParseMalformed(benchmark::State& state) {
    const std::string bad = "{bad json";
    for (auto _ : state) {
        try {
            auto req = Codec::parse(bad);
            benchmark::DoNotOptimize(req);
        } catch (const McpParseError& e) {
            benchmark::DoNotOptimize(e.what());
        }
    }
}
BENCHMARK(BM_ParseMalformed);

// ---- Serialize benchmarks ----

static void BM_SerializeToolResult(benchmark::State& state) {
    auto resp = JsonRpcResponse::success(42, nlohmann::json{
        {"content", {{{"type", "text"}, {"text", std::string(static_cast<size_t>(state.range(0)), 'x')}}}},
        {"isError", false}
    });
    for (auto _ : state) {
        auto out = Codec::serialize(resp);
        benchmark::DoNotOptimize(out);
    }
}
BENCHMARK(BM_SerializeToolResult)->Range(16, 64 << 10);

static void BM_SerializeError(benchmark::State& state) {
    auto resp = JsonRpcResponse::failure(nullptr, -32700, "Parse error: bad input");
    for (auto _ : state) {
        auto out = Codec::serialize(resp);
        benchmark::DoNotOptimize(out);
    }
}
BENCHMARK(BM_SerializeError);
