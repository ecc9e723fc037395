#include <benchmark/benchmark.h>
#include "ranger/codec.hpp"
#include "ranger/error.hpp"
#include "ranger/json_rpc.hpp"
#include <string>

using namespace ranger;

static const std::string kPing =
    R"({"jsonrpc":"2.0","id":1,"method":"ping","params":{}})";

static const std::string kToolCall =
    R"({"jsonrpc":"2.0","id":42,"method":"tools/call","params":{"name":"any_request","arguments":{"request":"hello","x":1,"nested":{"a":[1,2,3]}}}})";

static const std::string kToolResult =
    R"({"jsonrpc":"2.0","id":42,"result":{"content":[{"type":"text","text":"Ranger！"}],"isError":false}})";

static std::string make_batch(int n) {
    nlohmann::json batch = nlohmann::json::array();
    for (int i = 0; i < n; ++i) {
        batch.push_back({{"jsonrpc", "2.0"}, {"id", i}, {"method", "tools/call"},
                         {"params", {{"name", "ranger"}}}});
    }
    return batch.dump();
}

static void BM_ParsePing(benchmark::State& state) {
    for (auto _ : state) {
        auto msg = Codec::parse(kPing);
        benchmark::DoNotOptimize(msg);
    }
    state.SetBytesProcessed(state.iterations() * kPing.size());
}
BENCHMARK(BM_ParsePing);

static void BM_ParseToolCall(benchmark::State& state) {
    for (auto _ : state) {
        auto msg = Codec::parse(kToolCall);
        benchmark::DoNotOptimize(msg);
    }
    state.SetBytesProcessed(state.iterations() * kToolCall.size());
}
BENCHMARK(BM_ParseToolCall);

static void BM_ParseBatch(benchmark::State& state) {
    const std::string raw = make_batch(static_cast<int>(state.range(0)));
    for (auto _ : state) {
        auto msgs = Codec::parse_batch(raw);
        benchmark::DoNotOptimize(msgs);
    }
    state.SetBytesProcessed(state.iterations() * raw.size());
}
BENCHMARK(BM_ParseBatch)->Arg(8)->Arg(64);

static void BM_ParseInvalidJson(benchmark::State& state) {
    const std::string bad = "{this is not valid json at all!!!";
    for (auto _ : state) {
        try {
            auto msg = Codec::parse(bad);
            benchmark::DoNotOptimize(msg);
        } catch (const McpParseError& e) {
            benchmark::DoNotOptimize(e.code);
        }
    }
}
BENCHMARK(BM_ParseInvalidJson);

static void BM_SerializeToolResult(benchmark::State& state) {
    auto msg = Codec::parse(kToolResult);
    for (auto _ : state) {
        auto s = Codec::serialize(msg);
        benchmark::DoNotOptimize(s);
    }
}
BENCHMARK(BM_SerializeToolResult);
