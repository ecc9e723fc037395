#include <benchmark/benchmark.h>
#include "ranger/ranger.hpp"
#include <unistd.h>
#include <memory>
#include <string>
#include <thread>

using namespace ranger;

namespace {

class DiscardSink : public ILogSink {
public:
    void write(const LogRecord& record) override { benchmark::DoNotOptimize(record); }
};

struct RangerFixture {
    LogContext logs{std::make_shared<DiscardSink>()};
    ResponderService responder{logs};
    std::unique_ptr<McpServer> server;

    RangerFixture() {
        ToolRegistry tools;
        register_ranger_tools(tools, responder);
        McpServer::Options opts;
        opts.server_info = Implementation{"bench-server", std::nullopt, std::string(SERVER_VERSION)};
        server = std::make_unique<McpServer>(opts, std::move(tools), logs);
    }
};

JsonRpcRequest tool_call(const std::string& name, nlohmann::json arguments) {
    JsonRpcRequest req;
    req.id = RequestId{int64_t{1}};
    req.method = "tools/call";
    req.params = {{"name", name}, {"arguments", std::move(arguments)}};
    return req;
}

} // namespace

static void BM_HandlePlain(benchmark::State& state) {
    RangerFixture fixture;
    const JsonRpcMessage msg = tool_call("ranger", nlohmann::json::object());
    for (auto _ : state) {
        auto reply = fixture.server->handle(msg);
        benchmark::DoNotOptimize(reply);
    }
}
BENCHMARK(BM_HandlePlain);

static void BM_HandleAnyRequest(benchmark::State& state) {
    RangerFixture fixture;
    const JsonRpcMessage msg = tool_call("any_request",
        {{"request", "hello"}, {"x", 1}, {"tags", {"a", "b", "c"}}});
    for (auto _ : state) {
        auto reply = fixture.server->handle(msg);
        benchmark::DoNotOptimize(reply);
    }
}
BENCHMARK(BM_HandleAnyRequest);

static void BM_HandleToolsList(benchmark::State& state) {
    RangerFixture fixture;
    JsonRpcRequest req;
    req.id = RequestId{int64_t{1}};
    req.method = "tools/list";
    const JsonRpcMessage msg = req;
    for (auto _ : state) {
        auto reply = fixture.server->handle(msg);
        benchmark::DoNotOptimize(reply);
    }
}
BENCHMARK(BM_HandleToolsList);

// Full round trip over a pipe pair, framing included.
static void BM_ToolCallStdio(benchmark::State& state) {
    RangerFixture fixture;
    int c2s[2];
    int s2c[2];
    if (::pipe(c2s) < 0 || ::pipe(s2c) < 0) {
        state.SkipWithError("pipe failed");
        return;
    }

    std::thread serve([&fixture, in = c2s[0], out = s2c[1]]() {
        fixture.server->serve(std::make_unique<StdioTransport>(in, out));
    });

    const std::string line =
        R"({"jsonrpc":"2.0","id":1,"method":"tools/call","params":{"name":"ranger"}})" "\n";
    std::string pending;
    char buf[4096];
    for (auto _ : state) {
        if (::write(c2s[1], line.data(), line.size()) != static_cast<ssize_t>(line.size())) {
            state.SkipWithError("write failed");
            break;
        }
        while (pending.find('\n') == std::string::npos) {
            ssize_t n = ::read(s2c[0], buf, sizeof(buf));
            if (n <= 0) break;
            pending.append(buf, static_cast<size_t>(n));
        }
        pending.erase(0, pending.find('\n') + 1);
    }
    state.SetLabel("stdio tools/call roundtrip");

    ::close(c2s[1]);
    serve.join();
    ::close(s2c[0]);
}
BENCHMARK(BM_ToolCallStdio)->UseRealTime();
