#include <benchmark/benchmark.h>
#include "citadel/codec.hpp"
#include "citadel/error.hpp"
#include "citadel/json_rpc.hpp"
#include <string>

using namespace citadel;

static const std::string kPing =
    R"({"jsonrpc":"2.0","id":1,"method":"ping","params":{}})";

// What a client sends through the gateway, server parameter included
static const std::string kToolCall =
    R"({"jsonrpc":"2.0","id":"c-42","method":"tools/call","params":{"server":"github","name":"search_issues","arguments":{"repo":"octo/hello","query":"is:open label:bug"}}})";

// A backend's tools/list answer with N tools
static std::string make_tools_list(int n) {
    nlohmann::json tools = nlohmann::json::array();
    for (int i = 0; i < n; ++i) {
        tools.push_back({
            {"name", "tool_" + std::to_string(i)},
            {"description", "Backend tool number " + std::to_string(i)},
            {"inputSchema", {
                {"type", "object"},
                {"properties", {
                    {"query", {{"type", "string"}}},
                    {"limit", {{"type", "integer"}}}
                }},
                {"required", {"query"}}
            }}
        });
    }
    nlohmann::json resp = {{"jsonrpc", "2.0"}, {"id", 1}, {"result", {{"tools", tools}}}};
    return resp.dump();
}

static const std::string kToolsList = make_tools_list(100);

// ---- Decode ----

static void BM_DecodePing(benchmark::State& state) {
    for (auto _ : state) {
        auto env = Codec::decode(kPing);
        benchmark::DoNotOptimize(env);
    }
    state.SetBytesProcessed(state.iterations() * kPing.size());
}
BENCHMARK(BM_DecodePing)->MinTime(1.0);

static void BM_DecodeToolCall(benchmark::State& state) {
    for (auto _ : state) {
        auto env = Codec::decode_line(kToolCall);
        benchmark::DoNotOptimize(env);
    }
    state.SetBytesProcessed(state.iterations() * kToolCall.size());
}
BENCHMARK(BM_DecodeToolCall)->MinTime(1.0);

static void BM_DecodeToolsList(benchmark::State& state) {
    for (auto _ : state) {
        auto env = Codec::decode(kToolsList);
        benchmark::DoNotOptimize(env);
    }
    state.SetBytesProcessed(state.iterations() * kToolsList.size());
}
BENCHMARK(BM_DecodeToolsList)->MinTime(1.0);

static void BM_DecodeMalformed(benchmark::State& state) {
    const std::string bad = "{this is not valid json at all!!!";
    for (auto _ : state) {
        try {
            auto env = Codec::decode(bad);
            benchmark::DoNotOptimize(env);
        } catch (const ParseError& e) {
            benchmark::DoNotOptimize(e.what());
        }
    }
}
BENCHMARK(BM_DecodeMalformed)->MinTime(1.0);

// ---- Encode ----

static void BM_EncodeForwardedRequest(benchmark::State& state) {
    auto env = Codec::decode(kToolCall);
    auto req = std::get<Request>(env);
    req.params->erase("server");
    req.id = RequestId{int64_t{1000}};
    Envelope out = req;

    for (auto _ : state) {
        auto s = Codec::encode(out);
        benchmark::DoNotOptimize(s);
    }
}
BENCHMARK(BM_EncodeForwardedRequest)->MinTime(1.0);

static void BM_EncodeToolsList(benchmark::State& state) {
    auto env = Codec::decode(kToolsList);
    for (auto _ : state) {
        auto s = Codec::encode(env);
        benchmark::DoNotOptimize(s);
    }
    state.SetBytesProcessed(state.iterations() * kToolsList.size());
}
BENCHMARK(BM_EncodeToolsList)->MinTime(1.0);

// Decode a client line, rewrite it for the backend, encode it again
static void BM_RelayRewrite(benchmark::State& state) {
    int64_t next_id = 1;
    for (auto _ : state) {
        auto env = Codec::decode_line(kToolCall);
        auto& req = std::get<Request>(env);
        req.params->erase("server");
        req.id = RequestId{next_id++};
        auto s = Codec::encode(env);
        benchmark::DoNotOptimize(s);
    }
}
BENCHMARK(BM_RelayRewrite)->MinTime(1.0);
