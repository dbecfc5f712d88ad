#include <benchmark/benchmark.h>
#include "mcpparse/codec.hpp"
#include "mcpparse/json_rpc.hpp"
#include <string>
#include <vector>

using namespace mcpparse;

static const std::string kSimpleRequest =
    R"({"jsonrpc":"2.0","id":1,"method":"tools/list"})";

static const std::string kComplexRequest = R"({
    "jsonrpc": "2.0",
    "id": "request-12345",
    "method": "tools/call",
    "params": {
        "name": "get_posts",
        "arguments": {
            "userId": "1",
            "limit": 10,
            "filters": {
                "status": "published",
                "tags": ["rust", "python", "mcp"]
            }
        }
    }
})";

static const std::string kSimpleResponse =
    R"({"jsonrpc":"2.0","id":1,"result":{"status":"ok"}})";

// get_posts result carrying `count` posts, as the REST adapter returns them
static std::string make_posts_response(int count) {
    std::string posts;
    for (int i = 1; i <= count; ++i) {
        if (i > 1) posts += ",";
        posts += R"({"userId":)" + std::to_string((i - 1) / 10 + 1)
               + R"(,"id":)" + std::to_string(i)
               + R"(,"title":"post )" + std::to_string(i)
               + R"(","body":"quia et suscipit\nsuscipit recusandae consequuntur expedita et cum"})";
    }
    return R"({"jsonrpc":"2.0","id":"request-12345","result":{"content":[{"type":"text","text":"get_posts"}],"posts":[)"
           + posts + "]}}";
}

static const std::string kPostsResponse = make_posts_response(100);

// ---- Decode benchmarks ----

static void BM_DecodeSimpleRequest(benchmark::State& state) {
    for (auto _ : state) {
        auto req = Codec::decode_request(kSimpleRequest);
        benchmark::DoNotOptimize(req);
    }
    state.SetBytesProcessed(state.iterations() * kSimpleRequest.size());
}
BENCHMARK(BM_DecodeSimpleRequest)->MinTime(1.0);

static void BM_DecodeComplexRequest(benchmark::State& state) {
    for (auto _ : state) {
        auto req = Codec::decode_request(kComplexRequest);
        benchmark::DoNotOptimize(req);
    }
    state.SetBytesProcessed(state.iterations() * kComplexRequest.size());
}
BENCHMARK(BM_DecodeComplexRequest)->MinTime(1.0);

static void BM_DecodeSimpleResponse(benchmark::State& state) {
    for (auto _ : state) {
        auto resp = Codec::decode_response(kSimpleResponse);
        benchmark::DoNotOptimize(resp);
    }
    state.SetBytesProcessed(state.iterations() * kSimpleResponse.size());
}
BENCHMARK(BM_DecodeSimpleResponse)->MinTime(1.0);

static void BM_DecodePostsResponse(benchmark::State& state) {
    for (auto _ : state) {
        auto resp = Codec::decode_response(kPostsResponse);
        benchmark::DoNotOptimize(resp);
    }
    state.SetBytesProcessed(state.iterations() * kPostsResponse.size());
}
BENCHMARK(BM_DecodePostsResponse)->MinTime(1.0);

static void BM_DecodeInvalidJson(benchmark::State& state) {
    const std::string bad = "{this is not valid json at all!!!";
    for (auto _ : state) {
        auto req = Codec::decode_request(bad);
        benchmark::DoNotOptimize(req);
    }
}
BENCHMARK(BM_DecodeInvalidJson)->MinTime(1.0);

// ---- Admission filter ----

static void BM_IsValid(benchmark::State& state) {
    for (auto _ : state) {
        bool ok = Codec::is_valid(kSimpleRequest);
        benchmark::DoNotOptimize(ok);
    }
}
BENCHMARK(BM_IsValid)->MinTime(1.0);

static void BM_IsValidFastReject(benchmark::State& state) {
    const std::string other = R"({"id":1,"method":"tools/list","params":{"cursor":"abc"}})";
    for (auto _ : state) {
        bool ok = Codec::is_valid(other);
        benchmark::DoNotOptimize(ok);
    }
}
BENCHMARK(BM_IsValidFastReject)->MinTime(1.0);

// ---- Batch ----

static void BM_DecodeBatch(benchmark::State& state) {
    std::vector<std::string_view> inputs(static_cast<size_t>(state.range(0)), kSimpleRequest);
    for (auto _ : state) {
        auto reqs = Codec::decode_request_batch(inputs);
        benchmark::DoNotOptimize(reqs);
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_DecodeBatch)->Arg(100)->MinTime(1.0);

// ---- Serialize ----

static void BM_SerializeComplexRequest(benchmark::State& state) {
    auto req = Codec::parse_request(kComplexRequest);
    for (auto _ : state) {
        auto s = Codec::serialize(req);
        benchmark::DoNotOptimize(s);
    }
}
BENCHMARK(BM_SerializeComplexRequest)->MinTime(1.0);

static void BM_RoundTrip(benchmark::State& state) {
    for (auto _ : state) {
        auto req = Codec::decode_request(kComplexRequest);
        auto serialized = Codec::serialize(req.value());
        benchmark::DoNotOptimize(serialized);
    }
}
BENCHMARK(BM_RoundTrip)->MinTime(1.0);
