#include <benchmark/benchmark.h>
#include "datauri/builder.hpp"
#include "datauri/data_uri.hpp"
#include <sstream>
#include <string>
#include <vector>

using namespace datauri;

static std::vector<uint8_t> CreateTextData(size_t size) {
    static const std::string words = "Lorem ipsum dolor sit amet, consectetur adipiscing elit; 100% done & more. ";
    std::vector<uint8_t> data;
    data.reserve(size);
    while (data.size() < size) {
        data.push_back(static_cast<uint8_t>(words[data.size() % words.size()]));
    }
    return data;
}

static void BM_MediaType_Parse(benchmark::State& state) {
    for (auto _ : state) {
        auto mediaType = MediaType::parse("text/html; charset=\"UTF-8\"; name=\"index;v=2\"; q=\\\"x\\\"");
        benchmark::DoNotOptimize(mediaType);
    }
}
BENCHMARK(BM_MediaType_Parse);

static void BM_Encode_Base64(benchmark::State& state) {
    auto data = CreateTextData(static_cast<size_t>(state.range(0)));
    auto mediaType = MediaType::create("application/octet-stream");
    for (auto _ : state) {
        auto uri = encodeUri(mediaType, data, true);
        benchmark::DoNotOptimize(uri);
    }
    state.SetBytesProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_Encode_Base64)->Arg(1024)->Arg(65536);

static void BM_Encode_Text(benchmark::State& state) {
    auto data = CreateTextData(static_cast<size_t>(state.range(0)));
    auto mediaType = MediaType::create("text/plain", {{"charset", "UTF-8"}});
    for (auto _ : state) {
        auto uri = encodeUri(mediaType, data, false);
        benchmark::DoNotOptimize(uri);
    }
    state.SetBytesProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_Encode_Text)->Arg(1024)->Arg(65536);

static void BM_Decode_Base64(benchmark::State& state) {
    auto uri = encodeUri(std::nullopt, CreateTextData(static_cast<size_t>(state.range(0))), true);
    for (auto _ : state) {
        auto body = decodeUri(uri);
        benchmark::DoNotOptimize(body);
    }
    state.SetBytesProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_Decode_Base64)->Arg(1024)->Arg(65536);

static void BM_Decode_Text(benchmark::State& state) {
    auto uri = encodeUri(std::nullopt, CreateTextData(static_cast<size_t>(state.range(0))), false);
    for (auto _ : state) {
        auto body = decodeUri(uri);
        benchmark::DoNotOptimize(body);
    }
    state.SetBytesProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_Decode_Text)->Arg(1024)->Arg(65536);

static void BM_Builder_Stream(benchmark::State& state) {
    auto data = CreateTextData(65536);
    const std::string text(data.begin(), data.end());
    for (auto _ : state) {
        std::istringstream in(text);
        auto uri = DataUriBuilder::fromBytes(in).withMediaType("text/plain").build();
        benchmark::DoNotOptimize(uri);
    }
}
BENCHMARK(BM_Builder_Stream);
