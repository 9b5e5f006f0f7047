#include <benchmark/benchmark.h>
#include "datauri/base64.hpp"
#include <algorithm>
#include <vector>
#include <span>
#include <string>
#include <random>

using namespace datauri;

// Test data of different sizes
static const std::vector<uint8_t> SMALL_DATA = {0x48, 0x65, 0x6C, 0x6C, 0x6F, 0x2C, 0x20, 0x57, 0x6F, 0x72, 0x6C, 0x64, 0x21}; // "Hello, World!"

static std::vector<uint8_t> CreateRandomData(size_t size) {
    std::vector<uint8_t> data(size);
    std::mt19937 gen(42); // Fixed seed for reproducible benchmarks
    std::uniform_int_distribution<int> dis(0, 255);
    for (auto& byte : data) {
        byte = static_cast<uint8_t>(dis(gen));
    }
    return data;
}

static void BM_Base64_Encode_Small(benchmark::State& state) {
    for (auto _ : state) {
        std::string encoded = base64Encode(SMALL_DATA);
        benchmark::DoNotOptimize(encoded);
    }
}
BENCHMARK(BM_Base64_Encode_Small);

static void BM_Base64_Encode(benchmark::State& state) {
    auto data = CreateRandomData(static_cast<size_t>(state.range(0)));
    for (auto _ : state) {
        std::string encoded = base64Encode(data);
        benchmark::DoNotOptimize(encoded);
    }
    state.SetBytesProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_Base64_Encode)->Arg(1024)->Arg(10240)->Arg(102400);

static void BM_Base64_Decode(benchmark::State& state) {
    auto encoded = base64Encode(CreateRandomData(static_cast<size_t>(state.range(0))));
    for (auto _ : state) {
        auto decoded = base64Decode(encoded);
        benchmark::DoNotOptimize(decoded);
    }
    state.SetBytesProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_Base64_Decode)->Arg(1024)->Arg(10240)->Arg(102400);

// Encoder fed in small pieces, as from a stream
static void BM_Base64_Encoder_Chunked(benchmark::State& state) {
    auto data = CreateRandomData(102400);
    const size_t chunk = static_cast<size_t>(state.range(0));
    for (auto _ : state) {
        std::string out;
        Base64Appender appender(out);
        Base64Encoder encoder(appender);
        for (size_t offset = 0; offset < data.size(); offset += chunk) {
            size_t n = std::min(chunk, data.size() - offset);
            encoder.update(std::span<const uint8_t>(data.data() + offset, n));
        }
        encoder.finish();
        benchmark::DoNotOptimize(out);
    }
    state.SetBytesProcessed(state.iterations() * static_cast<int64_t>(data.size()));
}
BENCHMARK(BM_Base64_Encoder_Chunked)->Arg(7)->Arg(256)->Arg(4096);

static void BM_Base64_Appender_Bytes(benchmark::State& state) {
    auto data = CreateRandomData(10240);
    for (auto _ : state) {
        std::string out;
        Base64Appender appender(out);
        for (uint8_t b : data) {
            appender.writeByte(b);
        }
        benchmark::DoNotOptimize(out);
    }
}
BENCHMARK(BM_Base64_Appender_Bytes);
