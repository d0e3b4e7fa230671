#include <benchmark/benchmark.h>
#include "ambassador/frame_reader.hpp"
#include <string>

using namespace ambassador;

// Stream of ping requests cut into fixed-size chunks, as read() delivers them.
static std::string make_stream(int messages) {
    std::string out;
    for (int i = 0; i < messages; ++i) {
        out += R"({"jsonrpc":"2.0","id":)" + std::to_string(i) + R"(,"method":"ping"})" "\n";
    }
    return out;
}

static void BM_FrameReaderChunked(benchmark::State& state) {
    const std::string stream = make_stream(1000);
    const size_t chunk = static_cast<size_t>(state.range(0));
    for (auto _ : state) {
        FrameReader reader;
        size_t lines = 0;
        for (size_t pos = 0; pos < stream.size(); pos += chunk) {
            lines += reader.feed(std::string_view(stream).substr(pos, chunk)).size();
        }
        benchmark::DoNotOptimize(lines);
    }
    state.SetBytesProcessed(state.iterations() * stream.size());
}
BENCHMARK(BM_FrameReaderChunked)->Arg(64)->Arg(4096)->Arg(65536);

static void BM_FrameReaderLargeMessage(benchmark::State& state) {
    const std::string line = R"({"jsonrpc":"2.0","id":1,"method":"tools/call","params":{"name":"x","arguments":{"blob":")"
                             + std::string(static_cast<size_t>(state.range(0)), 'a') + "\"}}}\n";
    for (auto _ : state) {
        FrameReader reader;
        size_t lines = 0;
        for (size_t pos = 0; pos < line.size(); pos += 4096) {
            lines += reader.feed(std::string_view(line).substr(pos, 4096)).size();
        }
        benchmark::DoNotOptimize(lines);
    }
    state.SetBytesProcessed(state.iterations() * line.size());
}
BENCHMARK(BM_FrameReaderLargeMessage)->Arg(64 * 1024)->Arg(512 * 1024);
