#include <benchmark/benchmark.h>
#include <memory>
#include <sstream>
#include <string>
#include "chunk/codec.hpp"
#include "chunk/index.hpp"
#include "chunk/player.hpp"

using namespace chunkdump;
using namespace chunkdump::chunk;

namespace {

/// Log with `channels` channels of `pages` pages each, interleaved
std::string make_log(int channels, int pages) {
    std::string log;
    for (int p = 0; p < pages; ++p) {
        for (int ch = 0; ch < channels; ++ch) {
            slack::Message m;
            m.user = "U100";
            m.text = "hello";
            m.ts = std::to_string(1700000000 + p) + ".000001";
            Chunk c;
            c.timestamp = 1700000000000000;
            c.channel_id = "C" + std::to_string(ch);
            c.count = 1;
            c.payload = MessagesPayload{{m}, p + 1 == pages, 0};
            log += ChunkCodec::encode(c).value();
        }
    }
    return log;
}

}  // namespace

// Index build over a whole log
static void BM_IndexBuild(benchmark::State& state) {
    const auto log = make_log(10, static_cast<int>(state.range(0)));
    for (auto _ : state) {
        std::istringstream in(log);
        auto index = Index::build(in);
        benchmark::DoNotOptimize(index);
    }
    state.SetItemsProcessed(state.iterations() * 10 * state.range(0));
}
BENCHMARK(BM_IndexBuild)->Arg(10)->Arg(100)->Arg(1000);

// Page through one channel with next(), resetting when exhausted
static void BM_PlayerNext(benchmark::State& state) {
    auto opened = Player::from_stream(std::make_unique<std::istringstream>(make_log(10, 100)));
    if (opened.is_err()) {
        state.SkipWithError(opened.error().to_string().c_str());
        return;
    }
    auto player = std::move(opened).take_value();

    for (auto _ : state) {
        auto chunk = player->next("C3");
        if (chunk.is_err()) {
            state.PauseTiming();
            if (player->reset().is_err()) {
                state.SkipWithError("reset failed");
                break;
            }
            state.ResumeTiming();
            continue;
        }
        benchmark::DoNotOptimize(chunk);
    }
}
BENCHMARK(BM_PlayerNext);

// Full scan with for_each
static void BM_PlayerForEach(benchmark::State& state) {
    auto opened = Player::from_stream(std::make_unique<std::istringstream>(make_log(10, 100)));
    if (opened.is_err()) {
        state.SkipWithError(opened.error().to_string().c_str());
        return;
    }
    auto player = std::move(opened).take_value();

    for (auto _ : state) {
        std::size_t seen = 0;
        auto status = player->for_each([&seen](const Chunk&) {
            ++seen;
            return ok_status();
        });
        benchmark::DoNotOptimize(status);
        benchmark::DoNotOptimize(seen);
    }
    state.SetItemsProcessed(state.iterations() * 1000);
}
BENCHMARK(BM_PlayerForEach);
