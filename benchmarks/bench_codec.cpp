#include <benchmark/benchmark.h>
#include <string>
#include <vector>
#include "chunk/codec.hpp"

using namespace chunkdump;
using namespace chunkdump::chunk;

namespace {

Chunk make_page(int messages) {
    std::vector<slack::Message> page;
    for (int i = 0; i < messages; ++i) {
        slack::Message m;
        m.user = "U100";
        m.text = "message body of a typical length for a busy channel";
        m.ts = "1700000000." + std::to_string(100000 + i);
        page.push_back(std::move(m));
    }
    Chunk c;
    c.timestamp = 1700000000000000;
    c.channel_id = "C1";
    c.count = messages;
    c.payload = MessagesPayload{std::move(page), false, 0};
    return c;
}

}  // namespace

// Encode one history page
static void BM_EncodeMessagesPage(benchmark::State& state) {
    const auto chunk = make_page(static_cast<int>(state.range(0)));
    for (auto _ : state) {
        benchmark::DoNotOptimize(ChunkCodec::encode(chunk).value());
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_EncodeMessagesPage)->Arg(1)->Arg(100)->Arg(1000);

// Decode one history page
static void BM_DecodeMessagesPage(benchmark::State& state) {
    const auto record = ChunkCodec::encode(make_page(static_cast<int>(state.range(0)))).value();
    for (auto _ : state) {
        auto chunk = ChunkCodec::decode(record);
        benchmark::DoNotOptimize(chunk);
    }
    state.SetBytesProcessed(state.iterations() * static_cast<int64_t>(record.size()));
}
BENCHMARK(BM_DecodeMessagesPage)->Arg(1)->Arg(100)->Arg(1000);

// Group key derivation alone
static void BM_GroupId(benchmark::State& state) {
    Chunk c;
    c.channel_id = "C1";
    slack::Message parent;
    parent.ts = "1700000000.000100";
    parent.thread_ts = parent.ts;
    c.payload = ThreadMessagesPayload{parent, {}, true};
    for (auto _ : state) {
        benchmark::DoNotOptimize(c.group_id());
    }
}
BENCHMARK(BM_GroupId);
