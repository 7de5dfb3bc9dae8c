#include <benchmark/benchmark.h>
#include "conduit/Message.hpp"
#include "conduit/rt/Channel.hpp"
#include <thread>
#include <vector>

using namespace conduit;

static void BM_ChannelSendRecv(benchmark::State& state) {
    auto ch = rt::makeChannel<Message>();
    Value v = 0;

    for (auto _ : state) {
        ch.first.send(Generated{v++});
        benchmark::DoNotOptimize(ch.second.tryRecv());
    }

    state.SetItemsProcessed(state.iterations());
}

BENCHMARK(BM_ChannelSendRecv)->Unit(benchmark::kNanosecond);

static void BM_ChannelFanIn(benchmark::State& state) {
    const int producers = static_cast<int>(state.range(0));
    const int perProducer = 10000;

    for (auto _ : state) {
        auto ch = rt::makeChannel<Message>();
        std::vector<std::thread> ths;
        for (int p = 0; p < producers; ++p) {
            ths.emplace_back([tx = ch.first, perProducer]() mutable {
                for (int i = 0; i < perProducer; ++i) tx.send(Transformed{static_cast<Wide>(i)});
            });
        }
        ch.first.release();

        std::size_t n = 0;
        while (ch.second.recv()) ++n;
        for (auto& t : ths) t.join();
        benchmark::DoNotOptimize(n);
    }

    state.SetItemsProcessed(state.iterations() * producers * perProducer);
}

BENCHMARK(BM_ChannelFanIn)->Arg(1)->Arg(2)->Arg(4)->Unit(benchmark::kMillisecond);

BENCHMARK_MAIN();
