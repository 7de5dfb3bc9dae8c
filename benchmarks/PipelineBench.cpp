#include <benchmark/benchmark.h>
#include "conduit/pipeline/Pipeline.hpp"
#include "conduit/util/Logger.hpp"

using namespace conduit;

static void BM_PipelineRun(benchmark::State& state) {
    util::logger().setLevel(util::LogLevel::Error);

    pipeline::PipelineConfig cfg;
    cfg.workers = static_cast<unsigned>(state.range(0));
    cfg.stopAt  = static_cast<Value>(state.range(1));
    pipeline::Pipeline p(cfg);

    for (auto _ : state) {
        auto rep = p.run();
        benchmark::DoNotOptimize(rep.merged.data());
    }

    state.SetItemsProcessed(state.iterations() * (state.range(1) - cfg.seed + 1));
}

BENCHMARK(BM_PipelineRun)
    ->Args({1, 10000})
    ->Args({2, 10000})
    ->Args({4, 10000})
    ->Args({8, 10000})
    ->Unit(benchmark::kMillisecond);

static void BM_PipelineStartStop(benchmark::State& state) {
    util::logger().setLevel(util::LogLevel::Error);

    pipeline::PipelineConfig cfg;
    cfg.workers = static_cast<unsigned>(state.range(0));
    pipeline::Pipeline p(cfg);

    for (auto _ : state) {
        benchmark::DoNotOptimize(p.run().merged.size());
    }

    state.SetItemsProcessed(state.iterations());
}

BENCHMARK(BM_PipelineStartStop)->Arg(2)->Arg(16)->Unit(benchmark::kMicrosecond);

BENCHMARK_MAIN();
