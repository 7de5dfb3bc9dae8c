#include "conduit/pipeline/Pipeline.hpp"

#include "conduit/pipeline/WorkerRing.hpp"
#include "conduit/rt/Channel.hpp"
#include "conduit/rt/StageHandle.hpp"
#include "conduit/stages/Generator.hpp"
#include "conduit/stages/Merge.hpp"
#include "conduit/stages/Square.hpp"
#include "conduit/util/Config.hpp"
#include "conduit/util/Logger.hpp"
#include "conduit/util/Metrics.hpp"

#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace conduit::pipeline {

using util::LogLevel;
using util::logger;

PipelineConfig fromConfig(const util::Config& cfg) {
  PipelineConfig pc;
  pc.workers     = cfg.workers;
  pc.seed        = cfg.seed;
  pc.stopAt      = cfg.stopAt;
  pc.joinTimeout = std::chrono::milliseconds(cfg.joinTimeoutMs);
  return pc;
}

Pipeline::Pipeline(PipelineConfig cfg, rt::StageMonitor* monitor)
  : cfg_(std::move(cfg)), monitor_(monitor)
{
  if (cfg_.workers == 0)
    throw std::invalid_argument("Pipeline: workers must be >= 1");
}

RunReport Pipeline::run() {
  const auto t0 = std::chrono::steady_clock::now();
  const unsigned n = cfg_.workers;

  RunReport rep;
  CONDUIT_METRIC_SET("pipeline.workers", (double)n);
  logger().log(LogLevel::Info, "pipeline start", {
    {"workers", std::to_string(n)},
    {"seed",    std::to_string(cfg_.seed)},
    {"stopAt",  std::to_string(cfg_.stopAt)}
  });

  // Stage objects must outlive the handles (declared after) that run them.
  stages::Merge     merge(monitor_);
  stages::Generator gen(cfg_.seed, monitor_);
  std::vector<std::unique_ptr<stages::Square>> squares;
  squares.reserve(n);

  std::vector<rt::StageHandle> handles;
  handles.reserve(n + 2);

  auto results = rt::makeChannel<Message>();
  auto mergeIn = rt::makeChannel<Message>();

  handles.emplace_back(stages::Merge::kName,
    [&merge, in = std::move(mergeIn.second), out = std::move(results.first)]() mutable {
      merge.run(std::move(in), std::move(out));
    });

  // Every worker gets exactly one clone of the merge-input send-end; ours is
  // dropped right after, or merge would never see its inbound close.
  std::vector<rt::Sender<Message>> workerTx;
  workerTx.reserve(n);
  for (unsigned i = 0; i < n; ++i) {
    auto ch = rt::makeChannel<Message>();
    workerTx.push_back(std::move(ch.first));
    squares.push_back(std::make_unique<stages::Square>(i, monitor_));
    stages::Square& sq = *squares.back();
    handles.emplace_back(sq.name(),
      [&sq, in = std::move(ch.second), out = mergeIn.first]() mutable {
        sq.run(std::move(in), std::move(out));
      });
  }
  mergeIn.first.release();

  {
    WorkerRing ring(std::move(workerTx));

    auto genCh = rt::makeChannel<Message>();
    rt::Receiver<Message> generated = std::move(genCh.second);
    handles.emplace_back(stages::Generator::kName,
      [&gen, out = std::move(genCh.first)]() mutable {
        gen.run(std::move(out));
      });

    while (auto msg = generated.recv()) {
      const Value v = expectGenerated(kName, *msg);
      ring.dispatch(std::move(*msg));
      rep.generated.push_back(v);
      if (shouldStop(v, cfg_.stopAt)) {
        logger().log(LogLevel::Info, "stop condition reached", {{"value", std::to_string(v)}});
        break;
      }
    }

    rep.perWorker = ring.counts();
    generated.release();
    ring.release();
  }

  while (auto msg = results.second.recv()) {
    const Wide v = expectMerged(kName, *msg);
    logger().log(LogLevel::Debug, "result", {{"value", std::to_string(v)}});
    rep.merged.push_back(v);
  }
  if (monitor_) monitor_->recordExit(kName);

  const auto deadline = std::chrono::steady_clock::now() + cfg_.joinTimeout;
  for (auto& h : handles) {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
      deadline - std::chrono::steady_clock::now());
    if (left.count() < 0) left = std::chrono::milliseconds(0);
    if (!h.waitFor(left)) {
      logger().log(LogLevel::Error, "stage still running after join timeout", {{"stage", h.name()}});
      rep.lateStages.push_back(h.name());
    }
  }
  for (auto& h : handles) h.join();

  for (const auto& sq : squares) rep.processedPerWorker.push_back(sq->processed());
  rep.generatorSent  = gen.sent();
  rep.mergeForwarded = merge.forwarded();
  rep.elapsed = std::chrono::duration_cast<std::chrono::microseconds>(
    std::chrono::steady_clock::now() - t0);

  logger().log(LogLevel::Info, "pipeline drained", {
    {"generated", std::to_string(rep.generated.size())},
    {"merged",    std::to_string(rep.merged.size())},
    {"late",      std::to_string(rep.lateStages.size())}
  });
  return rep;
}

} // namespace conduit::pipeline
