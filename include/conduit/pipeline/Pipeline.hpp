#pragma once
#include <chrono>

#include "conduit/Message.hpp"
#include "conduit/pipeline/RunReport.hpp"
#include "conduit/rt/StageMonitor.hpp"

namespace conduit::util { class Config; }

namespace conduit::pipeline {

struct PipelineConfig {
  unsigned workers = 2;
  Value    seed    = 2;
  Value    stopAt  = 3;   // stop once a generated value reaches this
  std::chrono::milliseconds joinTimeout{1000};
};

// Pipeline shape from the loaded key=value config.
PipelineConfig fromConfig(const util::Config& cfg);

/**
 * Orchestrator for generate -> square x N -> merge.
 *
 * Shutdown is driven only by releasing send-ends, in this order:
 *   1. the stop predicate fires and the generated receive-end is dropped,
 *      so the generator's next send fails;
 *   2. the worker ring is dropped, closing every square's inbound;
 *   3. each square releases its merge-input clone; the last one closes merge;
 *   4. merge releases the results send-end, ending the drain loop.
 * Messages sent before a close are still delivered downstream.
 *
 * After the drain every stage gets cfg.joinTimeout (shared deadline) to
 * finish; the ones that miss it are logged and listed in
 * RunReport::lateStages. run() still joins them, since handles are never
 * detached, so a stage that never finishes blocks run() instead of being
 * reported. lateStages only flags stages that were slow to wind down.
 */
class Pipeline {
public:
  static constexpr const char* kName = "orchestrator";

  // Throws std::invalid_argument when cfg.workers == 0 (the ring would
  // have nothing to dispatch to and the run would never finish).
  explicit Pipeline(PipelineConfig cfg, rt::StageMonitor* monitor = nullptr);

  RunReport run();

  const PipelineConfig& config() const noexcept { return cfg_; }

  // Monotonic threshold rather than equality, so a seed past stopAt still stops.
  static bool shouldStop(Value generated, Value stopAt) noexcept { return generated >= stopAt; }

private:
  PipelineConfig    cfg_;
  rt::StageMonitor* monitor_;
};

} // namespace conduit::pipeline
