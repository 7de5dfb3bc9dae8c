#include "conduit/stages/Generator.hpp"

#include "conduit/util/Logger.hpp"
#include "conduit/util/Metrics.hpp"

#include <limits>
#include <string>

namespace conduit::stages {

using util::LogLevel;
using util::logger;

void Generator::run(rt::Sender<Message> out) {
  Value v = seed_;
  for (;;) {
    if (!out.send(Generated{v})) break;
    sent_.fetch_add(1, std::memory_order_acq_rel);
    CONDUIT_METRIC_HIT("generator.sent");
    logger().log(LogLevel::Debug, "generated", {{"value", std::to_string(v)}});

    if (v == std::numeric_limits<Value>::max()) {
      logger().log(LogLevel::Warn, "value range exhausted");
      break;
    }
    ++v;
  }

  if (monitor_) monitor_->recordExit(kName);
  out.release();
  logger().log(LogLevel::Debug, "generator sender dropped", {{"sent", std::to_string(sent())}});
}

} // namespace conduit::stages
