#include "conduit/stages/Square.hpp"

#include "conduit/util/Logger.hpp"
#include "conduit/util/Metrics.hpp"

namespace conduit::stages {

using util::LogLevel;
using util::logger;

Square::Square(std::size_t index, rt::StageMonitor* monitor)
  : index_(index)
  , name_("square-" + std::to_string(index))
  , monitor_(monitor)
{
}

void Square::run(rt::Receiver<Message> in, rt::Sender<Message> out) {
  while (auto msg = in.recv()) {
    const Value v = expectGenerated(name_.c_str(), *msg);
    const Wide sq = square(v);
    processed_.fetch_add(1, std::memory_order_acq_rel);
    CONDUIT_METRIC_HIT("square.processed");

    if (!out.send(Transformed{sq})) {
      logger().log(LogLevel::Warn, "merge input closed", {{"value", std::to_string(v)}});
      continue;
    }
    logger().log(LogLevel::Debug, "squared",
                 {{"value", std::to_string(v)}, {"square", std::to_string(sq)}});
  }

  if (monitor_) monitor_->recordExit(name_);
  out.release();
  logger().log(LogLevel::Debug, "square sender dropped", {{"processed", std::to_string(processed())}});
}

} // namespace conduit::stages
