#include "conduit/stages/Merge.hpp"

#include "conduit/util/Logger.hpp"
#include "conduit/util/Metrics.hpp"

#include <string>

namespace conduit::stages {

using util::LogLevel;
using util::logger;

void Merge::run(rt::Receiver<Message> in, rt::Sender<Message> out) {
  while (auto msg = in.recv()) {
    const Wide v = expectTransformed(kName, *msg);
    logger().log(LogLevel::Debug, "merge received", {{"value", std::to_string(v)}});

    if (!out.send(Merged{v})) {
      logger().log(LogLevel::Warn, "results closed", {{"value", std::to_string(v)}});
      continue;
    }
    forwarded_.fetch_add(1, std::memory_order_acq_rel);
    CONDUIT_METRIC_HIT("merge.forwarded");
  }

  if (monitor_) monitor_->recordExit(kName);
  out.release();
  logger().log(LogLevel::Debug, "merged sender dropped", {{"forwarded", std::to_string(forwarded())}});
}

} // namespace conduit::stages
