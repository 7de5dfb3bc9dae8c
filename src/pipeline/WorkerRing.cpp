#include "conduit/pipeline/WorkerRing.hpp"

#include "conduit/util/Logger.hpp"

#include <stdexcept>
#include <string>
#include <utility>

namespace conduit::pipeline {

using util::LogLevel;
using util::logger;

WorkerRing::WorkerRing(std::vector<rt::Sender<Message>> workers)
  : counts_(workers.size(), 0)
{
  if (workers.empty())
    throw std::invalid_argument("WorkerRing: at least one worker is required");
  for (std::size_t i = 0; i < workers.size(); ++i) {
    ring_.push_back(Slot{i, std::move(workers[i])});
  }
}

std::size_t WorkerRing::dispatch(Message msg) {
  if (ring_.empty())
    throw std::logic_error("WorkerRing: dispatch after release");

  Slot slot = std::move(ring_.front());
  ring_.pop_front();

  if (!slot.tx.send(std::move(msg))) {
    logger().log(LogLevel::Warn, "worker inbound closed", {{"worker", std::to_string(slot.index)}});
  } else {
    ++counts_[slot.index];
  }

  const std::size_t idx = slot.index;
  ring_.push_back(std::move(slot));
  return idx;
}

void WorkerRing::release() noexcept {
  ring_.clear();
}

} // namespace conduit::pipeline
