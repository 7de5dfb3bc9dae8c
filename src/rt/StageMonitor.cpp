#include "conduit/rt/StageMonitor.hpp"

namespace conduit::rt {

void StageMonitor::recordExit(const std::string& stage) {
  std::lock_guard<std::mutex> lk(mx_);
  exits_.push_back({stage, next_++});
}

std::optional<std::uint64_t> StageMonitor::exitSeq(const std::string& stage) const {
  std::lock_guard<std::mutex> lk(mx_);
  for (const auto& e : exits_) {
    if (e.stage == stage) return e.seq;
  }
  return std::nullopt;
}

std::size_t StageMonitor::exitCount() const {
  std::lock_guard<std::mutex> lk(mx_);
  return exits_.size();
}

std::vector<std::string> StageMonitor::order() const {
  std::lock_guard<std::mutex> lk(mx_);
  std::vector<std::string> out;
  out.reserve(exits_.size());
  for (const auto& e : exits_) out.push_back(e.stage);
  return out;
}

} // namespace conduit::rt
