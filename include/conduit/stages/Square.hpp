#pragma once
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <string>

#include "conduit/Message.hpp"
#include "conduit/rt/Channel.hpp"
#include "conduit/rt/StageMonitor.hpp"

namespace conduit::stages {

// One fan-out worker: Generated(v) -> Transformed(v*v).
// `out` is this worker's clone of the shared merge-input send-end; it is
// released as soon as `in` closes so the merge stage can observe closure.
class Square final {
public:
  explicit Square(std::size_t index, rt::StageMonitor* monitor = nullptr);

  Square(const Square&)            = delete;
  Square& operator=(const Square&) = delete;

  void run(rt::Receiver<Message> in, rt::Sender<Message> out);

  const std::string& name() const noexcept { return name_; }
  std::size_t index() const noexcept { return index_; }
  std::uint64_t processed() const noexcept { return processed_.load(std::memory_order_acquire); }

  static Wide square(Value v) noexcept { return static_cast<Wide>(v) * v; }

private:
  const std::size_t index_;
  const std::string name_;
  rt::StageMonitor* monitor_;
  std::atomic<std::uint64_t> processed_{0};
};

} // namespace conduit::stages
