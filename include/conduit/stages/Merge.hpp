#pragma once
#include <atomic>
#include <cstdint>

#include "conduit/Message.hpp"
#include "conduit/rt/Channel.hpp"
#include "conduit/rt/StageMonitor.hpp"

namespace conduit::stages {

// Fan-in: Transformed(v) -> Merged(v). `in` is shared by every worker, so
// run() returns only after all of them have released their send-ends.
class Merge final {
public:
  static constexpr const char* kName = "merge";

  explicit Merge(rt::StageMonitor* monitor = nullptr) : monitor_(monitor) {}

  Merge(const Merge&)            = delete;
  Merge& operator=(const Merge&) = delete;

  void run(rt::Receiver<Message> in, rt::Sender<Message> out);

  std::uint64_t forwarded() const noexcept { return forwarded_.load(std::memory_order_acquire); }

private:
  rt::StageMonitor* monitor_;
  std::atomic<std::uint64_t> forwarded_{0};
};

} // namespace conduit::stages
