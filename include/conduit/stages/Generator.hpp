#pragma once
#include <atomic>
#include <cstdint>

#include "conduit/Message.hpp"
#include "conduit/rt/Channel.hpp"
#include "conduit/rt/StageMonitor.hpp"

namespace conduit::stages {

/**
 * Generator sends Generated(seed), Generated(seed+1), ... until a send fails,
 * i.e. nobody holds the receive-end any more. That failed send is its only
 * exit (besides running out of Value range).
 */
class Generator final {
public:
  static constexpr const char* kName = "generator";

  explicit Generator(Value seed = 2, rt::StageMonitor* monitor = nullptr)
    : seed_(seed), monitor_(monitor) {}

  Generator(const Generator&)            = delete;
  Generator& operator=(const Generator&) = delete;

  void run(rt::Sender<Message> out);

  std::uint64_t sent() const noexcept { return sent_.load(std::memory_order_acquire); }

private:
  const Value seed_;
  rt::StageMonitor* monitor_;
  std::atomic<std::uint64_t> sent_{0};
};

} // namespace conduit::stages
