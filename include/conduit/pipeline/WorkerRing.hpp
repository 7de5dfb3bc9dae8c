#pragma once
#include <cstddef>
#include <cstdint>
#include <deque>
#include <vector>

#include "conduit/Message.hpp"
#include "conduit/rt/Channel.hpp"

namespace conduit::pipeline {

// Round-robin distributor over worker inbound send-ends. Not thread-safe:
// only the orchestrator touches it.
class WorkerRing {
public:
  // Throws std::invalid_argument on an empty set of workers.
  explicit WorkerRing(std::vector<rt::Sender<Message>> workers);

  // Sends to the front worker, rotates it to the back; returns its index.
  std::size_t dispatch(Message msg);

  std::size_t size() const noexcept { return counts_.size(); }
  std::uint64_t dispatchedTo(std::size_t worker) const { return counts_.at(worker); }
  const std::vector<std::uint64_t>& counts() const noexcept { return counts_; }

  // Drops every worker send-end; the workers see their inbound close.
  void release() noexcept;

private:
  struct Slot {
    std::size_t         index;
    rt::Sender<Message> tx;
  };

  std::deque<Slot>           ring_;
  std::vector<std::uint64_t> counts_;
};

} // namespace conduit::pipeline
