#pragma once
#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

#include "conduit/Message.hpp"

namespace conduit::pipeline {

// What one Pipeline::run() observed.
struct RunReport {
  std::vector<Value>         generated;          // dispatched, in generation order
  std::vector<Wide>          merged;             // drained, in arrival order
  std::vector<std::uint64_t> perWorker;          // dispatch counts from the ring
  std::vector<std::uint64_t> processedPerWorker; // counts reported by each square
  std::uint64_t              generatorSent  = 0; // >= generated.size()
  std::uint64_t              mergeForwarded = 0;
  std::vector<std::string>   lateStages;         // missed the join timeout
  std::chrono::microseconds  elapsed{0};

  bool clean() const noexcept { return lateStages.empty(); }

  std::string toJson() const;
};

} // namespace conduit::pipeline
