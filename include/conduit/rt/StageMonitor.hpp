#pragma once
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace conduit::rt {

// Records stage exits in one global order. An exit with a lower sequence
// number happened-before any exit with a higher one.
class StageMonitor {
public:
  virtual ~StageMonitor() = default;

  // Called on the stage's own thread, before it releases its downstream send-end.
  virtual void recordExit(const std::string& stage);

  std::optional<std::uint64_t> exitSeq(const std::string& stage) const;
  bool exited(const std::string& stage) const { return exitSeq(stage).has_value(); }
  std::size_t exitCount() const;

  // Stage names in exit order.
  std::vector<std::string> order() const;

private:
  struct Exit { std::string stage; std::uint64_t seq; };

  mutable std::mutex mx_;
  std::vector<Exit>  exits_;
  std::uint64_t      next_ = 0;
};

} // namespace conduit::rt
