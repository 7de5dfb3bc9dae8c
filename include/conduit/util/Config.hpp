#pragma once

#include <cstdint>
#include <string>

namespace conduit {
namespace util {

class Config {
public:
  // Construct with the reference run: 2 workers, seed 2, stop once 3 is generated.
  Config() = default;

  // Load from a simple "key=value" file (unknown keys ignored).
  // Returns true if file read successfully (even if some keys are unknown).
  bool loadFromFile(const std::string& path);

  // Same format, already in memory.
  void loadFromString(const std::string& text);

  // Pipeline shape
  unsigned      workers       = 2;
  std::uint32_t seed          = 2;
  std::uint32_t stopAt        = 3;
  unsigned      joinTimeoutMs = 1000;

  // Logging
  std::string logLevel  = "debug"; // per-value trace lines are Debug
  std::string logFormat = "text";  // text | json
  std::string logFile;             // empty -> stdout

  // Print the JSON run report when the drain finishes.
  bool report = false;

private:
  void applyLine(const std::string& line);
  static bool parseLineKV(const std::string& line, std::string& k, std::string& v);
  static std::string trim(const std::string& s);
};

} // namespace util
} // namespace conduit
