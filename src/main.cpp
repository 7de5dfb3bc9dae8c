// File: src/main.cpp
#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>

#include "conduit/pipeline/Pipeline.hpp"
#include "conduit/util/Config.hpp"
#include "conduit/util/Logger.hpp"
#include "conduit/util/Metrics.hpp"

// ---------------------------
// main
//   argv[1] = configFilePath (optional)
// ---------------------------
int main(int argc, char* argv[]) {
  using namespace conduit::util;

  // ---------------------------
  // 1) Config
  // ---------------------------
  Config cfg;
  bool cfgLoaded = true;
  if (argc > 1) cfgLoaded = cfg.loadFromFile(argv[1]);

  // ---------------------------
  // 2) Logger
  // ---------------------------
  logger().setLevel(parseLevel(cfg.logLevel));
  logger().setFormatJson(cfg.logFormat == "json");
  if (!cfg.logFile.empty() && !logger().setFile(cfg.logFile)) {
    logger().log(LogLevel::Warn, "cannot open log file, using stdout", {{"path", cfg.logFile}});
  }
  if (!cfgLoaded) {
    logger().log(LogLevel::Warn, "failed to load config file, using defaults", {{"path", argv[1]}});
  }

  // ---------------------------
  // 3) Run
  // ---------------------------
  conduit::pipeline::RunReport rep;
  try {
    conduit::pipeline::Pipeline pipeline(conduit::pipeline::fromConfig(cfg));
    rep = pipeline.run();
  } catch (const std::invalid_argument& ex) {
    logger().log(LogLevel::Error, "invalid configuration", {{"what", ex.what()}});
    return EXIT_FAILURE;
  }

  if (cfg.report) std::cout << rep.toJson() << std::endl;

  auto& m = MetricRegistry::instance();
  logger().log(LogLevel::Info, "run complete", {
    {"generated", std::to_string(rep.generated.size())},
    {"merged",    std::to_string(rep.merged.size())},
    {"generator.sent",   std::to_string((long long)m.counter("generator.sent"))},
    {"square.processed", std::to_string((long long)m.counter("square.processed"))},
    {"merge.forwarded",  std::to_string((long long)m.counter("merge.forwarded"))}
  });

  return rep.clean() ? EXIT_SUCCESS : EXIT_FAILURE;
}
