#pragma once

#include <mutex>
#include <string>
#include <unordered_map>

namespace conduit {
namespace util {

// A very small, thread-safe in-process metrics registry.
// - Counters are "add-only" numbers.
// - Gauges are "set" numbers.
class MetricRegistry {
public:
  static MetricRegistry& instance() {
    static MetricRegistry inst;
    return inst;
  }

  MetricRegistry() = default;

  MetricRegistry(const MetricRegistry&)            = delete;
  MetricRegistry& operator=(const MetricRegistry&) = delete;
  MetricRegistry(MetricRegistry&&)                 = delete;
  MetricRegistry& operator=(MetricRegistry&&)      = delete;

  void increment(const std::string& name, double v = 1.0) {
    std::lock_guard<std::mutex> lk(mu_);
    counters_[name] += v;
  }

  void setGauge(const std::string& name, double v) {
    std::lock_guard<std::mutex> lk(mu_);
    gauges_[name] = v;
  }

  // 0 when never touched.
  double counter(const std::string& name) const {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = counters_.find(name);
    return it == counters_.end() ? 0.0 : it->second;
  }

  double gauge(const std::string& name) const {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = gauges_.find(name);
    return it == gauges_.end() ? 0.0 : it->second;
  }

  std::unordered_map<std::string, double> snapshotCounters() const {
    std::lock_guard<std::mutex> lk(mu_);
    return counters_;
  }

  std::unordered_map<std::string, double> snapshotGauges() const {
    std::lock_guard<std::mutex> lk(mu_);
    return gauges_;
  }

  void reset() {
    std::lock_guard<std::mutex> lk(mu_);
    counters_.clear();
    gauges_.clear();
  }

private:
  mutable std::mutex mu_;
  std::unordered_map<std::string, double> counters_;
  std::unordered_map<std::string, double> gauges_;
};

} // namespace util

#define CONDUIT_METRIC_INC(name, d) ::conduit::util::MetricRegistry::instance().increment((name), (d))
#define CONDUIT_METRIC_HIT(name)    ::conduit::util::MetricRegistry::instance().increment((name), 1.0)
#define CONDUIT_METRIC_SET(name, v) ::conduit::util::MetricRegistry::instance().setGauge((name), (v))

} // namespace conduit
