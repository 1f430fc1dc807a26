/***
 * Name: pullup::obs::Metrics
 * Purpose: Collect per-phase timings and migration counters for visibility.
 * Inputs:
 *   - Calls to start/stop timers for named phases.
 *   - Counter and gauge updates from the migration passes.
 * Outputs:
 *   - Human-readable text and JSON summaries.
 * Theory of Operation:
 *   Uses steady_clock timestamps to measure durations. Stores ordered maps
 *   from names to microseconds and counts so summaries are stable.
 *   Formatting is performed on demand.
 */
#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace pullup::obs {

class Metrics {
 public:
  using Clock = std::chrono::steady_clock;

  void start(const std::string& name);
  void stop(const std::string& name);

  void incCounter(const std::string& key, uint64_t delta = 1) { counters_[key] += delta; }
  void setCounter(const std::string& key, uint64_t value) { counters_[key] = value; }
  void setGauge(const std::string& key, uint64_t value) { gauges_[key] = value; }
  uint64_t counter(const std::string& key) const;
  const auto& counters() const { return counters_; }
  const auto& gauges() const { return gauges_; }
  const auto& durations() const { return durations_us_; }

  void reset();

  std::string summaryText() const;
  std::string summaryJson() const;
  std::vector<std::string> hints() const;

 private:
  std::map<std::string, Clock::time_point> active_{};
  std::map<std::string, uint64_t> durations_us_{};
  std::map<std::string, uint64_t> counters_{};
  std::map<std::string, uint64_t> gauges_{};
};

// Stops the named timer when the scope ends, including on exception.
class ScopedTimer {
 public:
  ScopedTimer(Metrics* metrics, std::string name) : metrics_(metrics), name_(std::move(name)) {
    if (metrics_ != nullptr) { metrics_->start(name_); }
  }
  ~ScopedTimer() {
    if (metrics_ != nullptr) { metrics_->stop(name_); }
  }
  ScopedTimer(const ScopedTimer&) = delete;
  ScopedTimer& operator=(const ScopedTimer&) = delete;

 private:
  Metrics* metrics_;
  std::string name_;
};

} // namespace pullup::obs
