// Copyright (c) 2024 Mintnode
// Distributed under the MIT software license

#ifndef MINTNODE_METRICS_REGISTRY_HPP
#define MINTNODE_METRICS_REGISTRY_HPP

#include <atomic>
#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace mintnode {
namespace metrics {

enum class MetricType { COUNTER, GAUGE };

class Metric {
public:
  Metric(std::string name, std::string help)
      : name_(std::move(name)), help_(std::move(help)) {}
  virtual ~Metric() = default;

  Metric(const Metric &) = delete;
  Metric &operator=(const Metric &) = delete;

  const std::string &name() const { return name_; }
  const std::string &help() const { return help_; }

  virtual MetricType type() const = 0;
  virtual int64_t value() const = 0;

private:
  std::string name_;
  std::string help_;
};

// Monotonic counter
class Counter : public Metric {
public:
  using Metric::Metric;

  void inc(uint64_t n = 1) { value_.fetch_add(n, std::memory_order_relaxed); }

  MetricType type() const override { return MetricType::COUNTER; }
  int64_t value() const override {
    return static_cast<int64_t>(value_.load(std::memory_order_relaxed));
  }

private:
  std::atomic<uint64_t> value_{0};
};

class Gauge : public Metric {
public:
  using Metric::Metric;

  void set(int64_t v) { value_.store(v, std::memory_order_relaxed); }
  void inc(int64_t n = 1) { value_.fetch_add(n, std::memory_order_relaxed); }
  void dec(int64_t n = 1) { value_.fetch_sub(n, std::memory_order_relaxed); }

  MetricType type() const override { return MetricType::GAUGE; }
  int64_t value() const override {
    return value_.load(std::memory_order_relaxed);
  }

private:
  std::atomic<int64_t> value_{0};
};

/**
 * MetricsRegistry - process-wide operational counters and gauges
 *
 * Updated lock-free from any thread. The metrics endpoint renders a
 * snapshot; readers never touch ledger state.
 */
class MetricsRegistry {
public:
  MetricsRegistry();

  MetricsRegistry(const MetricsRegistry &) = delete;
  MetricsRegistry &operator=(const MetricsRegistry &) = delete;

  // Counters
  Counter connections_accepted;
  Counter blocks_produced;
  Counter mint_skipped;
  Counter transactions_accepted;
  Counter transactions_rejected;
  Counter transactions_duplicate;
  Counter sessions_dropped_backpressure;
  Counter notifications_dropped;
  Counter frames_malformed;

  // Gauges
  Gauge sessions_active;
  Gauge subscribers;
  Gauge chain_height;

  const std::vector<const Metric *> &all() const { return all_; }

  // nullptr if no metric has this name
  const Metric *find(const std::string &name) const;

  // Prometheus text exposition format, version 0.0.4
  std::string render_prometheus() const;

  // {"name": value, ...}
  nlohmann::json to_json() const;

private:
  std::vector<const Metric *> all_;
};

} // namespace metrics
} // namespace mintnode

#endif // MINTNODE_METRICS_REGISTRY_HPP
