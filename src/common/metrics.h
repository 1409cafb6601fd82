#pragma once

#include <absl/time/clock.h>
#include <absl/time/time.h>
#include <prometheus/counter.h>
#include <prometheus/family.h>
#include <prometheus/gauge.h>
#include <prometheus/labels.h>
#include <prometheus/registry.h>
#include <prometheus/text_serializer.h>

#include <string>

#include "macros.h"

namespace mcache {

using prometheus::Counter;
using prometheus::Gauge;

class Metrics final {
 public:
  Metrics(const Metrics&) = delete;
  Metrics& operator=(const Metrics&) = delete;

  Metrics(Metrics&&) = delete;
  Metrics& operator=(Metrics&&) = delete;

  // a singleton class
  static Metrics& Instance() {
    static Metrics instance;
    return instance;
  }

  // get the metrics string in prometheus text format
  std::string GetString() const {
    prometheus::TextSerializer serializer;
    return serializer.Serialize(registry_.Collect());
  }

  // helper functions to define metrics
  prometheus::Family<prometheus::Gauge>& BuildGauge(const std::string& name,
                                                    const std::string& desc) {
    return prometheus::BuildGauge().Name(name).Help(desc).Register(registry_);
  }

  prometheus::Family<prometheus::Counter>& BuildCounter(
      const std::string& name,
      const std::string& desc) {
    return prometheus::BuildCounter().Name(name).Help(desc).Register(registry_);
  }

 private:
  Metrics() = default;
  ~Metrics() = default;

  prometheus::Registry registry_;
};

// adds the elapsed seconds of its own lifetime to a counter
class AutoCounter final {
 public:
  AutoCounter(prometheus::Counter& counter)
      : counter_(counter), start_(absl::Now()) {}

  ~AutoCounter() {
    counter_.Increment(absl::ToDoubleSeconds(absl::Now() - start_));
  }

 private:
  // NOLINTNEXTLINE
  prometheus::Counter& counter_;

  absl::Time start_;
};

}  // namespace mcache

// define helpful macros to hide boilerplate code
// NOLINTBEGIN(bugprone-macro-parentheses)

// a gauge is a metric that represents a single numerical value that can
// arbitrarily go up and down.
#define DEFINE_GAUGE(name, desc)    \
  prometheus::Gauge& GAUGE_##name = \
      mcache::Metrics::Instance().BuildGauge(#name, desc).Add({});

#define GAUGE_SET(name, value) GAUGE_##name.Set(value);

// a counter is a monotonically increasing counter whose value can only increase
// or be reset to zero on restart.
#define DEFINE_COUNTER(name, desc)      \
  prometheus::Counter& COUNTER_##name = \
      mcache::Metrics::Instance().BuildCounter(#name, desc).Add({});

#define COUNTER_INC(name) COUNTER_##name.Increment();

// Declares a latency counter having a variable name based on line number.
// example: AUTO_COUNTER(a_counter_name);
#define AUTO_COUNTER(name) \
  mcache::AutoCounter MCACHE_ANON_VAR(name)(COUNTER_##name);

// declare gauge
#define DECLARE_GAUGE(name) extern prometheus::Gauge& GAUGE_##name;

// declare counter
#define DECLARE_COUNTER(name) extern prometheus::Counter& COUNTER_##name;

// NOLINTEND(bugprone-macro-parentheses)
