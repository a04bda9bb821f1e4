// Copyright 2026 Google Inc. All Rights Reserved.
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#ifndef INCDEX_METRICS_H_
#define INCDEX_METRICS_H_

#include <stdint.h>

#include <mutex>
#include <string>
#include <vector>
using namespace std;

struct Status;

/// Timing and counting stats for `-d stats`. See METRIC_RECORD and
/// METRIC_COUNT below.

/// One tracked code path or quantity, like "desugar graph load".
struct Metric {
  Metric(const string& name, bool timed) : name_(name), timed_(timed) {}

  void AddResult(int64_t count, int64_t time_us) {
    std::lock_guard<std::mutex> lock(mutex_);
    count_ += count;
    sum_ += time_us;
  }

  const string& name() const { return name_; }
  bool timed() const { return timed_; }

  int64_t count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return count_;
  }

  /// Total time in micros. Always 0 for counters.
  int64_t time() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sum_;
  }

 private:
  string name_;
  bool timed_;
  mutable std::mutex mutex_;
  int64_t count_ = 0;
  int64_t sum_ = 0;
};

/// A scoped object for recording a metric across the body of a function.
/// Used by the METRIC_RECORD macro.
struct ScopedMetric {
  explicit ScopedMetric(Metric* metric);
  ~ScopedMetric();

 private:
  Metric* metric_;
  /// Monotonic clock reading in nanoseconds.
  int64_t start_ = 0;
};

/// Owns the metrics and prints the report.
struct Metrics {
  Metrics() {}
  ~Metrics();

  Metrics(const Metrics&) = delete;
  Metrics& operator=(const Metrics&) = delete;

  /// Register a metric. Counters (|timed| false) only accumulate counts.
  Metric* NewMetric(const string& name, bool timed = true);

  /// Print the timed metrics, slowest first, followed by the counters.
  /// Metrics registered under the same name at several places are merged.
  void Report(Status* status);

 private:
  std::mutex mutex_;
  vector<Metric*> metrics_;
};

/// Report peak memory use and page faults of the process.
void DumpMemoryUsage(Status* status);

/// Use METRIC_RECORD("foobar") at the top of a function to get timing stats
/// recorded for each call of the function.
#define METRIC_RECORD(name)                                             \
  static Metric* metrics_h_metric =                                     \
      g_metrics ? g_metrics->NewMetric(name) : NULL;                    \
  ScopedMetric metrics_h_scoped(metrics_h_metric);

/// Add |n| to the counter |name|, e.g. the number of edges reported.
#define METRIC_COUNT(name, n)                                           \
  do {                                                                  \
    static Metric* metrics_h_counter =                                  \
        g_metrics ? g_metrics->NewMetric(name, false) : NULL;           \
    if (metrics_h_counter)                                              \
      metrics_h_counter->AddResult((n), 0);                             \
  } while (0)

extern Metrics* g_metrics;

#endif  // INCDEX_METRICS_H_
