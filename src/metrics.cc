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

#include "metrics.h"

#include <errno.h>
#include <string.h>
#include <sys/resource.h>
#include <time.h>

#include <algorithm>
#include <map>

#include "status.h"
#include "util.h"

Metrics* g_metrics = NULL;

namespace {

int64_t HighResTimer() {
  timespec ts;
  if (clock_gettime(CLOCK_MONOTONIC, &ts) < 0)
    Fatal("clock_gettime: %s", strerror(errno));
  return (int64_t)ts.tv_sec * 1000000000LL + ts.tv_nsec;
}

struct MetricTotal {
  int64_t count = 0;
  int64_t time_us = 0;
};

}  // anonymous namespace

ScopedMetric::ScopedMetric(Metric* metric) : metric_(metric) {
  if (metric_)
    start_ = HighResTimer();
}

ScopedMetric::~ScopedMetric() {
  if (metric_)
    metric_->AddResult(1, (HighResTimer() - start_) / 1000);
}

Metrics::~Metrics() {
  for (Metric* metric : metrics_)
    delete metric;
}

Metric* Metrics::NewMetric(const string& name, bool timed) {
  std::lock_guard<std::mutex> lock(mutex_);
  Metric* result = new Metric(name, timed);
  metrics_.push_back(result);
  return result;
}

void Metrics::Report(Status* status) {
  std::lock_guard<std::mutex> lock(mutex_);

  map<string, MetricTotal> timed, counters;
  for (const Metric* metric : metrics_) {
    MetricTotal& total = metric->timed() ? timed[metric->name()]
                                         : counters[metric->name()];
    total.count += metric->count();
    total.time_us += metric->time();
  }

  vector<pair<string, MetricTotal> > sorted(timed.begin(), timed.end());
  stable_sort(sorted.begin(), sorted.end(),
              [](const pair<string, MetricTotal>& a,
                 const pair<string, MetricTotal>& b) {
    return a.second.time_us > b.second.time_us;
  });

  int width = 6;
  for (const auto& entry : timed)
    width = max(static_cast<int>(entry.first.size()), width);
  for (const auto& entry : counters)
    width = max(static_cast<int>(entry.first.size()), width);

  status->Debug("%-*s\t%-6s\t%-9s\t%s", width,
                "metric", "count", "avg (us)", "total (ms)");
  for (const auto& entry : sorted) {
    const MetricTotal& total = entry.second;
    double avg = total.count ? total.time_us / (double)total.count : 0;
    status->Debug("%-*s\t%-6lld\t%-8.1f\t%.1f", width, entry.first.c_str(),
                  (long long)total.count, avg, total.time_us / 1000.0);
  }
  for (const auto& entry : counters) {
    status->Debug("%-*s\t%lld", width, entry.first.c_str(),
                  (long long)entry.second.count);
  }
}

void DumpMemoryUsage(Status* status) {
  struct rusage usage {};
  if (getrusage(RUSAGE_SELF, &usage) < 0) {
    status->Warning("getrusage: %s", strerror(errno));
    return;
  }
  status->Debug("%ld MiB maxrss, %ld maj faults, %ld min faults",
                usage.ru_maxrss / 1024, usage.ru_majflt, usage.ru_minflt);
}
