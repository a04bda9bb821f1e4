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

#ifndef INCDEX_PARALLEL_MAP_H_
#define INCDEX_PARALLEL_MAP_H_

#include <functional>
#include <iterator>
#include <memory>
#include <type_traits>
#include <utility>
#include <vector>

#include "thread_pool.h"
#include "util.h"

/// Ranges handed to a thread pool per job. Converting one class file can take
/// much longer than another, so smaller ranges keep every worker busy.
const int kParallelMapChunksPerJob = 4;

/// Run |map_fn| on every element of |items| on |thread_pool| and return the
/// results in input order.
///
/// |map_fn| is called concurrently from several threads and must be safe to
/// call that way, which is why it is taken by const reference.
template <typename Vector, typename MapFn>
auto ParallelMap(ThreadPool* thread_pool, const Vector& items,
                 const MapFn& map_fn)
    -> std::vector<typename std::decay<decltype(map_fn(items[0]))>::type> {
  typedef typename std::decay<decltype(map_fn(items[0]))>::type Result;
  const size_t size = items.size();

  // A plain array instead of std::vector<Result>: std::vector<bool> packs
  // its elements, so neighbouring ones can't be written from two threads.
  std::unique_ptr<Result[]> results(new Result[size]());

  std::vector<std::pair<size_t, size_t>> ranges = SplitByCount(
      size, thread_pool->job_count() * kParallelMapChunksPerJob);
  std::vector<std::function<void()>> tasks;
  tasks.reserve(ranges.size());
  Result* out = results.get();
  for (const auto& range : ranges) {
    tasks.emplace_back([&items, &map_fn, out, range] {
      for (size_t i = range.first; i < range.second; ++i)
        out[i] = map_fn(items[i]);
    });
  }
  thread_pool->RunTasks(std::move(tasks));

  return std::vector<Result>(std::make_move_iterator(out),
                             std::make_move_iterator(out + size));
}

#endif  // INCDEX_PARALLEL_MAP_H_
