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

#ifndef INCDEX_THREAD_POOL_H_
#define INCDEX_THREAD_POOL_H_

#include <functional>
#include <memory>
#include <vector>

/// Runs batches of tasks on a fixed number of threads.
struct ThreadPool {
  virtual ~ThreadPool() {}

  /// Run every task and return once all of them have finished. Tasks may run
  /// concurrently and in any order.
  virtual void RunTasks(std::vector<std::function<void()>>&& tasks) = 0;

  /// The maximum number of tasks that run at the same time.
  virtual int job_count() const = 0;
};

/// Create a thread pool sized by GetOptimalThreadPoolJobCount().
std::unique_ptr<ThreadPool> CreateThreadPool();

/// Create a thread pool running at most |job_count| tasks at once. A count of
/// 1 runs every task on the calling thread.
std::unique_ptr<ThreadPool> CreateThreadPool(int job_count);

/// The number of jobs to use when the user did not pick one.
int GetOptimalThreadPoolJobCount();

#endif  // INCDEX_THREAD_POOL_H_
