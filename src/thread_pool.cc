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

#include "thread_pool.h"

#include <atomic>
#include <thread>

#include "util.h"

namespace {

struct SerialThreadPool : public ThreadPool {
  virtual void RunTasks(std::vector<std::function<void()>>&& tasks) {
    for (auto& task : tasks)
      task();
  }
  virtual int job_count() const { return 1; }
};

struct WorkerThreadPool : public ThreadPool {
  explicit WorkerThreadPool(int job_count) : job_count_(job_count) {}

  virtual void RunTasks(std::vector<std::function<void()>>&& tasks);
  virtual int job_count() const { return job_count_; }

 private:
  int job_count_;
};

void WorkerThreadPool::RunTasks(std::vector<std::function<void()>>&& tasks) {
  if (tasks.size() <= 1) {
    for (auto& task : tasks)
      task();
    return;
  }

  // Each worker claims the next unstarted task until none are left. The
  // calling thread acts as one of the workers.
  std::atomic<size_t> next_task { 0 };
  auto worker = [&tasks, &next_task]() {
    while (true) {
      size_t index = next_task++;
      if (index >= tasks.size())
        return;
      tasks[index]();
    }
  };

  size_t thread_count =
      std::min(tasks.size(), static_cast<size_t>(job_count_)) - 1;
  std::vector<std::thread> threads;
  threads.reserve(thread_count);
  for (size_t i = 0; i < thread_count; ++i)
    threads.emplace_back(worker);
  worker();
  for (auto& thread : threads)
    thread.join();
}

}  // anonymous namespace

std::unique_ptr<ThreadPool> CreateThreadPool() {
  return CreateThreadPool(GetOptimalThreadPoolJobCount());
}

std::unique_ptr<ThreadPool> CreateThreadPool(int job_count) {
  if (job_count <= 1)
    return std::unique_ptr<ThreadPool>(new SerialThreadPool);
  return std::unique_ptr<ThreadPool>(new WorkerThreadPool(job_count));
}

int GetOptimalThreadPoolJobCount() {
  switch (int processors = GetProcessorCount()) {
  case 0:
  case 1:
    return 2;
  case 2:
    return 3;
  default:
    return processors + 2;
  }
}
