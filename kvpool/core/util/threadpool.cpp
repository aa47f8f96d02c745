/* Copyright 2025 The xLLM Authors. All Rights Reserved.

Licensed under the Apache License, Version 2.0 (the "License");
you may not use this file except in compliance with the License.
You may obtain a copy of the License at

    https://github.com/jd-opensource/xllm/blob/main/LICENSE

Unless required by applicable law or agreed to in writing, software
distributed under the License is distributed on an "AS IS" BASIS,
WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
See the License for the specific language governing permissions and
limitations under the License.
==============================================================================*/

#include "threadpool.h"

#include <glog/logging.h>

#include <algorithm>

#include "util/blocking_counter.h"

namespace kvpool {

ThreadPool::ThreadPool(size_t num_threads) : queues_(num_threads) {
  CHECK_GT(num_threads, 0) << "ThreadPool needs at least one thread";
  threads_.reserve(num_threads);
  for (size_t i = 0; i < num_threads; ++i) {
    threads_.emplace_back([this, i]() { internal_loop(i); });
  }
}

ThreadPool::~ThreadPool() {
  // push nullptr to the queue to signal threads to exit
  for (size_t i = 0; i < threads_.size(); ++i) {
    queues_[i].push(nullptr);
  }
  for (auto& thread : threads_) {
    thread.join();
  }
}

int32_t ThreadPool::schedule(Runnable runnable) {
  if (runnable == nullptr) {
    return -1;
  }

  size_t current;
  size_t next;
  do {
    current = index_.load(std::memory_order_relaxed);
    next = (current + 1) % queues_.size();
  } while (!index_.compare_exchange_weak(
      current, next, std::memory_order_relaxed, std::memory_order_relaxed));
  queues_[current].push(std::move(runnable));
  return static_cast<int32_t>(current);
}

void ThreadPool::parallel_for(size_t num_items, const RangeFunc& func) {
  if (num_items == 0) {
    return;
  }
  const size_t num_tasks = std::min(num_items, threads_.size());
  const size_t items_per_task = (num_items + num_tasks - 1) / num_tasks;

  BlockingCounter counter(static_cast<int>(num_tasks));
  for (size_t task_idx = 0; task_idx < num_tasks; ++task_idx) {
    const size_t begin = std::min(task_idx * items_per_task, num_items);
    const size_t end = std::min(begin + items_per_task, num_items);
    // tasks are pinned round-robin, one range per worker queue
    queues_[task_idx].push([&func, begin, end, &counter]() {
      func(begin, end);
      counter.decrement_count();
    });
  }
  counter.wait();
}

void ThreadPool::internal_loop(size_t index) {
  while (true) {
    Runnable runnable = queues_[index].pop();
    if (runnable == nullptr) {
      // nullptr is a signal to exit
      break;
    }
    runnable();
  }
}

}  // namespace kvpool
