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

#pragma once
#include <folly/Function.h>

#include <atomic>
#include <functional>
#include <thread>
#include <vector>

#include "util/concurrent_queue.h"

namespace kvpool {

class ThreadPool final {
 public:
  // a runnable is an object intended to be executed by the threadpool
  // it must be invokable with no arguments and return void.
  using Runnable = folly::Function<void()>;

  // processes the items in [begin, end)
  using RangeFunc = std::function<void(size_t begin, size_t end)>;

  ThreadPool() : ThreadPool(1) {}

  explicit ThreadPool(size_t num_threads);

  ~ThreadPool();

  // disable copy/move constructor and assignment
  ThreadPool(const ThreadPool&) = delete;
  ThreadPool& operator=(const ThreadPool&) = delete;
  ThreadPool(ThreadPool&&) = delete;
  ThreadPool& operator=(ThreadPool&&) = delete;

  // schedule a runnable to be executed, returns the index of the worker
  // queue it was pushed to or -1 for an empty runnable.
  int32_t schedule(Runnable runnable);

  // split [0, num_items) into at most size() contiguous ranges, run each
  // range on a worker and block until all of them are done.
  void parallel_for(size_t num_items, const RangeFunc& func);

  size_t size() const { return threads_.size(); }

 private:
  void internal_loop(size_t index);

  std::vector<std::thread> threads_;
  std::vector<ConcurrentQueue<Runnable>> queues_;

  std::atomic<size_t> index_{0};
};

}  // namespace kvpool
