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

#include <atomic>
#include <condition_variable>
#include <mutex>

namespace kvpool {

// Blocks a waiter until the counter has been decremented `initial_count`
// times.
class BlockingCounter {
 public:
  explicit BlockingCounter(int initial_count)
      : state_(initial_count << 1), notified_(false) {}

  ~BlockingCounter() = default;

  inline void decrement_count() {
    unsigned int v = state_.fetch_sub(2, std::memory_order_acq_rel) - 2;
    if (v != 1) {
      return;  // either count has not dropped to 0, or waiter is not waiting
    }
    std::lock_guard<std::mutex> lock(mu_);
    notified_ = true;
    cond_var_.notify_all();
  }

  inline void wait() {
    unsigned int v = state_.fetch_or(1, std::memory_order_acq_rel);
    if ((v >> 1) == 0) {
      return;
    }
    std::unique_lock<std::mutex> lock(mu_);
    while (!notified_) {
      cond_var_.wait(lock);
    }
  }

 private:
  std::mutex mu_;
  std::condition_variable cond_var_;
  std::atomic<int> state_;  // low bit is waiter flag
  bool notified_;
};

}  // namespace kvpool
