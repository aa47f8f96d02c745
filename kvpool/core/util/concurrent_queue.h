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

#include <absl/synchronization/mutex.h>

#include <queue>

#if __has_attribute(guarded_by)
#define GUARDED_BY(x) __attribute__((guarded_by(x)))
#else
#define GUARDED_BY(x)
#endif

namespace kvpool {

// Unbounded multi-producer multi-consumer queue feeding the thread pool
// workers. pop() blocks until an element is available.
template <typename T>
class ConcurrentQueue {
 public:
  ConcurrentQueue() = default;

  void push(T value) {
    absl::MutexLock lock(&mutex_);
    queue_.push(std::move(value));
  }

  T pop() {
    absl::MutexLock lock(&mutex_);
    auto not_empty = [this]() { return !queue_.empty(); };
    mutex_.Await(absl::Condition(&not_empty));
    T value = std::move(queue_.front());
    queue_.pop();
    return value;
  }

  bool empty() {
    absl::MutexLock lock(&mutex_);
    return queue_.empty();
  }

 private:
  std::queue<T> queue_ GUARDED_BY(mutex_);

  absl::Mutex mutex_;
};

}  // namespace kvpool
