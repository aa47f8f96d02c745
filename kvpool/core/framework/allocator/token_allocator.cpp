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

#include "token_allocator.h"

#include <absl/strings/str_format.h>

#include "util/env_var.h"

namespace kvpool {

TokenAllocator::TokenAllocator(const Options& options, KVCacheStorage* kv_cache)
    : options_(options), kv_cache_(kv_cache) {
  CHECK_GT(options_.size(), 0) << "kv cache pool must not be empty";
  CHECK_GT(options_.page_size(), 0) << "page size must be positive";
  debug_mode_ = options_.debug_mode() || util::memory_pool_debug_enabled();
}

std::optional<std::vector<int64_t>> TokenAllocator::alloc_extend(
    const Slice<int64_t>& /*prefix_lens*/,
    const Slice<int64_t>& /*seq_lens*/,
    const Slice<int64_t>& /*last_loc*/,
    int64_t /*extend_num_tokens*/) {
  LOG(FATAL) << "alloc_extend is only supported by the paged allocator";
  return std::nullopt;
}

std::optional<std::vector<int64_t>> TokenAllocator::alloc_decode(
    const Slice<int64_t>& /*seq_lens*/,
    const Slice<int64_t>& /*last_loc*/) {
  LOG(FATAL) << "alloc_decode is only supported by the paged allocator";
  return std::nullopt;
}

void TokenAllocator::free(const Slice<int64_t>& indices) {
  if (indices.empty()) {
    return;
  }
  if (free_mode_ == FreeMode::kBuffering) {
    free_group_.emplace_back(indices);
    return;
  }
  free_indices(indices);
}

void TokenAllocator::free_group_begin() {
  free_mode_ = FreeMode::kBuffering;
  free_group_.clear();
}

void TokenAllocator::free_group_end() {
  free_mode_ = FreeMode::kImmediate;
  if (free_group_.empty()) {
    return;
  }

  size_t total = 0;
  for (const auto& indices : free_group_) {
    total += indices.size();
  }
  std::vector<int64_t> merged;
  merged.reserve(total);
  for (const auto& indices : free_group_) {
    merged.insert(merged.end(), indices.begin(), indices.end());
  }
  free_group_.clear();
  free(merged);
}

void TokenAllocator::reset_free_group() {
  free_mode_ = FreeMode::kImmediate;
  free_group_.clear();
}

void TokenAllocator::restore_state(State state) {
  free_pages_ = std::move(state.free_pages);
}

HostKVCache TokenAllocator::get_cpu_copy(const Slice<int64_t>& /*indices*/) {
  LOG(FATAL) << "get_cpu_copy is not supported by this allocator";
  return {};
}

void TokenAllocator::load_cpu_copy(const HostKVCache& /*host_cache*/,
                                   const Slice<int64_t>& /*indices*/) {
  LOG(FATAL) << "load_cpu_copy is not supported by this allocator";
}

std::pair<std::string, int64_t> TokenAllocator::log_usage(
    int64_t evictable_size) const {
  const int64_t num_used = size() - (available_size() + evictable_size);
  std::string msg =
      absl::StrFormat("#token: %d, token usage: %.2f, ",
                      num_used,
                      static_cast<double>(num_used) / size());
  return {std::move(msg), num_used};
}

}  // namespace kvpool
