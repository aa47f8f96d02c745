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

#include "flat_token_allocator.h"

#include <numeric>
#include <unordered_set>

namespace kvpool {

FlatTokenAllocator::FlatTokenAllocator(const Options& options,
                                       KVCacheStorage* kv_cache)
    : TokenAllocator(options, kv_cache) {
  CHECK_EQ(options_.page_size(), 1)
      << "FlatTokenAllocator only supports page size 1";
  clear();
}

void FlatTokenAllocator::clear() {
  // slot 0 is the padding slot for dummy outputs of padded tokens
  free_pages_.resize(size());
  std::iota(free_pages_.begin(), free_pages_.end(), 1);
  reset_free_group();
}

std::optional<std::vector<int64_t>> FlatTokenAllocator::alloc(
    int64_t need_size) {
  if (need_size > available_size()) {
    return std::nullopt;
  }
  CHECK_GE(need_size, 0);

  std::vector<int64_t> select_index(free_pages_.begin(),
                                    free_pages_.begin() + need_size);
  free_pages_.erase(free_pages_.begin(), free_pages_.begin() + need_size);
  return select_index;
}

void FlatTokenAllocator::free_indices(const Slice<int64_t>& indices) {
  if (debug_mode_) {
    std::unordered_set<int64_t> free_slots(free_pages_.begin(),
                                           free_pages_.end());
    for (const int64_t index : indices) {
      CHECK(index > 0 && index <= size())
          << "freeing slot " << index << " outside of the pool";
      CHECK(free_slots.insert(index).second)
          << "double free of slot " << index;
    }
    CHECK_LE(available_size() + static_cast<int64_t>(indices.size()), size())
        << "more slots freed than allocated";
  }
  free_pages_.insert(free_pages_.end(), indices.begin(), indices.end());
}

HostKVCache FlatTokenAllocator::get_cpu_copy(const Slice<int64_t>& indices) {
  CHECK(kv_cache_ != nullptr) << "allocator is not bound to a kv cache";
  return kv_cache_->get_cpu_copy(indices);
}

void FlatTokenAllocator::load_cpu_copy(const HostKVCache& host_cache,
                                       const Slice<int64_t>& indices) {
  CHECK(kv_cache_ != nullptr) << "allocator is not bound to a kv cache";
  kv_cache_->load_cpu_copy(host_cache, indices);
}

}  // namespace kvpool
