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

#include "token_allocator.h"

namespace kvpool {

// Token granular allocator (page size 1). The free set holds slot indices
// 1..size, allocation takes from the front and freed slots go to the back.
class FlatTokenAllocator final : public TokenAllocator {
 public:
  FlatTokenAllocator(const Options& options, KVCacheStorage* kv_cache);

  void clear() override;

  std::optional<std::vector<int64_t>> alloc(int64_t need_size) override;

  int64_t available_size() const override { return free_pages_.size(); }

  HostKVCache get_cpu_copy(const Slice<int64_t>& indices) override;
  void load_cpu_copy(const HostKVCache& host_cache,
                     const Slice<int64_t>& indices) override;

 protected:
  void free_indices(const Slice<int64_t>& indices) override;
};

}  // namespace kvpool
