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

#include <algorithm>
#include <memory>

#include "framework/kv_cache/swa_kv_cache.h"
#include "paged_token_allocator.h"

namespace kvpool {

// Allocator of a hybrid model with full attention and sliding window
// layers. Every token holds one slot in each pool: the returned indices are
// full attention slots and full_to_swa_index_mapping_ maps each of them to
// its sliding window slot, 0 meaning unmapped.
class SWATokenAllocator final : public TokenAllocator {
 public:
  // options.size() and options.size_swa() size the two pools
  SWATokenAllocator(const Options& options, SWAKVCache* kv_cache);

  ~SWATokenAllocator() override;

  void clear() override;

  // succeeds only if both pools can serve need_size slots
  std::optional<std::vector<int64_t>> alloc(int64_t need_size) override;

  int64_t available_size() const override {
    return std::min(full_available_size(), swa_available_size());
  }

  int64_t full_available_size() const {
    return full_attn_allocator_->available_size();
  }

  int64_t swa_available_size() const {
    return swa_attn_allocator_->available_size();
  }

  int64_t size_full() const { return options_.size(); }
  int64_t size_swa() const { return options_.size_swa(); }

  State backup_state() const override;
  void restore_state(State state) override;

  std::vector<int32_t> translate_loc_from_full_to_swa(
      const Slice<int64_t>& indices) const;

  const std::vector<int64_t>& full_to_swa_index_mapping() const {
    return full_to_swa_index_mapping_;
  }

  std::string debug_print() const override;

  // a single evictable size counts against the sliding window pool
  std::pair<std::string, int64_t> log_usage(
      int64_t evictable_size = 0) const override;

  std::pair<std::string, int64_t> log_usage(int64_t swa_evictable_size,
                                            int64_t full_evictable_size) const;

  TokenAllocator* full_attn_allocator() const {
    return full_attn_allocator_.get();
  }
  TokenAllocator* swa_attn_allocator() const {
    return swa_attn_allocator_.get();
  }

 protected:
  void free_indices(const Slice<int64_t>& indices) override;

 private:
  void free_swa(const Slice<int64_t>& indices);

  std::unique_ptr<PagedTokenAllocator> full_attn_allocator_;
  std::unique_ptr<PagedTokenAllocator> swa_attn_allocator_;

  std::vector<int64_t> full_to_swa_index_mapping_;
};

}  // namespace kvpool
