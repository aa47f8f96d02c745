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

#include <cstdint>
#include <memory>
#include <vector>

#include "kv_cache.h"

namespace kvpool {

// Storage of a hybrid model: full attention layers live in one KVCache, the
// sliding window layers in a second, smaller one. Slots are addressed by
// their full attention index; the sliding window slot is found through the
// translation table owned by the SWATokenAllocator.
class SWAKVCache final : public KVCacheStorage {
 public:
  SWAKVCache(std::unique_ptr<KVCache> full_kv_cache,
             std::unique_ptr<KVCache> swa_kv_cache);

  ~SWAKVCache() override = default;

  // host copy of full attention layers followed by sliding window layers
  HostKVCache get_cpu_copy(const Slice<int64_t>& indices) const override;

  void load_cpu_copy(const HostKVCache& host_cache,
                     const Slice<int64_t>& indices) override;

  KVCache* full_kv_cache() const { return full_kv_cache_.get(); }
  KVCache* swa_kv_cache() const { return swa_kv_cache_.get(); }

  // the table stays owned by the allocator, it is only read here
  void set_full_to_swa_index_mapping(const std::vector<int64_t>* mapping) {
    full_to_swa_index_mapping_ = mapping;
  }

  const std::vector<int64_t>* full_to_swa_index_mapping() const {
    return full_to_swa_index_mapping_;
  }

  std::vector<int64_t> translate_loc_from_full_to_swa(
      const Slice<int64_t>& indices) const;

 private:
  std::unique_ptr<KVCache> full_kv_cache_;
  std::unique_ptr<KVCache> swa_kv_cache_;

  const std::vector<int64_t>* full_to_swa_index_mapping_ = nullptr;
};

}  // namespace kvpool
