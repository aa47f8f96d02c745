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

#include "swa_kv_cache.h"

#include <glog/logging.h>

namespace kvpool {

SWAKVCache::SWAKVCache(std::unique_ptr<KVCache> full_kv_cache,
                       std::unique_ptr<KVCache> swa_kv_cache)
    : full_kv_cache_(std::move(full_kv_cache)),
      swa_kv_cache_(std::move(swa_kv_cache)) {
  CHECK(full_kv_cache_ != nullptr) << "full attention kv cache is required";
  CHECK(swa_kv_cache_ != nullptr) << "sliding window kv cache is required";
}

std::vector<int64_t> SWAKVCache::translate_loc_from_full_to_swa(
    const Slice<int64_t>& indices) const {
  CHECK(full_to_swa_index_mapping_ != nullptr)
      << "full to swa index mapping is not set";
  const auto& mapping = *full_to_swa_index_mapping_;
  std::vector<int64_t> swa_indices;
  swa_indices.reserve(indices.size());
  for (const int64_t index : indices) {
    DCHECK(index >= 0 && index < static_cast<int64_t>(mapping.size()));
    swa_indices.push_back(mapping[index]);
  }
  return swa_indices;
}

HostKVCache SWAKVCache::get_cpu_copy(const Slice<int64_t>& indices) const {
  HostKVCache host_cache = full_kv_cache_->get_cpu_copy(indices);
  const auto swa_indices = translate_loc_from_full_to_swa(indices);
  HostKVCache swa_host_cache = swa_kv_cache_->get_cpu_copy(swa_indices);
  for (size_t i = 0; i < swa_host_cache.key_caches.size(); ++i) {
    host_cache.key_caches.push_back(std::move(swa_host_cache.key_caches[i]));
    host_cache.value_caches.push_back(
        std::move(swa_host_cache.value_caches[i]));
  }
  return host_cache;
}

void SWAKVCache::load_cpu_copy(const HostKVCache& host_cache,
                               const Slice<int64_t>& indices) {
  if (indices.empty()) {
    return;
  }
  const size_t num_full_layers = full_kv_cache_->num_layers();
  const size_t num_swa_layers = swa_kv_cache_->num_layers();
  CHECK_EQ(host_cache.key_caches.size(), num_full_layers + num_swa_layers)
      << "host cache layer count mismatch";
  CHECK_EQ(host_cache.value_caches.size(), num_full_layers + num_swa_layers)
      << "host cache layer count mismatch";

  auto split = [&](size_t begin, size_t end) {
    HostKVCache part;
    part.key_caches.assign(host_cache.key_caches.begin() + begin,
                           host_cache.key_caches.begin() + end);
    part.value_caches.assign(host_cache.value_caches.begin() + begin,
                             host_cache.value_caches.begin() + end);
    return part;
  };

  full_kv_cache_->load_cpu_copy(split(0, num_full_layers), indices);
  const auto swa_indices = translate_loc_from_full_to_swa(indices);
  swa_kv_cache_->load_cpu_copy(
      split(num_full_layers, num_full_layers + num_swa_layers), swa_indices);
}

}  // namespace kvpool
