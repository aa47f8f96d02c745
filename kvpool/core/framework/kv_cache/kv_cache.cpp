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

#include "kv_cache.h"

#include <glog/logging.h>

namespace kvpool {

KVCache::KVCache(std::vector<torch::Tensor> key_caches,
                 std::vector<torch::Tensor> value_caches)
    : key_caches_(std::move(key_caches)),
      value_caches_(std::move(value_caches)) {
  CHECK_EQ(key_caches_.size(), value_caches_.size())
      << "key and value caches must have the same number of layers";
  CHECK(!key_caches_.empty()) << "kv cache needs at least one layer";
  for (size_t i = 0; i < key_caches_.size(); ++i) {
    CHECK_EQ(key_caches_[i].size(0), key_caches_[0].size(0))
        << "layer " << i << " has a different number of slots";
    CHECK_EQ(value_caches_[i].size(0), key_caches_[0].size(0))
        << "layer " << i << " has a different number of slots";
  }
}

KVCache::KVCache(int64_t num_layers,
                 int64_t num_slots,
                 int64_t num_kv_heads,
                 int64_t head_dim,
                 const torch::TensorOptions& options) {
  CHECK_GT(num_layers, 0);
  CHECK_GT(num_slots, 0);
  key_caches_.reserve(num_layers);
  value_caches_.reserve(num_layers);
  for (int64_t i = 0; i < num_layers; ++i) {
    key_caches_.emplace_back(
        torch::zeros({num_slots, num_kv_heads, head_dim}, options));
    value_caches_.emplace_back(
        torch::zeros({num_slots, num_kv_heads, head_dim}, options));
  }
}

torch::Tensor KVCache::make_index_tensor(const Slice<int64_t>& indices) const {
  return torch::tensor(std::vector<int64_t>(indices),
                       torch::dtype(torch::kInt64)
                           .device(key_caches_[0].device()));
}

HostKVCache KVCache::get_cpu_copy(const Slice<int64_t>& indices) const {
  HostKVCache host_cache;
  if (indices.empty()) {
    return host_cache;
  }
  auto index = make_index_tensor(indices);
  host_cache.key_caches.reserve(key_caches_.size());
  host_cache.value_caches.reserve(value_caches_.size());
  for (size_t i = 0; i < key_caches_.size(); ++i) {
    host_cache.key_caches.push_back(
        key_caches_[i].index_select(0, index).to(torch::kCPU));
    host_cache.value_caches.push_back(
        value_caches_[i].index_select(0, index).to(torch::kCPU));
  }
  return host_cache;
}

void KVCache::load_cpu_copy(const HostKVCache& host_cache,
                            const Slice<int64_t>& indices) {
  if (indices.empty()) {
    return;
  }
  CHECK_EQ(host_cache.key_caches.size(), key_caches_.size())
      << "host cache layer count mismatch";
  CHECK_EQ(host_cache.value_caches.size(), value_caches_.size())
      << "host cache layer count mismatch";
  auto index = make_index_tensor(indices);
  for (size_t i = 0; i < key_caches_.size(); ++i) {
    const auto device = key_caches_[i].device();
    key_caches_[i].index_copy_(0, index, host_cache.key_caches[i].to(device));
    value_caches_[i].index_copy_(
        0, index, host_cache.value_caches[i].to(device));
  }
}

torch::Tensor KVCache::get_k_cache(int64_t layer_id) const {
  CHECK(layer_id >= 0 && layer_id < num_layers())
      << "layer id out of range: " << layer_id;
  return key_caches_[layer_id];
}

torch::Tensor KVCache::get_v_cache(int64_t layer_id) const {
  CHECK(layer_id >= 0 && layer_id < num_layers())
      << "layer id out of range: " << layer_id;
  return value_caches_[layer_id];
}

int64_t KVCache::num_slots() const { return key_caches_[0].size(0); }

}  // namespace kvpool
