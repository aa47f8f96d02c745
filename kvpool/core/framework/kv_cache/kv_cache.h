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
#include <torch/torch.h>

#include <cstdint>
#include <memory>
#include <vector>

#include "common/macros.h"
#include "util/slice.h"

namespace kvpool {

// Host-side copy of the cached key/value entries of a set of slots, one
// tensor per layer, each of shape [num_indices, num_kv_heads, head_dim].
struct HostKVCache {
  std::vector<torch::Tensor> key_caches;
  std::vector<torch::Tensor> value_caches;
};

// Physical storage behind a token allocator. Allocators only hand out slot
// indices; moving cached values to and from host memory is delegated here.
class KVCacheStorage {
 public:
  virtual ~KVCacheStorage() = default;

  virtual HostKVCache get_cpu_copy(const Slice<int64_t>& indices) const = 0;

  virtual void load_cpu_copy(const HostKVCache& host_cache,
                             const Slice<int64_t>& indices) = 0;

 protected:
  KVCacheStorage() = default;

 private:
  DISALLOW_COPY_AND_ASSIGN(KVCacheStorage);
};

class KVCache final : public KVCacheStorage {
 public:
  KVCache(std::vector<torch::Tensor> key_caches,
          std::vector<torch::Tensor> value_caches);

  // allocates num_layers key/value tensors of shape
  // [num_slots, num_kv_heads, head_dim]
  KVCache(int64_t num_layers,
          int64_t num_slots,
          int64_t num_kv_heads,
          int64_t head_dim,
          const torch::TensorOptions& options);

  ~KVCache() override = default;

  HostKVCache get_cpu_copy(const Slice<int64_t>& indices) const override;

  void load_cpu_copy(const HostKVCache& host_cache,
                     const Slice<int64_t>& indices) override;

  torch::Tensor get_k_cache(int64_t layer_id) const;
  torch::Tensor get_v_cache(int64_t layer_id) const;

  int64_t num_layers() const { return key_caches_.size(); }
  int64_t num_slots() const;

 private:
  torch::Tensor make_index_tensor(const Slice<int64_t>& indices) const;

  std::vector<torch::Tensor> key_caches_;
  std::vector<torch::Tensor> value_caches_;
};

}  // namespace kvpool
