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

#include "token_allocator_factory.h"

#include "common/global_flags.h"
#include "flat_token_allocator.h"
#include "paged_token_allocator.h"
#include "swa_token_allocator.h"

namespace kvpool {

TokenAllocator::Options allocator_options_from_flags() {
  TokenAllocator::Options options;
  options.size(FLAGS_max_total_num_tokens)
      .size_swa(FLAGS_swa_max_total_num_tokens)
      .page_size(FLAGS_page_size)
      .debug_mode(FLAGS_debug_memory_pool)
      .num_threads(FLAGS_num_alloc_threads);
  return options;
}

std::unique_ptr<TokenAllocator> create_token_allocator(
    const TokenAllocator::Options& options,
    KVCacheStorage* kv_cache) {
  if (options.size_swa() > 0) {
    auto* swa_kv_cache = dynamic_cast<SWAKVCache*>(kv_cache);
    CHECK(swa_kv_cache != nullptr)
        << "sliding window allocator requires a SWAKVCache";
    return std::make_unique<SWATokenAllocator>(options, swa_kv_cache);
  }
  if (options.page_size() == 1) {
    return std::make_unique<FlatTokenAllocator>(options, kv_cache);
  }
  return std::make_unique<PagedTokenAllocator>(options, kv_cache);
}

}  // namespace kvpool
