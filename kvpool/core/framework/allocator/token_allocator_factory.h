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

#include <memory>

#include "token_allocator.h"

namespace kvpool {

// Options built from the kv cache pool flags.
TokenAllocator::Options allocator_options_from_flags();

// Selects the allocator variant for a pool:
//   size_swa > 0   -> SWATokenAllocator, kv_cache must be a SWAKVCache
//   page_size == 1 -> FlatTokenAllocator
//   otherwise      -> PagedTokenAllocator
std::unique_ptr<TokenAllocator> create_token_allocator(
    const TokenAllocator::Options& options,
    KVCacheStorage* kv_cache);

}  // namespace kvpool
