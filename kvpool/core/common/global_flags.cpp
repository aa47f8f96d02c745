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

#include "global_flags.h"

// NOTE: related flags should be placed together.

// --- kv cache pool config ---

DEFINE_int64(max_total_num_tokens,
             0,
             "Number of token slots in the full attention kv cache pool.");

DEFINE_int32(page_size,
             1,
             "Number of tokens per page. 1 selects the token-granular "
             "allocator, larger values select the paged allocator.");

DEFINE_int64(swa_max_total_num_tokens,
             0,
             "Number of token slots in the sliding window kv cache pool. "
             "A positive value enables the hybrid sliding window allocator.");

// --- allocator runtime config ---

DEFINE_bool(debug_memory_pool,
            false,
            "Enable extra consistency checks in the kv cache allocators. "
            "Can also be enabled by env KVPOOL_DEBUG_MEMORY_POOL=1.");

DEFINE_int32(num_alloc_threads,
             0,
             "Number of worker threads used by the batched extend/decode "
             "allocation kernels. 0 means run them on the caller thread.");
