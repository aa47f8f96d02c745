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
#include <vector>

#include "util/slice.h"
#include "util/threadpool.h"

namespace kvpool {

// Page/output partition of one batched allocation.
//
// Every request i takes the fresh pages
//   new_pages[new_page_start_loc[i], new_page_start_loc[i] + num_new_pages[i])
// and writes its slots to
//   out[output_start_loc[i], output_start_loc[i] + seq_lens[i] - prefix_lens[i])
// Both start locations are exclusive prefix sums, so no two requests share a
// page or an output position and the fill step can run per request in any
// order.
struct AllocPlan {
  std::vector<int64_t> num_new_pages;
  std::vector<int64_t> new_page_start_loc;
  std::vector<int64_t> output_start_loc;

  // batch aggregates, the only values admission may be decided on
  int64_t total_new_pages = 0;
  int64_t total_new_tokens = 0;
};

AllocPlan plan_alloc_extend(const Slice<int64_t>& prefix_lens,
                            const Slice<int64_t>& seq_lens,
                            int64_t page_size);

// decode is an extend by exactly one token per request
AllocPlan plan_alloc_decode(const Slice<int64_t>& seq_lens, int64_t page_size);

// Fills out_indices (plan.total_new_tokens entries) for every request:
//   1. slots after last_loc[i] up to the end of the partially used page
//   2. whole fresh pages
//   3. leading slots of one more fresh page
// new_pages holds plan.total_new_pages pages already taken from the free
// set. Runs on thread_pool when given and the batch is large enough, the
// output does not depend on it.
void alloc_extend_kernel(const AllocPlan& plan,
                         const Slice<int64_t>& prefix_lens,
                         const Slice<int64_t>& seq_lens,
                         const Slice<int64_t>& last_loc,
                         const Slice<int64_t>& new_pages,
                         int64_t page_size,
                         ThreadPool* thread_pool,
                         int64_t* out_indices);

// Writes one slot per request: last_loc[i] + 1 if the token still fits the
// current page, otherwise the first slot of the request's fresh page.
void alloc_decode_kernel(const AllocPlan& plan,
                         const Slice<int64_t>& seq_lens,
                         const Slice<int64_t>& last_loc,
                         const Slice<int64_t>& new_pages,
                         int64_t page_size,
                         ThreadPool* thread_pool,
                         int64_t* out_indices);

}  // namespace kvpool
