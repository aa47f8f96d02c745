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

#include "paged_alloc_kernels.h"

#include <glog/logging.h>

#include <algorithm>
#include <numeric>

namespace kvpool {

namespace {

inline int64_t ceil_div(int64_t a, int64_t b) { return (a + b - 1) / b; }

inline int64_t round_up(int64_t a, int64_t b) { return ceil_div(a, b) * b; }

inline int64_t round_down(int64_t a, int64_t b) { return a / b * b; }

AllocPlan make_plan(const Slice<int64_t>& prefix_lens,
                    const Slice<int64_t>& seq_lens,
                    int64_t page_size) {
  const size_t bs = seq_lens.size();
  AllocPlan plan;
  plan.num_new_pages.resize(bs);
  plan.new_page_start_loc.resize(bs);
  plan.output_start_loc.resize(bs);

  std::vector<int64_t> extend_lens(bs);
  for (size_t i = 0; i < bs; ++i) {
    extend_lens[i] = seq_lens[i] - prefix_lens[i];
    plan.num_new_pages[i] =
        ceil_div(seq_lens[i], page_size) - ceil_div(prefix_lens[i], page_size);
  }

  std::exclusive_scan(plan.num_new_pages.begin(),
                      plan.num_new_pages.end(),
                      plan.new_page_start_loc.begin(),
                      int64_t{0});
  std::exclusive_scan(extend_lens.begin(),
                      extend_lens.end(),
                      plan.output_start_loc.begin(),
                      int64_t{0});
  if (bs > 0) {
    plan.total_new_pages =
        plan.new_page_start_loc[bs - 1] + plan.num_new_pages[bs - 1];
    plan.total_new_tokens = plan.output_start_loc[bs - 1] + extend_lens[bs - 1];
  }
  return plan;
}

// runs func over [0, bs) on the caller thread for small batches
void run_per_request(size_t bs,
                     ThreadPool* thread_pool,
                     const ThreadPool::RangeFunc& func) {
  if (thread_pool == nullptr || bs < thread_pool->size()) {
    func(0, bs);
  } else {
    thread_pool->parallel_for(bs, func);
  }
}

}  // namespace

AllocPlan plan_alloc_extend(const Slice<int64_t>& prefix_lens,
                            const Slice<int64_t>& seq_lens,
                            int64_t page_size) {
  CHECK_EQ(prefix_lens.size(), seq_lens.size())
      << "prefix_lens and seq_lens must have the same batch size";
  for (size_t i = 0; i < seq_lens.size(); ++i) {
    CHECK_GE(seq_lens[i], prefix_lens[i])
        << "request " << i << " shrinks from " << prefix_lens[i] << " to "
        << seq_lens[i] << " tokens";
  }
  return make_plan(prefix_lens, seq_lens, page_size);
}

AllocPlan plan_alloc_decode(const Slice<int64_t>& seq_lens, int64_t page_size) {
  std::vector<int64_t> prefix_lens(seq_lens.size());
  for (size_t i = 0; i < seq_lens.size(); ++i) {
    CHECK_GT(seq_lens[i], 0) << "decode request " << i << " has no tokens";
    prefix_lens[i] = seq_lens[i] - 1;
  }
  return make_plan(prefix_lens, seq_lens, page_size);
}

void alloc_extend_kernel(const AllocPlan& plan,
                         const Slice<int64_t>& prefix_lens,
                         const Slice<int64_t>& seq_lens,
                         const Slice<int64_t>& last_loc,
                         const Slice<int64_t>& new_pages,
                         int64_t page_size,
                         ThreadPool* thread_pool,
                         int64_t* out_indices) {
  const size_t bs = seq_lens.size();
  CHECK_EQ(last_loc.size(), bs);
  CHECK_EQ(static_cast<int64_t>(new_pages.size()), plan.total_new_pages);

  auto fill_request = [&](size_t i) {
    const int64_t pre_len = prefix_lens[i];
    const int64_t seq_len = seq_lens[i];
    int64_t* out = out_indices + plan.output_start_loc[i];
    const int64_t* pages = new_pages.data() + plan.new_page_start_loc[i];

    // part 1: fill the old partial page
    const int64_t num_part1 =
        std::min(seq_len, round_up(pre_len, page_size)) - pre_len;
    for (int64_t j = 0; j < num_part1; ++j) {
      out[j] = last_loc[i] + 1 + j;
    }
    if (pre_len + num_part1 == seq_len) {
      return;
    }
    out += num_part1;

    // part 2: fill the new full pages
    const int64_t num_part2 =
        round_down(seq_len, page_size) - round_up(pre_len, page_size);
    for (int64_t j = 0; j < num_part2; ++j) {
      out[j] = pages[j / page_size] * page_size + j % page_size;
    }
    if (pre_len + num_part1 + num_part2 == seq_len) {
      return;
    }
    out += num_part2;

    // part 3: fill the new partial page
    const int64_t num_part3 = seq_len - round_down(seq_len, page_size);
    const int64_t last_page = pages[plan.num_new_pages[i] - 1];
    for (int64_t j = 0; j < num_part3; ++j) {
      out[j] = last_page * page_size + j;
    }
  };

  run_per_request(bs, thread_pool, [&](size_t begin, size_t end) {
    for (size_t i = begin; i < end; ++i) {
      fill_request(i);
    }
  });
}

void alloc_decode_kernel(const AllocPlan& plan,
                         const Slice<int64_t>& seq_lens,
                         const Slice<int64_t>& last_loc,
                         const Slice<int64_t>& new_pages,
                         int64_t page_size,
                         ThreadPool* thread_pool,
                         int64_t* out_indices) {
  const size_t bs = seq_lens.size();
  CHECK_EQ(last_loc.size(), bs);
  CHECK_EQ(static_cast<int64_t>(new_pages.size()), plan.total_new_pages);

  run_per_request(bs, thread_pool, [&](size_t begin, size_t end) {
    for (size_t i = begin; i < end; ++i) {
      if (plan.num_new_pages[i] == 0) {
        out_indices[i] = last_loc[i] + 1;
      } else {
        out_indices[i] = new_pages[plan.new_page_start_loc[i]] * page_size;
      }
    }
  });
}

}  // namespace kvpool
