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

#include "paged_token_allocator.h"

#include <algorithm>
#include <numeric>
#include <unordered_set>

#include "paged_alloc_kernels.h"

namespace kvpool {

PagedTokenAllocator::PagedTokenAllocator(const Options& options,
                                         KVCacheStorage* kv_cache)
    : TokenAllocator(options, kv_cache) {
  num_pages_ = size() / page_size();
  CHECK_GT(num_pages_, 0) << "pool of " << size()
                          << " slots is smaller than one page of "
                          << page_size();
  if (options_.num_threads() > 0) {
    thread_pool_ = std::make_unique<ThreadPool>(options_.num_threads());
  }
  LOG(INFO) << "Paged token allocator: " << num_pages_ << " pages of "
            << page_size() << " tokens, debug mode: " << debug_mode_
            << ", kernel threads: " << options_.num_threads();
  clear();
}

PagedTokenAllocator::~PagedTokenAllocator() = default;

void PagedTokenAllocator::clear() {
  // page 0 holds the padding slots for dummy outputs of padded tokens
  free_pages_.resize(num_pages_);
  std::iota(free_pages_.begin(), free_pages_.end(), 1);
  page_is_free_.assign(num_pages_ + 1, true);
  page_is_free_[0] = false;
  reset_free_group();
}

std::vector<int64_t> PagedTokenAllocator::take_free_pages(int64_t num_pages) {
  std::vector<int64_t> pages(free_pages_.begin(),
                             free_pages_.begin() + num_pages);
  free_pages_.erase(free_pages_.begin(), free_pages_.begin() + num_pages);
  for (const int64_t page : pages) {
    page_is_free_[page] = false;
  }
  return pages;
}

std::optional<std::vector<int64_t>> PagedTokenAllocator::alloc(
    int64_t need_size) {
  CHECK_GE(need_size, 0) << "negative allocation size " << need_size;
  if (debug_mode_) {
    CHECK_EQ(need_size % page_size(), 0)
        << "The allocation size should be page-aligned";
  }

  const int64_t num_pages = need_size / page_size();
  if (num_pages > static_cast<int64_t>(free_pages_.size())) {
    return std::nullopt;
  }

  const auto pages = take_free_pages(num_pages);
  std::vector<int64_t> out_indices;
  out_indices.reserve(num_pages * page_size());
  for (const int64_t page : pages) {
    for (int64_t j = 0; j < page_size(); ++j) {
      out_indices.push_back(page * page_size() + j);
    }
  }
  return out_indices;
}

std::optional<std::vector<int64_t>> PagedTokenAllocator::alloc_extend(
    const Slice<int64_t>& prefix_lens,
    const Slice<int64_t>& seq_lens,
    const Slice<int64_t>& last_loc,
    int64_t extend_num_tokens) {
  CHECK_EQ(prefix_lens.size(), last_loc.size())
      << "batch arrays must have the same size";
  if (debug_mode_) {
    for (size_t i = 0; i < prefix_lens.size(); ++i) {
      CHECK_EQ((last_loc[i] + 1) % page_size(), prefix_lens[i] % page_size())
          << "last_loc of request " << i << " is not consistent with its "
          << "prefix length " << prefix_lens[i];
    }
  }

  const AllocPlan plan = plan_alloc_extend(prefix_lens, seq_lens, page_size());
  CHECK_EQ(plan.total_new_tokens, extend_num_tokens)
      << "extend_num_tokens does not match the batch";

  if (plan.total_new_pages > static_cast<int64_t>(free_pages_.size())) {
    return std::nullopt;
  }

  const auto new_pages = take_free_pages(plan.total_new_pages);
  std::vector<int64_t> out_indices(extend_num_tokens);
  alloc_extend_kernel(plan,
                      prefix_lens,
                      seq_lens,
                      last_loc,
                      new_pages,
                      page_size(),
                      thread_pool_.get(),
                      out_indices.data());

  if (debug_mode_) {
    check_unique(out_indices);
  }
  return out_indices;
}

std::optional<std::vector<int64_t>> PagedTokenAllocator::alloc_decode(
    const Slice<int64_t>& seq_lens,
    const Slice<int64_t>& last_loc) {
  CHECK_EQ(seq_lens.size(), last_loc.size())
      << "batch arrays must have the same size";
  if (debug_mode_) {
    for (size_t i = 0; i < seq_lens.size(); ++i) {
      CHECK_EQ((last_loc[i] + 2) % page_size(), seq_lens[i] % page_size())
          << "last_loc of request " << i << " is not consistent with its "
          << "sequence length " << seq_lens[i];
    }
  }

  const AllocPlan plan = plan_alloc_decode(seq_lens, page_size());
  if (plan.total_new_pages > static_cast<int64_t>(free_pages_.size())) {
    return std::nullopt;
  }

  const auto new_pages = take_free_pages(plan.total_new_pages);
  std::vector<int64_t> out_indices(seq_lens.size());
  alloc_decode_kernel(plan,
                      seq_lens,
                      last_loc,
                      new_pages,
                      page_size(),
                      thread_pool_.get(),
                      out_indices.data());

  if (debug_mode_) {
    check_unique(out_indices);
  }
  return out_indices;
}

void PagedTokenAllocator::free_indices(const Slice<int64_t>& indices) {
  std::vector<int64_t> free_page_indices;
  free_page_indices.reserve(indices.size());
  for (const int64_t index : indices) {
    const int64_t page = index / page_size();
    if (page <= 0 || page > num_pages_) {
      // padding page or out of range, never handed out
      CHECK(!debug_mode_) << "freeing slot " << index
                          << " outside of the pool";
      continue;
    }
    free_page_indices.push_back(page);
  }
  std::sort(free_page_indices.begin(), free_page_indices.end());
  free_page_indices.erase(
      std::unique(free_page_indices.begin(), free_page_indices.end()),
      free_page_indices.end());

  // the rest of a page may have been freed by an earlier call
  free_page_indices.erase(
      std::remove_if(free_page_indices.begin(),
                     free_page_indices.end(),
                     [this](int64_t page) { return page_is_free_[page]; }),
      free_page_indices.end());
  for (const int64_t page : free_page_indices) {
    page_is_free_[page] = true;
  }
  free_pages_.insert(
      free_pages_.begin(), free_page_indices.begin(), free_page_indices.end());

  if (debug_mode_) {
    CHECK_LE(static_cast<int64_t>(free_pages_.size()), num_pages_)
        << "free set larger than the pool";
  }
}

void PagedTokenAllocator::restore_state(State state) {
  TokenAllocator::restore_state(std::move(state));
  page_is_free_.assign(num_pages_ + 1, false);
  for (const int64_t page : free_pages_) {
    page_is_free_[page] = true;
  }
}

void PagedTokenAllocator::check_unique(
    const std::vector<int64_t>& out_indices) const {
  std::unordered_set<int64_t> seen(out_indices.begin(), out_indices.end());
  CHECK_EQ(seen.size(), out_indices.size())
      << "batched allocation produced duplicate slots";
}

}  // namespace kvpool
