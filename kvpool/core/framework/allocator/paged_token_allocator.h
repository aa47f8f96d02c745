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
#include "util/threadpool.h"

namespace kvpool {

// Page granular allocator. The free set holds page ids 1..num_pages; page p
// covers the slots [p * page_size, (p + 1) * page_size). All allocations of
// one request are page aligned, so a request never shares a page with
// another one.
class PagedTokenAllocator final : public TokenAllocator {
 public:
  PagedTokenAllocator(const Options& options, KVCacheStorage* kv_cache);

  ~PagedTokenAllocator() override;

  void clear() override;

  // need_size has to be a multiple of page_size, the slots of the drawn
  // pages are returned page by page
  std::optional<std::vector<int64_t>> alloc(int64_t need_size) override;

  std::optional<std::vector<int64_t>> alloc_extend(
      const Slice<int64_t>& prefix_lens,
      const Slice<int64_t>& seq_lens,
      const Slice<int64_t>& last_loc,
      int64_t extend_num_tokens) override;

  std::optional<std::vector<int64_t>> alloc_decode(
      const Slice<int64_t>& seq_lens,
      const Slice<int64_t>& last_loc) override;

  void restore_state(State state) override;

  int64_t num_pages() const { return num_pages_; }

 protected:
  // releases every page touched by indices once, pages that are already
  // free are skipped
  void free_indices(const Slice<int64_t>& indices) override;

 private:
  // detaches the first num_pages pages of the free set
  std::vector<int64_t> take_free_pages(int64_t num_pages);

  void check_unique(const std::vector<int64_t>& out_indices) const;

  int64_t num_pages_ = 0;

  // page_is_free_[p] is true iff page p is in free_pages_
  std::vector<bool> page_is_free_;

  std::unique_ptr<ThreadPool> thread_pool_;
};

}  // namespace kvpool
