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

#include <gtest/gtest.h>

#include <random>
#include <set>

namespace kvpool {

namespace {

TokenAllocator::Options paged_options(int64_t size,
                                      int32_t page_size,
                                      bool debug_mode = false) {
  TokenAllocator::Options options;
  options.size(size).page_size(page_size).debug_mode(debug_mode);
  return options;
}

std::set<int64_t> pages_of(const std::vector<int64_t>& indices,
                           int64_t page_size) {
  std::set<int64_t> pages;
  for (const int64_t index : indices) {
    pages.insert(index / page_size);
  }
  return pages;
}

}  // namespace

TEST(PagedTokenAllocatorTest, AllocWholePages) {
  PagedTokenAllocator allocator(paged_options(16, 4), nullptr);
  EXPECT_EQ(allocator.num_pages(), 4);
  EXPECT_EQ(allocator.available_size(), 16);

  auto indices = allocator.alloc(8);
  ASSERT_TRUE(indices.has_value());
  EXPECT_EQ(*indices, std::vector<int64_t>({4, 5, 6, 7, 8, 9, 10, 11}));
  EXPECT_EQ(pages_of(*indices, 4).size(), 2);
  EXPECT_EQ(allocator.available_size(), 8);

  EXPECT_FALSE(allocator.alloc(12).has_value());
  EXPECT_EQ(allocator.available_size(), 8);

  allocator.free(*indices);
  EXPECT_EQ(allocator.available_size(), 16);
}

TEST(PagedTokenAllocatorTest, DebugModeRequiresPageAlignedAlloc) {
  PagedTokenAllocator allocator(
      paged_options(16, 4, /*debug_mode=*/true), nullptr);
  EXPECT_DEATH(allocator.alloc(6), "page-aligned");
}

TEST(PagedTokenAllocatorTest, NegativeAllocSizeDies) {
  PagedTokenAllocator allocator(paged_options(16, 4), nullptr);
  EXPECT_DEATH(allocator.alloc(-4), "negative allocation size");
  EXPECT_EQ(allocator.available_size(), 16);
}

TEST(PagedTokenAllocatorTest, ExtendNeedsOneFreshPagePerRequest) {
  // prefix_lens [0, 4] -> seq_lens [4, 8]: both requests start a new page
  std::vector<int64_t> prefix_lens = {0, 4};
  std::vector<int64_t> seq_lens = {4, 8};
  std::vector<int64_t> last_loc = {-1, 3};

  {
    PagedTokenAllocator allocator(paged_options(4, 4), nullptr);
    const auto before = allocator.backup_state();
    EXPECT_FALSE(
        allocator.alloc_extend(prefix_lens, seq_lens, last_loc, 8).has_value());
    EXPECT_EQ(allocator.available_size(), 4);
    EXPECT_EQ(allocator.backup_state().free_pages, before.free_pages);
  }
  {
    PagedTokenAllocator allocator(paged_options(12, 4), nullptr);
    auto indices = allocator.alloc_extend(prefix_lens, seq_lens, last_loc, 8);
    ASSERT_TRUE(indices.has_value());
    EXPECT_EQ(*indices, std::vector<int64_t>({4, 5, 6, 7, 8, 9, 10, 11}));
    EXPECT_EQ(allocator.available_size(), 4);
  }
}

TEST(PagedTokenAllocatorTest, ExtendFillsPartialPages) {
  PagedTokenAllocator allocator(
      paged_options(32, 4, /*debug_mode=*/true), nullptr);

  // request A: 0 -> 6 tokens, pages 1 and 2
  std::vector<int64_t> prefix_lens = {0};
  std::vector<int64_t> seq_lens = {6};
  std::vector<int64_t> last_loc = {-1};
  auto first = allocator.alloc_extend(prefix_lens, seq_lens, last_loc, 6);
  ASSERT_TRUE(first.has_value());
  EXPECT_EQ(*first, std::vector<int64_t>({4, 5, 6, 7, 8, 9}));
  EXPECT_EQ(allocator.available_size(), 24);

  // A grows 6 -> 13: two slots left in page 2, page 3 in full, one slot of
  // page 4. B starts 0 -> 3 in page 5.
  prefix_lens = {6, 0};
  seq_lens = {13, 3};
  last_loc = {9, -1};
  auto second = allocator.alloc_extend(prefix_lens, seq_lens, last_loc, 10);
  ASSERT_TRUE(second.has_value());
  EXPECT_EQ(*second,
            std::vector<int64_t>({10, 11, 12, 13, 14, 15, 16, 20, 21, 22}));
  EXPECT_EQ(allocator.available_size(), 12);

  // decode: A and B stay in their pages, C needs page 6
  seq_lens = {14, 4, 1};
  last_loc = {16, 22, -1};
  auto third = allocator.alloc_decode(seq_lens, last_loc);
  ASSERT_TRUE(third.has_value());
  EXPECT_EQ(*third, std::vector<int64_t>({17, 23, 24}));
  EXPECT_EQ(allocator.available_size(), 8);

  // B crosses into a new page
  seq_lens = {5};
  last_loc = {23};
  auto fourth = allocator.alloc_decode(seq_lens, last_loc);
  ASSERT_TRUE(fourth.has_value());
  EXPECT_EQ(*fourth, std::vector<int64_t>({28}));
  EXPECT_EQ(allocator.available_size(), 4);
}

TEST(PagedTokenAllocatorTest, ExtendWithinPartialPageTakesNoPage) {
  PagedTokenAllocator allocator(paged_options(16, 4), nullptr);
  std::vector<int64_t> prefix_lens = {5};
  std::vector<int64_t> seq_lens = {7};
  std::vector<int64_t> last_loc = {8};
  auto indices = allocator.alloc_extend(prefix_lens, seq_lens, last_loc, 2);
  ASSERT_TRUE(indices.has_value());
  EXPECT_EQ(*indices, std::vector<int64_t>({9, 10}));
  EXPECT_EQ(allocator.available_size(), 16);
}

TEST(PagedTokenAllocatorTest, DecodeRejectedAtomically) {
  PagedTokenAllocator allocator(paged_options(8, 4), nullptr);
  auto held = allocator.alloc(4);
  ASSERT_TRUE(held.has_value());

  // both requests sit at a page boundary and need a fresh page, one is left
  std::vector<int64_t> seq_lens = {5, 9};
  std::vector<int64_t> last_loc = {7, 3};
  const auto before = allocator.backup_state();
  EXPECT_FALSE(allocator.alloc_decode(seq_lens, last_loc).has_value());
  EXPECT_EQ(allocator.backup_state().free_pages, before.free_pages);
  EXPECT_EQ(allocator.available_size(), 4);
}

TEST(PagedTokenAllocatorTest, ExtendTokenCountMustMatchBatch) {
  PagedTokenAllocator allocator(paged_options(16, 4), nullptr);
  std::vector<int64_t> prefix_lens = {0};
  std::vector<int64_t> seq_lens = {4};
  std::vector<int64_t> last_loc = {-1};
  EXPECT_DEATH(allocator.alloc_extend(prefix_lens, seq_lens, last_loc, 3),
               "extend_num_tokens does not match the batch");
}

TEST(PagedTokenAllocatorTest, DebugModeChecksLastLoc) {
  PagedTokenAllocator allocator(
      paged_options(16, 4, /*debug_mode=*/true), nullptr);
  std::vector<int64_t> prefix_lens = {5};
  std::vector<int64_t> seq_lens = {7};
  std::vector<int64_t> last_loc = {9};
  EXPECT_DEATH(allocator.alloc_extend(prefix_lens, seq_lens, last_loc, 2),
               "not consistent");
}

TEST(PagedTokenAllocatorTest, FreePrependsReleasedPages) {
  PagedTokenAllocator allocator(paged_options(16, 4), nullptr);
  auto all = allocator.alloc(16);
  ASSERT_TRUE(all.has_value());
  EXPECT_EQ(allocator.available_size(), 0);

  allocator.free(std::vector<int64_t>{12, 4, 13});
  EXPECT_EQ(allocator.backup_state().free_pages, std::deque<int64_t>({1, 3}));
  EXPECT_EQ(allocator.available_size(), 8);

  auto again = allocator.alloc(4);
  EXPECT_EQ(*again, std::vector<int64_t>({4, 5, 6, 7}));
}

TEST(PagedTokenAllocatorTest, PageReleasedOnceAcrossCalls) {
  PagedTokenAllocator split(paged_options(16, 4), nullptr);
  PagedTokenAllocator whole(paged_options(16, 4), nullptr);
  auto split_indices = split.alloc(8);
  auto whole_indices = whole.alloc(8);

  // a subset of page 1, then the rest of page 1 and all of page 2
  split.free(std::vector<int64_t>{4, 5});
  EXPECT_EQ(split.available_size(), 12);
  split.free(std::vector<int64_t>{6, 7, 8, 9, 10, 11});
  EXPECT_EQ(split.available_size(), 16);

  whole.free(*whole_indices);
  EXPECT_EQ(split.available_size(), whole.available_size());

  const auto free_pages = split.backup_state().free_pages;
  std::set<int64_t> unique(free_pages.begin(), free_pages.end());
  EXPECT_EQ(unique.size(), free_pages.size());
  EXPECT_EQ(unique, std::set<int64_t>({1, 2, 3, 4}));
}

TEST(PagedTokenAllocatorTest, FreeGroupMatchesSingleFree) {
  PagedTokenAllocator grouped(paged_options(32, 4), nullptr);
  PagedTokenAllocator direct(paged_options(32, 4), nullptr);

  std::vector<std::vector<int64_t>> batches;
  for (int i = 0; i < 4; ++i) {
    batches.push_back(*grouped.alloc(8));
    direct.alloc(8);
  }

  grouped.free_group_begin();
  grouped.free(batches[2]);
  grouped.free(batches[0]);
  grouped.free(batches[3]);
  EXPECT_EQ(grouped.available_size(), 0);
  grouped.free_group_end();

  std::vector<int64_t> merged = batches[2];
  merged.insert(merged.end(), batches[0].begin(), batches[0].end());
  merged.insert(merged.end(), batches[3].begin(), batches[3].end());
  direct.free(merged);

  EXPECT_EQ(grouped.available_size(), 24);
  EXPECT_EQ(grouped.backup_state().free_pages,
            direct.backup_state().free_pages);
}

TEST(PagedTokenAllocatorTest, RestoreRollsBackExtend) {
  PagedTokenAllocator allocator(paged_options(32, 4), nullptr);
  auto held = allocator.alloc(8);
  const auto state = allocator.backup_state();

  std::vector<int64_t> prefix_lens = {0, 0};
  std::vector<int64_t> seq_lens = {5, 3};
  std::vector<int64_t> last_loc = {-1, -1};
  auto speculative =
      allocator.alloc_extend(prefix_lens, seq_lens, last_loc, 8);
  ASSERT_TRUE(speculative.has_value());
  EXPECT_EQ(allocator.available_size(), 12);

  allocator.restore_state(state);
  EXPECT_EQ(allocator.available_size(), 24);
  auto replay = allocator.alloc_extend(prefix_lens, seq_lens, last_loc, 8);
  EXPECT_EQ(*replay, *speculative);

  // pages held before the snapshot can still be released
  allocator.free(*held);
  EXPECT_EQ(allocator.available_size(), 20);
}

TEST(PagedTokenAllocatorTest, RandomAllocFreeConservesCapacity) {
  constexpr int32_t kPageSize = 4;
  PagedTokenAllocator allocator(
      paged_options(256, kPageSize, /*debug_mode=*/true), nullptr);
  std::mt19937 rng(2024);

  std::vector<std::vector<int64_t>> live;
  std::set<int64_t> live_slots;
  for (int step = 0; step < 500; ++step) {
    if (live.empty() || rng() % 3 != 0) {
      const int64_t need = (1 + rng() % 4) * kPageSize;
      auto indices = allocator.alloc(need);
      if (!indices.has_value()) {
        EXPECT_LT(allocator.available_size(), need);
        continue;
      }
      for (const int64_t index : *indices) {
        EXPECT_TRUE(live_slots.insert(index).second)
            << "slot " << index << " handed out twice";
      }
      live.push_back(std::move(*indices));
    } else {
      const size_t victim = rng() % live.size();
      for (const int64_t index : live[victim]) {
        live_slots.erase(index);
      }
      allocator.free(live[victim]);
      live.erase(live.begin() + victim);
    }
    EXPECT_EQ(allocator.available_size() +
                  static_cast<int64_t>(live_slots.size()),
              allocator.size());
  }
}

TEST(PagedTokenAllocatorTest, HostCopyIsUnsupported) {
  PagedTokenAllocator allocator(paged_options(16, 4), nullptr);
  std::vector<int64_t> indices = {4};
  EXPECT_DEATH(allocator.get_cpu_copy(indices), "not supported");
}

}  // namespace kvpool
