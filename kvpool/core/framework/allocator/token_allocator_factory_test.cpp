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

#include <gtest/gtest.h>

#include "common/global_flags.h"
#include "flat_token_allocator.h"
#include "paged_token_allocator.h"
#include "swa_token_allocator.h"

namespace kvpool {

namespace {

std::unique_ptr<KVCache> make_kv_cache(int64_t num_slots) {
  return std::make_unique<KVCache>(/*num_layers=*/1,
                                   num_slots,
                                   /*num_kv_heads=*/1,
                                   /*head_dim=*/2,
                                   torch::dtype(torch::kFloat32));
}

}  // namespace

TEST(TokenAllocatorFactoryTest, OptionsFromFlags) {
  gflags::FlagSaver flag_saver;
  FLAGS_max_total_num_tokens = 128;
  FLAGS_page_size = 16;
  FLAGS_swa_max_total_num_tokens = 32;
  FLAGS_debug_memory_pool = true;
  FLAGS_num_alloc_threads = 2;

  const auto options = allocator_options_from_flags();
  EXPECT_EQ(options.size(), 128);
  EXPECT_EQ(options.page_size(), 16);
  EXPECT_EQ(options.size_swa(), 32);
  EXPECT_TRUE(options.debug_mode());
  EXPECT_EQ(options.num_threads(), 2);
}

TEST(TokenAllocatorFactoryTest, SelectsVariant) {
  auto kv_cache = make_kv_cache(/*num_slots=*/80);

  TokenAllocator::Options options;
  options.size(64).page_size(1);
  auto flat = create_token_allocator(options, kv_cache.get());
  EXPECT_NE(dynamic_cast<FlatTokenAllocator*>(flat.get()), nullptr);
  EXPECT_EQ(flat->kv_cache(), kv_cache.get());

  options.page_size(16).num_threads(2);
  auto paged = create_token_allocator(options, kv_cache.get());
  EXPECT_NE(dynamic_cast<PagedTokenAllocator*>(paged.get()), nullptr);
  EXPECT_EQ(paged->available_size(), 64);

  auto swa_kv_cache =
      std::make_unique<SWAKVCache>(make_kv_cache(80), make_kv_cache(48));
  options.size_swa(32);
  auto swa = create_token_allocator(options, swa_kv_cache.get());
  EXPECT_NE(dynamic_cast<SWATokenAllocator*>(swa.get()), nullptr);
  EXPECT_EQ(swa->available_size(), 32);
}

TEST(TokenAllocatorFactoryTest, SlidingWindowNeedsSWAKVCache) {
  auto kv_cache = make_kv_cache(/*num_slots=*/80);
  TokenAllocator::Options options;
  options.size(64).size_swa(32).page_size(1);
  EXPECT_DEATH(create_token_allocator(options, kv_cache.get()),
               "requires a SWAKVCache");
}

}  // namespace kvpool
