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

#include "swa_token_allocator.h"

#include <absl/strings/str_format.h>

#include <algorithm>

namespace kvpool {

SWATokenAllocator::SWATokenAllocator(const Options& options,
                                     SWAKVCache* kv_cache)
    : TokenAllocator(options, kv_cache) {
  CHECK(kv_cache != nullptr) << "SWATokenAllocator needs a SWAKVCache";
  CHECK_GT(options_.size_swa(), 0) << "sliding window pool must not be empty";

  // both pools keep the page size, the batched kernels are not used here
  Options full_options = options_;
  full_options.size_swa(0).num_threads(0);
  Options swa_options = full_options;
  swa_options.size(options_.size_swa());

  full_attn_allocator_ = std::make_unique<PagedTokenAllocator>(
      full_options, kv_cache->full_kv_cache());
  swa_attn_allocator_ = std::make_unique<PagedTokenAllocator>(
      swa_options, kv_cache->swa_kv_cache());

  // every slot handed out by the full pool must be addressable
  const int64_t num_full_slots =
      (full_attn_allocator_->num_pages() + 1) * page_size();
  full_to_swa_index_mapping_.assign(
      std::max(size_full() + size_swa() + 1, num_full_slots), 0);
  clear();

  kv_cache->set_full_to_swa_index_mapping(&full_to_swa_index_mapping_);
  LOG(INFO) << "SWA token allocator: full attention slots " << size_full()
            << ", sliding window slots " << size_swa() << ", page size "
            << page_size();
}

SWATokenAllocator::~SWATokenAllocator() {
  auto* swa_kv_cache = static_cast<SWAKVCache*>(kv_cache_);
  if (swa_kv_cache->full_to_swa_index_mapping() ==
      &full_to_swa_index_mapping_) {
    swa_kv_cache->set_full_to_swa_index_mapping(nullptr);
  }
}

void SWATokenAllocator::clear() {
  swa_attn_allocator_->clear();
  full_attn_allocator_->clear();
  std::fill(full_to_swa_index_mapping_.begin(),
            full_to_swa_index_mapping_.end(),
            0);
  reset_free_group();
}

std::optional<std::vector<int64_t>> SWATokenAllocator::alloc(
    int64_t need_size) {
  if (need_size > full_attn_allocator_->available_size()) {
    return std::nullopt;
  }
  if (need_size > swa_attn_allocator_->available_size()) {
    return std::nullopt;
  }

  auto full_indices = full_attn_allocator_->alloc(need_size);
  auto swa_indices = swa_attn_allocator_->alloc(need_size);
  CHECK(full_indices.has_value() && swa_indices.has_value())
      << "allocation failed after admission";
  CHECK_EQ(full_indices->size(), swa_indices->size());

  for (size_t i = 0; i < full_indices->size(); ++i) {
    full_to_swa_index_mapping_[(*full_indices)[i]] = (*swa_indices)[i];
  }
  return full_indices;
}

void SWATokenAllocator::free_indices(const Slice<int64_t>& indices) {
  // a full slot with no mapping is not allocated, freeing it again would
  // put it into the full pool twice
  std::vector<int64_t> live_indices;
  live_indices.reserve(indices.size());
  for (const int64_t index : indices) {
    if (index <= 0 ||
        index >= static_cast<int64_t>(full_to_swa_index_mapping_.size())) {
      CHECK(!debug_mode_) << "freeing slot " << index
                          << " outside of the pool";
      continue;
    }
    if (debug_mode_) {
      CHECK_NE(full_to_swa_index_mapping_[index], 0)
          << "double free of full attention slot " << index;
    }
    if (full_to_swa_index_mapping_[index] != 0) {
      live_indices.push_back(index);
    }
  }
  if (live_indices.size() < indices.size()) {
    LOG(WARNING) << "skip freeing " << indices.size() - live_indices.size()
                 << " unmapped full attention slots";
  }
  if (live_indices.empty()) {
    return;
  }

  full_attn_allocator_->free(live_indices);
  free_swa(live_indices);

  CHECK_LE(full_attn_allocator_->available_size(), size_full());
  CHECK_LE(swa_attn_allocator_->available_size(), size_swa());
}

void SWATokenAllocator::free_swa(const Slice<int64_t>& indices) {
  std::vector<int64_t> swa_indices;
  swa_indices.reserve(indices.size());
  for (const int64_t index : indices) {
    const int64_t swa_index = full_to_swa_index_mapping_[index];
    if (swa_index > 0) {
      swa_indices.push_back(swa_index);
    }
    full_to_swa_index_mapping_[index] = 0;
  }
  swa_attn_allocator_->free(swa_indices);
}

std::vector<int32_t> SWATokenAllocator::translate_loc_from_full_to_swa(
    const Slice<int64_t>& indices) const {
  std::vector<int32_t> swa_indices;
  swa_indices.reserve(indices.size());
  for (const int64_t index : indices) {
    swa_indices.push_back(
        static_cast<int32_t>(full_to_swa_index_mapping_[index]));
  }
  return swa_indices;
}

TokenAllocator::State SWATokenAllocator::backup_state() const {
  LOG(FATAL) << "backup_state is not supported by SWATokenAllocator";
  return {};
}

void SWATokenAllocator::restore_state(State /*state*/) {
  LOG(FATAL) << "restore_state is not supported by SWATokenAllocator";
}

std::string SWATokenAllocator::debug_print() const {
  return absl::StrFormat(
      "#swa-available-size: %d, #full-attn-available-size: %d, ",
      swa_attn_allocator_->available_size(),
      full_attn_allocator_->available_size());
}

std::pair<std::string, int64_t> SWATokenAllocator::log_usage(
    int64_t evictable_size) const {
  return log_usage(evictable_size, /*full_evictable_size=*/0);
}

std::pair<std::string, int64_t> SWATokenAllocator::log_usage(
    int64_t swa_evictable_size,
    int64_t full_evictable_size) const {
  const int64_t used_full =
      size_full() - (full_available_size() + full_evictable_size);
  const int64_t used_swa =
      size_swa() - (swa_available_size() + swa_evictable_size);
  std::string msg = absl::StrFormat(
      "#token: full=%d, swa=%d, token usage: full=%.2f, swa=%.2f, ",
      used_full,
      used_swa,
      static_cast<double>(used_full) / size_full(),
      static_cast<double>(used_swa) / size_swa());
  return {std::move(msg), used_full};
}

}  // namespace kvpool
