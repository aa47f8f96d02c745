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

#include <glog/logging.h>

#include <cstdint>
#include <deque>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "common/macros.h"
#include "framework/kv_cache/kv_cache.h"
#include "util/slice.h"

namespace kvpool {

// Hands out slot indices of a fixed size kv cache pool. Slot/page 0 is
// reserved as padding target and is never allocated.
//
// Instances are not thread safe, callers serialize all calls on one
// instance. Running out of slots is an expected outcome reported as
// std::nullopt with the allocator left untouched.
class TokenAllocator {
 public:
  struct Options {
    // number of token slots in the (full attention) pool
    PROPERTY(int64_t, size) = 0;
    // number of token slots in the sliding window pool, 0 if not hybrid
    PROPERTY(int64_t, size_swa) = 0;
    PROPERTY(int32_t, page_size) = 1;
    // run consistency checks on every call
    PROPERTY(bool, debug_mode) = false;
    // workers for the batched extend/decode kernels, 0 for none
    PROPERTY(int32_t, num_threads) = 0;
  };

  // Opaque copy of the free set, see backup_state()/restore_state().
  struct State {
    std::deque<int64_t> free_pages;
  };

  enum class FreeMode {
    kImmediate,
    // free() only records its argument, free_group_end() releases them
    kBuffering,
  };

  TokenAllocator(const Options& options, KVCacheStorage* kv_cache);

  virtual ~TokenAllocator() = default;

  // reset to full capacity
  virtual void clear() = 0;

  // allocate need_size slots, std::nullopt if not enough slots
  virtual std::optional<std::vector<int64_t>> alloc(int64_t need_size) = 0;

  // batched allocation growing every request from prefix_lens[i] to
  // seq_lens[i] tokens, last_loc[i] is the last slot the request occupies.
  // Returns the new slots of all requests concatenated in request order.
  virtual std::optional<std::vector<int64_t>> alloc_extend(
      const Slice<int64_t>& prefix_lens,
      const Slice<int64_t>& seq_lens,
      const Slice<int64_t>& last_loc,
      int64_t extend_num_tokens);

  // batched allocation of exactly one new slot per request, seq_lens are the
  // lengths after appending the token.
  virtual std::optional<std::vector<int64_t>> alloc_decode(
      const Slice<int64_t>& seq_lens,
      const Slice<int64_t>& last_loc);

  // release slots, an empty batch is a no-op
  void free(const Slice<int64_t>& indices);

  void free_group_begin();
  void free_group_end();

  virtual int64_t available_size() const {
    return static_cast<int64_t>(free_pages_.size()) * page_size();
  }

  virtual State backup_state() const { return State{free_pages_}; }
  virtual void restore_state(State state);

  virtual HostKVCache get_cpu_copy(const Slice<int64_t>& indices);
  virtual void load_cpu_copy(const HostKVCache& host_cache,
                             const Slice<int64_t>& indices);

  KVCacheStorage* kv_cache() const { return kv_cache_; }

  virtual std::string debug_print() const { return ""; }

  // returns the usage message and the number of used slots
  virtual std::pair<std::string, int64_t> log_usage(
      int64_t evictable_size = 0) const;

  int64_t size() const { return options_.size(); }
  int32_t page_size() const { return options_.page_size(); }
  bool debug_mode() const { return debug_mode_; }
  FreeMode free_mode() const { return free_mode_; }

  const Options& options() const { return options_; }

 protected:
  // releases indices right away, free mode is already handled
  virtual void free_indices(const Slice<int64_t>& indices) = 0;

  void reset_free_group();

  Options options_;

  bool debug_mode_ = false;

  // not owned
  KVCacheStorage* kv_cache_ = nullptr;

  // free pages (slots for page size 1), allocation takes from the front
  std::deque<int64_t> free_pages_;

 private:
  FreeMode free_mode_ = FreeMode::kImmediate;
  std::vector<std::vector<int64_t>> free_group_;

  DISALLOW_COPY_AND_ASSIGN(TokenAllocator);
};

}  // namespace kvpool
