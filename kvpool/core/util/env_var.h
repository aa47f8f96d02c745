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

#include <string>

namespace kvpool {
namespace util {

bool get_bool_env(const std::string& key, bool default_value);

// true if the memory pool diagnostic checks are requested through
// env KVPOOL_DEBUG_MEMORY_POOL
bool memory_pool_debug_enabled();

}  // namespace util
}  // namespace kvpool
