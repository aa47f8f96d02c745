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

#include "env_var.h"

#include <cstdlib>

namespace kvpool {
namespace util {

bool get_bool_env(const std::string& key, bool default_value) {
  const char* val = std::getenv(key.c_str());
  if (val == nullptr) {
    return default_value;
  }
  std::string str_val(val);
  return (str_val == "1" || str_val == "true" || str_val == "TRUE" ||
          str_val == "True");
}

bool memory_pool_debug_enabled() {
  constexpr const char* kDebugEnvVar = "KVPOOL_DEBUG_MEMORY_POOL";
  return get_bool_env(kDebugEnvVar, false);
}

}  // namespace util
}  // namespace kvpool
