// Copyright 2025 Jonas Teuwen. All Rights Reserved.
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#include "omeslice/utilities/thread_pool.h"

#include <cstddef>
#include <cstdlib>
#include <string_view>

#include <BS_thread_pool.hpp>

#include "absl/strings/numbers.h"

namespace omeslice {

namespace {

constexpr const char* kThreadCountVariable = "OMESLICE_NUM_THREADS";

/// @brief Thread count requested through the environment (0 = not set)
std::size_t GetThreadCountFromEnv() {
  const char* env_value = std::getenv(kThreadCountVariable);
  if (env_value == nullptr) {
    return 0;
  }
  std::size_t value = 0;
  if (!absl::SimpleAtoi(std::string_view(env_value), &value)) {
    return 0;
  }
  return value;
}

}  // namespace

BS::light_thread_pool& ThreadPoolManager::GetInstance() {
  static BS::light_thread_pool pool(GetThreadCountFromEnv());
  return pool;
}

void ThreadPoolManager::SetThreadCount(std::size_t count) {
  BS::light_thread_pool& pool = GetInstance();
  pool.wait();
  pool.reset(count);
}

}  // namespace omeslice
