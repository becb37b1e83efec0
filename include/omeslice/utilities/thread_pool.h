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

#ifndef AIFO_OMESLICE_INCLUDE_OMESLICE_UTILITIES_THREAD_POOL_H_
#define AIFO_OMESLICE_INCLUDE_OMESLICE_UTILITIES_THREAD_POOL_H_

#include <cstddef>

#include <BS_thread_pool.hpp>

namespace omeslice {

/// @brief Process-wide decode thread pool
///
/// Created on first use. The thread count comes from the
/// `OMESLICE_NUM_THREADS` environment variable when it holds a positive
/// number, otherwise from the hardware concurrency.
class ThreadPoolManager {
 public:
  /// @brief Get the shared pool
  static BS::light_thread_pool& GetInstance();

  /// @brief Resize the shared pool
  ///
  /// Waits for queued tasks before resizing.
  ///
  /// @param count Number of threads (0 = hardware concurrency)
  static void SetThreadCount(std::size_t count);

 private:
  ThreadPoolManager() = delete;
  ~ThreadPoolManager() = delete;
  ThreadPoolManager(const ThreadPoolManager&) = delete;
  ThreadPoolManager& operator=(const ThreadPoolManager&) = delete;
};

}  // namespace omeslice

#endif  // AIFO_OMESLICE_INCLUDE_OMESLICE_UTILITIES_THREAD_POOL_H_
