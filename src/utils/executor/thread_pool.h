// Copyright (c) 2025 dingodb.com, Inc. All Rights Reserved
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

#ifndef CHUNKFS_SRC_UTILS_EXECUTOR_THREAD_POOL_H_
#define CHUNKFS_SRC_UTILS_EXECUTOR_THREAD_POOL_H_

#include <functional>
#include <memory>

namespace chunkfs {

class ThreadPool {
 public:
  virtual ~ThreadPool() = default;

  virtual void Start() = 0;

  // Run every queued task, then join the background threads.
  virtual void Stop() = 0;

  virtual bool IsRunning() const = 0;

  virtual int GetBackgroundThreads() = 0;

  // Get the number of task scheduled in the ThreadPool
  virtual int GetTaskNum() const = 0;

  // Submit a fire and forget job, return false if the pool is not running
  virtual bool Execute(const std::function<void()>&) = 0;

  // This moves the function in for efficiency
  virtual bool Execute(std::function<void()>&&) = 0;
};

using ThreadPoolUPtr = std::unique_ptr<ThreadPool>;
using ThreadPoolSPtr = std::shared_ptr<ThreadPool>;

}  // namespace chunkfs

#endif  // CHUNKFS_SRC_UTILS_EXECUTOR_THREAD_POOL_H_
