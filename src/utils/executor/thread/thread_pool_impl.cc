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

#include "utils/executor/thread/thread_pool_impl.h"

#include <pthread.h>

#include "glog/logging.h"

namespace chunkfs {

void ThreadPoolImpl::ThreadProc(size_t thread_id) {
  VLOG(12) << name_ << " thread " << thread_id << " started.";

  pthread_setname_np(pthread_self(), name_.substr(0, 15).c_str());

  while (true) {
    std::function<void()> task;

    {
      std::unique_lock<std::mutex> lock(mutex_);
      condition_.wait(lock, [this] { return !tasks_.empty() || !running_; });

      // drain queued tasks before exit
      if (!running_ && tasks_.empty()) {
        break;
      }

      task = std::move(tasks_.front());
      tasks_.pop();
    }  // end lock scope

    CHECK(task);
    (task)();
  }  // end of while loop

  VLOG(12) << name_ << " thread " << thread_id << " exit.";
}

void ThreadPoolImpl::Start() {
  std::unique_lock<std::mutex> lg(mutex_);
  if (running_) {
    return;
  }

  running_ = true;

  threads_.resize(thread_num_);
  for (size_t i = 0; i < threads_.size(); i++) {
    threads_[i] = std::thread([this, i] { ThreadProc(i); });
  }

  LOG(INFO) << "Thread pool " << name_ << " started with " << thread_num_
            << " threads.";
}

void ThreadPoolImpl::Stop() {
  {
    std::unique_lock<std::mutex> lock(mutex_);
    if (!running_) {
      return;
    }

    running_ = false;
    condition_.notify_all();
  }

  for (auto& thread : threads_) {
    if (thread.joinable()) {
      thread.join();
    }
  }
  threads_.clear();

  LOG(INFO) << "Thread pool " << name_ << " stopped.";
}

bool ThreadPoolImpl::IsRunning() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return running_;
}

int ThreadPoolImpl::GetBackgroundThreads() {
  std::lock_guard<std::mutex> lock(mutex_);
  return thread_num_;
}

int ThreadPoolImpl::GetTaskNum() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return tasks_.size();
}

bool ThreadPoolImpl::Execute(const std::function<void()>& task) {
  auto cp(task);
  return Execute(std::move(cp));
}

bool ThreadPoolImpl::Execute(std::function<void()>&& task) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!running_) {
    return false;
  }
  tasks_.push(std::move(task));
  condition_.notify_one();
  return true;
}

}  // namespace chunkfs
