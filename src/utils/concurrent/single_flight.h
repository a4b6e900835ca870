/*
 * Copyright (c) 2025 dingodb.com, Inc. All Rights Reserved
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#ifndef CHUNKFS_SRC_UTILS_CONCURRENT_SINGLE_FLIGHT_H_
#define CHUNKFS_SRC_UTILS_CONCURRENT_SINGLE_FLIGHT_H_

#include <bthread/condition_variable.h>
#include <bthread/mutex.h>

#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

#include "common/status.h"

namespace chunkfs {
namespace utils {

// Collapses concurrent calls with the same key into one execution of the
// supplied function. Every caller of one flight receives the same status and
// value. The key is forgotten as soon as the flight lands, so a failed
// result is never served to later callers.
template <typename T>
class SingleFlight {
 public:
  using Func = std::function<Status(T* value)>;

  SingleFlight() = default;
  SingleFlight(const SingleFlight&) = delete;
  SingleFlight& operator=(const SingleFlight&) = delete;

  // shared is set to true when the caller joined a flight started by others.
  Status Do(const std::string& key, const Func& func, T* value,
            bool* shared = nullptr) {
    std::shared_ptr<Call> call;
    bool leader = false;
    {
      std::lock_guard<bthread::Mutex> lock(mutex_);
      auto iter = calls_.find(key);
      if (iter != calls_.end()) {
        call = iter->second;
      } else {
        call = std::make_shared<Call>();
        calls_.emplace(key, call);
        leader = true;
      }
    }

    if (shared != nullptr) {
      *shared = !leader;
    }

    if (!leader) {
      std::unique_lock<bthread::Mutex> lock(call->mutex);
      while (!call->done) {
        call->cond.wait(lock);
      }
      *value = call->value;
      return call->status;
    }

    T result;
    Status status = func(&result);

    {
      std::lock_guard<bthread::Mutex> lock(mutex_);
      calls_.erase(key);
    }

    {
      std::lock_guard<bthread::Mutex> lock(call->mutex);
      call->status = status;
      call->value = result;
      call->done = true;
      call->cond.notify_all();
    }

    *value = std::move(result);
    return status;
  }

  // Number of keys with a flight in progress.
  size_t Inflights() const {
    std::lock_guard<bthread::Mutex> lock(mutex_);
    return calls_.size();
  }

 private:
  struct Call {
    bthread::Mutex mutex;
    bthread::ConditionVariable cond;
    bool done{false};
    Status status;
    T value;
  };

  mutable bthread::Mutex mutex_;
  std::unordered_map<std::string, std::shared_ptr<Call>> calls_;
};

}  // namespace utils
}  // namespace chunkfs

#endif  // CHUNKFS_SRC_UTILS_CONCURRENT_SINGLE_FLIGHT_H_
