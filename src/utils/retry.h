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

#ifndef CHUNKFS_SRC_UTILS_RETRY_H_
#define CHUNKFS_SRC_UTILS_RETRY_H_

#include <cstdint>
#include <functional>
#include <string>

#include "common/status.h"

namespace chunkfs {
namespace utils {

struct RetryOption {
  RetryOption() = default;
  RetryOption(uint32_t max_retry, uint32_t base_ms, uint32_t max_ms)
      : max_retry(max_retry), base_ms(base_ms), max_ms(max_ms) {}

  uint32_t max_retry{3};
  uint32_t base_ms{100};
  uint32_t max_ms{2000};
};

using RetryJob = std::function<Status()>;
using ShouldRetryFunc = std::function<bool(const Status&)>;

// Backoff before the retry-th retry (1-based): base_ms * 2^(retry-1) capped
// by max_ms, plus up to 50% random jitter, in microseconds.
uint64_t CalRetryWaitTimeUs(const RetryOption& option, uint32_t retry);

bool IsTransientError(const Status& status);

// Runs job at most option.max_retry + 1 times. A failure is retried only
// while should_retry accepts it. Returns the status of the last attempt.
Status Retry(const std::string& name, const RetryOption& option,
             const RetryJob& job,
             const ShouldRetryFunc& should_retry = IsTransientError);

}  // namespace utils
}  // namespace chunkfs

#endif  // CHUNKFS_SRC_UTILS_RETRY_H_
