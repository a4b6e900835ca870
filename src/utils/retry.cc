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

#include "utils/retry.h"

#include <bthread/bthread.h>
#include <butil/fast_rand.h>
#include <fmt/format.h>
#include <glog/logging.h>

#include <algorithm>

namespace chunkfs {
namespace utils {

uint64_t CalRetryWaitTimeUs(const RetryOption& option, uint32_t retry) {
  uint32_t shift = std::min<uint32_t>(retry > 0 ? retry - 1 : 0, 20);
  uint64_t wait_ms = static_cast<uint64_t>(option.base_ms) << shift;
  wait_ms = std::min<uint64_t>(wait_ms, option.max_ms);

  // exponential backoff with jitter
  uint64_t jitter_ms = butil::fast_rand_less_than(wait_ms / 2 + 1);
  return (wait_ms + jitter_ms) * 1000;
}

bool IsTransientError(const Status& status) {
  return status.IsNetError() || status.IsTimeout() || status.IsInternal();
}

Status Retry(const std::string& name, const RetryOption& option,
             const RetryJob& job, const ShouldRetryFunc& should_retry) {
  Status status;
  for (uint32_t retry = 0;; ++retry) {
    if (retry > 0) {
      uint64_t wait_us = CalRetryWaitTimeUs(option, retry);
      VLOG(3) << fmt::format("[retry] {} retry({}/{}) after {}us.", name,
                             retry, option.max_retry, wait_us);
      bthread_usleep(wait_us);
    }

    status = job();
    if (status.ok() || !should_retry(status)) {
      return status;
    }

    if (retry >= option.max_retry) {
      break;
    }

    LOG(WARNING) << fmt::format("[retry] {} failed, status({}).", name,
                                status.ToString());
  }

  LOG(ERROR) << fmt::format("[retry] {} give up after {} retries, status({}).",
                            name, option.max_retry, status.ToString());
  return status;
}

}  // namespace utils
}  // namespace chunkfs
