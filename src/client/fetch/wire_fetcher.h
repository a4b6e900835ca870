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

#ifndef CHUNKFS_SRC_CLIENT_FETCH_WIRE_FETCHER_H_
#define CHUNKFS_SRC_CLIENT_FETCH_WIRE_FETCHER_H_

#include <memory>
#include <string>
#include <vector>

#include "common/io_buffer.h"
#include "common/status.h"

namespace chunkfs {
namespace client {

// Downloads the raw content of one whole chunk from any of the candidate
// urls, undoing encryption and compression as flagged.
class WireFetcher {
 public:
  virtual ~WireFetcher() = default;

  virtual Status Fetch(const std::vector<std::string>& urls,
                       const std::string& cipher_key, bool is_compressed,
                       IOBuffer* data) = 0;
};

using WireFetcherSPtr = std::shared_ptr<WireFetcher>;

}  // namespace client
}  // namespace chunkfs

#endif  // CHUNKFS_SRC_CLIENT_FETCH_WIRE_FETCHER_H_
