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

#ifndef CHUNKFS_SRC_CLIENT_CACHE_CHUNK_CACHE_H_
#define CHUNKFS_SRC_CLIENT_CACHE_CHUNK_CACHE_H_

#include <cstdint>
#include <memory>
#include <string>

#include "common/io_buffer.h"
#include "common/status.h"

namespace chunkfs {
namespace client {

// Whole chunk content keyed by chunk id.
class ChunkCache {
 public:
  virtual ~ChunkCache() = default;

  // Returns false on miss. A cached payload shorter than size_hint is
  // reported as a miss.
  virtual bool GetChunk(const std::string& chunk_id, uint64_t size_hint,
                        IOBuffer* data) = 0;

  virtual Status SetChunk(const std::string& chunk_id,
                          const IOBuffer& data) = 0;
};

using ChunkCacheSPtr = std::shared_ptr<ChunkCache>;

}  // namespace client
}  // namespace chunkfs

#endif  // CHUNKFS_SRC_CLIENT_CACHE_CHUNK_CACHE_H_
