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

#ifndef CHUNKFS_SRC_CLIENT_CACHE_MEM_CHUNK_CACHE_H_
#define CHUNKFS_SRC_CLIENT_CACHE_MEM_CHUNK_CACHE_H_

#include <list>
#include <mutex>
#include <string>
#include <unordered_map>

#include "client/cache/chunk_cache.h"

namespace chunkfs {
namespace client {

// In-memory ChunkCache bounded by the total bytes of cached payloads,
// least recently used chunks are evicted first.
class MemChunkCache final : public ChunkCache {
 public:
  explicit MemChunkCache(uint64_t capacity_bytes);

  ~MemChunkCache() override = default;

  bool GetChunk(const std::string& chunk_id, uint64_t size_hint,
                IOBuffer* data) override;

  Status SetChunk(const std::string& chunk_id, const IOBuffer& data) override;

  uint64_t UsedBytes() const;

  size_t Size() const;

 private:
  struct Entry {
    std::string chunk_id;
    IOBuffer data;
  };

  using EntryList = std::list<Entry>;

  void EvictLocked(uint64_t need_bytes);

  const uint64_t capacity_bytes_;
  mutable std::mutex mutex_;
  uint64_t used_bytes_{0};
  EntryList lru_;  // front is the most recently used
  std::unordered_map<std::string, EntryList::iterator> index_;
};

}  // namespace client
}  // namespace chunkfs

#endif  // CHUNKFS_SRC_CLIENT_CACHE_MEM_CHUNK_CACHE_H_
