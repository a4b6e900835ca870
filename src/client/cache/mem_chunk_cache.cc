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

#include "client/cache/mem_chunk_cache.h"

#include <fmt/format.h>
#include <glog/logging.h>

namespace chunkfs {
namespace client {

MemChunkCache::MemChunkCache(uint64_t capacity_bytes)
    : capacity_bytes_(capacity_bytes) {
  CHECK(capacity_bytes_ > 0) << "chunk cache capacity must be positive";
}

bool MemChunkCache::GetChunk(const std::string& chunk_id, uint64_t size_hint,
                             IOBuffer* data) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto iter = index_.find(chunk_id);
  if (iter == index_.end()) {
    return false;
  }

  auto node = iter->second;
  if (node->data.Size() < size_hint) {
    return false;
  }

  lru_.splice(lru_.begin(), lru_, node);
  *data = node->data;
  return true;
}

Status MemChunkCache::SetChunk(const std::string& chunk_id,
                               const IOBuffer& data) {
  if (data.Size() > capacity_bytes_) {
    return Status::CacheFull(fmt::format(
        "chunk({}) size({}) exceeds cache capacity({})", chunk_id,
        data.Size(), capacity_bytes_));
  }

  std::lock_guard<std::mutex> lock(mutex_);
  auto iter = index_.find(chunk_id);
  if (iter != index_.end()) {
    used_bytes_ -= iter->second->data.Size();
    lru_.erase(iter->second);
    index_.erase(iter);
  }

  EvictLocked(data.Size());

  lru_.push_front(Entry{chunk_id, data});
  index_[chunk_id] = lru_.begin();
  used_bytes_ += data.Size();
  return Status::OK();
}

void MemChunkCache::EvictLocked(uint64_t need_bytes) {
  while (!lru_.empty() && used_bytes_ + need_bytes > capacity_bytes_) {
    auto& victim = lru_.back();
    VLOG(9) << fmt::format("[chunk.cache] evict chunk({}) size({}).",
                           victim.chunk_id, victim.data.Size());
    used_bytes_ -= victim.data.Size();
    index_.erase(victim.chunk_id);
    lru_.pop_back();
  }
}

uint64_t MemChunkCache::UsedBytes() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return used_bytes_;
}

size_t MemChunkCache::Size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return lru_.size();
}

}  // namespace client
}  // namespace chunkfs
