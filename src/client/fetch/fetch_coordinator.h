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

#ifndef CHUNKFS_SRC_CLIENT_FETCH_FETCH_COORDINATOR_H_
#define CHUNKFS_SRC_CLIENT_FETCH_FETCH_COORDINATOR_H_

#include <memory>

#include "client/cache/chunk_cache.h"
#include "client/fetch/chunk_fetcher.h"
#include "client/reader/chunk_view.h"
#include "common/io_buffer.h"
#include "common/status.h"
#include "utils/concurrent/single_flight.h"
#include "utils/executor/thread_pool.h"

namespace chunkfs {
namespace client {

// Shared by every reader of a hub: serves whole chunks from the content
// cache, collapses concurrent fetches of one chunk into a single download
// and warms the cache with read-ahead.
class FetchCoordinator {
 public:
  // cache and readahead_executor may be null, read-ahead is off without
  // either of them.
  FetchCoordinator(ChunkFetcherSPtr fetcher, ChunkCacheSPtr cache,
                   ThreadPoolSPtr readahead_executor, bool readahead_enable);

  virtual ~FetchCoordinator() = default;

  virtual Status GetWholeChunk(const ChunkView& view, IOBuffer* data);

  // Fire and forget, failures are only logged.
  virtual void Prefetch(const ChunkView& view);

  bool ReadaheadEnabled() const;

 private:
  Status LoadChunk(const ChunkView& view, IOBuffer* data);

  ChunkFetcherSPtr fetcher_;
  ChunkCacheSPtr cache_;
  const bool readahead_enable_;
  utils::SingleFlight<IOBuffer> single_flight_;
  // Queued read-ahead tasks hold a raw pointer to this coordinator, the owner
  // must Stop() the executor before dropping the coordinator.
  ThreadPoolSPtr readahead_executor_;
};

using FetchCoordinatorSPtr = std::shared_ptr<FetchCoordinator>;

}  // namespace client
}  // namespace chunkfs

#endif  // CHUNKFS_SRC_CLIENT_FETCH_FETCH_COORDINATOR_H_
