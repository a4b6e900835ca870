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

#ifndef CHUNKFS_SRC_CLIENT_HUB_READER_HUB_H_
#define CHUNKFS_SRC_CLIENT_HUB_READER_HUB_H_

#include <glog/logging.h>

#include <atomic>
#include <cstdint>
#include <memory>
#include <vector>

#include "client/cache/chunk_cache.h"
#include "client/fetch/chunk_fetcher.h"
#include "client/fetch/fetch_coordinator.h"
#include "client/fetch/wire_fetcher.h"
#include "client/location/location_cache.h"
#include "client/location/location_resolver.h"
#include "client/location/volume_lookup.h"
#include "client/reader/chunk_reader.h"
#include "client/reader/chunk_view.h"
#include "common/options/reader.h"
#include "common/status.h"
#include "utils/executor/thread_pool.h"

namespace chunkfs {
namespace client {

class ReaderHub {
 public:
  ReaderHub() = default;

  virtual ~ReaderHub() = default;

  virtual Status Start(const ReaderHubOption& option) = 0;

  virtual Status Stop() = 0;

  // All readers of one hub share its FetchCoordinator.
  virtual Status NewChunkReader(std::vector<ChunkView> views,
                                int64_t file_size,
                                ChunkReaderUPtr* reader) = 0;

  virtual LocationCache* GetLocationCache() = 0;

  virtual LocationResolver* GetLocationResolver() = 0;

  virtual FetchCoordinator* GetFetchCoordinator() = 0;

  virtual ThreadPool* GetReadaheadExecutor() = 0;
};

using ReaderHubUPtr = std::unique_ptr<ReaderHub>;

class ReaderHubImpl : public ReaderHub {
 public:
  // chunk_cache may be null. location_cache is created if null.
  ReaderHubImpl(VolumeLookupSPtr volume_lookup, WireFetcherSPtr wire_fetcher,
                ChunkCacheSPtr chunk_cache,
                LocationCacheSPtr location_cache = nullptr);

  ~ReaderHubImpl() override { Stop(); }

  Status Start(const ReaderHubOption& option) override;

  Status Stop() override;

  Status NewChunkReader(std::vector<ChunkView> views, int64_t file_size,
                        ChunkReaderUPtr* reader) override;

  LocationCache* GetLocationCache() override {
    CHECK_NOTNULL(location_cache_);
    return location_cache_.get();
  }

  LocationResolver* GetLocationResolver() override {
    CHECK_NOTNULL(location_resolver_);
    return location_resolver_.get();
  }

  FetchCoordinator* GetFetchCoordinator() override {
    CHECK_NOTNULL(fetch_coordinator_);
    return fetch_coordinator_.get();
  }

  // null if read-ahead is disabled
  ThreadPool* GetReadaheadExecutor() override {
    return readahead_executor_.get();
  }

 private:
  std::atomic<bool> started_{false};

  VolumeLookupSPtr volume_lookup_;
  WireFetcherSPtr wire_fetcher_;
  ChunkCacheSPtr chunk_cache_;
  LocationCacheSPtr location_cache_;

  LocationResolverSPtr location_resolver_;
  ChunkFetcherSPtr chunk_fetcher_;
  ThreadPoolSPtr readahead_executor_;
  FetchCoordinatorSPtr fetch_coordinator_;
};

}  // namespace client
}  // namespace chunkfs

#endif  // CHUNKFS_SRC_CLIENT_HUB_READER_HUB_H_
