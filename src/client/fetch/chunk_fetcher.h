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

#ifndef CHUNKFS_SRC_CLIENT_FETCH_CHUNK_FETCHER_H_
#define CHUNKFS_SRC_CLIENT_FETCH_CHUNK_FETCHER_H_

#include <memory>

#include "client/fetch/wire_fetcher.h"
#include "client/location/location_resolver.h"
#include "client/reader/chunk_view.h"
#include "common/io_buffer.h"
#include "common/status.h"

namespace chunkfs {
namespace client {

// Downloads the whole content of the chunk behind a view.
class ChunkFetcher {
 public:
  ChunkFetcher(LocationResolverSPtr resolver, WireFetcherSPtr wire_fetcher,
               bool invalidate_location_on_error);

  virtual ~ChunkFetcher() = default;

  // Returns Unresolvable if the chunk can not be located, FetchFailed if no
  // storage node served it.
  virtual Status Fetch(const ChunkView& view, IOBuffer* data);

 private:
  LocationResolverSPtr resolver_;
  WireFetcherSPtr wire_fetcher_;
  const bool invalidate_location_on_error_;
};

using ChunkFetcherSPtr = std::shared_ptr<ChunkFetcher>;

}  // namespace client
}  // namespace chunkfs

#endif  // CHUNKFS_SRC_CLIENT_FETCH_CHUNK_FETCHER_H_
