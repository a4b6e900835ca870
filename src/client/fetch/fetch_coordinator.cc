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

#include "client/fetch/fetch_coordinator.h"

#include <fmt/format.h>
#include <glog/logging.h>

#include <algorithm>
#include <cstdint>

#include "common/metrics/reader_metric.h"

namespace chunkfs {
namespace client {

using metrics::ReaderMetric;

FetchCoordinator::FetchCoordinator(ChunkFetcherSPtr fetcher,
                                   ChunkCacheSPtr cache,
                                   ThreadPoolSPtr readahead_executor,
                                   bool readahead_enable)
    : fetcher_(fetcher),
      cache_(cache),
      readahead_enable_(readahead_enable),
      readahead_executor_(readahead_executor) {
  CHECK_NOTNULL(fetcher_);
}

Status FetchCoordinator::GetWholeChunk(const ChunkView& view,
                                       IOBuffer* data) {
  bool shared = false;
  Status status = single_flight_.Do(
      view.chunk_id,
      [this, &view](IOBuffer* value) { return LoadChunk(view, value); }, data,
      &shared);

  if (shared) {
    ReaderMetric::GetInstance().shared_fetch_waiters << 1;
    VLOG(6) << fmt::format(
        "[coordinator] chunk({}) shared an inflight fetch, status({}).",
        view.chunk_id, status.ToString());
  }
  return status;
}

Status FetchCoordinator::LoadChunk(const ChunkView& view, IOBuffer* data) {
  if (cache_ != nullptr) {
    // a cached chunk must at least cover the visible part of the view
    uint64_t size_hint = std::max<uint64_t>(
        view.chunk_size, static_cast<uint64_t>(view.chunk_offset + view.size));
    if (cache_->GetChunk(view.chunk_id, size_hint, data)) {
      ReaderMetric::GetInstance().chunk_cache_hits << 1;
      VLOG(6) << fmt::format("[coordinator] chunk({}) cache hit, size({}).",
                             view.chunk_id, data->Size());
      return Status::OK();
    }
    ReaderMetric::GetInstance().chunk_cache_misses << 1;
  }

  CHUNKFS_RETURN_NOT_OK(fetcher_->Fetch(view, data));

  if (cache_ != nullptr) {
    Status status = cache_->SetChunk(view.chunk_id, *data);
    if (!status.ok()) {
      LOG(WARNING) << fmt::format(
          "[coordinator] cache chunk({}) size({}) failed, status({}).",
          view.chunk_id, data->Size(), status.ToString());
    }
  }
  return Status::OK();
}

bool FetchCoordinator::ReadaheadEnabled() const {
  return readahead_enable_ && cache_ != nullptr &&
         readahead_executor_ != nullptr;
}

void FetchCoordinator::Prefetch(const ChunkView& view) {
  if (!ReadaheadEnabled()) {
    return;
  }

  auto& metric = ReaderMetric::GetInstance();
  metric.inflight_readaheads << 1;
  bool submitted = readahead_executor_->Execute([this, view]() {
    IOBuffer data;
    Status status = GetWholeChunk(view, &data);
    if (!status.ok()) {
      ReaderMetric::GetInstance().readahead_failures << 1;
      LOG_EVERY_N(WARNING, 100) << fmt::format(
          "[coordinator] readahead chunk({}) failed, status({}).",
          view.chunk_id, status.ToString());
    }
    ReaderMetric::GetInstance().inflight_readaheads << -1;
  });

  if (!submitted) {
    metric.inflight_readaheads << -1;
    VLOG(3) << fmt::format(
        "[coordinator] skip readahead chunk({}), executor stopped.",
        view.chunk_id);
  }
}

}  // namespace client
}  // namespace chunkfs
