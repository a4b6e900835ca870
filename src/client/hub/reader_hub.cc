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

#include "client/hub/reader_hub.h"

#include <fmt/format.h>

#include <utility>

#include "utils/executor/thread/thread_pool_impl.h"

namespace chunkfs {
namespace client {

ReaderHubImpl::ReaderHubImpl(VolumeLookupSPtr volume_lookup,
                             WireFetcherSPtr wire_fetcher,
                             ChunkCacheSPtr chunk_cache,
                             LocationCacheSPtr location_cache)
    : volume_lookup_(volume_lookup),
      wire_fetcher_(wire_fetcher),
      chunk_cache_(chunk_cache),
      location_cache_(location_cache) {
  CHECK_NOTNULL(volume_lookup_);
  CHECK_NOTNULL(wire_fetcher_);
  if (location_cache_ == nullptr) {
    location_cache_ = std::make_shared<LocationCache>();
  }
}

Status ReaderHubImpl::Start(const ReaderHubOption& option) {
  CHECK(started_.load(std::memory_order_relaxed) == false)
      << "unexpected start";

  LOG(INFO) << fmt::format(
      "[reader.hub] reader hub starting, lookup_retry({}) readahead({}) "
      "readahead_threads({}) chunk_cache({}).",
      option.lookup_retry_option.max_retry, option.readahead_enable,
      option.readahead_threads, chunk_cache_ != nullptr);

  if (option.readahead_enable && option.readahead_threads == 0) {
    return Status::InvalidParam("readahead needs at least one thread");
  }

  location_resolver_ = std::make_shared<LocationResolver>(
      location_cache_, volume_lookup_, option.lookup_retry_option);

  chunk_fetcher_ = std::make_shared<ChunkFetcher>(
      location_resolver_, wire_fetcher_,
      option.invalidate_location_on_fetch_error);

  if (option.readahead_enable) {
    readahead_executor_ = std::make_shared<ThreadPoolImpl>(
        "chunk_readahead", option.readahead_threads);
    readahead_executor_->Start();
  }

  fetch_coordinator_ = std::make_shared<FetchCoordinator>(
      chunk_fetcher_, chunk_cache_, readahead_executor_,
      option.readahead_enable);

  started_.store(true, std::memory_order_relaxed);
  LOG(INFO) << "[reader.hub] reader hub started.";
  return Status::OK();
}

Status ReaderHubImpl::Stop() {
  if (!started_.load(std::memory_order_relaxed)) {
    return Status::OK();
  }

  LOG(INFO) << "[reader.hub] reader hub stopping.";

  // drain read-ahead before the services it uses go away
  if (readahead_executor_ != nullptr) {
    readahead_executor_->Stop();
  }

  fetch_coordinator_.reset();
  readahead_executor_.reset();
  chunk_fetcher_.reset();
  location_resolver_.reset();

  started_.store(false, std::memory_order_relaxed);
  LOG(INFO) << "[reader.hub] reader hub stopped.";
  return Status::OK();
}

Status ReaderHubImpl::NewChunkReader(std::vector<ChunkView> views,
                                     int64_t file_size,
                                     ChunkReaderUPtr* reader) {
  if (!started_.load(std::memory_order_relaxed)) {
    return Status::Internal("reader hub is not started");
  }

  if (file_size < 0) {
    return Status::InvalidParam(fmt::format("invalid file size {}", file_size));
  }

  CHUNKFS_RETURN_NOT_OK(ValidateChunkViews(views));

  *reader = std::make_unique<ChunkReader>(fetch_coordinator_, std::move(views),
                                          file_size);
  return Status::OK();
}

}  // namespace client
}  // namespace chunkfs
