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

#include "client/fetch/chunk_fetcher.h"

#include <fmt/format.h>
#include <glog/logging.h>

#include <string>
#include <vector>

namespace chunkfs {
namespace client {

ChunkFetcher::ChunkFetcher(LocationResolverSPtr resolver,
                           WireFetcherSPtr wire_fetcher,
                           bool invalidate_location_on_error)
    : resolver_(resolver),
      wire_fetcher_(wire_fetcher),
      invalidate_location_on_error_(invalidate_location_on_error) {
  CHECK_NOTNULL(resolver_);
  CHECK_NOTNULL(wire_fetcher_);
}

Status ChunkFetcher::Fetch(const ChunkView& view, IOBuffer* data) {
  std::vector<std::string> urls;
  Status status = resolver_->Resolve(view.chunk_id, &urls);
  if (!status.ok()) {
    return status;
  }

  status = wire_fetcher_->Fetch(urls, view.cipher_key, view.is_compressed,
                                data);
  if (status.ok()) {
    VLOG(6) << fmt::format("[chunk.fetch] fetch chunk({}) success, size({}).",
                           view.chunk_id, data->Size());
    return status;
  }

  LOG(ERROR) << fmt::format(
      "[chunk.fetch] fetch chunk({}) from {} urls failed, status({}).",
      view.chunk_id, urls.size(), status.ToString());

  if (invalidate_location_on_error_) {
    resolver_->Invalidate(view.chunk_id);
  }

  if (status.IsNotSupport()) {
    return Status::NotSupport(fmt::format("fetch chunk {}", view.chunk_id),
                              status.ToString());
  }
  return Status::FetchFailed(fmt::format("fetch chunk {}", view.chunk_id),
                             status.ToString());
}

}  // namespace client
}  // namespace chunkfs
