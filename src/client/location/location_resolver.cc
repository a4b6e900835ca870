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

#include "client/location/location_resolver.h"

#include <butil/fast_rand.h>
#include <butil/time.h>
#include <fmt/format.h>
#include <glog/logging.h>

#include <utility>

#include "client/reader/chunk_view.h"
#include "common/metrics/reader_metric.h"

namespace chunkfs {
namespace client {

using metrics::ReaderMetric;

LocationResolver::LocationResolver(LocationCacheSPtr cache,
                                   VolumeLookupSPtr lookup,
                                   const utils::RetryOption& retry_option)
    : cache_(cache), lookup_(lookup), retry_option_(retry_option) {
  CHECK_NOTNULL(cache_);
  CHECK_NOTNULL(lookup_);
}

Status LocationResolver::Resolve(const std::string& chunk_id,
                                 std::vector<std::string>* urls) {
  std::string volume_id;
  CHUNKFS_RETURN_NOT_OK(VolumeIdOf(chunk_id, &volume_id));

  LocationList locations;
  if (cache_->Get(volume_id, &locations)) {
    ReaderMetric::GetInstance().location_cache_hits << 1;
  } else {
    ReaderMetric::GetInstance().location_cache_misses << 1;

    Status status = LookupLocations(volume_id, &locations);
    if (!status.ok()) {
      LOG(ERROR) << fmt::format(
          "[location] lookup volume({}) for chunk({}) failed, status({}).",
          volume_id, chunk_id, status.ToString());
      return Status::Unresolvable(
          fmt::format("lookup volume {} for chunk {}", volume_id, chunk_id),
          status.ToString());
    }

    if (locations.empty()) {
      return Status::Unresolvable(fmt::format(
          "failed to locate volume {} for chunk {}", volume_id, chunk_id));
    }

    cache_->Put(volume_id, locations);
  }

  urls->clear();
  urls->reserve(locations.size());
  for (const auto& location : locations) {
    urls->emplace_back(
        fmt::format("http://{}/{}", lookup_->AdjustedUrl(location), chunk_id));
  }

  // Fisher-Yates
  for (size_t i = urls->size(); i > 1; i--) {
    size_t j = butil::fast_rand_less_than(i);
    std::swap((*urls)[i - 1], (*urls)[j]);
  }

  VLOG(6) << fmt::format("[location] chunk({}) resolved to {} urls.", chunk_id,
                         urls->size());
  return Status::OK();
}

void LocationResolver::Invalidate(const std::string& chunk_id) {
  std::string volume_id;
  if (VolumeIdOf(chunk_id, &volume_id).ok()) {
    cache_->Invalidate(volume_id);
  }
}

Status LocationResolver::LookupLocations(const std::string& volume_id,
                                         LocationList* locations) {
  butil::Timer timer;
  timer.start();

  Status status = utils::Retry(
      fmt::format("lookup volume {}", volume_id), retry_option_,
      [&]() -> Status {
        LocationsMap locations_map;
        CHUNKFS_RETURN_NOT_OK(
            lookup_->LookupVolume({volume_id}, &locations_map));

        auto iter = locations_map.find(volume_id);
        if (iter != locations_map.end()) {
          *locations = iter->second;
        }
        return Status::OK();
      });

  timer.stop();
  ReaderMetric::GetInstance().volume_lookup.Update(status.ok(), 0,
                                                   timer.u_elapsed());
  return status;
}

}  // namespace client
}  // namespace chunkfs
