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

#ifndef CHUNKFS_SRC_CLIENT_LOCATION_LOCATION_RESOLVER_H_
#define CHUNKFS_SRC_CLIENT_LOCATION_LOCATION_RESOLVER_H_

#include <memory>
#include <string>
#include <vector>

#include "client/location/location_cache.h"
#include "client/location/volume_lookup.h"
#include "common/status.h"
#include "utils/retry.h"

namespace chunkfs {
namespace client {

// Resolves a chunk id to the urls of the storage nodes holding it.
class LocationResolver {
 public:
  LocationResolver(LocationCacheSPtr cache, VolumeLookupSPtr lookup,
                   const utils::RetryOption& retry_option);

  virtual ~LocationResolver() = default;

  // urls are "http://<node>/<chunk_id>" in a random order, which differs
  // between calls so that repeated reads spread over the replicas.
  virtual Status Resolve(const std::string& chunk_id,
                         std::vector<std::string>* urls);

  // Forget the cached locations of the volume holding chunk_id.
  virtual void Invalidate(const std::string& chunk_id);

 private:
  Status LookupLocations(const std::string& volume_id,
                         LocationList* locations);

  LocationCacheSPtr cache_;
  VolumeLookupSPtr lookup_;
  const utils::RetryOption retry_option_;
};

using LocationResolverSPtr = std::shared_ptr<LocationResolver>;

}  // namespace client
}  // namespace chunkfs

#endif  // CHUNKFS_SRC_CLIENT_LOCATION_LOCATION_RESOLVER_H_
