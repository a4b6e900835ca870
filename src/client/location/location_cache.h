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

#ifndef CHUNKFS_SRC_CLIENT_LOCATION_LOCATION_CACHE_H_
#define CHUNKFS_SRC_CLIENT_LOCATION_LOCATION_CACHE_H_

#include <bthread/rwlock.h>

#include <memory>
#include <string>
#include <unordered_map>

#include "client/location/volume_lookup.h"

namespace chunkfs {
namespace client {

// Process wide volume id -> locations map shared by all readers.
// Entries never expire, Invalidate() drops one explicitly.
class LocationCache {
 public:
  LocationCache() = default;

  LocationCache(const LocationCache&) = delete;
  LocationCache& operator=(const LocationCache&) = delete;

  bool Get(const std::string& volume_id, LocationList* locations);

  void Put(const std::string& volume_id, const LocationList& locations);

  void Invalidate(const std::string& volume_id);

  void Clear();

  size_t Size();

 private:
  bthread::RWLock rwlock_;
  std::unordered_map<std::string, LocationList> entries_;
};

using LocationCacheSPtr = std::shared_ptr<LocationCache>;

}  // namespace client
}  // namespace chunkfs

#endif  // CHUNKFS_SRC_CLIENT_LOCATION_LOCATION_CACHE_H_
