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

#ifndef CHUNKFS_SRC_CLIENT_LOCATION_VOLUME_LOOKUP_H_
#define CHUNKFS_SRC_CLIENT_LOCATION_VOLUME_LOOKUP_H_

#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include "common/status.h"

namespace chunkfs {
namespace client {

struct Location {
  std::string url;
  std::string public_url;
  std::string data_center;
};

using LocationList = std::vector<Location>;
using LocationsMap = std::unordered_map<std::string, LocationList>;

// Remote lookup of the storage nodes serving a volume.
class VolumeLookup {
 public:
  virtual ~VolumeLookup() = default;

  // Volumes without any location are left out of locations_map.
  virtual Status LookupVolume(const std::vector<std::string>& volume_ids,
                              LocationsMap* locations_map) = 0;

  // The address a client should dial for the location, host:port.
  virtual std::string AdjustedUrl(const Location& location) const = 0;
};

using VolumeLookupSPtr = std::shared_ptr<VolumeLookup>;

}  // namespace client
}  // namespace chunkfs

#endif  // CHUNKFS_SRC_CLIENT_LOCATION_VOLUME_LOOKUP_H_
