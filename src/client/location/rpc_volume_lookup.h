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

#ifndef CHUNKFS_SRC_CLIENT_LOCATION_RPC_VOLUME_LOOKUP_H_
#define CHUNKFS_SRC_CLIENT_LOCATION_RPC_VOLUME_LOOKUP_H_

#include <brpc/channel.h>

#include <string>
#include <vector>

#include "client/location/volume_lookup.h"

namespace chunkfs {
namespace client {

// VolumeLookup backed by the LocationService of a filer/master.
class RpcVolumeLookup final : public VolumeLookup {
 public:
  explicit RpcVolumeLookup(const std::string& addr);

  ~RpcVolumeLookup() override = default;

  Status Init();

  Status LookupVolume(const std::vector<std::string>& volume_ids,
                      LocationsMap* locations_map) override;

  std::string AdjustedUrl(const Location& location) const override;

 private:
  const std::string addr_;
  bool inited_{false};
  brpc::Channel channel_;
};

}  // namespace client
}  // namespace chunkfs

#endif  // CHUNKFS_SRC_CLIENT_LOCATION_RPC_VOLUME_LOOKUP_H_
