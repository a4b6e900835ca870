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

#include "client/location/rpc_volume_lookup.h"

#include <brpc/controller.h>
#include <fmt/format.h>
#include <glog/logging.h>

#include "chunkfs/location.pb.h"
#include "common/options/reader.h"

namespace chunkfs {
namespace client {

RpcVolumeLookup::RpcVolumeLookup(const std::string& addr) : addr_(addr) {}

Status RpcVolumeLookup::Init() {
  if (inited_) {
    return Status::OK();
  }

  brpc::ChannelOptions options;
  options.timeout_ms = FLAGS_location_lookup_rpc_timeout_ms;
  options.max_retry = 0;
  if (channel_.Init(addr_.c_str(), &options) != 0) {
    LOG(ERROR) << fmt::format("[location.rpc] init channel fail, addr({}).",
                              addr_);
    return Status::Internal("init channel fail", addr_);
  }

  inited_ = true;
  return Status::OK();
}

Status RpcVolumeLookup::LookupVolume(const std::vector<std::string>& volume_ids,
                                     LocationsMap* locations_map) {
  CHECK(inited_) << "RpcVolumeLookup is not inited.";

  pb::location::LookupVolumeRequest request;
  pb::location::LookupVolumeResponse response;
  for (const auto& volume_id : volume_ids) {
    request.add_volume_ids(volume_id);
  }

  brpc::Controller cntl;
  cntl.set_timeout_ms(FLAGS_location_lookup_rpc_timeout_ms);

  pb::location::LocationService_Stub stub(&channel_);
  stub.LookupVolume(&cntl, &request, &response, nullptr);
  if (cntl.Failed()) {
    LOG(WARNING) << fmt::format(
        "[location.rpc][{}][LookupVolume][{}us] fail, request({}) error({} "
        "{}).",
        addr_, cntl.latency_us(), request.ShortDebugString(),
        cntl.ErrorCode(), cntl.ErrorText());
    if (cntl.ErrorCode() == brpc::ERPCTIMEDOUT) {
      return Status::Timeout(cntl.ErrorCode(), cntl.ErrorText());
    }
    return Status::NetError(cntl.ErrorCode(), cntl.ErrorText());
  }

  if (!response.error().empty()) {
    return Status::NotFound("lookup volume", response.error());
  }

  locations_map->clear();
  for (const auto& item : response.locations_map()) {
    LocationList locations;
    for (const auto& pb_location : item.second.locations()) {
      Location location;
      location.url = pb_location.url();
      location.public_url = pb_location.public_url();
      location.data_center = pb_location.data_center();
      locations.emplace_back(std::move(location));
    }

    if (!locations.empty()) {
      locations_map->emplace(item.first, std::move(locations));
    }
  }

  VLOG(3) << fmt::format(
      "[location.rpc][{}][LookupVolume][{}us] success, request({}) "
      "volumes({}).",
      addr_, cntl.latency_us(), request.ShortDebugString(),
      locations_map->size());
  return Status::OK();
}

std::string RpcVolumeLookup::AdjustedUrl(const Location& location) const {
  if (FLAGS_location_use_public_url && !location.public_url.empty()) {
    return location.public_url;
  }
  return location.url;
}

}  // namespace client
}  // namespace chunkfs
