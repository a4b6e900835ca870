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

#ifndef CHUNKFS_SRC_CLIENT_FETCH_HTTP_WIRE_FETCHER_H_
#define CHUNKFS_SRC_CLIENT_FETCH_HTTP_WIRE_FETCHER_H_

#include <brpc/channel.h>

#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "client/fetch/wire_fetcher.h"

namespace chunkfs {
namespace client {

// WireFetcher issuing plain HTTP GETs to the storage nodes.
class HttpWireFetcher final : public WireFetcher {
 public:
  HttpWireFetcher() = default;

  ~HttpWireFetcher() override = default;

  Status Fetch(const std::vector<std::string>& urls,
               const std::string& cipher_key, bool is_compressed,
               IOBuffer* data) override;

 private:
  using ChannelSPtr = std::shared_ptr<brpc::Channel>;

  Status FetchOne(const std::string& url, bool is_compressed, IOBuffer* data);

  ChannelSPtr GetOrCreateChannel(const std::string& host);

  std::mutex mutex_;
  std::unordered_map<std::string, ChannelSPtr> channels_;  // host -> channel
};

}  // namespace client
}  // namespace chunkfs

#endif  // CHUNKFS_SRC_CLIENT_FETCH_HTTP_WIRE_FETCHER_H_
