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

#ifndef CHUNKFS_SRC_COMMON_OPTIONS_READER_H_
#define CHUNKFS_SRC_COMMON_OPTIONS_READER_H_

#include <gflags/gflags_declare.h>

#include <cstdint>

#include "utils/retry.h"

namespace chunkfs {
namespace client {

// log
DECLARE_string(chunkfs_log_dir);
DECLARE_int32(chunkfs_log_level);

// volume location lookup
DECLARE_uint32(location_lookup_max_retry);
DECLARE_uint32(location_lookup_retry_base_ms);
DECLARE_uint32(location_lookup_retry_max_ms);
DECLARE_int64(location_lookup_rpc_timeout_ms);
DECLARE_bool(location_use_public_url);
DECLARE_bool(location_cache_invalidate_on_fetch_error);

// chunk readahead
DECLARE_bool(chunk_readahead_enable);
DECLARE_uint32(chunk_readahead_threads);

// chunk content cache
DECLARE_uint64(mem_chunk_cache_capacity_mb);

// wire fetch
DECLARE_int32(wire_fetch_timeout_ms);

struct ReaderHubOption {
  utils::RetryOption lookup_retry_option;
  bool invalidate_location_on_fetch_error{false};
  bool readahead_enable{true};
  uint32_t readahead_threads{4};
};

void InitReaderHubOption(ReaderHubOption* option);

}  // namespace client
}  // namespace chunkfs

#endif  // CHUNKFS_SRC_COMMON_OPTIONS_READER_H_
