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

#include "common/options/reader.h"

#include <brpc/reloadable_flags.h>
#include <gflags/gflags.h>
#include <glog/logging.h>

#include "common/logging.h"

namespace chunkfs {
namespace client {

DEFINE_string(chunkfs_log_dir, "/tmp/chunkfs/log", "set log directory");

DEFINE_int32(chunkfs_log_level, 0, "set verbose log level");
DEFINE_validator(chunkfs_log_level, [](const char* /*name*/, int32_t value) {
  Logger::SetMinVerboseLevel(value);
  LOG(INFO) << "current verbose logging level is `" << FLAGS_v << "`";
  return true;
});

// volume location lookup
DEFINE_uint32(location_lookup_max_retry, 3,
              "max retries of a volume location lookup");
DEFINE_validator(location_lookup_max_retry, brpc::PassValidate);

DEFINE_uint32(location_lookup_retry_base_ms, 100,
              "initial backoff between volume lookup retries");
DEFINE_validator(location_lookup_retry_base_ms, brpc::PassValidate);

DEFINE_uint32(location_lookup_retry_max_ms, 2000,
              "upper bound of the backoff between volume lookup retries");
DEFINE_validator(location_lookup_retry_max_ms, brpc::PassValidate);

DEFINE_int64(location_lookup_rpc_timeout_ms, 3000,
             "timeout of one volume lookup rpc");
DEFINE_validator(location_lookup_rpc_timeout_ms, brpc::PassValidate);

DEFINE_bool(location_use_public_url, false,
            "access storage nodes through their public url");
DEFINE_validator(location_use_public_url, brpc::PassValidate);

DEFINE_bool(location_cache_invalidate_on_fetch_error, false,
            "drop the cached volume locations of a chunk whose fetch failed");
DEFINE_validator(location_cache_invalidate_on_fetch_error, brpc::PassValidate);

// chunk readahead
DEFINE_bool(chunk_readahead_enable, true,
            "prefetch the next chunk view into the content cache");
DEFINE_validator(chunk_readahead_enable, brpc::PassValidate);

DEFINE_uint32(chunk_readahead_threads, 4, "number of readahead threads");

// chunk content cache
DEFINE_uint64(mem_chunk_cache_capacity_mb, 256,
              "capacity of the in-memory chunk content cache");

// wire fetch
DEFINE_int32(wire_fetch_timeout_ms, 10000,
             "timeout of fetching one chunk from one storage node");
DEFINE_validator(wire_fetch_timeout_ms, brpc::PassValidate);

void InitReaderHubOption(ReaderHubOption* option) {
  option->lookup_retry_option = utils::RetryOption(
      FLAGS_location_lookup_max_retry, FLAGS_location_lookup_retry_base_ms,
      FLAGS_location_lookup_retry_max_ms);
  option->invalidate_location_on_fetch_error =
      FLAGS_location_cache_invalidate_on_fetch_error;
  option->readahead_enable = FLAGS_chunk_readahead_enable;
  option->readahead_threads = FLAGS_chunk_readahead_threads;
}

}  // namespace client
}  // namespace chunkfs
