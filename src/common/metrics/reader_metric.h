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

#ifndef CHUNKFS_SRC_COMMON_METRICS_READER_METRIC_H_
#define CHUNKFS_SRC_COMMON_METRICS_READER_METRIC_H_

#include <bvar/bvar.h>

#include <cstdint>
#include <string>

#include "common/metrics/metric.h"

namespace chunkfs {
namespace metrics {

struct ReaderMetric {
  inline static const std::string prefix = "chunkfs_reader";

  InterfaceMetric read_at;
  InterfaceMetric wire_fetch;
  InterfaceMetric volume_lookup;

  bvar::Adder<uint64_t> zero_fill_bytes;
  bvar::Adder<uint64_t> recency_slot_hits;
  bvar::Adder<uint64_t> chunk_cache_hits;
  bvar::Adder<uint64_t> chunk_cache_misses;
  bvar::Adder<uint64_t> location_cache_hits;
  bvar::Adder<uint64_t> location_cache_misses;
  bvar::Adder<uint64_t> shared_fetch_waiters;
  bvar::Adder<int64_t> inflight_readaheads;
  bvar::Adder<uint64_t> readahead_failures;

  ReaderMetric()
      : read_at(prefix, "_read_at"),
        wire_fetch(prefix, "_wire_fetch"),
        volume_lookup(prefix, "_volume_lookup"),
        zero_fill_bytes(prefix, "zero_fill_bytes"),
        recency_slot_hits(prefix, "recency_slot_hits"),
        chunk_cache_hits(prefix, "chunk_cache_hits"),
        chunk_cache_misses(prefix, "chunk_cache_misses"),
        location_cache_hits(prefix, "location_cache_hits"),
        location_cache_misses(prefix, "location_cache_misses"),
        shared_fetch_waiters(prefix, "shared_fetch_waiters"),
        inflight_readaheads(prefix, "inflight_readaheads"),
        readahead_failures(prefix, "readahead_failures") {}

 public:
  ReaderMetric(const ReaderMetric&) = delete;

  ReaderMetric& operator=(const ReaderMetric&) = delete;

 public:
  static ReaderMetric& GetInstance() {
    static ReaderMetric instance;
    return instance;
  }
};

}  // namespace metrics
}  // namespace chunkfs

#endif  // CHUNKFS_SRC_COMMON_METRICS_READER_METRIC_H_
