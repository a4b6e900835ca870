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

#ifndef CHUNKFS_SRC_COMMON_METRICS_METRIC_H_
#define CHUNKFS_SRC_COMMON_METRICS_METRIC_H_

#include <bvar/bvar.h>

#include <cstdint>
#include <string>

namespace chunkfs {
namespace metrics {

// metric stats per second
struct PerSecondMetric {
  bvar::Adder<uint64_t> count;                   // total count
  bvar::PerSecond<bvar::Adder<uint64_t>> value;  // average count persecond

  PerSecondMetric(const std::string& prefix, const std::string& name)
      : count(prefix, name + "_total_count"), value(prefix, name, &count, 1) {}
};

// interface metric statistics
struct InterfaceMetric {
  PerSecondMetric qps;            // processed per second
  PerSecondMetric eps;            // error request per second
  PerSecondMetric bps;            // throughput with byte per second
  bvar::LatencyRecorder latency;  // latency in us

  InterfaceMetric(const std::string& prefix, const std::string& name)
      : qps(prefix, name + "_qps"),
        eps(prefix, name + "_eps"),
        bps(prefix, name + "_bps"),
        latency(prefix, name + "_lat", 1) {}

  void Update(bool ok, uint64_t bytes, int64_t latency_us) {
    if (ok) {
      qps.count << 1;
      bps.count << bytes;
      latency << latency_us;
    } else {
      eps.count << 1;
    }
  }
};

}  // namespace metrics
}  // namespace chunkfs

#endif  // CHUNKFS_SRC_COMMON_METRICS_METRIC_H_
