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

#include "client/reader/chunk_reader.h"

#include <butil/time.h>
#include <fmt/format.h>
#include <glog/logging.h>

#include <algorithm>
#include <cstring>
#include <limits>
#include <utility>

#include "common/metrics/reader_metric.h"

namespace chunkfs {
namespace client {

using metrics::ReaderMetric;

ChunkReader::ChunkReader(FetchCoordinatorSPtr coordinator,
                         std::vector<ChunkView> views, int64_t file_size)
    : coordinator_(coordinator),
      views_(std::move(views)),
      file_size_(file_size) {
  CHECK_NOTNULL(coordinator_);
  CHECK_GE(file_size_, 0);
}

std::string ChunkReader::UUID() const {
  return fmt::format("reader-{}", static_cast<const void*>(this));
}

Status ChunkReader::GetChunkData(size_t index, IOBuffer* data) {
  const ChunkView& view = views_[index];
  if (!last_chunk_id_.empty() && last_chunk_id_ == view.chunk_id) {
    ReaderMetric::GetInstance().recency_slot_hits << 1;
    *data = last_chunk_data_;
    return Status::OK();
  }

  CHUNKFS_RETURN_NOT_OK(coordinator_->GetWholeChunk(view, data));

  last_chunk_id_ = view.chunk_id;
  last_chunk_data_ = *data;

  if (index + 1 < views_.size() &&
      views_[index + 1].chunk_id != view.chunk_id) {
    coordinator_->Prefetch(views_[index + 1]);
  }
  return Status::OK();
}

Status ChunkReader::ReadAt(char* buf, int64_t size, int64_t offset,
                           int64_t* out_rsize) {
  *out_rsize = 0;
  if (offset < 0 || size < 0) {
    return Status::InvalidParam(
        fmt::format("invalid read range, offset({}) size({})", offset, size));
  }

  if (size > std::numeric_limits<int64_t>::max() - offset) {
    return Status::OutOfRange(
        fmt::format("read range overflow, offset({}) size({})", offset, size));
  }

  butil::Timer timer;
  timer.start();

  std::lock_guard<std::mutex> lock(mutex_);

  // never read past the end of file
  const int64_t end = std::min(offset + size, std::max(offset, file_size_));
  int64_t pos = offset;
  int64_t remaining = end - offset;
  int64_t n = 0;
  int64_t zeros = 0;
  Status status;

  for (size_t i = 0; i < views_.size(); i++) {
    if (remaining <= 0) {
      break;
    }

    const ChunkView& view = views_[i];

    // sparse hole before this view
    if (pos < view.logic_offset) {
      int64_t gap = std::min(view.logic_offset - pos, remaining);
      std::memset(buf + (pos - offset), 0, gap);
      VLOG(9) << fmt::format("[{}] zero fill [{}-{}].", UUID(), pos,
                             pos + gap);
      pos += gap;
      remaining -= gap;
      n += gap;
      zeros += gap;
      if (remaining <= 0) {
        break;
      }
    }

    int64_t start = std::max(pos, view.logic_offset);
    int64_t stop = std::min(pos + remaining, view.LogicEnd());
    if (start >= stop) {
      continue;
    }

    IOBuffer chunk_data;
    status = GetChunkData(i, &chunk_data);
    if (!status.ok()) {
      LOG(ERROR) << fmt::format(
          "[{}] read chunk view{} failed, read_bytes({}) status({}).", UUID(),
          view.ToString(), n, status.ToString());
      break;
    }

    int64_t buffer_offset = start - view.logic_offset + view.chunk_offset;
    int64_t length = stop - start;
    if (buffer_offset + length > static_cast<int64_t>(chunk_data.Size())) {
      status = Status::Internal(fmt::format(
          "chunk({}) data size({}) shorter than view end({})", view.chunk_id,
          chunk_data.Size(), buffer_offset + length));
      LOG(ERROR) << fmt::format("[{}] {}", UUID(), status.ToString());
      break;
    }

    size_t copied = chunk_data.CopyTo(buf + (start - offset), length,
                                      buffer_offset);
    CHECK_EQ(copied, static_cast<size_t>(length));

    VLOG(9) << fmt::format("[{}] read [{}-{}] from chunk view{}.", UUID(),
                           start, stop, view.ToString());
    pos = stop;
    remaining = end - pos;
    n += length;
  }

  if (status.ok() && remaining > 0 && pos < file_size_) {
    int64_t tail = std::min(remaining, file_size_ - pos);
    std::memset(buf + (pos - offset), 0, tail);
    VLOG(9) << fmt::format("[{}] zero fill tail [{}-{}].", UUID(), pos,
                           pos + tail);
    n += tail;
    zeros += tail;
  }

  *out_rsize = n;
  timer.stop();

  auto& metric = ReaderMetric::GetInstance();
  metric.read_at.Update(status.ok(), n, timer.u_elapsed());
  metric.zero_fill_bytes << zeros;

  if (!status.ok()) {
    return status;
  }

  VLOG(6) << fmt::format("[{}] read_at offset({}) size({}) read_bytes({}).",
                         UUID(), offset, size, n);

  if (offset + size >= file_size_) {
    return Status::EndOfFile();
  }
  return Status::OK();
}

}  // namespace client
}  // namespace chunkfs
