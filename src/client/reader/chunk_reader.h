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

#ifndef CHUNKFS_SRC_CLIENT_READER_CHUNK_READER_H_
#define CHUNKFS_SRC_CLIENT_READER_CHUNK_READER_H_

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "client/fetch/fetch_coordinator.h"
#include "client/reader/chunk_view.h"
#include "common/io_buffer.h"
#include "common/status.h"

namespace chunkfs {
namespace client {

// Random access reader over a logical file made of chunk views. Bytes not
// covered by any view read back as zeros up to file_size.
class ChunkReader {
 public:
  ChunkReader(FetchCoordinatorSPtr coordinator, std::vector<ChunkView> views,
              int64_t file_size);

  ~ChunkReader() = default;

  ChunkReader(const ChunkReader&) = delete;
  ChunkReader& operator=(const ChunkReader&) = delete;

  // Fills buf[0, size) with the file content at offset. out_rsize is the
  // number of bytes written and is valid whatever the status is.
  // Returns EndOfFile when offset + size reaches file_size, bytes may have
  // been written in the same call. On error the bytes written before the
  // failing chunk are kept.
  Status ReadAt(char* buf, int64_t size, int64_t offset, int64_t* out_rsize);

  int64_t FileSize() const { return file_size_; }

  const std::vector<ChunkView>& Views() const { return views_; }

 private:
  Status GetChunkData(size_t index, IOBuffer* data);

  std::string UUID() const;

  FetchCoordinatorSPtr coordinator_;
  const std::vector<ChunkView> views_;
  const int64_t file_size_;

  std::mutex mutex_;
  // the last chunk fetched in full
  std::string last_chunk_id_;
  IOBuffer last_chunk_data_;
};

using ChunkReaderUPtr = std::unique_ptr<ChunkReader>;

}  // namespace client
}  // namespace chunkfs

#endif  // CHUNKFS_SRC_CLIENT_READER_CHUNK_READER_H_
