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

#ifndef CHUNKFS_SRC_CLIENT_READER_CHUNK_VIEW_H_
#define CHUNKFS_SRC_CLIENT_READER_CHUNK_VIEW_H_

#include <cstdint>
#include <string>
#include <vector>

#include "common/status.h"

namespace chunkfs {
namespace client {

// The visible part of one immutable chunk inside a logical file:
// chunk bytes [chunk_offset, chunk_offset + size) show up at file
// offsets [logic_offset, logic_offset + size).
struct ChunkView {
  std::string chunk_id;
  int64_t chunk_offset{0};
  int64_t logic_offset{0};
  int64_t size{0};
  uint64_t chunk_size{0};
  std::string cipher_key;  // empty if the chunk is not encrypted
  bool is_compressed{false};

  int64_t LogicEnd() const { return logic_offset + size; }

  bool IsEncrypted() const { return !cipher_key.empty(); }

  std::string ToString() const;
};

// Chunk ids look like "<volume>,<needle><cookie>".
Status VolumeIdOf(const std::string& chunk_id, std::string* volume_id);

// Views must be ascending by logic_offset and must not overlap.
Status ValidateChunkViews(const std::vector<ChunkView>& views);

// Parses "id:chunk_offset:logic_offset:size:chunk_size[:gz]" items separated
// by ';', then validates the result.
Status ParseChunkViews(const std::string& text, std::vector<ChunkView>* views);

}  // namespace client
}  // namespace chunkfs

#endif  // CHUNKFS_SRC_CLIENT_READER_CHUNK_VIEW_H_
