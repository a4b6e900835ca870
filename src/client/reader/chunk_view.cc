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

#include "client/reader/chunk_view.h"

#include <absl/strings/str_split.h>
#include <fmt/format.h>

#include "utils/string.h"

namespace chunkfs {
namespace client {

std::string ChunkView::ToString() const {
  return fmt::format(
      "(chunk_id: {}, chunk_range: [{}-{}], logic_range: [{}-{}], "
      "chunk_size: {}, encrypted: {}, compressed: {})",
      chunk_id, chunk_offset, chunk_offset + size, logic_offset, LogicEnd(),
      chunk_size, IsEncrypted(), is_compressed);
}

Status VolumeIdOf(const std::string& chunk_id, std::string* volume_id) {
  auto pos = chunk_id.find(',');
  if (pos == std::string::npos || pos == 0) {
    return Status::Unresolvable("invalid chunk id", chunk_id);
  }

  *volume_id = chunk_id.substr(0, pos);
  return Status::OK();
}

Status ValidateChunkViews(const std::vector<ChunkView>& views) {
  for (size_t i = 0; i < views.size(); i++) {
    const auto& view = views[i];
    if (view.chunk_id.empty() || view.chunk_offset < 0 ||
        view.logic_offset < 0 || view.size <= 0) {
      return Status::InvalidParam("invalid chunk view", view.ToString());
    }

    if (view.chunk_size > 0 &&
        static_cast<uint64_t>(view.chunk_offset + view.size) >
            view.chunk_size) {
      return Status::InvalidParam("chunk view exceeds chunk size",
                                  view.ToString());
    }

    if (i > 0 && view.logic_offset < views[i - 1].LogicEnd()) {
      return Status::InvalidParam(
          "chunk views out of order or overlapped",
          fmt::format("{} vs {}", views[i - 1].ToString(), view.ToString()));
    }
  }
  return Status::OK();
}

static Status ParseChunkView(const std::string& item, ChunkView* view) {
  std::vector<std::string> fields = absl::StrSplit(item, ':');
  if (fields.size() != 5 && fields.size() != 6) {
    return Status::InvalidParam("invalid chunk view item", item);
  }

  uint64_t chunk_size;
  if (!utils::Str2Int(fields[1], &view->chunk_offset) ||
      !utils::Str2Int(fields[2], &view->logic_offset) ||
      !utils::Str2Int(fields[3], &view->size) ||
      !utils::Str2Int(fields[4], &chunk_size)) {
    return Status::InvalidParam("invalid number in chunk view item", item);
  }

  if (fields.size() == 6) {
    if (fields[5] != "gz") {
      return Status::InvalidParam("unknown chunk view flag", item);
    }
    view->is_compressed = true;
  }

  view->chunk_id = fields[0];
  view->chunk_size = chunk_size;
  return Status::OK();
}

Status ParseChunkViews(const std::string& text, std::vector<ChunkView>* views) {
  std::vector<std::string> items =
      absl::StrSplit(text, ';', absl::SkipWhitespace());

  views->clear();
  for (const auto& item : items) {
    ChunkView view;
    CHUNKFS_RETURN_NOT_OK(ParseChunkView(utils::TrimSpace(item), &view));
    views->emplace_back(std::move(view));
  }

  return ValidateChunkViews(*views);
}

}  // namespace client
}  // namespace chunkfs
