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

#include <fmt/format.h>
#include <gflags/gflags.h>
#include <glog/logging.h>

#include <cstdint>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "client/cache/mem_chunk_cache.h"
#include "client/fetch/http_wire_fetcher.h"
#include "client/hub/reader_hub.h"
#include "client/location/rpc_volume_lookup.h"
#include "client/reader/chunk_view.h"
#include "common/logging.h"
#include "common/options/reader.h"
#include "common/status.h"

DEFINE_string(filer_addr, "127.0.0.1:18888",
              "address of the location service, host:port");
DEFINE_string(chunks, "",
              "chunk views, id:chunk_offset:logic_offset:size:chunk_size[:gz] "
              "separated by ';'");
DEFINE_int64(file_size, -1, "logical file size, sum of views if negative");
DEFINE_int64(offset, 0, "read offset");
DEFINE_int64(length, -1, "read length, up to the end of file if negative");
DEFINE_string(output, "", "output file path, stdout if empty");

using chunkfs::Status;
using chunkfs::client::ChunkView;

static int64_t DefaultFileSize(const std::vector<ChunkView>& views) {
  return views.empty() ? 0 : views.back().LogicEnd();
}

static Status WriteOutput(const std::vector<char>& data, int64_t size) {
  if (FLAGS_output.empty()) {
    std::cout.write(data.data(), size);
    std::cout.flush();
    return std::cout.good() ? Status::OK()
                            : Status::IoError("write stdout failed");
  }

  std::ofstream out(FLAGS_output, std::ios::binary | std::ios::trunc);
  if (!out.is_open()) {
    return Status::IoError("open output failed", FLAGS_output);
  }
  out.write(data.data(), size);
  return out.good() ? Status::OK()
                    : Status::IoError("write output failed", FLAGS_output);
}

int main(int argc, char* argv[]) {
  google::ParseCommandLineFlags(&argc, &argv, true);

  chunkfs::Logger::Init(chunkfs::client::FLAGS_chunkfs_log_dir, "chunk_cat");

  std::vector<ChunkView> views;
  Status status = chunkfs::client::ParseChunkViews(FLAGS_chunks, &views);
  if (!status.ok()) {
    std::cerr << "parse --chunks failed: " << status.ToString() << std::endl;
    return 1;
  }

  int64_t file_size =
      FLAGS_file_size >= 0 ? FLAGS_file_size : DefaultFileSize(views);
  int64_t length = FLAGS_length >= 0 ? FLAGS_length : file_size - FLAGS_offset;
  if (FLAGS_offset < 0 || length < 0) {
    std::cerr << fmt::format("invalid read range, offset({}) length({})",
                             FLAGS_offset, length)
              << std::endl;
    return 1;
  }

  auto volume_lookup =
      std::make_shared<chunkfs::client::RpcVolumeLookup>(FLAGS_filer_addr);
  status = volume_lookup->Init();
  if (!status.ok()) {
    std::cerr << "init volume lookup failed: " << status.ToString()
              << std::endl;
    return 1;
  }

  auto chunk_cache = std::make_shared<chunkfs::client::MemChunkCache>(
      chunkfs::client::FLAGS_mem_chunk_cache_capacity_mb * 1024 * 1024);

  chunkfs::client::ReaderHubImpl hub(
      volume_lookup, std::make_shared<chunkfs::client::HttpWireFetcher>(),
      chunk_cache);

  chunkfs::client::ReaderHubOption option;
  chunkfs::client::InitReaderHubOption(&option);
  status = hub.Start(option);
  if (!status.ok()) {
    std::cerr << "start reader hub failed: " << status.ToString() << std::endl;
    return 1;
  }

  chunkfs::client::ChunkReaderUPtr reader;
  status = hub.NewChunkReader(views, file_size, &reader);
  if (!status.ok()) {
    std::cerr << "create reader failed: " << status.ToString() << std::endl;
    return 1;
  }

  std::vector<char> buffer(length);
  int64_t rsize = 0;
  status = reader->ReadAt(buffer.data(), length, FLAGS_offset, &rsize);
  if (!status.ok() && !status.IsEndOfFile()) {
    std::cerr << fmt::format("read failed after {} bytes: {}", rsize,
                             status.ToString())
              << std::endl;
    return 1;
  }

  status = WriteOutput(buffer, rsize);
  if (!status.ok()) {
    std::cerr << status.ToString() << std::endl;
    return 1;
  }

  LOG(INFO) << fmt::format("read {} bytes at offset {}, file size {}.", rsize,
                           FLAGS_offset, file_size);

  reader.reset();
  status = hub.Stop();
  if (!status.ok()) {
    LOG(WARNING) << "stop reader hub failed: " << status.ToString();
  }
  return 0;
}
