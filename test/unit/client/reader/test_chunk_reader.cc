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

#include <gtest/gtest.h>

#include <limits>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "client/cache/mem_chunk_cache.h"
#include "client/reader/chunk_reader.h"
#include "client/test_reader_common.h"

namespace chunkfs {
namespace client {

class ChunkReaderTest : public ::testing::Test {
 protected:
  void SetUp() override {
    payload_a_ = CreatePayload('a', 100);
    payload_b_ = CreatePayload('A', 100);
  }

  std::string payload_a_;
  std::string payload_b_;
};

TEST_F(ChunkReaderTest, ZeroChunkFile) {
  ReaderStack stack;
  ChunkReader reader(stack.coordinator, {}, 100);

  std::vector<char> buf(100, 'x');
  int64_t rsize = -1;
  auto status = reader.ReadAt(buf.data(), 100, 0, &rsize);
  EXPECT_TRUE(status.IsEndOfFile());
  ASSERT_EQ(rsize, 100);
  EXPECT_EQ(std::string(buf.data(), 100), std::string(100, '\0'));

  status = reader.ReadAt(buf.data(), 10, 100, &rsize);
  EXPECT_TRUE(status.IsEndOfFile());
  EXPECT_EQ(rsize, 0);
  EXPECT_EQ(stack.wire->FetchCount(), 0);
}

TEST_F(ChunkReaderTest, ZeroChunkFileMiddleWindow) {
  ReaderStack stack;
  ChunkReader reader(stack.coordinator, {}, 100);

  std::vector<char> buf(30, 'x');
  int64_t rsize = 0;
  auto status = reader.ReadAt(buf.data(), 30, 10, &rsize);
  EXPECT_TRUE(status.ok());
  EXPECT_EQ(rsize, 30);
  EXPECT_EQ(std::string(buf.data(), 30), std::string(30, '\0'));
}

TEST_F(ChunkReaderTest, ReadWholeSingleView) {
  ReaderStack stack;
  stack.wire->AddChunk("1,a", payload_a_);
  ChunkReader reader(stack.coordinator, {CreateView("1,a", 0, 0, 100, 100)},
                     100);

  std::vector<char> buf(100);
  int64_t rsize = 0;
  auto status = reader.ReadAt(buf.data(), 100, 0, &rsize);
  EXPECT_TRUE(status.IsEndOfFile());
  ASSERT_EQ(rsize, 100);
  EXPECT_EQ(std::string(buf.data(), 100), payload_a_);
}

TEST_F(ChunkReaderTest, ChunkOffsetShiftsSource) {
  ReaderStack stack;
  stack.wire->AddChunk("1,a", payload_a_);
  // chunk bytes [40, 80) are visible at file offsets [0, 40)
  ChunkReader reader(stack.coordinator, {CreateView("1,a", 40, 0, 40, 100)},
                     40);

  std::vector<char> buf(10);
  int64_t rsize = 0;
  auto status = reader.ReadAt(buf.data(), 10, 5, &rsize);
  EXPECT_TRUE(status.ok());
  ASSERT_EQ(rsize, 10);
  EXPECT_EQ(std::string(buf.data(), 10), payload_a_.substr(45, 10));
}

TEST_F(ChunkReaderTest, GapZeroFill) {
  ReaderStack stack;
  stack.wire->AddChunk("1,a", payload_a_);
  stack.wire->AddChunk("1,b", payload_b_.substr(0, 50));
  ChunkReader reader(stack.coordinator,
                     {CreateView("1,a", 0, 0, 100, 100),
                      CreateView("1,b", 0, 150, 50, 50)},
                     200);

  std::vector<char> buf(70, 'x');
  int64_t rsize = 0;
  auto status = reader.ReadAt(buf.data(), 70, 90, &rsize);
  EXPECT_TRUE(status.ok());
  ASSERT_EQ(rsize, 70);

  std::string got(buf.data(), 70);
  EXPECT_EQ(got.substr(0, 10), payload_a_.substr(90, 10));
  EXPECT_EQ(got.substr(10, 50), std::string(50, '\0'));
  EXPECT_EQ(got.substr(60, 10), payload_b_.substr(0, 10));
}

TEST_F(ChunkReaderTest, WindowInsideGapFetchesNothing) {
  ReaderStack stack;
  stack.wire->AddChunk("1,a", payload_a_);
  stack.wire->AddChunk("1,b", payload_b_);
  ChunkReader reader(stack.coordinator,
                     {CreateView("1,a", 0, 0, 100, 100),
                      CreateView("1,b", 0, 300, 100, 100)},
                     400);

  std::vector<char> buf(50, 'x');
  int64_t rsize = 0;
  auto status = reader.ReadAt(buf.data(), 50, 150, &rsize);
  EXPECT_TRUE(status.ok());
  EXPECT_EQ(rsize, 50);
  EXPECT_EQ(std::string(buf.data(), 50), std::string(50, '\0'));
  EXPECT_EQ(stack.wire->FetchCount(), 0);
}

TEST_F(ChunkReaderTest, TrailingHoleUpToFileSize) {
  ReaderStack stack;
  stack.wire->AddChunk("1,a", payload_a_);
  ChunkReader reader(stack.coordinator, {CreateView("1,a", 0, 0, 100, 100)},
                     150);

  std::vector<char> buf(200, 'x');
  int64_t rsize = 0;
  auto status = reader.ReadAt(buf.data(), 200, 50, &rsize);
  EXPECT_TRUE(status.IsEndOfFile());
  ASSERT_EQ(rsize, 100);

  std::string got(buf.data(), 100);
  EXPECT_EQ(got.substr(0, 50), payload_a_.substr(50, 50));
  EXPECT_EQ(got.substr(50, 50), std::string(50, '\0'));
  EXPECT_EQ(buf[100], 'x');
}

TEST_F(ChunkReaderTest, EndOfFileBoundary) {
  ReaderStack stack;
  stack.wire->AddChunk("1,a", payload_a_);
  ChunkReader reader(stack.coordinator, {CreateView("1,a", 0, 0, 100, 100)},
                     100);

  std::vector<char> buf(11, 'x');
  int64_t rsize = 0;
  auto status = reader.ReadAt(buf.data(), 11, 99, &rsize);
  EXPECT_TRUE(status.IsEndOfFile());
  ASSERT_EQ(rsize, 1);
  EXPECT_EQ(buf[0], payload_a_[99]);
  EXPECT_EQ(buf[1], 'x');
}

TEST_F(ChunkReaderTest, ExactEndIsEndOfFile) {
  ReaderStack stack;
  stack.wire->AddChunk("1,a", payload_a_);
  ChunkReader reader(stack.coordinator, {CreateView("1,a", 0, 0, 100, 100)},
                     100);

  std::vector<char> buf(50);
  int64_t rsize = 0;
  EXPECT_TRUE(reader.ReadAt(buf.data(), 50, 0, &rsize).ok());
  EXPECT_EQ(rsize, 50);
  EXPECT_TRUE(reader.ReadAt(buf.data(), 50, 50, &rsize).IsEndOfFile());
  EXPECT_EQ(rsize, 50);
}

TEST_F(ChunkReaderTest, RecencySlotShortCircuit) {
  ReaderStack stack;
  stack.wire->AddChunk("1,a", payload_a_);
  ChunkReader reader(stack.coordinator, {CreateView("1,a", 0, 0, 100, 100)},
                     100);

  std::vector<char> buf(10);
  int64_t rsize = 0;
  EXPECT_TRUE(reader.ReadAt(buf.data(), 10, 0, &rsize).ok());
  EXPECT_EQ(std::string(buf.data(), 10), payload_a_.substr(0, 10));

  EXPECT_TRUE(reader.ReadAt(buf.data(), 10, 20, &rsize).ok());
  EXPECT_EQ(std::string(buf.data(), 10), payload_a_.substr(20, 10));

  EXPECT_EQ(stack.wire->FetchCount(), 1);
}

TEST_F(ChunkReaderTest, ViewsOfSameChunkFetchOnce) {
  ReaderStack stack;
  stack.wire->AddChunk("1,a", payload_a_);
  // two disjoint parts of one chunk
  ChunkReader reader(stack.coordinator,
                     {CreateView("1,a", 0, 0, 30, 100),
                      CreateView("1,a", 60, 30, 40, 100)},
                     70);

  std::vector<char> buf(70);
  int64_t rsize = 0;
  EXPECT_TRUE(reader.ReadAt(buf.data(), 70, 0, &rsize).IsEndOfFile());
  ASSERT_EQ(rsize, 70);
  EXPECT_EQ(std::string(buf.data(), 30), payload_a_.substr(0, 30));
  EXPECT_EQ(std::string(buf.data() + 30, 40), payload_a_.substr(60, 40));
  EXPECT_EQ(stack.wire->FetchCount(), 1);
}

TEST_F(ChunkReaderTest, PartialFailurePreservesPriorBytes) {
  ReaderStack stack;
  stack.wire->AddChunk("1,a", payload_a_);
  stack.wire->AddChunk("1,b", payload_b_);
  stack.wire->FailChunk("1,b");
  ChunkReader reader(stack.coordinator,
                     {CreateView("1,a", 0, 0, 100, 100),
                      CreateView("1,b", 0, 120, 80, 100)},
                     200);

  std::vector<char> buf(200, 'x');
  int64_t rsize = 0;
  auto status = reader.ReadAt(buf.data(), 200, 0, &rsize);
  EXPECT_TRUE(status.IsFetchFailed()) << status.ToString();
  ASSERT_EQ(rsize, 120);
  EXPECT_EQ(std::string(buf.data(), 100), payload_a_);
  EXPECT_EQ(std::string(buf.data() + 100, 20), std::string(20, '\0'));
}

TEST_F(ChunkReaderTest, ErrorIsNotCached) {
  ReaderStack stack;
  stack.wire->AddChunk("1,a", payload_a_);
  stack.wire->FailChunk("1,a");
  ChunkReader reader(stack.coordinator, {CreateView("1,a", 0, 0, 100, 100)},
                     100);

  std::vector<char> buf(100);
  int64_t rsize = 0;
  EXPECT_TRUE(reader.ReadAt(buf.data(), 100, 0, &rsize).IsFetchFailed());
  EXPECT_EQ(rsize, 0);

  stack.wire->RecoverChunk("1,a");
  EXPECT_TRUE(reader.ReadAt(buf.data(), 100, 0, &rsize).IsEndOfFile());
  EXPECT_EQ(rsize, 100);
  EXPECT_EQ(std::string(buf.data(), 100), payload_a_);
  EXPECT_EQ(stack.wire->FetchCount(), 2);
}

TEST_F(ChunkReaderTest, UnresolvableChunk) {
  ReaderStack stack;
  ChunkReader reader(stack.coordinator, {CreateView("9,z", 0, 0, 100, 100)},
                     100);

  std::vector<char> buf(100);
  int64_t rsize = 0;
  auto status = reader.ReadAt(buf.data(), 100, 0, &rsize);
  EXPECT_TRUE(status.IsUnresolvable()) << status.ToString();
  EXPECT_EQ(rsize, 0);
  EXPECT_EQ(stack.wire->FetchCount(), 0);
}

TEST_F(ChunkReaderTest, ShortChunkDataIsInternalError) {
  ReaderStack stack;
  stack.wire->AddChunk("1,a", payload_a_.substr(0, 10));
  ChunkReader reader(stack.coordinator, {CreateView("1,a", 0, 0, 100, 100)},
                     100);

  std::vector<char> buf(100);
  int64_t rsize = 0;
  EXPECT_TRUE(reader.ReadAt(buf.data(), 100, 0, &rsize).IsInternal());
  EXPECT_EQ(rsize, 0);
}

TEST_F(ChunkReaderTest, InvalidRange) {
  ReaderStack stack;
  ChunkReader reader(stack.coordinator, {}, 100);

  std::vector<char> buf(10);
  int64_t rsize = 0;
  EXPECT_TRUE(reader.ReadAt(buf.data(), 10, -1, &rsize).IsInvalidParam());
  EXPECT_EQ(rsize, 0);
  EXPECT_TRUE(reader.ReadAt(buf.data(), -1, 0, &rsize).IsInvalidParam());

  const int64_t max = std::numeric_limits<int64_t>::max();
  EXPECT_TRUE(reader.ReadAt(buf.data(), 10, max - 5, &rsize).IsOutOfRange());
  EXPECT_EQ(rsize, 0);
  EXPECT_TRUE(reader.ReadAt(buf.data(), max, 1, &rsize).IsOutOfRange());

  // largest window that still fits
  auto status = reader.ReadAt(buf.data(), 5, max - 5, &rsize);
  EXPECT_TRUE(status.IsEndOfFile()) << status.ToString();
  EXPECT_EQ(rsize, 0);
}

TEST_F(ChunkReaderTest, ZeroLengthRead) {
  ReaderStack stack;
  stack.wire->AddChunk("1,a", payload_a_);
  ChunkReader reader(stack.coordinator, {CreateView("1,a", 0, 0, 100, 100)},
                     100);

  std::vector<char> buf(1, 'x');
  int64_t rsize = -1;
  auto status = reader.ReadAt(buf.data(), 0, 40, &rsize);
  EXPECT_TRUE(status.ok()) << status.ToString();
  EXPECT_EQ(rsize, 0);

  rsize = -1;
  status = reader.ReadAt(buf.data(), 0, 100, &rsize);
  EXPECT_TRUE(status.IsEndOfFile()) << status.ToString();
  EXPECT_EQ(rsize, 0);

  EXPECT_EQ(buf[0], 'x');
  EXPECT_EQ(stack.wire->FetchCount(), 0);
}

TEST_F(ChunkReaderTest, ShortCachedChunkOfUnknownSizeIsRefetched) {
  auto cache = std::make_shared<MemChunkCache>(1024 * 1024);
  ReaderStack stack(cache);
  stack.wire->AddChunk("1,a", payload_a_);
  ASSERT_TRUE(
      cache->SetChunk("1,a", IOBuffer(payload_a_.substr(0, 10))).ok());

  // chunk size unknown, the visible range decides what a usable entry is
  ChunkReader reader(stack.coordinator, {CreateView("1,a", 0, 0, 100, 0)},
                     100);

  std::vector<char> buf(100);
  int64_t rsize = 0;
  auto status = reader.ReadAt(buf.data(), 100, 0, &rsize);
  EXPECT_TRUE(status.IsEndOfFile()) << status.ToString();
  ASSERT_EQ(rsize, 100);
  EXPECT_EQ(std::string(buf.data(), 100), payload_a_);
  EXPECT_EQ(stack.wire->FetchCount(), 1);

  IOBuffer cached;
  ASSERT_TRUE(cache->GetChunk("1,a", 100, &cached));
  EXPECT_EQ(cached.Size(), 100);
}

TEST_F(ChunkReaderTest, ConcurrentReadersFetchOnce) {
  auto cache = std::make_shared<MemChunkCache>(1024 * 1024);
  ReaderStack stack(cache);
  stack.wire->AddChunk("1,a", payload_a_);
  stack.wire->SetDelayMs(200);

  const int kReaders = 8;
  std::vector<ChunkReaderUPtr> readers;
  std::vector<std::vector<char>> bufs(kReaders, std::vector<char>(100));
  std::vector<int64_t> rsizes(kReaders, 0);
  std::vector<Status> statuses(kReaders);
  for (int i = 0; i < kReaders; i++) {
    readers.emplace_back(std::make_unique<ChunkReader>(
        stack.coordinator,
        std::vector<ChunkView>{CreateView("1,a", 0, 0, 100, 100)}, 100));
  }

  std::vector<std::thread> threads;
  for (int i = 0; i < kReaders; i++) {
    threads.emplace_back([&, i]() {
      statuses[i] =
          readers[i]->ReadAt(bufs[i].data(), 100, 0, &rsizes[i]);
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }

  EXPECT_EQ(stack.wire->FetchCount(), 1);
  for (int i = 0; i < kReaders; i++) {
    EXPECT_TRUE(statuses[i].IsEndOfFile());
    EXPECT_EQ(rsizes[i], 100);
    EXPECT_EQ(std::string(bufs[i].data(), 100), payload_a_);
  }
}

TEST_F(ChunkReaderTest, ReadaheadWarmsNextChunk) {
  auto cache = std::make_shared<MemChunkCache>(1024 * 1024);
  ReaderStack stack(cache, true);
  stack.wire->AddChunk("1,a", payload_a_);
  stack.wire->AddChunk("1,b", payload_b_);
  ChunkReader reader(stack.coordinator,
                     {CreateView("1,a", 0, 0, 100, 100),
                      CreateView("1,b", 0, 100, 100, 100)},
                     200);

  std::vector<char> buf(10);
  int64_t rsize = 0;
  EXPECT_TRUE(reader.ReadAt(buf.data(), 10, 0, &rsize).ok());
  stack.DrainReadahead();

  EXPECT_EQ(stack.wire->FetchCount("1,b"), 1);
  IOBuffer cached;
  EXPECT_TRUE(cache->GetChunk("1,b", 100, &cached));
  EXPECT_EQ(cached.ToString(), payload_b_);

  // served by the content cache
  EXPECT_TRUE(reader.ReadAt(buf.data(), 10, 150, &rsize).ok());
  EXPECT_EQ(std::string(buf.data(), 10), payload_b_.substr(50, 10));
  EXPECT_EQ(stack.wire->FetchCount(), 2);
}

TEST_F(ChunkReaderTest, ReadaheadFailureIsAbsorbed) {
  auto cache = std::make_shared<MemChunkCache>(1024 * 1024);
  ReaderStack stack(cache, true);
  stack.wire->AddChunk("1,a", payload_a_);
  stack.wire->AddChunk("1,b", payload_b_);
  stack.wire->FailChunk("1,b");
  ChunkReader reader(stack.coordinator,
                     {CreateView("1,a", 0, 0, 100, 100),
                      CreateView("1,b", 0, 100, 100, 100)},
                     200);

  std::vector<char> buf(100);
  int64_t rsize = 0;
  EXPECT_TRUE(reader.ReadAt(buf.data(), 100, 0, &rsize).ok());
  EXPECT_EQ(std::string(buf.data(), 100), payload_a_);
  stack.DrainReadahead();

  EXPECT_EQ(stack.wire->FetchCount("1,b"), 1);
  IOBuffer cached;
  EXPECT_FALSE(cache->GetChunk("1,b", 100, &cached));
}

TEST_F(ChunkReaderTest, NoReadaheadWithoutCache) {
  ReaderStack stack(nullptr, true);
  stack.wire->AddChunk("1,a", payload_a_);
  stack.wire->AddChunk("1,b", payload_b_);
  ChunkReader reader(stack.coordinator,
                     {CreateView("1,a", 0, 0, 100, 100),
                      CreateView("1,b", 0, 100, 100, 100)},
                     200);

  std::vector<char> buf(10);
  int64_t rsize = 0;
  EXPECT_TRUE(reader.ReadAt(buf.data(), 10, 0, &rsize).ok());
  stack.DrainReadahead();
  EXPECT_EQ(stack.wire->FetchCount("1,b"), 0);
}

}  // namespace client
}  // namespace chunkfs
