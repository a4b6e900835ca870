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

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "client/fetch/fetch_coordinator.h"
#include "client/mock/mock_chunk_cache.h"
#include "client/test_reader_common.h"

namespace chunkfs {
namespace client {

using ::testing::_;
using ::testing::DoAll;
using ::testing::Return;
using ::testing::SetArgPointee;

TEST(FetchCoordinatorTest, CacheHitSkipsFetch) {
  auto cache = std::make_shared<MockChunkCache>();
  ReaderStack stack(cache);
  stack.wire->AddChunk("1,a", "from wire");

  EXPECT_CALL(*cache, GetChunk("1,a", 9, _))
      .WillOnce(DoAll(SetArgPointee<2>(IOBuffer(std::string("from cache"))),
                      Return(true)));
  EXPECT_CALL(*cache, SetChunk(_, _)).Times(0);

  IOBuffer data;
  ASSERT_TRUE(
      stack.coordinator->GetWholeChunk(CreateView("1,a", 0, 0, 9, 9), &data)
          .ok());
  EXPECT_EQ(data.ToString(), "from cache");
  EXPECT_EQ(stack.wire->FetchCount(), 0);
}

TEST(FetchCoordinatorTest, MissFetchesAndStores) {
  auto cache = std::make_shared<MockChunkCache>();
  ReaderStack stack(cache);
  stack.wire->AddChunk("1,a", "from wire");

  EXPECT_CALL(*cache, GetChunk("1,a", 9, _)).WillOnce(Return(false));
  EXPECT_CALL(*cache, SetChunk("1,a", _)).WillOnce(Return(Status::OK()));

  IOBuffer data;
  ASSERT_TRUE(
      stack.coordinator->GetWholeChunk(CreateView("1,a", 0, 0, 9, 9), &data)
          .ok());
  EXPECT_EQ(data.ToString(), "from wire");
  EXPECT_EQ(stack.wire->FetchCount(), 1);
}

TEST(FetchCoordinatorTest, SizeHintCoversVisibleRange) {
  auto cache = std::make_shared<MockChunkCache>();
  ReaderStack stack(cache);
  stack.wire->AddChunk("1,a", "0123456789abcdef");

  // chunk size unknown
  EXPECT_CALL(*cache, GetChunk("1,a", 12, _)).WillOnce(Return(false));
  EXPECT_CALL(*cache, SetChunk("1,a", _)).WillOnce(Return(Status::OK()));

  IOBuffer data;
  ASSERT_TRUE(
      stack.coordinator->GetWholeChunk(CreateView("1,a", 4, 0, 8, 0), &data)
          .ok());
  EXPECT_EQ(data.Size(), 16);
}

TEST(FetchCoordinatorTest, StoreFailureIsNotReadFailure) {
  auto cache = std::make_shared<MockChunkCache>();
  ReaderStack stack(cache);
  stack.wire->AddChunk("1,a", "from wire");

  EXPECT_CALL(*cache, GetChunk(_, _, _)).WillOnce(Return(false));
  EXPECT_CALL(*cache, SetChunk(_, _))
      .WillOnce(Return(Status::CacheFull("cache is full")));

  IOBuffer data;
  ASSERT_TRUE(
      stack.coordinator->GetWholeChunk(CreateView("1,a", 0, 0, 9, 9), &data)
          .ok());
  EXPECT_EQ(data.ToString(), "from wire");
}

TEST(FetchCoordinatorTest, FetchErrorNotStored) {
  auto cache = std::make_shared<MockChunkCache>();
  ReaderStack stack(cache);
  stack.wire->AddChunk("1,a", "from wire");
  stack.wire->FailChunk("1,a");

  EXPECT_CALL(*cache, GetChunk(_, _, _)).WillOnce(Return(false));
  EXPECT_CALL(*cache, SetChunk(_, _)).Times(0);

  IOBuffer data;
  EXPECT_TRUE(
      stack.coordinator->GetWholeChunk(CreateView("1,a", 0, 0, 9, 9), &data)
          .IsFetchFailed());
}

TEST(FetchCoordinatorTest, ConcurrentCallersShareOneFetch) {
  ReaderStack stack;
  stack.wire->AddChunk("1,a", "shared payload");
  stack.wire->SetDelayMs(300);

  const int kCallers = 6;
  std::vector<IOBuffer> results(kCallers);
  std::vector<Status> statuses(kCallers);
  std::vector<std::thread> threads;
  for (int i = 0; i < kCallers; i++) {
    threads.emplace_back([&, i]() {
      statuses[i] = stack.coordinator->GetWholeChunk(
          CreateView("1,a", 0, 0, 14, 14), &results[i]);
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }

  EXPECT_EQ(stack.wire->FetchCount(), 1);
  for (int i = 0; i < kCallers; i++) {
    EXPECT_TRUE(statuses[i].ok());
    EXPECT_EQ(results[i].ToString(), "shared payload");
  }
}

TEST(FetchCoordinatorTest, ConcurrentCallersShareOneError) {
  ReaderStack stack;
  stack.wire->AddChunk("1,a", "shared payload");
  stack.wire->FailChunk("1,a");
  stack.wire->SetDelayMs(300);

  const int kCallers = 4;
  std::vector<Status> statuses(kCallers);
  std::vector<std::thread> threads;
  for (int i = 0; i < kCallers; i++) {
    threads.emplace_back([&, i]() {
      IOBuffer data;
      statuses[i] = stack.coordinator->GetWholeChunk(
          CreateView("1,a", 0, 0, 14, 14), &data);
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }

  EXPECT_EQ(stack.wire->FetchCount(), 1);
  for (int i = 0; i < kCallers; i++) {
    EXPECT_TRUE(statuses[i].IsFetchFailed());
  }
}

TEST(FetchCoordinatorTest, PrefetchIsNoopWithoutCache) {
  ReaderStack stack(nullptr, true);
  stack.wire->AddChunk("1,a", "payload");

  EXPECT_FALSE(stack.coordinator->ReadaheadEnabled());
  stack.coordinator->Prefetch(CreateView("1,a", 0, 0, 7, 7));
  stack.DrainReadahead();
  EXPECT_EQ(stack.wire->FetchCount(), 0);
}

TEST(FetchCoordinatorTest, PrefetchStoresIntoCache) {
  auto cache = std::make_shared<MockChunkCache>();
  ReaderStack stack(cache, true);
  stack.wire->AddChunk("1,a", "payload");

  EXPECT_CALL(*cache, GetChunk("1,a", 7, _)).WillOnce(Return(false));
  EXPECT_CALL(*cache, SetChunk("1,a", _)).WillOnce(Return(Status::OK()));

  EXPECT_TRUE(stack.coordinator->ReadaheadEnabled());
  stack.coordinator->Prefetch(CreateView("1,a", 0, 0, 7, 7));
  stack.DrainReadahead();
  EXPECT_EQ(stack.wire->FetchCount(), 1);
}

TEST(FetchCoordinatorTest, PrefetchAfterStopIsDropped) {
  auto cache = std::make_shared<MockChunkCache>();
  ReaderStack stack(cache, true);
  stack.wire->AddChunk("1,a", "payload");
  stack.DrainReadahead();

  EXPECT_CALL(*cache, GetChunk(_, _, _)).Times(0);
  stack.coordinator->Prefetch(CreateView("1,a", 0, 0, 7, 7));
  EXPECT_EQ(stack.wire->FetchCount(), 0);
}

}  // namespace client
}  // namespace chunkfs
