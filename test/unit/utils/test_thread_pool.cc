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

#include <atomic>
#include <chrono>
#include <memory>
#include <thread>

#include "utils/executor/thread/thread_pool_impl.h"

namespace chunkfs {

class ThreadPoolImplTest : public ::testing::Test {
 public:
  ThreadPoolImplTest() {
    pool = std::make_unique<ThreadPoolImpl>("unit_test", 2);
  }

  ~ThreadPoolImplTest() override = default;

  std::unique_ptr<ThreadPoolImpl> pool{nullptr};
};

TEST_F(ThreadPoolImplTest, StartStop) {
  EXPECT_FALSE(pool->IsRunning());
  pool->Start();
  EXPECT_TRUE(pool->IsRunning());
  EXPECT_EQ(pool->GetBackgroundThreads(), 2);

  pool->Stop();
  EXPECT_FALSE(pool->IsRunning());

  // stop twice
  pool->Stop();
}

TEST_F(ThreadPoolImplTest, ExecuteBeforeStart) {
  std::atomic<int> count(0);
  EXPECT_FALSE(pool->Execute([&]() { count.fetch_add(1); }));
  EXPECT_EQ(count.load(), 0);
}

TEST_F(ThreadPoolImplTest, StopDrainsQueuedTasks) {
  pool->Start();

  std::atomic<int> count(0);
  for (int i = 0; i < 20; i++) {
    EXPECT_TRUE(pool->Execute([&]() {
      std::this_thread::sleep_for(std::chrono::milliseconds(5));
      count.fetch_add(1);
    }));
  }

  pool->Stop();
  EXPECT_EQ(count.load(), 20);
  EXPECT_EQ(pool->GetTaskNum(), 0);

  EXPECT_FALSE(pool->Execute([&]() { count.fetch_add(1); }));
  EXPECT_EQ(count.load(), 20);
}

}  // namespace chunkfs
