// Copyright 2025 Memgraph Ltd.
//
// Use of this software is governed by the Business Source License
// included in the file licenses/BSL.txt; by using this file, you agree to be bound by the terms of the Business Source
// License, and you may not use this file except in compliance with the Business Source License.
//
// As of the Change Date specified in that file, in accordance with
// the Business Source License, use of this software will be governed
// by the Apache License, Version 2.0, included in the file
// licenses/APL.txt.


#include <cstdint>
#include <functional>
#include <new>
#include <set>
#include <thread>
#include <vector>

#include <gtest/gtest.h>

#include "utils/memory.hpp"

TEST(NullMemoryResource, ThrowsOnAllocation) {
  auto *memory = strata::utils::NullMemoryResource();
  EXPECT_THROW(memory->allocate(8, 8), strata::utils::BadAlloc);
  EXPECT_THROW(memory->allocate(8, 8), std::bad_alloc);
  EXPECT_TRUE(memory->is_equal(*strata::utils::NullMemoryResource()));
}

TEST(CountingResource, TracksOutstandingAllocations) {
  strata::utils::CountingResource memory;
  EXPECT_EQ(memory.GetUpstreamResource(), strata::utils::NewDeleteResource());

  void *first = memory.allocate(24, 8);
  void *second = memory.allocate(100, 16);
  EXPECT_EQ(memory.GetOutstandingAllocations(), 2);
  EXPECT_EQ(memory.GetOutstandingBytes(), 124);
  EXPECT_EQ(memory.GetTotalAllocations(), 2);
  EXPECT_EQ(reinterpret_cast<uintptr_t>(second) % 16, 0);

  memory.deallocate(first, 24, 8);
  EXPECT_EQ(memory.GetOutstandingAllocations(), 1);
  EXPECT_EQ(memory.GetOutstandingBytes(), 100);

  memory.deallocate(second, 100, 16);
  EXPECT_EQ(memory.GetOutstandingAllocations(), 0);
  EXPECT_EQ(memory.GetOutstandingBytes(), 0);
  EXPECT_EQ(memory.GetTotalAllocations(), 2);
}

TEST(CountingResource, UpstreamFailurePropagates) {
  strata::utils::CountingResource memory{strata::utils::NullMemoryResource()};
  EXPECT_THROW(memory.allocate(8, 8), strata::utils::BadAlloc);
  EXPECT_EQ(memory.GetOutstandingAllocations(), 0);
  EXPECT_EQ(memory.GetTotalAllocations(), 0);
}

TEST(CountingResource, WorksWithAllocator) {
  strata::utils::CountingResource memory;
  {
    std::set<int64_t, std::less<>, strata::utils::Allocator<int64_t>> container{&memory};
    for (int64_t i = 0; i < 10; ++i) container.insert(i);
    EXPECT_EQ(memory.GetOutstandingAllocations(), 10);
  }
  EXPECT_EQ(memory.GetOutstandingAllocations(), 0);
}

TEST(CountingResource, ThreadSafe) {
  constexpr int kThreads = 4;
  constexpr int kAllocations = 10000;

  strata::utils::CountingResource memory;
  std::vector<std::thread> threads;
  threads.reserve(kThreads);
  for (int i = 0; i < kThreads; ++i) {
    threads.emplace_back([&memory] {
      std::vector<void *> blocks;
      blocks.reserve(kAllocations);
      for (int j = 0; j < kAllocations; ++j) blocks.push_back(memory.allocate(16, 8));
      for (auto *block : blocks) memory.deallocate(block, 16, 8);
    });
  }
  for (auto &thread : threads) thread.join();

  EXPECT_EQ(memory.GetOutstandingAllocations(), 0);
  EXPECT_EQ(memory.GetOutstandingBytes(), 0);
  EXPECT_EQ(memory.GetTotalAllocations(), kThreads * kAllocations);
}
