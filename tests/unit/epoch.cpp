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


#include <atomic>
#include <thread>
#include <utility>
#include <vector>

#include <gtest/gtest.h>

#include "epoch/epoch.hpp"

using strata::epoch::Collector;
using strata::epoch::LocalHandle;

namespace {

// Pins and flushes a few times. Every fresh pin observes the newest epoch, so
// with no other participant pinned each round advances the epoch by one.
void Advance(const LocalHandle &handle, int rounds = 3) {
  for (int i = 0; i < rounds; ++i) {
    auto const guard = handle.Pin();
    guard.Flush();
  }
}

}  // namespace

TEST(Epoch, CollectorIdentity) {
  Collector collector;
  Collector copy = collector;
  Collector other;

  EXPECT_EQ(collector, copy);
  EXPECT_EQ(collector.id(), copy.id());
  EXPECT_NE(collector, other);
  EXPECT_NE(collector.id(), other.id());

  auto handle = collector.Register();
  EXPECT_EQ(handle.collector(), collector);
  auto const guard = handle.Pin();
  EXPECT_EQ(guard.collector(), collector);
  EXPECT_EQ(guard.collector_id(), collector.id());
}

TEST(Epoch, NestedPins) {
  Collector collector;
  auto handle = collector.Register();
  EXPECT_FALSE(handle.IsPinned());
  {
    auto const outer = handle.Pin();
    EXPECT_TRUE(handle.IsPinned());
    {
      auto const inner = handle.Pin();
      EXPECT_TRUE(handle.IsPinned());
    }
    EXPECT_TRUE(handle.IsPinned());
  }
  EXPECT_FALSE(handle.IsPinned());
}

TEST(Epoch, MovedHandle) {
  Collector collector;
  auto handle = collector.Register();
  LocalHandle moved = std::move(handle);
  {
    auto const guard = moved.Pin();
    EXPECT_TRUE(moved.IsPinned());
  }
  EXPECT_FALSE(moved.IsPinned());
}

TEST(Epoch, DeferredRunsAfterUnpin) {
  Collector collector;
  auto handle = collector.Register();
  std::atomic<int> destroyed{0};
  {
    auto const guard = handle.Pin();
    guard.DeferUnchecked([&destroyed] { destroyed.fetch_add(1); });
    guard.Flush();
    guard.Flush();
    EXPECT_EQ(destroyed.load(), 0);
  }
  Advance(handle);
  EXPECT_EQ(destroyed.load(), 1);
  EXPECT_EQ(collector.PendingBags(), 0);
}

TEST(Epoch, PinnedParticipantBlocksReclamation) {
  Collector collector;
  auto handle = collector.Register();
  auto reader = collector.Register();
  std::atomic<int> destroyed{0};

  {
    auto const blocker = reader.Pin();
    {
      auto const guard = handle.Pin();
      guard.DeferUnchecked([&destroyed] { destroyed.fetch_add(1); });
    }
    Advance(handle, 10);
    EXPECT_EQ(destroyed.load(), 0);
    EXPECT_EQ(collector.PendingBags(), 1);
  }

  Advance(handle);
  EXPECT_EQ(destroyed.load(), 1);
}

TEST(Epoch, EpochAdvancesOnlyPastObservers) {
  Collector collector;
  auto handle = collector.Register();
  auto reader = collector.Register();
  auto const start = collector.Epoch();

  auto guard = reader.Pin();
  Advance(handle, 5);
  // The reader observed `start`, which allows exactly one step.
  EXPECT_EQ(collector.Epoch(), start + 1);

  guard.Repin();
  Advance(handle, 1);
  EXPECT_EQ(collector.Epoch(), start + 2);
}

TEST(Epoch, FullBagIsSealed) {
  Collector collector;
  auto handle = collector.Register();
  std::atomic<int> destroyed{0};
  {
    auto const guard = handle.Pin();
    for (size_t i = 0; i < strata::epoch::kEpochBagCapacity; ++i) {
      guard.DeferUnchecked([&destroyed] { destroyed.fetch_add(1); });
    }
    EXPECT_EQ(collector.PendingBags(), 1);
  }
  Advance(handle);
  EXPECT_EQ(destroyed.load(), strata::epoch::kEpochBagCapacity);
}

TEST(Epoch, DestroyingCollectorRunsEverything) {
  std::atomic<int> destroyed{0};
  {
    Collector collector;
    auto handle = collector.Register();
    auto reader = collector.Register();
    {
      auto const guard = handle.Pin();
      for (int i = 0; i < 10; ++i) guard.DeferUnchecked([&destroyed] { destroyed.fetch_add(1); });
    }
    EXPECT_EQ(destroyed.load(), 0);
  }
  EXPECT_EQ(destroyed.load(), 10);
}

TEST(Epoch, DefaultCollector) {
  EXPECT_FALSE(strata::epoch::IsPinned());
  {
    auto const guard = strata::epoch::Pin();
    EXPECT_TRUE(strata::epoch::IsPinned());
    EXPECT_EQ(guard.collector_id(), strata::epoch::DefaultCollector().id());
    EXPECT_EQ(strata::epoch::DefaultHandle().collector(), strata::epoch::DefaultCollector());
  }
  EXPECT_FALSE(strata::epoch::IsPinned());
}

TEST(Epoch, ConcurrentDefer) {
  constexpr int kThreads = 8;
  constexpr int kItemsPerThread = 10000;

  std::atomic<int> destroyed{0};
  {
    Collector collector;
    std::vector<std::thread> threads;
    threads.reserve(kThreads);
    for (int i = 0; i < kThreads; ++i) {
      threads.emplace_back([&collector, &destroyed] {
        auto handle = collector.Register();
        for (int j = 0; j < kItemsPerThread; ++j) {
          auto const guard = handle.Pin();
          guard.DeferUnchecked([&destroyed] { destroyed.fetch_add(1); });
        }
      });
    }
    for (auto &thread : threads) thread.join();
    EXPECT_LE(destroyed.load(), kThreads * kItemsPerThread);
  }
  EXPECT_EQ(destroyed.load(), kThreads * kItemsPerThread);
}
