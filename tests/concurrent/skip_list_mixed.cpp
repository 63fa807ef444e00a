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
#include <chrono>
#include <cstdint>
#include <random>
#include <thread>
#include <vector>

#include "skip_list_common.hpp"

#include "epoch/epoch.hpp"
#include "utils/skip_list.hpp"

// kNumThreadsRemove should be smaller than kNumThreadsInsert because there
// should be some leftover items in the list for the find threads.
const int kNumThreadsInsert = 5;
const int kNumThreadsRemove = 2;
const int kNumThreadsFind = 3;

int main(int argc, char **argv) {
  InitConcurrentTest(&argc, &argv);

  uint64_t const per_thread = FLAGS_num_elements;

  strata::utils::SkipList<uint64_t, uint64_t> list;

  std::atomic<bool> run{true};
  std::atomic<bool> modify_done{false};
  std::atomic<uint64_t> lookups{0};

  std::vector<std::thread> threads_modify;
  std::vector<std::thread> threads_find;

  for (int i = 0; i < kNumThreadsInsert; ++i) {
    threads_modify.emplace_back([&list, i, per_thread] {
      for (uint64_t num = i * per_thread; num < (i + 1) * per_thread; ++num) {
        auto const guard = strata::epoch::Pin();
        auto entry = list.get_or_insert(num, num * 2, guard);
        STRATA_ASSERT(entry.key() == num, "Inserted {} but got {}", num, entry.key());
        std::move(entry).release(guard);
      }
    });
  }
  for (int i = 0; i < kNumThreadsRemove; ++i) {
    threads_modify.emplace_back([&list, i, per_thread] {
      for (uint64_t num = i * per_thread; num < (i + 1) * per_thread; ++num) {
        while (true) {
          auto const guard = strata::epoch::Pin();
          auto entry = list.remove(num, guard);
          if (entry) {
            std::move(*entry).release(guard);
            break;
          }
        }
      }
    });
  }

  for (int i = 0; i < kNumThreadsFind; ++i) {
    threads_find.emplace_back([&list, &run, &modify_done, &lookups, i, per_thread] {
      std::mt19937 gen(3137 + i);
      std::uniform_int_distribution<uint64_t> dist(0, kNumThreadsInsert * per_thread - 1);
      while (run.load(std::memory_order_relaxed)) {
        auto const guard = strata::epoch::Pin();
        auto const num = dist(gen);
        auto entry = list.get(num, guard);
        if (entry) {
          STRATA_ASSERT(entry->key() == num && entry->value() == num * 2, "Found a wrong entry for {}", num);
        }
        if (modify_done.load(std::memory_order_relaxed) && num >= kNumThreadsRemove * per_thread) {
          STRATA_ASSERT(entry, "Key {} is missing", num);
        }
        lookups.fetch_add(1, std::memory_order_relaxed);
      }
    });
  }

  for (auto &thread : threads_modify) {
    thread.join();
  }

  modify_done.store(true, std::memory_order_relaxed);
  std::this_thread::sleep_for(std::chrono::seconds(FLAGS_duration));
  run.store(false, std::memory_order_relaxed);

  for (auto &thread : threads_find) {
    thread.join();
  }

  STRATA_ASSERT(list.size() == (kNumThreadsInsert - kNumThreadsRemove) * per_thread, "Unexpected size {}", list.size());
  auto const guard = strata::epoch::Pin();
  for (uint64_t i = per_thread * kNumThreadsRemove; i < per_thread * kNumThreadsInsert; ++i) {
    auto entry = list.get(i, guard);
    STRATA_ASSERT(entry && entry->key() == i, "Key {} is missing", i);
  }

  spdlog::info("{} entries left after the mixed workload, {} lookups", list.size(), lookups.load());
  return 0;
}
