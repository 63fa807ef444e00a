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
#include <exception>
#include <random>

#include "skip_list_common.hpp"

#include "epoch/epoch.hpp"
#include "utils/skip_list.hpp"

// Every thread hammers the same key with a random mix of operations.
int main(int argc, char **argv) {
  gflags::ParseCommandLineFlags(&argc, &argv, true);

  strata::utils::SkipList<int64_t, uint64_t> list;

  RunConcurrentTest([&list](int id, auto *run, auto *stats) {
    std::mt19937 generator(std::random_device{}());
    std::uniform_int_distribution<int> distribution(0, 3);
    while (run->load(std::memory_order_relaxed)) {
      int value = distribution(generator);
      auto const guard = strata::epoch::Pin();
      switch (value) {
        case 0: {
          auto const tag = OperationTag(id, stats->total);
          auto entry = list.get_or_insert(5, tag, guard);
          stats->succ[OP_INSERT] += static_cast<uint64_t>(entry.value() == tag);
          std::move(entry).release(guard);
          break;
        }
        case 1:
          stats->succ[OP_CONTAINS] += static_cast<uint64_t>(list.contains_key(5, guard));
          break;
        case 2: {
          auto entry = list.remove(5, guard);
          if (entry) {
            ++stats->succ[OP_REMOVE];
            std::move(*entry).release(guard);
          }
          break;
        }
        case 3:
          stats->succ[OP_FIND] += static_cast<uint64_t>(list.get(5, guard).has_value());
          break;
        default:
          std::terminate();
      }
      ++stats->total;
    }
  });

  return 0;
}
