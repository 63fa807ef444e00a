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

#include "skip_list_common.hpp"

#include "epoch/epoch.hpp"
#include "utils/skip_list.hpp"

int main(int argc, char **argv) {
  InitConcurrentTest(&argc, &argv);

  uint64_t const per_thread = FLAGS_num_elements;
  uint64_t const total = per_thread * FLAGS_num_threads;

  strata::utils::SkipList<uint64_t, uint64_t> list;

  RunThreads([&list, per_thread](int id) {
    for (uint64_t num = id * per_thread; num < (id + 1) * per_thread; ++num) {
      auto const guard = strata::epoch::Pin();
      auto entry = list.insert(num, num, guard);
      STRATA_ASSERT(entry.key() == num);
      std::move(entry).release(guard);
    }
  });

  STRATA_ASSERT(list.size() == total, "Expected {} entries, found {}", total, list.size());
  auto const guard = strata::epoch::Pin();
  for (uint64_t i = 0; i < total; ++i) {
    auto entry = list.get(i, guard);
    STRATA_ASSERT(entry, "Key {} is missing", i);
    STRATA_ASSERT(entry->value() == i);
  }

  uint64_t expected = 0;
  for (auto &entry : list.iter(guard)) {
    STRATA_ASSERT(entry.key() == expected, "Iteration yielded {} instead of {}", entry.key(), expected);
    ++expected;
  }
  STRATA_ASSERT(expected == total);

  spdlog::info("Inserted {} entries", total);
  return 0;
}
