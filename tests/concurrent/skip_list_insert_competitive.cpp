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
#include <cstdint>

#include "skip_list_common.hpp"

#include "epoch/epoch.hpp"
#include "utils/skip_list.hpp"

// Every thread inserts the same keys; exactly one insertion per key may win.
int main(int argc, char **argv) {
  InitConcurrentTest(&argc, &argv);

  uint64_t const num_elements = FLAGS_num_elements;

  strata::utils::SkipList<uint64_t, int> list;
  std::atomic<uint64_t> success{0};

  RunThreads([&list, &success, num_elements](int id) {
    for (uint64_t num = 0; num < num_elements; ++num) {
      auto const guard = strata::epoch::Pin();
      auto entry = list.get_or_insert(num, id, guard);
      if (entry.value() == id) {
        success.fetch_add(1, std::memory_order_relaxed);
      }
      std::move(entry).release(guard);
    }
  });

  STRATA_ASSERT(success == num_elements, "{} successful insertions for {} keys", success.load(), num_elements);
  STRATA_ASSERT(list.size() == num_elements);

  auto const guard = strata::epoch::Pin();
  for (uint64_t i = 0; i < num_elements; ++i) {
    STRATA_ASSERT(list.contains_key(i, guard), "Key {} is missing", i);
  }

  spdlog::info("{} keys inserted by {} competing threads", num_elements, FLAGS_num_threads);
  return 0;
}
