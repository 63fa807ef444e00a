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
#pragma once

#include <algorithm>
#include <cstdint>
#include <ctime>
#include <thread>

namespace strata::utils {

#if defined(__i386__) || defined(__x86_64__)
#define STRATA_PAUSE __builtin_ia32_pause()
#elif defined(__aarch64__)
#define STRATA_PAUSE asm volatile("YIELD")
#else
#error("no PAUSE/YIELD instructions for unknown architecture");
#endif

/// Exponential backoff for spin loops. The first `spin_limit` attempts are
/// separated by a pause instruction, after that every attempt is preceded by
/// a sleep of a doubling number of nanoseconds (capped at `kMaxSleepNs`).
struct yielder {
  static constexpr long kMaxSleepNs = 512;

  explicit yielder(uint_fast32_t spin_limit = 8) noexcept : spin_limit_{spin_limit} {}

  /// Retries `f` while the spin budget lasts. Once it is used up, every call
  /// sleeps and tries `f` one more time.
  ///
  /// @return true if `f` succeeded
  bool operator()(auto &&f) noexcept {
    while (spins_ < spin_limit_) {
      ++spins_;
      if (f()) return true;
      STRATA_PAUSE;
    }
    Sleep();
    return f();
  }

 private:
  void Sleep() noexcept {
    if (pause_.tv_nsec >= kMaxSleepNs) {
      std::this_thread::yield();
    }
    nanosleep(&pause_, nullptr);
    pause_.tv_nsec = std::min<decltype(pause_.tv_nsec)>(pause_.tv_nsec * 2, kMaxSleepNs);
  }

  uint_fast32_t spin_limit_;
  uint_fast32_t spins_{0};
  timespec pause_ = {.tv_sec = 0, .tv_nsec = 1};
};

#undef STRATA_PAUSE

}  // namespace strata::utils
