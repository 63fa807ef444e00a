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

#include <pthread.h>

#include "utils/logging.hpp"
#include "utils/yielder.hpp"

namespace strata::utils {

/// Wrapper around `pthread_spinlock_t` for critical sections that are held for
/// a handful of instructions (pushing to or popping from a garbage queue).
/// Under contention it backs off with `yielder` instead of burning the core.
///
/// Satisfies Lockable, so it works with `std::lock_guard` and
/// `std::unique_lock`.
class SpinLock {
 public:
  SpinLock() {
    // Fails only on platforms that allocate for the lock; `pthread_spinlock_t`
    // is a plain `int` on Linux.
    STRATA_ASSERT(pthread_spin_init(&lock_, PTHREAD_PROCESS_PRIVATE) == 0, "Couldn't construct utils::SpinLock!");
  }

  SpinLock(const SpinLock &) = delete;
  SpinLock &operator=(const SpinLock &) = delete;
  SpinLock(SpinLock &&) = delete;
  SpinLock &operator=(SpinLock &&) = delete;

  ~SpinLock() { STRATA_ASSERT(pthread_spin_destroy(&lock_) == 0, "Couldn't destruct utils::SpinLock!"); }

  void lock() {
    yielder backoff;
    while (!backoff([this] { return try_lock(); })) {
    }
  }

  bool try_lock() {
    // EBUSY is the only documented failure.
    return pthread_spin_trylock(&lock_) == 0;
  }

  void unlock() { STRATA_ASSERT(pthread_spin_unlock(&lock_) == 0, "Couldn't unlock utils::SpinLock!"); }

 private:
  pthread_spinlock_t lock_;
};

}  // namespace strata::utils
