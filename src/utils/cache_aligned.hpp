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

#include <cstddef>
#include <utility>

namespace strata::utils {

// Cache line size is typically 64 bytes on x86-64
constexpr std::size_t kCacheLineSize = 64;

/// Places `T` on its own cache line(s) so that writes to it don't invalidate
/// neighbouring data (false sharing). The size is rounded up to a whole number
/// of cache lines by the alignment.
template <typename T>
struct alignas(kCacheLineSize) CacheAligned {
  T value;

  CacheAligned() = default;
  template <typename... Args>
  explicit CacheAligned(std::in_place_t /*unused*/, Args &&...args) : value(std::forward<Args>(args)...) {}

  T &operator*() { return value; }
  const T &operator*() const { return value; }
  T *operator->() { return &value; }
  const T *operator->() const { return &value; }
};

static_assert(sizeof(CacheAligned<char>) == kCacheLineSize);

}  // namespace strata::utils
