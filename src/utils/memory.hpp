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

/// @file
/// Memory resources used for node allocation. Built on the C++17
/// <memory_resource> interface.

#pragma once

#include <atomic>
#include <cstddef>
#include <memory_resource>
#include <new>
#include <string>

namespace strata::utils {

/// std::bad_alloc has no constructor accepting a message, so we wrap our
/// exceptions in this class.
class BadAlloc final : public std::bad_alloc {
  std::string msg_;

 public:
  explicit BadAlloc(std::string msg) : msg_(std::move(msg)) {}

  const char *what() const noexcept override { return msg_.c_str(); }
};

/// Abstract class for writing custom memory management, i.e. allocators.
using MemoryResource = std::pmr::memory_resource;

/// Allocator for a concrete type T using the underlying MemoryResource.
template <class T>
using Allocator = std::pmr::polymorphic_allocator<T>;

inline MemoryResource *NewDeleteResource() noexcept { return std::pmr::new_delete_resource(); }

/// MemoryResource that throws `BadAlloc` on every allocation.
MemoryResource *NullMemoryResource() noexcept;

/// Thread-safe MemoryResource that forwards to `upstream` and keeps live
/// counters of outstanding allocations and bytes.
class CountingResource final : public MemoryResource {
 public:
  explicit CountingResource(MemoryResource *upstream = NewDeleteResource()) : upstream_(upstream) {}

  CountingResource(const CountingResource &) = delete;
  CountingResource &operator=(const CountingResource &) = delete;
  CountingResource(CountingResource &&) = delete;
  CountingResource &operator=(CountingResource &&) = delete;
  ~CountingResource() override = default;

  /// Number of blocks allocated and not yet deallocated.
  size_t GetOutstandingAllocations() const noexcept { return outstanding_allocations_.load(std::memory_order_acquire); }
  size_t GetOutstandingBytes() const noexcept { return outstanding_bytes_.load(std::memory_order_acquire); }
  size_t GetTotalAllocations() const noexcept { return total_allocations_.load(std::memory_order_acquire); }

  MemoryResource *GetUpstreamResource() const noexcept { return upstream_; }

 private:
  void *do_allocate(size_t bytes, size_t alignment) override;
  void do_deallocate(void *p, size_t bytes, size_t alignment) override;
  bool do_is_equal(const MemoryResource &other) const noexcept override { return this == &other; }

  MemoryResource *upstream_;
  std::atomic<size_t> outstanding_allocations_{0};
  std::atomic<size_t> outstanding_bytes_{0};
  std::atomic<size_t> total_allocations_{0};
};

}  // namespace strata::utils
