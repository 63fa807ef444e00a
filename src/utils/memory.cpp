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

#include "utils/memory.hpp"

#include "utils/logging.hpp"

namespace strata::utils {

namespace {

struct NullMemoryResourceImpl final : public MemoryResource {
  NullMemoryResourceImpl() = default;
  NullMemoryResourceImpl(NullMemoryResourceImpl const &) = delete;
  NullMemoryResourceImpl &operator=(NullMemoryResourceImpl const &) = delete;
  NullMemoryResourceImpl(NullMemoryResourceImpl &&) = delete;
  NullMemoryResourceImpl &operator=(NullMemoryResourceImpl &&) = delete;
  ~NullMemoryResourceImpl() override = default;

 private:
  void *do_allocate(size_t bytes, size_t /*alignment*/) override {
    throw BadAlloc{fmt::format("NullMemoryResource doesn't allocate ({} bytes requested)", bytes)};
  }
  void do_deallocate(void * /*p*/, size_t /*bytes*/, size_t /*alignment*/) override {
    LOG_FATAL("NullMemoryResource doesn't deallocate");
  }
  bool do_is_equal(MemoryResource const &other) const noexcept override {
    return dynamic_cast<NullMemoryResourceImpl const *>(&other) != nullptr;
  }
};

}  // namespace

MemoryResource *NullMemoryResource() noexcept {
  static auto res = NullMemoryResourceImpl{};
  return &res;
}

void *CountingResource::do_allocate(size_t bytes, size_t alignment) {
  void *ptr = upstream_->allocate(bytes, alignment);
  outstanding_allocations_.fetch_add(1, std::memory_order_acq_rel);
  outstanding_bytes_.fetch_add(bytes, std::memory_order_acq_rel);
  total_allocations_.fetch_add(1, std::memory_order_relaxed);
  return ptr;
}

void CountingResource::do_deallocate(void *p, size_t bytes, size_t alignment) {
  DSTRATA_ASSERT(outstanding_allocations_.load(std::memory_order_acquire) > 0,
                 "Deallocating more blocks than were allocated");
  upstream_->deallocate(p, bytes, alignment);
  outstanding_bytes_.fetch_sub(bytes, std::memory_order_acq_rel);
  outstanding_allocations_.fetch_sub(1, std::memory_order_acq_rel);
}

}  // namespace strata::utils
