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

#include <atomic>
#include <cstdint>

#include "utils/logging.hpp"

namespace strata::utils {

/// A pointer of type @p T with one tag bit packed into its lowest bit. The
/// pointed-to type must be at least 2-byte aligned so that the bit is
/// naturally zero in every valid pointer.
template <typename T>
class TaggedPtr {
  static_assert(alignof(T) >= 2, "TaggedPtr needs a free low bit in the pointer");
  static constexpr uintptr_t kTagMask = 1;
  static constexpr uintptr_t kPtrMask = ~kTagMask;

 public:
  TaggedPtr() = default;
  // NOLINTNEXTLINE(google-explicit-constructor)
  TaggedPtr(T *ptr, uintptr_t tag = 0) : storage_(reinterpret_cast<uintptr_t>(ptr) | (tag & kTagMask)) {
    DSTRATA_ASSERT((reinterpret_cast<uintptr_t>(ptr) & kTagMask) == 0, "Pointer must be aligned!");
  }

  static TaggedPtr FromRaw(uintptr_t raw) {
    TaggedPtr result;
    result.storage_ = raw;
    return result;
  }

  T *ptr() const { return reinterpret_cast<T *>(storage_ & kPtrMask); }
  uintptr_t tag() const { return storage_ & kTagMask; }
  uintptr_t raw() const { return storage_; }
  bool is_null() const { return ptr() == nullptr; }

  /// Same pointer, with the tag replaced.
  TaggedPtr with_tag(uintptr_t tag) const { return FromRaw((storage_ & kPtrMask) | (tag & kTagMask)); }

  T *operator->() const { return ptr(); }
  T &operator*() const { return *ptr(); }

  friend bool operator==(TaggedPtr lhs, TaggedPtr rhs) { return lhs.storage_ == rhs.storage_; }
  friend bool operator!=(TaggedPtr lhs, TaggedPtr rhs) { return lhs.storage_ != rhs.storage_; }

 private:
  uintptr_t storage_{0};
};

/// Atomic cell holding a `TaggedPtr<T>`. All read-modify-write operations act
/// on the pointer and the tag together.
template <typename T>
class AtomicTaggedPtr {
 public:
  AtomicTaggedPtr() = default;
  explicit AtomicTaggedPtr(TaggedPtr<T> value) : storage_(value.raw()) {}

  AtomicTaggedPtr(const AtomicTaggedPtr &) = delete;
  AtomicTaggedPtr &operator=(const AtomicTaggedPtr &) = delete;

  TaggedPtr<T> load(std::memory_order order = std::memory_order_seq_cst) const {
    return TaggedPtr<T>::FromRaw(storage_.load(order));
  }

  void store(TaggedPtr<T> value, std::memory_order order = std::memory_order_seq_cst) {
    storage_.store(value.raw(), order);
  }

  /// Replaces the value with `desired` if it currently equals `expected`
  /// (pointer and tag). On failure `expected` is updated to the current value.
  bool compare_exchange(TaggedPtr<T> &expected, TaggedPtr<T> desired,
                        std::memory_order success = std::memory_order_seq_cst,
                        std::memory_order failure = std::memory_order_relaxed) {
    uintptr_t raw = expected.raw();
    bool const ok = storage_.compare_exchange_strong(raw, desired.raw(), success, failure);
    if (!ok) expected = TaggedPtr<T>::FromRaw(raw);
    return ok;
  }

  /// Same as `compare_exchange`, but the caller doesn't need the current value
  /// on failure.
  bool compare_and_set(TaggedPtr<T> expected, TaggedPtr<T> desired,
                       std::memory_order success = std::memory_order_seq_cst) {
    return compare_exchange(expected, desired, success, std::memory_order_relaxed);
  }

  /// ORs `tag` into the stored tag and returns the previous value.
  TaggedPtr<T> fetch_or(uintptr_t tag, std::memory_order order = std::memory_order_seq_cst) {
    return TaggedPtr<T>::FromRaw(storage_.fetch_or(tag & 1, order));
  }

 private:
  std::atomic<uintptr_t> storage_{0};
};

}  // namespace strata::utils
