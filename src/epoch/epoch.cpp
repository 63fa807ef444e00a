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

#include "epoch/epoch.hpp"

#include <atomic>
#include <deque>
#include <mutex>

#include "utils/cache_aligned.hpp"
#include "utils/logging.hpp"
#include "utils/spin_lock.hpp"

namespace strata::epoch {

namespace detail {

namespace {

// Participant state word: the epoch observed when pinning, shifted left by
// one, with the lowest bit set while pinned.
constexpr uint64_t kPinnedBit = 1;

constexpr uint64_t MakePinned(uint64_t epoch) { return (epoch << 1U) | kPinnedBit; }
constexpr bool IsPinnedState(uint64_t state) { return (state & kPinnedBit) != 0; }
constexpr uint64_t StateEpoch(uint64_t state) { return state >> 1U; }

}  // namespace

/// Shared record of one registered thread. Records are never freed before the
/// collector; a released record is reused by the next registration.
struct alignas(utils::kCacheLineSize) Participant {
  std::atomic<uint64_t> state{0};
  std::atomic<bool> in_use{true};
  Participant *next{nullptr};
};

struct SealedBag {
  uint64_t epoch;
  std::vector<Deferred> items;
};

struct Global {
  Global() = default;
  Global(const Global &) = delete;
  Global &operator=(const Global &) = delete;
  Global(Global &&) = delete;
  Global &operator=(Global &&) = delete;

  ~Global() {
    // No participant is left, everything can run. Nothing is logged here, the
    // default collector may outlive the logger registry.
    for (auto &bag : garbage) {
      for (auto &f : bag.items) f();
    }
    auto *participant = participants.load(std::memory_order_acquire);
    while (participant != nullptr) {
      auto *next = participant->next;
      delete participant;
      participant = next;
    }
  }

  Participant *Acquire() {
    for (auto *it = participants.load(std::memory_order_acquire); it != nullptr; it = it->next) {
      bool expected = false;
      if (it->in_use.compare_exchange_strong(expected, true, std::memory_order_acq_rel)) return it;
    }
    auto *participant = new Participant();
    auto *head = participants.load(std::memory_order_relaxed);
    do {
      participant->next = head;
    } while (!participants.compare_exchange_weak(head, participant, std::memory_order_release,
                                                 std::memory_order_relaxed));
    return participant;
  }

  void Push(std::vector<Deferred> items) {
    if (items.empty()) return;
    std::lock_guard guard(garbage_lock);
    // Sealed under the lock so the queue stays ordered by epoch.
    garbage.push_back(SealedBag{.epoch = epoch->load(std::memory_order_seq_cst), .items = std::move(items)});
  }

  /// Advances the global epoch if every pinned participant has observed the
  /// current one. Returns the (possibly new) global epoch.
  uint64_t TryAdvance() {
    auto const current = epoch->load(std::memory_order_seq_cst);
    std::atomic_thread_fence(std::memory_order_seq_cst);
    for (auto *it = participants.load(std::memory_order_acquire); it != nullptr; it = it->next) {
      auto const state = it->state.load(std::memory_order_seq_cst);
      if (IsPinnedState(state) && StateEpoch(state) != current) return current;
    }
    std::atomic_thread_fence(std::memory_order_acquire);
    auto expected = current;
    if (epoch->compare_exchange_strong(expected, current + 1, std::memory_order_release, std::memory_order_relaxed)) {
      spdlog::trace("Epoch advanced to {}", current + 1);
      return current + 1;
    }
    return expected;
  }

  /// Runs every bag sealed at least two epochs ago.
  void Collect() {
    auto const global_epoch = TryAdvance();
    std::vector<SealedBag> expired;
    {
      std::lock_guard guard(garbage_lock);
      while (!garbage.empty() && garbage.front().epoch + 2 <= global_epoch) {
        expired.push_back(std::move(garbage.front()));
        garbage.pop_front();
      }
    }
    if (expired.empty()) return;
    size_t count = 0;
    for (auto &bag : expired) {
      for (auto &f : bag.items) {
        f();
        ++count;
      }
    }
    spdlog::trace("Collected {} deferred functions at epoch {}", count, global_epoch);
  }

  utils::CacheAligned<std::atomic<uint64_t>> epoch{std::in_place, 0};
  std::atomic<Participant *> participants{nullptr};
  utils::SpinLock garbage_lock;
  std::deque<SealedBag> garbage;
};

struct Local {
  explicit Local(std::shared_ptr<Global> g) : global(std::move(g)), participant(global->Acquire()) {
    bag.reserve(kEpochBagCapacity);
  }

  Local(const Local &) = delete;
  Local &operator=(const Local &) = delete;
  Local(Local &&) = delete;
  Local &operator=(Local &&) = delete;

  ~Local() {
    STRATA_ASSERT(guard_count == 0, "LocalHandle destroyed while {} guard(s) are alive", guard_count);
    global->Push(std::move(bag));
    participant->state.store(0, std::memory_order_release);
    participant->in_use.store(false, std::memory_order_release);
  }

  void Pin() {
    if (guard_count++ != 0) return;
    auto const global_epoch = global->epoch->load(std::memory_order_relaxed);
    participant->state.exchange(MakePinned(global_epoch), std::memory_order_seq_cst);
    std::atomic_thread_fence(std::memory_order_seq_cst);
    if (++pin_count % kEpochPinsBetweenCollect == 0) global->Collect();
  }

  void Unpin() {
    DSTRATA_ASSERT(guard_count > 0, "Unpinning a participant that isn't pinned");
    if (--guard_count == 0) participant->state.store(0, std::memory_order_release);
  }

  void Repin() {
    if (guard_count != 1) return;
    auto const global_epoch = global->epoch->load(std::memory_order_relaxed);
    if (StateEpoch(participant->state.load(std::memory_order_relaxed)) != global_epoch) {
      participant->state.store(MakePinned(global_epoch), std::memory_order_release);
    }
  }

  void Defer(Deferred f) {
    bag.push_back(std::move(f));
    if (bag.size() >= kEpochBagCapacity) {
      Seal();
      global->Collect();
    }
  }

  void Seal() {
    if (bag.empty()) return;
    std::vector<Deferred> sealed;
    sealed.reserve(kEpochBagCapacity);
    sealed.swap(bag);
    global->Push(std::move(sealed));
  }

  std::shared_ptr<Global> global;
  Participant *participant;
  std::vector<Deferred> bag;
  size_t guard_count{0};
  size_t pin_count{0};
};

}  // namespace detail

Collector::Collector() : global_(std::make_shared<detail::Global>()) {}

LocalHandle Collector::Register() const { return LocalHandle(std::make_unique<detail::Local>(global_)); }

uint64_t Collector::Epoch() const { return global_->epoch->load(std::memory_order_acquire); }

size_t Collector::PendingBags() const {
  std::lock_guard guard(global_->garbage_lock);
  return global_->garbage.size();
}

LocalHandle::LocalHandle(std::unique_ptr<detail::Local> local) : local_(std::move(local)) {}
LocalHandle::LocalHandle(LocalHandle &&) noexcept = default;
LocalHandle &LocalHandle::operator=(LocalHandle &&) noexcept = default;
LocalHandle::~LocalHandle() = default;

Guard LocalHandle::Pin() const {
  STRATA_ASSERT(local_, "Pinning a moved-from LocalHandle");
  return Guard(local_.get());
}

bool LocalHandle::IsPinned() const { return local_ && local_->guard_count > 0; }

Collector LocalHandle::collector() const { return Collector(local_->global); }

Guard::Guard(detail::Local *local) : local_(local) { local_->Pin(); }

Guard::~Guard() { local_->Unpin(); }

void Guard::Defer(Deferred f) const { local_->Defer(std::move(f)); }

void Guard::Repin() { local_->Repin(); }

void Guard::Flush() const {
  local_->Seal();
  local_->global->Collect();
}

Collector Guard::collector() const { return Collector(local_->global); }

const void *Guard::collector_id() const noexcept { return local_->global.get(); }

Collector &DefaultCollector() {
  static Collector collector;
  return collector;
}

LocalHandle &DefaultHandle() {
  thread_local LocalHandle handle = DefaultCollector().Register();
  return handle;
}

}  // namespace strata::epoch
