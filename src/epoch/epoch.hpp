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
/// Epoch based memory reclamation.
///
/// Lock-free structures unlink objects that other threads may still be
/// reading. Instead of freeing such an object immediately, the unlinking
/// thread hands a destruction function to the collector through a `Guard`.
/// The function runs only after every thread that was pinned at the time of
/// the hand-off has unpinned.
///
/// Every thread registers with a `Collector` once (`LocalHandle`) and then
/// pins before touching shared data:
///
///   auto handle = collector.Register();
///   {
///     auto guard = handle.Pin();
///     ... read shared pointers ...
///     guard.DeferUnchecked([node] { delete node; });
///   }
///
/// The global epoch only moves from `e` to `e + 1` when every pinned
/// participant has observed `e`. Garbage sealed at epoch `e` is safe to
/// destroy once the global epoch reaches `e + 2`.

#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <type_traits>
#include <utility>
#include <vector>

namespace strata::epoch {

/// Number of deferred functions a thread buffers before it seals them into a
/// bag on the global queue.
constexpr size_t kEpochBagCapacity = 64;
/// Every this many pins the pinning thread tries to advance the epoch and
/// collect garbage.
constexpr size_t kEpochPinsBetweenCollect = 128;

using Deferred = std::function<void()>;

class Guard;
class LocalHandle;

namespace detail {
struct Global;
struct Local;
}  // namespace detail

/// Cheap copyable handle to a garbage collector. All copies share the same
/// global state; the state is destroyed (running every deferred function that
/// is still pending) when the last `Collector` copy and the last `LocalHandle`
/// registered with it are gone.
class Collector {
 public:
  Collector();

  /// Registers a new participant. The returned handle must only be used by
  /// one thread at a time.
  LocalHandle Register() const;

  /// Current value of the global epoch.
  uint64_t Epoch() const;

  /// Number of sealed bags waiting on the global queue.
  size_t PendingBags() const;

  /// Identity of the shared state, equal for all copies of a collector.
  const void *id() const noexcept { return global_.get(); }

  friend bool operator==(const Collector &lhs, const Collector &rhs) { return lhs.global_ == rhs.global_; }
  friend bool operator!=(const Collector &lhs, const Collector &rhs) { return lhs.global_ != rhs.global_; }

 private:
  friend class Guard;
  friend class LocalHandle;
  explicit Collector(std::shared_ptr<detail::Global> global) : global_(std::move(global)) {}

  std::shared_ptr<detail::Global> global_;
};

/// A thread's registration with a `Collector`. Not thread-safe. Must outlive
/// every `Guard` it hands out.
class LocalHandle {
 public:
  LocalHandle(const LocalHandle &) = delete;
  LocalHandle &operator=(const LocalHandle &) = delete;
  LocalHandle(LocalHandle &&) noexcept;
  LocalHandle &operator=(LocalHandle &&) noexcept;
  ~LocalHandle();

  /// Pins the participant. Pins nest; the participant is unpinned when the
  /// outermost guard is destroyed.
  Guard Pin() const;

  bool IsPinned() const;

  Collector collector() const;

 private:
  friend class Collector;
  explicit LocalHandle(std::unique_ptr<detail::Local> local);

  std::unique_ptr<detail::Local> local_;
};

/// RAII pin of a participant. While a guard is alive, nothing deferred by any
/// thread after this guard was created will be executed.
class Guard {
 public:
  Guard(const Guard &) = delete;
  Guard &operator=(const Guard &) = delete;
  Guard(Guard &&) = delete;
  Guard &operator=(Guard &&) = delete;
  ~Guard();

  /// Schedules `f` to run once all currently pinned participants have
  /// unpinned. `f` must be safe to run on any thread and must not throw.
  template <typename F>
  void DeferUnchecked(F &&f) const {
    Defer(Deferred(std::forward<F>(f)));
  }

  /// Unpins and immediately pins again if this is the only guard of the
  /// participant, allowing the epoch to advance during a long operation.
  /// References obtained under this guard must not be used afterwards.
  void Repin();

  /// Seals the participant's buffered garbage and tries to advance the epoch
  /// and run expired garbage.
  void Flush() const;

  Collector collector() const;
  const void *collector_id() const noexcept;

 private:
  friend class LocalHandle;
  explicit Guard(detail::Local *local);

  void Defer(Deferred f) const;

  detail::Local *local_;
};

/// Process-wide collector.
Collector &DefaultCollector();

/// Calling thread's participant of `DefaultCollector()`, registered lazily.
LocalHandle &DefaultHandle();

/// Pins the calling thread on `DefaultCollector()`.
inline Guard Pin() { return DefaultHandle().Pin(); }

inline bool IsPinned() { return DefaultHandle().IsPinned(); }

}  // namespace strata::epoch
