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
#include <atomic>
#include <bit>
#include <cstddef>
#include <cstdint>
#include <iterator>
#include <limits>
#include <new>
#include <optional>
#include <type_traits>
#include <utility>

#include <spdlog/spdlog.h>

#include "epoch/epoch.hpp"
#include "utils/bound.hpp"
#include "utils/cache_aligned.hpp"
#include "utils/logging.hpp"
#include "utils/memory.hpp"
#include "utils/on_scope_exit.hpp"
#include "utils/tagged_ptr.hpp"

// This code heavily depends on atomic operations. For a more detailed
// description of how exactly atomic operations work, see:
// https://www.codeproject.com/Articles/1183423/We-make-a-std-shared-mutex-times-faster
// How the specified memory fences influence the generated assembler
// instructions, see: https://www.cl.cam.ac.uk/~pes20/cpp/cpp0xmappings.html

namespace strata::utils {

/// This is the maximum height of the list. The height of a node is stored in
/// `kSkipListHeightBits` bits of its `refs_and_height` word, so the two
/// constants have to be changed together.
constexpr uint64_t kSkipListMaxHeight = 32;
constexpr uint64_t kSkipListHeightBits = 5;
constexpr uint64_t kSkipListHeightMask = (1ULL << kSkipListHeightBits) - 1;
static_assert(kSkipListMaxHeight == kSkipListHeightMask + 1, "Maximum height must fill the height bits exactly");

/// One reference in the `refs_and_height` word.
constexpr uint64_t kSkipListRefUnit = 1ULL << kSkipListHeightBits;

/// Number of entries `SkipList::clear` marks before it repins the guard so the
/// epoch can advance while a large list is being cleared.
constexpr size_t kSkipListClearBatchSize = 100;

/// This is the Node object that represents each element stored in the list. The
/// array of tower pointers is declared here to a size of 0 so that we can
/// dynamically allocate different sizes of memory for nodes of different
/// heights. When we allocate memory for the node we allocate
/// `sizeof(SkipListNode<K, V>) + height * sizeof(AtomicTaggedPtr<SkipListNode<K, V>>)`.
///
/// The allocated memory is then used like this:
/// [      Node      ][Link][Link][Link]...[Link]
///         |           |     |     |        |
///         |           0     1     2     height-1
/// |----------------||----------------------------|
///   space for the         space for tagged
///   Node structure       pointers to next Node
///
/// A tag of 1 in the level 0 pointer means the node is logically removed.
///
/// `refs_and_height` packs the tower height minus one into the low
/// `kSkipListHeightBits` bits and the reference count into the rest. The count
/// is the number of handles pointing at the node plus the number of levels at
/// which the node is linked into the list.
template <typename K, typename V>
struct SkipListNode {
  using Link = AtomicTaggedPtr<SkipListNode>;

  template <typename TKey, typename TValue>
  SkipListNode(uint64_t height, uint64_t refs, MemoryResource *memory, TKey &&key, TValue &&value)
      : key(std::forward<TKey>(key)),
        value(std::forward<TValue>(value)),
        memory(memory),
        refs_and_height((refs << kSkipListHeightBits) | (height - 1)) {
    for (uint64_t i = 0; i < height; ++i) new (&tower[i]) Link();
  }

  SkipListNode(const SkipListNode &) = delete;
  SkipListNode &operator=(const SkipListNode &) = delete;
  SkipListNode(SkipListNode &&) = delete;
  SkipListNode &operator=(SkipListNode &&) = delete;
  ~SkipListNode() = default;

  /// Size in bytes of a node with the given tower height.
  static constexpr size_t SizeFor(uint64_t height) { return sizeof(SkipListNode) + height * sizeof(Link); }

  /// Allocates a node from `memory` and constructs it. The tower starts out
  /// null. If the key or value constructor throws, the memory is returned
  /// before the exception propagates.
  static SkipListNode *Create(uint64_t height, uint64_t refs, MemoryResource *memory, K key, V value) {
    DSTRATA_ASSERT(height >= 1 && height <= kSkipListMaxHeight, "Invalid skip list node height {}", height);
    auto const size = SizeFor(height);
    void *ptr = memory->allocate(size, alignof(SkipListNode));
    OnScopeExit deallocate([memory, ptr, size] { memory->deallocate(ptr, size, alignof(SkipListNode)); });
    auto *node = new (ptr) SkipListNode(height, refs, memory, std::move(key), std::move(value));
    deallocate.Disable();
    return node;
  }

  /// Destroys the key and the value and returns the memory to the resource
  /// the node was allocated from.
  static void Finalize(SkipListNode *node) {
    auto *memory = node->memory;
    auto const size = SizeFor(node->height());
    node->~SkipListNode();
    memory->deallocate(node, size, alignof(SkipListNode));
  }

  uint64_t height() const { return (refs_and_height.load(std::memory_order_relaxed) & kSkipListHeightMask) + 1; }

  uint64_t refs() const { return refs_and_height.load(std::memory_order_acquire) >> kSkipListHeightBits; }

  /// Tags every level of the tower, from the top down.
  ///
  /// @return false if level 0 was already tagged, i.e. another thread removed
  ///         the node first
  bool mark_tower() {
    for (auto level = height(); level-- > 0;) {
      auto const previous = tower[level].fetch_or(1, std::memory_order_seq_cst);
      if (level == 0 && previous.tag() == 1) return false;
    }
    return true;
  }

  bool is_removed() const { return tower[0].load(std::memory_order_relaxed).tag() == 1; }

  /// Adds a reference unless the count already dropped to zero. A node at zero
  /// is waiting for destruction and must not be revived.
  bool try_increment() {
    auto current = refs_and_height.load(std::memory_order_relaxed);
    while (true) {
      if ((current & ~kSkipListHeightMask) == 0) return false;
      STRATA_ASSERT(current <= std::numeric_limits<uint64_t>::max() - kSkipListRefUnit,
                    "SkipList reference count overflow");
      if (refs_and_height.compare_exchange_weak(current, current + kSkipListRefUnit, std::memory_order_relaxed,
                                                std::memory_order_relaxed)) {
        return true;
      }
    }
  }

  /// Drops a reference. The last one schedules the node's destruction on the
  /// guard's collector.
  void decrement(const epoch::Guard &guard) {
    if ((refs_and_height.fetch_sub(kSkipListRefUnit, std::memory_order_release) >> kSkipListHeightBits) == 1) {
      std::atomic_thread_fence(std::memory_order_acquire);
      guard.DeferUnchecked([node = this] { Finalize(node); });
    }
  }

  /// Same as `decrement`, but pins (by calling `pin`) only when the last
  /// reference is dropped.
  template <typename TPin>
  void decrement_with_pin(const void *collector_id, TPin &&pin) {
    if ((refs_and_height.fetch_sub(kSkipListRefUnit, std::memory_order_release) >> kSkipListHeightBits) == 1) {
      std::atomic_thread_fence(std::memory_order_acquire);
      auto const guard = pin();
      STRATA_ASSERT(guard.collector_id() == collector_id,
                    "Pin function returned a guard of a collector the SkipList doesn't use");
      guard.DeferUnchecked([node = this] { Finalize(node); });
    }
  }

  /// Drops a reference without a guard. Only valid while no other thread can
  /// reach the node (the owning list is being destroyed or consumed).
  void decrement_unprotected() {
    if ((refs_and_height.fetch_sub(kSkipListRefUnit, std::memory_order_acq_rel) >> kSkipListHeightBits) == 1) {
      Finalize(this);
    }
  }

  K key;
  V value;
  MemoryResource *memory;
  std::atomic<uint64_t> refs_and_height;
  Link tower[0];
};

/// Maximum size of a single SkipListNode instance.
///
/// This can be used to tune a pool allocator for SkipListNode instances.
template <typename K, typename V>
constexpr size_t MaxSkipListNodeSize() {
  return SkipListNode<K, V>::SizeFor(kSkipListMaxHeight);
}

/// Get the size in bytes of the given SkipListNode instance.
template <typename K, typename V>
size_t SkipListNodeSize(const SkipListNode<K, V> &node) {
  return SkipListNode<K, V>::SizeFor(node.height());
}

/// Calls `func` until it returns no entry, or an entry that can be pinned, and
/// returns the pinned entry. Entries whose node is being destroyed are skipped
/// by asking again.
template <typename TFunc>
auto TryPinLoop(TFunc &&func) -> decltype(func()->pin()) {
  while (true) {
    auto entry = func();
    if (!entry) return std::nullopt;
    if (auto pinned = entry->pin()) return pinned;
  }
}

namespace detail {

/// Input iterator over any source with `std::optional<value_type> next()`,
/// so the list's iterators can be used in range-based for loops.
template <typename TSource>
class SkipListCursor {
 public:
  using value_type = typename TSource::value_type;
  using difference_type = std::ptrdiff_t;

  SkipListCursor() = default;
  explicit SkipListCursor(TSource *source) : source_(source), current_(source->next()) {}

  value_type &operator*() const { return *current_; }
  value_type *operator->() const { return &*current_; }

  SkipListCursor &operator++() {
    current_ = source_->next();
    return *this;
  }
  void operator++(int) { ++*this; }

  friend bool operator==(const SkipListCursor &cursor, std::default_sentinel_t /*unused*/) {
    return !cursor.current_.has_value();
  }

 private:
  TSource *source_{nullptr};
  mutable std::optional<value_type> current_;
};

}  // namespace detail

/// This is a lock-free ordered map (or set, with an empty value type) built as
/// a concurrent skip list. Insertion, lookup, range queries and removal can be
/// performed concurrently from any number of threads without locks. All
/// coordination is done with CAS operations on tagged tower pointers.
///
/// Removal is done in two steps. First every level of the removed node's tower
/// is tagged (logical removal), from then on the node is a ghost that readers
/// skip. Then the node is unlinked from each level by the removing thread or by
/// any other thread that meets the ghost while searching (helping). Memory of
/// unlinked nodes is handed to the epoch collector the list was created with,
/// so it is freed only after every thread that could still be reading the node
/// has unpinned.
///
/// Every operation that touches nodes takes an `epoch::Guard` pinned on the
/// list's collector:
///
///   SkipList<int, std::string> list;
///   {
///     auto guard = epoch::Pin();
///     list.insert(1, "one", guard).release(guard);
///     if (auto entry = list.get(1, guard)) std::cout << entry->value();
///   }
///
/// There are two kinds of handles to list entries:
///  - `Entry` is valid while the guard it was obtained with is alive. It
///    doesn't hold a reference count. The list operations that return it don't
///    accept a temporary guard.
///  - `RefEntry` holds a reference count on the node and is valid until it is
///    released with `std::move(entry).release(guard)`. It keeps the key and the
///    value readable even after the list itself is destroyed. A `RefEntry`
///    that is destroyed without being released leaks its node.
///
/// Keys only need `operator<`. Lookups accept any type `Q` for which both
/// `Q < K` and `K < Q` are defined (heterogeneous lookup).
///
/// `size()` is a best-effort count and iteration isn't a snapshot; both are
/// consistent with some interleaving of the concurrent operations.
template <typename K, typename V>
class SkipList final {
 public:
  using Node = SkipListNode<K, V>;
  using Link = typename Node::Link;

  class RefEntry;
  class Entry;
  class Iter;
  template <typename Q>
  class Range;
  class RefIter;
  template <typename Q>
  class RefRange;
  class IntoIter;

  /// Reference counted handle to an entry.
  class RefEntry {
   public:
    RefEntry(const RefEntry &) = delete;
    RefEntry &operator=(const RefEntry &) = delete;

    RefEntry(RefEntry &&other) noexcept
        : parent_(other.parent_), node_(std::exchange(other.node_, nullptr)), collector_id_(other.collector_id_) {}

    RefEntry &operator=(RefEntry &&other) noexcept {
      if (this != &other) {
        LogLeak();
        parent_ = other.parent_;
        node_ = std::exchange(other.node_, nullptr);
        collector_id_ = other.collector_id_;
      }
      return *this;
    }

    ~RefEntry() { LogLeak(); }

    const K &key() const { return node_->key; }
    const V &value() const { return node_->value; }
    bool is_removed() const { return node_->is_removed(); }

    /// The list this entry belongs to. Only valid while the list is alive.
    SkipList &skiplist() const { return *parent_; }

    /// Drops the reference. Releasing a moved-from entry does nothing.
    void release(const epoch::Guard &guard) && {
      if (node_ == nullptr) return;
      STRATA_ASSERT(guard.collector_id() == collector_id_,
                    "Guard used to release a SkipList entry doesn't belong to the list's collector");
      std::exchange(node_, nullptr)->decrement(guard);
    }

    /// Drops the reference and calls `pin` to get a guard only if the node has
    /// to be destroyed.
    template <typename TPin>
    void release_with_pin(TPin &&pin) && {
      if (node_ == nullptr) return;
      std::exchange(node_, nullptr)->decrement_with_pin(collector_id_, std::forward<TPin>(pin));
    }

    /// Acquires another reference to the same node.
    RefEntry clone() const {
      [[maybe_unused]] bool const acquired = node_->try_increment();
      DSTRATA_ASSERT(acquired, "Cloning a RefEntry whose node has no references");
      return RefEntry(parent_, node_, collector_id_);
    }

    /// Removes the entry from the list.
    ///
    /// @return true if this call removed it, false if it was already removed
    bool remove(const epoch::Guard &guard) const {
      parent_->check_guard(guard);
      if (!node_->mark_tower()) return false;
      parent_->hot_->len.fetch_sub(1, std::memory_order_relaxed);
      parent_->search_bound(BoundRef<K>::Inclusive(node_->key), false, guard);
      return true;
    }

    /// Next entry in key order, skipping entries whose node is being destroyed.
    std::optional<RefEntry> next(const epoch::Guard &guard) const {
      parent_->check_guard(guard);
      Node *node = node_;
      while (true) {
        node = parent_->next_node(node->tower, BoundRef<K>::Exclusive(node->key), guard);
        if (node == nullptr) return std::nullopt;
        if (auto entry = TryAcquire(parent_, node)) return entry;
      }
    }

    std::optional<RefEntry> prev(const epoch::Guard &guard) const {
      parent_->check_guard(guard);
      Node *node = node_;
      while (true) {
        node = parent_->search_bound(BoundRef<K>::Exclusive(node->key), true, guard);
        if (node == nullptr) return std::nullopt;
        if (auto entry = TryAcquire(parent_, node)) return entry;
      }
    }

    /// Moves to the next entry, releasing the current one.
    ///
    /// @return false if there is no next entry, the handle is unchanged then
    bool move_next(const epoch::Guard &guard) { return MoveTo(next(guard), guard); }
    bool move_prev(const epoch::Guard &guard) { return MoveTo(prev(guard), guard); }

   private:
    friend class SkipList;

    RefEntry(SkipList *parent, Node *node, const void *collector_id)
        : parent_(parent), node_(node), collector_id_(collector_id) {}

    static std::optional<RefEntry> TryAcquire(SkipList *parent, Node *node) {
      if (!node->try_increment()) return std::nullopt;
      return RefEntry(parent, node, parent->collector_.id());
    }

    bool MoveTo(std::optional<RefEntry> target, const epoch::Guard &guard) {
      if (!target) return false;
      RefEntry previous = std::move(*this);
      *this = std::move(*target);
      std::move(previous).release(guard);
      return true;
    }

    void LogLeak() const {
      if (node_ != nullptr) {
        spdlog::debug("SkipList RefEntry destroyed without release, its node will never be freed");
      }
    }

    SkipList *parent_;
    Node *node_;
    const void *collector_id_;
  };

  /// Handle to an entry that is valid while the guard used to obtain it is
  /// alive.
  class Entry {
   public:
    const K &key() const { return node_->key; }
    const V &value() const { return node_->value; }
    bool is_removed() const { return node_->is_removed(); }
    SkipList &skiplist() const { return *parent_; }

    /// Upgrades to a reference counted handle. Fails if the node is being
    /// destroyed.
    std::optional<RefEntry> pin() const { return RefEntry::TryAcquire(parent_, node_); }

    /// Removes the entry from the list.
    ///
    /// @return true if this call removed it
    bool remove() const {
      if (!node_->mark_tower()) return false;
      parent_->hot_->len.fetch_sub(1, std::memory_order_relaxed);
      parent_->search_bound(BoundRef<K>::Inclusive(node_->key), false, *guard_);
      return true;
    }

    std::optional<Entry> next() const {
      return parent_->MakeEntry(parent_->next_node(node_->tower, BoundRef<K>::Exclusive(node_->key), *guard_),
                                *guard_);
    }

    std::optional<Entry> prev() const {
      return parent_->MakeEntry(parent_->search_bound(BoundRef<K>::Exclusive(node_->key), true, *guard_), *guard_);
    }

    bool move_next() {
      auto next_entry = next();
      if (!next_entry) return false;
      *this = *next_entry;
      return true;
    }

    bool move_prev() {
      auto prev_entry = prev();
      if (!prev_entry) return false;
      *this = *prev_entry;
      return true;
    }

   private:
    friend class SkipList;

    Entry(SkipList *parent, Node *node, const epoch::Guard *guard) : parent_(parent), node_(node), guard_(guard) {}

    SkipList *parent_;
    Node *node_;
    const epoch::Guard *guard_;
  };

  /// Double ended iterator over all entries, bound to a guard.
  class Iter {
   public:
    using value_type = Entry;

    std::optional<Entry> next() {
      if (finished_) return std::nullopt;
      head_ = head_ != nullptr ? parent_->next_node(head_->tower, BoundRef<K>::Exclusive(head_->key), *guard_)
                               : parent_->next_node(parent_->head_, BoundRef<K>::Unbounded(), *guard_);
      if (head_ == nullptr || (tail_ != nullptr && !(head_->key < tail_->key))) return Finish();
      return Entry(parent_, head_, guard_);
    }

    std::optional<Entry> next_back() {
      if (finished_) return std::nullopt;
      tail_ = tail_ != nullptr ? parent_->search_bound(BoundRef<K>::Exclusive(tail_->key), true, *guard_)
                               : parent_->search_bound(BoundRef<K>::Unbounded(), true, *guard_);
      if (tail_ == nullptr || (head_ != nullptr && !(head_->key < tail_->key))) return Finish();
      return Entry(parent_, tail_, guard_);
    }

    detail::SkipListCursor<Iter> begin() { return detail::SkipListCursor<Iter>(this); }
    std::default_sentinel_t end() const { return std::default_sentinel; }

   private:
    friend class SkipList;

    Iter(SkipList *parent, const epoch::Guard *guard) : parent_(parent), guard_(guard) {}

    std::optional<Entry> Finish() {
      finished_ = true;
      head_ = nullptr;
      tail_ = nullptr;
      return std::nullopt;
    }

    SkipList *parent_;
    const epoch::Guard *guard_;
    Node *head_{nullptr};
    Node *tail_{nullptr};
    bool finished_{false};
  };

  /// Double ended iterator over the entries between two bounds, bound to a
  /// guard.
  template <typename Q>
  class Range {
   public:
    using value_type = Entry;

    std::optional<Entry> next() {
      if (finished_) return std::nullopt;
      head_ = head_ != nullptr ? parent_->next_node(head_->tower, BoundRef<K>::Exclusive(head_->key), *guard_)
                               : parent_->search_bound(BoundRef<Q>(lower_), false, *guard_);
      if (head_ == nullptr) return Finish();
      bool const in_range = tail_ != nullptr ? BelowUpperBound(BoundRef<K>::Exclusive(tail_->key), head_->key)
                                             : BelowUpperBound(BoundRef<Q>(upper_), head_->key);
      if (!in_range) return Finish();
      return Entry(parent_, head_, guard_);
    }

    std::optional<Entry> next_back() {
      if (finished_) return std::nullopt;
      tail_ = tail_ != nullptr ? parent_->search_bound(BoundRef<K>::Exclusive(tail_->key), true, *guard_)
                               : parent_->search_bound(BoundRef<Q>(upper_), true, *guard_);
      if (tail_ == nullptr) return Finish();
      bool const in_range = head_ != nullptr ? AboveLowerBound(BoundRef<K>::Exclusive(head_->key), tail_->key)
                                             : AboveLowerBound(BoundRef<Q>(lower_), tail_->key);
      if (!in_range) return Finish();
      return Entry(parent_, tail_, guard_);
    }

    detail::SkipListCursor<Range> begin() { return detail::SkipListCursor<Range>(this); }
    std::default_sentinel_t end() const { return std::default_sentinel; }

   private:
    friend class SkipList;

    Range(SkipList *parent, std::optional<Bound<Q>> lower, std::optional<Bound<Q>> upper, const epoch::Guard *guard)
        : parent_(parent), lower_(std::move(lower)), upper_(std::move(upper)), guard_(guard) {}

    std::optional<Entry> Finish() {
      finished_ = true;
      head_ = nullptr;
      tail_ = nullptr;
      return std::nullopt;
    }

    SkipList *parent_;
    std::optional<Bound<Q>> lower_;
    std::optional<Bound<Q>> upper_;
    const epoch::Guard *guard_;
    Node *head_{nullptr};
    Node *tail_{nullptr};
    bool finished_{false};
  };

  /// Double ended iterator yielding reference counted entries. It isn't bound
  /// to a guard; every step takes one. The iterator holds references to its
  /// current head and tail which are dropped when it finishes or with
  /// `release`.
  class RefIter {
   public:
    std::optional<RefEntry> next(const epoch::Guard &guard) {
      parent_->check_guard(guard);
      if (finished_) return std::nullopt;
      std::optional<RefEntry> new_head;
      if (head_) {
        new_head = head_->next(guard);
        std::move(*head_).release(guard);
      } else {
        new_head = TryPinLoop([&] { return parent_->front(guard); });
      }
      head_ = std::move(new_head);
      if (!head_ || (tail_ && !(head_->key() < tail_->key()))) return Finish(guard);
      return head_->clone();
    }

    std::optional<RefEntry> next_back(const epoch::Guard &guard) {
      parent_->check_guard(guard);
      if (finished_) return std::nullopt;
      std::optional<RefEntry> new_tail;
      if (tail_) {
        new_tail = tail_->prev(guard);
        std::move(*tail_).release(guard);
      } else {
        new_tail = TryPinLoop([&] { return parent_->back(guard); });
      }
      tail_ = std::move(new_tail);
      if (!tail_ || (head_ && !(head_->key() < tail_->key()))) return Finish(guard);
      return tail_->clone();
    }

    /// Drops the references held by the iterator. The iterator is finished
    /// afterwards.
    void release(const epoch::Guard &guard) { Finish(guard); }

   private:
    friend class SkipList;

    explicit RefIter(SkipList *parent) : parent_(parent) {}

    std::optional<RefEntry> Finish(const epoch::Guard &guard) {
      finished_ = true;
      if (head_) std::move(*head_).release(guard);
      if (tail_) std::move(*tail_).release(guard);
      head_.reset();
      tail_.reset();
      return std::nullopt;
    }

    SkipList *parent_;
    std::optional<RefEntry> head_;
    std::optional<RefEntry> tail_;
    bool finished_{false};
  };

  /// Reference counted counterpart of `Range`.
  template <typename Q>
  class RefRange {
   public:
    std::optional<RefEntry> next(const epoch::Guard &guard) {
      parent_->check_guard(guard);
      if (finished_) return std::nullopt;
      std::optional<RefEntry> new_head;
      if (head_) {
        new_head = head_->next(guard);
        std::move(*head_).release(guard);
      } else {
        new_head = TryPinLoop(
            [&] { return parent_->MakeEntry(parent_->search_bound(BoundRef<Q>(lower_), false, guard), guard); });
      }
      head_ = std::move(new_head);
      if (!head_) return Finish(guard);
      bool const in_range = tail_ ? BelowUpperBound(BoundRef<K>::Exclusive(tail_->key()), head_->key())
                                  : BelowUpperBound(BoundRef<Q>(upper_), head_->key());
      if (!in_range) return Finish(guard);
      return head_->clone();
    }

    std::optional<RefEntry> next_back(const epoch::Guard &guard) {
      parent_->check_guard(guard);
      if (finished_) return std::nullopt;
      std::optional<RefEntry> new_tail;
      if (tail_) {
        new_tail = tail_->prev(guard);
        std::move(*tail_).release(guard);
      } else {
        new_tail = TryPinLoop(
            [&] { return parent_->MakeEntry(parent_->search_bound(BoundRef<Q>(upper_), true, guard), guard); });
      }
      tail_ = std::move(new_tail);
      if (!tail_) return Finish(guard);
      bool const in_range = head_ ? AboveLowerBound(BoundRef<K>::Exclusive(head_->key()), tail_->key())
                                  : AboveLowerBound(BoundRef<Q>(lower_), tail_->key());
      if (!in_range) return Finish(guard);
      return tail_->clone();
    }

    void release(const epoch::Guard &guard) { Finish(guard); }

   private:
    friend class SkipList;

    RefRange(SkipList *parent, std::optional<Bound<Q>> lower, std::optional<Bound<Q>> upper)
        : parent_(parent), lower_(std::move(lower)), upper_(std::move(upper)) {}

    std::optional<RefEntry> Finish(const epoch::Guard &guard) {
      finished_ = true;
      if (head_) std::move(*head_).release(guard);
      if (tail_) std::move(*tail_).release(guard);
      head_.reset();
      tail_.reset();
      return std::nullopt;
    }

    SkipList *parent_;
    std::optional<Bound<Q>> lower_;
    std::optional<Bound<Q>> upper_;
    std::optional<RefEntry> head_;
    std::optional<RefEntry> tail_;
    bool finished_{false};
  };

  /// Consuming iterator returned by `into_iter`. Yields the key-value pairs of
  /// entries that weren't removed, in key order, and frees every node it
  /// passes. Nodes it didn't reach are freed when it is destroyed.
  class IntoIter {
   public:
    using value_type = std::pair<K, V>;

    IntoIter(const IntoIter &) = delete;
    IntoIter &operator=(const IntoIter &) = delete;
    IntoIter(IntoIter &&other) noexcept : node_(std::exchange(other.node_, nullptr)) {}
    IntoIter &operator=(IntoIter &&other) noexcept {
      if (this != &other) {
        Drain();
        node_ = std::exchange(other.node_, nullptr);
      }
      return *this;
    }
    ~IntoIter() { Drain(); }

    std::optional<value_type> next() {
      while (node_ != nullptr) {
        Node *node = node_;
        auto const link = node->tower[0].load(std::memory_order_relaxed);
        node_ = link.ptr();
        std::optional<value_type> item;
        if (link.tag() == 0) item.emplace(Take(node));
        node->decrement_unprotected();
        if (item) return item;
      }
      return std::nullopt;
    }

    detail::SkipListCursor<IntoIter> begin() { return detail::SkipListCursor<IntoIter>(this); }
    std::default_sentinel_t end() const { return std::default_sentinel; }

   private:
    friend class SkipList;

    explicit IntoIter(Node *front) : node_(front) {}

    // A `RefEntry` may still point at the node, in which case it keeps seeing
    // the original pair.
    static value_type Take(Node *node) {
      if constexpr (std::is_copy_constructible_v<K> && std::is_copy_constructible_v<V>) {
        if (node->refs() > 1) return value_type(node->key, node->value);
      } else {
        STRATA_ASSERT(node->refs() == 1, "SkipList consumed while a RefEntry still points at one of its entries");
      }
      return value_type(std::move(node->key), std::move(node->value));
    }

    void Drain() {
      while (node_ != nullptr) {
        Node *node = node_;
        node_ = node->tower[0].load(std::memory_order_relaxed).ptr();
        node->decrement_unprotected();
      }
    }

    Node *node_;
  };

  /// Creates an empty list whose nodes are allocated from `memory` and
  /// reclaimed through `collector`. Both must outlive every node of the list,
  /// including nodes still held by a `RefEntry` after the list is destroyed.
  explicit SkipList(epoch::Collector collector = epoch::DefaultCollector(),
                    MemoryResource *memory = NewDeleteResource())
      : collector_(std::move(collector)), memory_(memory) {}

  SkipList(const SkipList &) = delete;
  SkipList &operator=(const SkipList &) = delete;
  SkipList(SkipList &&) = delete;
  SkipList &operator=(SkipList &&) = delete;

  /// Requires exclusive access. Every node drops the references held by the
  /// levels it is linked at; nodes that are still referenced by a `RefEntry`
  /// stay alive until that entry is released.
  ~SkipList() {
    for (auto level = kSkipListMaxHeight; level-- > 0;) {
      Node *node = head_[level].load(std::memory_order_relaxed).ptr();
      while (node != nullptr) {
        // The successor has to be read before the node can be freed.
        Node *next = node->tower[level].load(std::memory_order_relaxed).ptr();
        node->decrement_unprotected();
        node = next;
      }
    }
  }

  const epoch::Collector &collector() const { return collector_; }

  MemoryResource *GetMemoryResource() const { return memory_; }

  /// Approximate number of entries. Concurrent insertions and removals may not
  /// be reflected yet.
  size_t size() const {
    auto const len = hot_->len.load(std::memory_order_relaxed);
    return len > 0 ? static_cast<size_t>(len) : 0;
  }

  bool empty() const { return size() == 0; }

  /// Entry with the smallest key.
  std::optional<Entry> front(const epoch::Guard &guard) {
    check_guard(guard);
    return MakeEntry(next_node(head_, BoundRef<K>::Unbounded(), guard), guard);
  }
  std::optional<Entry> front(epoch::Guard &&) = delete;

  /// Entry with the largest key.
  std::optional<Entry> back(const epoch::Guard &guard) {
    check_guard(guard);
    return MakeEntry(search_bound(BoundRef<K>::Unbounded(), true, guard), guard);
  }
  std::optional<Entry> back(epoch::Guard &&) = delete;

  template <typename Q>
  bool contains_key(const Q &key, const epoch::Guard &guard) {
    return get(key, guard).has_value();
  }

  template <typename Q>
  std::optional<Entry> get(const Q &key, const epoch::Guard &guard) {
    check_guard(guard);
    Node *node = search_bound(BoundRef<Q>::Inclusive(key), false, guard);
    if (node == nullptr || key < node->key) return std::nullopt;
    return Entry(this, node, &guard);
  }
  template <typename Q>
  std::optional<Entry> get(const Q &key, epoch::Guard &&) = delete;

  /// First entry whose key is above `bound` (at or above for an inclusive
  /// bound). An empty bound returns the first entry.
  template <typename Q = K>
  std::optional<Entry> lower_bound(const std::type_identity_t<std::optional<Bound<Q>>> &bound,
                                   const epoch::Guard &guard) {
    check_guard(guard);
    return MakeEntry(search_bound(BoundRef<Q>(bound), false, guard), guard);
  }
  template <typename Q = K>
  std::optional<Entry> lower_bound(const std::type_identity_t<std::optional<Bound<Q>>> &bound,
                                   epoch::Guard &&) = delete;

  /// Last entry whose key is below `bound` (at or below for an inclusive
  /// bound). An empty bound returns the last entry.
  template <typename Q = K>
  std::optional<Entry> upper_bound(const std::type_identity_t<std::optional<Bound<Q>>> &bound,
                                   const epoch::Guard &guard) {
    check_guard(guard);
    return MakeEntry(search_bound(BoundRef<Q>(bound), true, guard), guard);
  }
  template <typename Q = K>
  std::optional<Entry> upper_bound(const std::type_identity_t<std::optional<Bound<Q>>> &bound,
                                   epoch::Guard &&) = delete;

  /// Inserts the pair if the key isn't in the list yet. Returns the existing
  /// entry otherwise.
  RefEntry get_or_insert(K key, V value, const epoch::Guard &guard) {
    return insert_internal(std::move(key), std::move(value), false, guard);
  }

  /// Inserts the pair. An existing entry with the same key is removed first.
  RefEntry insert(K key, V value, const epoch::Guard &guard) {
    return insert_internal(std::move(key), std::move(value), true, guard);
  }

  /// Removes the entry with the given key.
  ///
  /// @return the removed entry, or nothing if the key wasn't found (or another
  ///         thread removed it first)
  template <typename Q>
  std::optional<RefEntry> remove(const Q &key, const epoch::Guard &guard) {
    check_guard(guard);
    while (true) {
      auto const search = search_position(key, guard);
      Node *node = search.found;
      if (node == nullptr) return std::nullopt;
      auto entry = RefEntry::TryAcquire(this, node);
      if (!entry) continue;

      if (!node->mark_tower()) {
        // Somebody else removed it, search again.
        std::move(*entry).release(guard);
        continue;
      }
      hot_->len.fetch_sub(1, std::memory_order_relaxed);

      for (auto level = node->height(); level-- > 0;) {
        auto const succ = node->tower[level].load(std::memory_order_seq_cst).with_tag(0);
        if (search.left[level][level].compare_and_set(TaggedPtr<Node>(node), succ)) {
          node->decrement(guard);
        } else {
          // The predecessor changed. A search unlinks whatever is left.
          search_bound(BoundRef<Q>::Inclusive(key), false, guard);
          break;
        }
      }
      return entry;
    }
  }

  std::optional<RefEntry> pop_front(const epoch::Guard &guard) {
    check_guard(guard);
    while (true) {
      auto entry = front(guard);
      if (!entry) return std::nullopt;
      if (auto pinned = entry->pin()) {
        if (pinned->remove(guard)) return pinned;
        std::move(*pinned).release(guard);
      }
    }
  }

  std::optional<RefEntry> pop_back(const epoch::Guard &guard) {
    check_guard(guard);
    while (true) {
      auto entry = back(guard);
      if (!entry) return std::nullopt;
      if (auto pinned = entry->pin()) {
        if (pinned->remove(guard)) return pinned;
        std::move(*pinned).release(guard);
      }
    }
  }

  /// Removes every entry. The guard is repinned after every
  /// `kSkipListClearBatchSize` entries.
  void clear(epoch::Guard &guard) {
    check_guard(guard);
    size_t batches = 0;
    while (true) {
      {
        auto entry = front(guard);
        for (size_t i = 0; i < kSkipListClearBatchSize; ++i) {
          if (!entry) {
            spdlog::debug("SkipList cleared in {} batch(es)", batches + 1);
            return;
          }
          auto next = entry->next();
          if (entry->node_->mark_tower()) hot_->len.fetch_sub(1, std::memory_order_relaxed);
          entry = next;
        }
      }
      ++batches;
      guard.Repin();
    }
  }

  Iter iter(const epoch::Guard &guard) {
    check_guard(guard);
    return Iter(this, &guard);
  }
  Iter iter(epoch::Guard &&) = delete;

  /// Iterates over the entries between `lower` and `upper`. An empty bound
  /// leaves that side of the range open.
  template <typename Q = K>
  Range<Q> range(std::type_identity_t<std::optional<Bound<Q>>> lower,
                 std::type_identity_t<std::optional<Bound<Q>>> upper, const epoch::Guard &guard) {
    check_guard(guard);
    return Range<Q>(this, std::move(lower), std::move(upper), &guard);
  }
  template <typename Q = K>
  Range<Q> range(std::type_identity_t<std::optional<Bound<Q>>> lower,
                 std::type_identity_t<std::optional<Bound<Q>>> upper, epoch::Guard &&) = delete;

  RefIter ref_iter() { return RefIter(this); }

  template <typename Q = K>
  RefRange<Q> ref_range(std::type_identity_t<std::optional<Bound<Q>>> lower,
                        std::type_identity_t<std::optional<Bound<Q>>> upper) {
    return RefRange<Q>(this, std::move(lower), std::move(upper));
  }

  /// Moves every node out of the list into a consuming iterator. Requires
  /// exclusive access; the list is empty afterwards.
  IntoIter into_iter() && {
    // Only the level 0 chain is handed over, the upper level references go
    // away here.
    for (auto level = kSkipListMaxHeight; level-- > 1;) {
      Node *node = head_[level].load(std::memory_order_relaxed).ptr();
      head_[level].store(TaggedPtr<Node>(), std::memory_order_relaxed);
      while (node != nullptr) {
        Node *next = node->tower[level].load(std::memory_order_relaxed).ptr();
        node->decrement_unprotected();
        node = next;
      }
    }
    Node *front = head_[0].load(std::memory_order_relaxed).ptr();
    head_[0].store(TaggedPtr<Node>(), std::memory_order_relaxed);
    hot_->len.store(0, std::memory_order_relaxed);
    return IntoIter(front);
  }

 private:
  /// Result of `search_position`. `left[level]` is the tower of the last node
  /// at `level` whose key is below the searched key, `right[level]` is its
  /// successor at that level.
  struct Position {
    Node *found{nullptr};
    Link *left[kSkipListMaxHeight];
    TaggedPtr<Node> right[kSkipListMaxHeight];
  };

  struct HotData {
    std::atomic<uint64_t> seed{1};
    std::atomic<int64_t> len{0};
    std::atomic<uint64_t> max_height{1};
  };

  void check_guard(const epoch::Guard &guard) const {
    STRATA_ASSERT(guard.collector_id() == collector_.id(), "Guard used with a SkipList doesn't belong to its collector");
  }

  std::optional<Entry> MakeEntry(Node *node, const epoch::Guard &guard) {
    if (node == nullptr) return std::nullopt;
    return Entry(this, node, &guard);
  }

  /// Geometric height from a xorshift generator. Tall towers are only handed
  /// out once the levels right below them are in use.
  uint64_t random_height() {
    auto num = hot_->seed.load(std::memory_order_relaxed);
    num ^= num << 13U;
    num ^= num >> 17U;
    num ^= num << 5U;
    hot_->seed.store(num, std::memory_order_relaxed);

    auto height = std::min<uint64_t>(kSkipListMaxHeight, static_cast<uint64_t>(std::countr_zero(num)) + 1);
    while (height >= 4 && head_[height - 2].load(std::memory_order_relaxed).is_null()) --height;

    auto max_height = hot_->max_height.load(std::memory_order_relaxed);
    while (height > max_height) {
      if (hot_->max_height.compare_exchange_weak(max_height, height, std::memory_order_relaxed,
                                                 std::memory_order_relaxed)) {
        break;
      }
    }
    return height;
  }

  /// Highest level of the head that isn't empty, plus one.
  uint64_t start_level() const {
    auto level = hot_->max_height.load(std::memory_order_relaxed);
    while (level >= 1 && head_[level - 1].load(std::memory_order_relaxed).is_null()) --level;
    return level;
  }

  /// Unlinks the removed node `curr` from `pred` at one level.
  ///
  /// @return true on success, the search continues with `succ` then
  bool help_unlink(Link &pred, Node *curr, TaggedPtr<Node> succ, const epoch::Guard &guard) {
    if (!pred.compare_and_set(TaggedPtr<Node>(curr), succ.with_tag(0), std::memory_order_release)) return false;
    curr->decrement(guard);
    return true;
  }

  /// Level 0 successor of the node whose tower is `pred`. Removed successors
  /// are unlinked on the way. If `pred` itself is removed, or unlinking fails,
  /// falls back to a search for `lower_bound`.
  template <typename Q>
  Node *next_node(Link *pred, const BoundRef<Q> &lower_bound, const epoch::Guard &guard) {
    auto curr = pred[0].load(std::memory_order_acquire);
    if (curr.tag() == 1) return search_bound(lower_bound, false, guard);
    while (!curr.is_null()) {
      Node *node = curr.ptr();
      auto const succ = node->tower[0].load(std::memory_order_acquire);
      if (succ.tag() == 1) {
        if (help_unlink(pred[0], node, succ, guard)) {
          curr = succ.with_tag(0);
          continue;
        }
        return search_bound(lower_bound, false, guard);
      }
      return node;
    }
    return nullptr;
  }

  /// If `upper_bound` is true, returns the last node whose key satisfies
  /// `bound` from above, otherwise the first node whose key satisfies it from
  /// below.
  template <typename Q>
  Node *search_bound(const BoundRef<Q> &bound, bool upper_bound, const epoch::Guard &guard) {
    while (true) {
      if (auto result = search_bound_once(bound, upper_bound, guard)) return *result;
    }
  }

  // Returns nothing if the search lost a race and has to start over.
  template <typename Q>
  std::optional<Node *> search_bound_once(const BoundRef<Q> &bound, bool upper_bound, const epoch::Guard &guard) {
    auto level = start_level();
    Node *result = nullptr;
    Link *pred = head_;
    while (level >= 1) {
      --level;
      auto curr = pred[level].load(std::memory_order_acquire);
      if (curr.tag() == 1) return std::nullopt;
      while (!curr.is_null()) {
        Node *node = curr.ptr();
        auto const succ = node->tower[level].load(std::memory_order_acquire);
        if (succ.tag() == 1) {
          if (help_unlink(pred[level], node, succ, guard)) {
            curr = succ.with_tag(0);
            continue;
          }
          return std::nullopt;
        }
        if (upper_bound) {
          if (!BelowUpperBound(bound, node->key)) break;
          result = node;
        } else if (AboveLowerBound(bound, node->key)) {
          result = node;
          break;
        }
        pred = node->tower;
        curr = succ;
      }
    }
    return result;
  }

  template <typename Q>
  Position search_position(const Q &key, const epoch::Guard &guard) {
    while (true) {
      if (auto result = search_position_once(key, guard)) return *result;
    }
  }

  template <typename Q>
  std::optional<Position> search_position_once(const Q &key, const epoch::Guard &guard) {
    Position result;
    std::fill(std::begin(result.left), std::end(result.left), static_cast<Link *>(head_));
    auto level = start_level();
    Link *pred = head_;
    while (level >= 1) {
      --level;
      auto curr = pred[level].load(std::memory_order_acquire);
      if (curr.tag() == 1) return std::nullopt;
      while (!curr.is_null()) {
        Node *node = curr.ptr();
        auto const succ = node->tower[level].load(std::memory_order_acquire);
        if (succ.tag() == 1) {
          if (help_unlink(pred[level], node, succ, guard)) {
            curr = succ.with_tag(0);
            continue;
          }
          return std::nullopt;
        }
        if (key < node->key) break;
        if (!(node->key < key)) {
          result.found = node;
          break;
        }
        pred = node->tower;
        curr = succ;
      }
      result.left[level] = pred;
      result.right[level] = curr;
    }
    return result;
  }

  static bool KeysEqual(const K &lhs, const K &rhs) { return !(lhs < rhs) && !(rhs < lhs); }

  RefEntry insert_internal(K key, V value, bool replace, const epoch::Guard &guard) {
    check_guard(guard);

    Position search;
    while (true) {
      search = search_position(key, guard);
      Node *existing = search.found;
      if (existing == nullptr) break;
      if (replace) {
        if (existing->mark_tower()) hot_->len.fetch_sub(1, std::memory_order_relaxed);
      } else {
        if (auto entry = RefEntry::TryAcquire(this, existing)) return std::move(*entry);
        break;
      }
    }

    auto const height = random_height();
    // One reference for the returned entry and one for the level 0 link.
    Node *node = Node::Create(height, 2, memory_, std::move(key), std::move(value));
    hot_->len.fetch_add(1, std::memory_order_relaxed);

    while (true) {
      node->tower[0].store(search.right[0], std::memory_order_relaxed);
      if (search.left[0][0].compare_and_set(search.right[0], TaggedPtr<Node>(node))) break;

      {
        OnScopeExit free_node([this, node] {
          Node::Finalize(node);
          hot_->len.fetch_sub(1, std::memory_order_relaxed);
        });
        search = search_position(node->key, guard);
        free_node.Disable();
      }

      if (Node *existing = search.found) {
        if (replace) {
          if (existing->mark_tower()) hot_->len.fetch_sub(1, std::memory_order_relaxed);
        } else if (auto entry = RefEntry::TryAcquire(this, existing)) {
          Node::Finalize(node);
          hot_->len.fetch_sub(1, std::memory_order_relaxed);
          return std::move(*entry);
        }
      }
    }

    RefEntry entry(this, node, collector_.id());

    // Upper levels only speed up searches; building stops as soon as the node
    // gets removed.
    bool building = true;
    for (uint64_t level = 1; building && level < height; ++level) {
      while (true) {
        Link *pred = search.left[level];
        auto const succ = search.right[level];
        auto const next = node->tower[level].load(std::memory_order_seq_cst);
        if (next.tag() == 1) {
          building = false;
          break;
        }

        if (!succ.is_null() && KeysEqual(succ->key, node->key)) {
          search = search_position(node->key, guard);
          continue;
        }

        if (!node->tower[level].compare_and_set(next, succ)) {
          building = false;
          break;
        }

        node->refs_and_height.fetch_add(kSkipListRefUnit, std::memory_order_relaxed);
        if (pred[level].compare_and_set(succ, TaggedPtr<Node>(node))) break;

        node->refs_and_height.fetch_sub(kSkipListRefUnit, std::memory_order_relaxed);
        search = search_position(node->key, guard);
      }
    }

    // Removed while being built, make sure it doesn't linger in the upper
    // levels.
    if (node->tower[height - 1].load(std::memory_order_seq_cst).tag() == 1) {
      search_bound(BoundRef<K>::Inclusive(node->key), false, guard);
    }

    return entry;
  }

  Link head_[kSkipListMaxHeight];
  epoch::Collector collector_;
  MemoryResource *memory_;
  CacheAligned<HotData> hot_;
};

}  // namespace strata::utils
