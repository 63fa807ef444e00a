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

#include <initializer_list>
#include <optional>
#include <type_traits>
#include <utility>
#include <vector>

#include "epoch/epoch.hpp"
#include "utils/bound.hpp"
#include "utils/skip_list.hpp"

namespace strata::utils {

/// Ordered concurrent map on top of `SkipList` that manages guards itself.
/// Every call pins the calling thread on `epoch::DefaultCollector()`.
///
/// Entries returned by the map hold a reference to their node and release it
/// when destroyed, so they can be kept around for as long as needed. Copying
/// an entry acquires another reference.
template <typename K, typename V>
class SkipMap final {
  using List = SkipList<K, V>;
  using ListRefEntry = typename List::RefEntry;

 public:
  class Entry {
   public:
    Entry(const Entry &other) {
      if (other.inner_) inner_.emplace(other.inner_->clone());
    }
    Entry &operator=(const Entry &other) {
      if (this != &other) {
        Release();
        if (other.inner_) inner_.emplace(other.inner_->clone());
      }
      return *this;
    }
    Entry(Entry &&other) noexcept : inner_(std::exchange(other.inner_, std::nullopt)) {}
    Entry &operator=(Entry &&other) noexcept {
      if (this != &other) {
        Release();
        inner_ = std::exchange(other.inner_, std::nullopt);
      }
      return *this;
    }
    ~Entry() { Release(); }

    const K &key() const { return inner_->key(); }
    const V &value() const { return inner_->value(); }
    bool is_removed() const { return inner_->is_removed(); }

    /// Removes the entry from the map.
    ///
    /// @return true if this call removed it
    bool remove() const {
      auto const guard = epoch::Pin();
      return inner_->remove(guard);
    }

    std::optional<Entry> next() const {
      auto const guard = epoch::Pin();
      return Wrap(inner_->next(guard));
    }

    std::optional<Entry> prev() const {
      auto const guard = epoch::Pin();
      return Wrap(inner_->prev(guard));
    }

    bool move_next() {
      auto const guard = epoch::Pin();
      return inner_->move_next(guard);
    }

    bool move_prev() {
      auto const guard = epoch::Pin();
      return inner_->move_prev(guard);
    }

   private:
    friend class SkipMap;

    explicit Entry(ListRefEntry inner) : inner_(std::move(inner)) {}

    void Release() {
      if (inner_) std::move(*inner_).release_with_pin(epoch::Pin);
      inner_.reset();
    }

    std::optional<ListRefEntry> inner_;
  };

  /// Double ended iterator over the map. Holds references to the entries at
  /// its two ends until it is destroyed.
  class Iter {
   public:
    using value_type = Entry;

    Iter(const Iter &) = delete;
    Iter &operator=(const Iter &) = delete;
    Iter(Iter &&) noexcept = default;
    Iter &operator=(Iter &&) = delete;
    ~Iter() {
      auto const guard = epoch::Pin();
      inner_.release(guard);
    }

    std::optional<Entry> next() {
      auto const guard = epoch::Pin();
      return Wrap(inner_.next(guard));
    }

    std::optional<Entry> next_back() {
      auto const guard = epoch::Pin();
      return Wrap(inner_.next_back(guard));
    }

    detail::SkipListCursor<Iter> begin() { return detail::SkipListCursor<Iter>(this); }
    std::default_sentinel_t end() const { return std::default_sentinel; }

   private:
    friend class SkipMap;

    explicit Iter(typename List::RefIter inner) : inner_(std::move(inner)) {}

    typename List::RefIter inner_;
  };

  /// Iterator over the entries between two bounds.
  template <typename Q>
  class Range {
   public:
    using value_type = Entry;

    Range(const Range &) = delete;
    Range &operator=(const Range &) = delete;
    Range(Range &&) noexcept = default;
    Range &operator=(Range &&) = delete;
    ~Range() {
      auto const guard = epoch::Pin();
      inner_.release(guard);
    }

    std::optional<Entry> next() {
      auto const guard = epoch::Pin();
      return Wrap(inner_.next(guard));
    }

    std::optional<Entry> next_back() {
      auto const guard = epoch::Pin();
      return Wrap(inner_.next_back(guard));
    }

    detail::SkipListCursor<Range> begin() { return detail::SkipListCursor<Range>(this); }
    std::default_sentinel_t end() const { return std::default_sentinel; }

   private:
    friend class SkipMap;

    explicit Range(typename List::template RefRange<Q> inner) : inner_(std::move(inner)) {}

    typename List::template RefRange<Q> inner_;
  };

  SkipMap() : list_(epoch::DefaultCollector()) {}

  SkipMap(std::initializer_list<std::pair<K, V>> items) : SkipMap() {
    auto const guard = epoch::Pin();
    for (const auto &[key, value] : items) list_.insert(key, value, guard).release(guard);
  }

  SkipMap(const SkipMap &) = delete;
  SkipMap &operator=(const SkipMap &) = delete;
  SkipMap(SkipMap &&) = delete;
  SkipMap &operator=(SkipMap &&) = delete;
  ~SkipMap() = default;

  size_t size() const { return list_.size(); }
  bool empty() const { return list_.empty(); }

  std::optional<Entry> front() {
    auto const guard = epoch::Pin();
    return Wrap(TryPinLoop([&] { return list_.front(guard); }));
  }

  std::optional<Entry> back() {
    auto const guard = epoch::Pin();
    return Wrap(TryPinLoop([&] { return list_.back(guard); }));
  }

  template <typename Q>
  bool contains(const Q &key) {
    auto const guard = epoch::Pin();
    return list_.contains_key(key, guard);
  }

  template <typename Q>
  std::optional<Entry> get(const Q &key) {
    auto const guard = epoch::Pin();
    return Wrap(TryPinLoop([&] { return list_.get(key, guard); }));
  }

  template <typename Q = K>
  std::optional<Entry> lower_bound(const std::type_identity_t<std::optional<Bound<Q>>> &bound) {
    auto const guard = epoch::Pin();
    return Wrap(TryPinLoop([&] { return list_.template lower_bound<Q>(bound, guard); }));
  }

  template <typename Q = K>
  std::optional<Entry> upper_bound(const std::type_identity_t<std::optional<Bound<Q>>> &bound) {
    auto const guard = epoch::Pin();
    return Wrap(TryPinLoop([&] { return list_.template upper_bound<Q>(bound, guard); }));
  }

  Entry get_or_insert(K key, V value) {
    auto const guard = epoch::Pin();
    return Entry(list_.get_or_insert(std::move(key), std::move(value), guard));
  }

  /// Inserts the pair, replacing an existing entry with the same key.
  Entry insert(K key, V value) {
    auto const guard = epoch::Pin();
    return Entry(list_.insert(std::move(key), std::move(value), guard));
  }

  template <typename Q>
  std::optional<Entry> remove(const Q &key) {
    auto const guard = epoch::Pin();
    return Wrap(list_.remove(key, guard));
  }

  std::optional<Entry> pop_front() {
    auto const guard = epoch::Pin();
    return Wrap(list_.pop_front(guard));
  }

  std::optional<Entry> pop_back() {
    auto const guard = epoch::Pin();
    return Wrap(list_.pop_back(guard));
  }

  void clear() {
    auto guard = epoch::Pin();
    list_.clear(guard);
  }

  Iter iter() { return Iter(list_.ref_iter()); }

  template <typename Q = K>
  Range<Q> range(std::type_identity_t<std::optional<Bound<Q>>> lower,
                 std::type_identity_t<std::optional<Bound<Q>>> upper) {
    return Range<Q>(list_.template ref_range<Q>(std::move(lower), std::move(upper)));
  }

  /// Moves every pair out of the map, in key order. The map is empty
  /// afterwards.
  typename List::IntoIter into_iter() && { return std::move(list_).into_iter(); }

  std::vector<std::pair<K, V>> into_vector() && {
    std::vector<std::pair<K, V>> items;
    items.reserve(list_.size());
    auto iter = std::move(list_).into_iter();
    while (auto item = iter.next()) items.push_back(std::move(*item));
    return items;
  }

 private:
  static std::optional<Entry> Wrap(std::optional<ListRefEntry> entry) {
    if (!entry) return std::nullopt;
    return Entry(std::move(*entry));
  }

  List list_;
};

}  // namespace strata::utils
