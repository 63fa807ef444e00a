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
#include <variant>
#include <vector>

#include "utils/bound.hpp"
#include "utils/skip_map.hpp"

namespace strata::utils {

/// Ordered concurrent set. A `SkipMap` whose values are empty.
template <typename T>
class SkipSet final {
  using Map = SkipMap<T, std::monostate>;
  using MapEntry = typename Map::Entry;

 public:
  class Entry {
   public:
    const T &value() const { return inner_.key(); }
    bool is_removed() const { return inner_.is_removed(); }
    bool remove() const { return inner_.remove(); }

    std::optional<Entry> next() const { return Wrap(inner_.next()); }
    std::optional<Entry> prev() const { return Wrap(inner_.prev()); }
    bool move_next() { return inner_.move_next(); }
    bool move_prev() { return inner_.move_prev(); }

   private:
    friend class SkipSet;

    explicit Entry(MapEntry inner) : inner_(std::move(inner)) {}

    MapEntry inner_;
  };

  class Iter {
   public:
    using value_type = Entry;

    std::optional<Entry> next() { return Wrap(inner_.next()); }
    std::optional<Entry> next_back() { return Wrap(inner_.next_back()); }

    detail::SkipListCursor<Iter> begin() { return detail::SkipListCursor<Iter>(this); }
    std::default_sentinel_t end() const { return std::default_sentinel; }

   private:
    friend class SkipSet;

    explicit Iter(typename Map::Iter inner) : inner_(std::move(inner)) {}

    typename Map::Iter inner_;
  };

  template <typename Q>
  class Range {
   public:
    using value_type = Entry;

    std::optional<Entry> next() { return Wrap(inner_.next()); }
    std::optional<Entry> next_back() { return Wrap(inner_.next_back()); }

    detail::SkipListCursor<Range> begin() { return detail::SkipListCursor<Range>(this); }
    std::default_sentinel_t end() const { return std::default_sentinel; }

   private:
    friend class SkipSet;

    explicit Range(typename Map::template Range<Q> inner) : inner_(std::move(inner)) {}

    typename Map::template Range<Q> inner_;
  };

  SkipSet() = default;

  SkipSet(std::initializer_list<T> items) {
    for (const auto &item : items) map_.insert(item, std::monostate{});
  }

  size_t size() const { return map_.size(); }
  bool empty() const { return map_.empty(); }

  std::optional<Entry> front() { return Wrap(map_.front()); }
  std::optional<Entry> back() { return Wrap(map_.back()); }

  template <typename Q>
  bool contains(const Q &key) {
    return map_.contains(key);
  }

  template <typename Q>
  std::optional<Entry> get(const Q &key) {
    return Wrap(map_.get(key));
  }

  template <typename Q = T>
  std::optional<Entry> lower_bound(const std::type_identity_t<std::optional<Bound<Q>>> &bound) {
    return Wrap(map_.template lower_bound<Q>(bound));
  }

  template <typename Q = T>
  std::optional<Entry> upper_bound(const std::type_identity_t<std::optional<Bound<Q>>> &bound) {
    return Wrap(map_.template upper_bound<Q>(bound));
  }

  Entry get_or_insert(T key) { return Entry(map_.get_or_insert(std::move(key), std::monostate{})); }

  /// Inserts the key, replacing an existing equal one.
  Entry insert(T key) { return Entry(map_.insert(std::move(key), std::monostate{})); }

  template <typename Q>
  std::optional<Entry> remove(const Q &key) {
    return Wrap(map_.remove(key));
  }

  std::optional<Entry> pop_front() { return Wrap(map_.pop_front()); }
  std::optional<Entry> pop_back() { return Wrap(map_.pop_back()); }

  void clear() { map_.clear(); }

  Iter iter() { return Iter(map_.iter()); }

  template <typename Q = T>
  Range<Q> range(std::type_identity_t<std::optional<Bound<Q>>> lower,
                 std::type_identity_t<std::optional<Bound<Q>>> upper) {
    return Range<Q>(map_.template range<Q>(std::move(lower), std::move(upper)));
  }

  /// Moves every key out of the set, in order. The set is empty afterwards.
  std::vector<T> into_vector() && {
    std::vector<T> items;
    items.reserve(map_.size());
    auto iter = std::move(map_).into_iter();
    while (auto item = iter.next()) items.push_back(std::move(item->first));
    return items;
  }

 private:
  static std::optional<Entry> Wrap(std::optional<MapEntry> entry) {
    if (!entry) return std::nullopt;
    return Entry(std::move(*entry));
  }

  Map map_;
};

}  // namespace strata::utils
