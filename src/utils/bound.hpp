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

#include <concepts>
#include <optional>
#include <utility>

namespace strata::utils {

/**
 * Determines whether the value of bound expression should be included or
 * excluded.
 */
enum class BoundType { INCLUSIVE, EXCLUSIVE };

/**
 * Defines a bounding value for a range. A missing bound
 * (`std::optional<Bound<T>>` without a value) means the range is unbounded on
 * that side.
 */
template <typename TValue>
class Bound {
 public:
  using Type = BoundType;

  Bound(TValue value, Type type) : value_(std::move(value)), type_(type) {}

  template <typename TOther>
  requires(!std::same_as<TOther, TValue> && std::constructible_from<TValue, const TOther &>)
  // NOLINTNEXTLINE(google-explicit-constructor)
  Bound(const Bound<TOther> &other) : value_(other.value()), type_(other.type()) {}

  Bound(const Bound &other) = default;
  Bound(Bound &&other) = default;

  Bound &operator=(const Bound &other) = default;
  Bound &operator=(Bound &&other) = default;

  /** Value for the bound. */
  const auto &value() const { return value_; }
  /** Whether the bound is inclusive or exclusive. */
  auto type() const { return type_; }
  auto IsInclusive() const { return type_ == BoundType::INCLUSIVE; }
  auto IsExclusive() const { return type_ == BoundType::EXCLUSIVE; }

 private:
  TValue value_;
  Type type_;
};

/**
 * Creates an inclusive @c Bound.
 *
 * @param value - Bound value
 * @tparam TValue - value type
 */
template <typename TValue>
Bound<TValue> MakeBoundInclusive(TValue value) {
  return Bound<TValue>(std::move(value), BoundType::INCLUSIVE);
}

/**
 * Creates an exclusive @c Bound.
 *
 * @param value - Bound value
 * @tparam TValue - value type
 */
template <typename TValue>
Bound<TValue> MakeBoundExclusive(TValue value) {
  return Bound<TValue>(std::move(value), BoundType::EXCLUSIVE);
}

/**
 * Non-owning view of an optional bound. A default constructed view is
 * unbounded. The viewed value must outlive the view.
 */
template <typename TValue>
class BoundRef {
 public:
  BoundRef() = default;
  BoundRef(const TValue &value, BoundType type) : value_(&value), type_(type) {}
  // NOLINTNEXTLINE(google-explicit-constructor)
  BoundRef(const std::optional<Bound<TValue>> &bound) {
    if (bound) {
      value_ = &bound->value();
      type_ = bound->type();
    }
  }

  static BoundRef Unbounded() { return BoundRef{}; }
  static BoundRef Inclusive(const TValue &value) { return BoundRef{value, BoundType::INCLUSIVE}; }
  static BoundRef Exclusive(const TValue &value) { return BoundRef{value, BoundType::EXCLUSIVE}; }

  bool IsUnbounded() const { return value_ == nullptr; }
  bool IsInclusive() const { return value_ != nullptr && type_ == BoundType::INCLUSIVE; }
  bool IsExclusive() const { return value_ != nullptr && type_ == BoundType::EXCLUSIVE; }
  const TValue &value() const { return *value_; }

 private:
  const TValue *value_{nullptr};
  BoundType type_{BoundType::INCLUSIVE};
};

/// Returns true if `key` lies on or above the lower `bound`. Only `operator<`
/// between the key and the bound value (in both directions) is required.
template <typename TValue, typename TKey>
bool AboveLowerBound(const BoundRef<TValue> &bound, const TKey &key) {
  if (bound.IsUnbounded()) return true;
  if (bound.IsInclusive()) return !(key < bound.value());
  return bound.value() < key;
}

/// Returns true if `key` lies on or below the upper `bound`.
template <typename TValue, typename TKey>
bool BelowUpperBound(const BoundRef<TValue> &bound, const TKey &key) {
  if (bound.IsUnbounded()) return true;
  if (bound.IsInclusive()) return !(bound.value() < key);
  return key < bound.value();
}

}  // namespace strata::utils
