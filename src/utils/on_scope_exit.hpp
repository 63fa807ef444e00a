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
#include <type_traits>
#include <utility>

namespace strata::utils {

/**
 * Calls a function in its destructor (on scope exit) unless it was disarmed.
 *
 * Typical use is releasing a speculative resource when the code between its
 * acquisition and its hand-off throws:
 *
 * Node *node = AllocateNode();
 * {
 *     OnScopeExit free_node([node] { FreeNode(node); });
 *     Search(...);          // may throw
 *     free_node.Disable();  // ownership stays with the caller
 * }
 */
template <typename Callable>
class [[nodiscard]] OnScopeExit {
 public:
  template <typename U>
  requires std::constructible_from<Callable, U>
  explicit OnScopeExit(U &&function) : function_{std::forward<U>(function)} {}
  OnScopeExit(OnScopeExit const &) = delete;
  OnScopeExit(OnScopeExit &&) = delete;
  OnScopeExit &operator=(OnScopeExit const &) = delete;
  OnScopeExit &operator=(OnScopeExit &&) = delete;
  ~OnScopeExit() {
    if (armed_) function_();
  }

  void Disable() { armed_ = false; }

 private:
  Callable function_;
  bool armed_{true};
};
template <typename Callable>
OnScopeExit(Callable &&) -> OnScopeExit<std::decay_t<Callable>>;

}  // namespace strata::utils
