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

#undef SPDLOG_ACTIVE_LEVEL
#ifndef NDEBUG
#define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_TRACE
#else
#define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_OFF
#endif
#include <exception>
#include <source_location>
#include <string>
#include <string_view>

#include <fmt/format.h>
#include <spdlog/fmt/ostr.h>
#include <spdlog/spdlog.h>

#include <boost/preprocessor/control/if.hpp>
#include <boost/preprocessor/facilities/is_empty.hpp>

namespace strata::logging {

[[noreturn]] void AssertFailed(std::source_location loc, const char *expr, const std::string &message);

#define STRATA_GET_MESSAGE(...) BOOST_PP_IF(BOOST_PP_IS_EMPTY(__VA_ARGS__), "", fmt::format(__VA_ARGS__))

#define STRATA_ASSERT(expr, ...)                                                                                   \
  do {                                                                                                             \
    if (!(expr)) [[unlikely]] {                                                                                    \
      [&]() __attribute__((noinline, cold, noreturn)) {                                                            \
        ::strata::logging::AssertFailed(std::source_location::current(), #expr, STRATA_GET_MESSAGE(__VA_ARGS__)); \
      }                                                                                                            \
      ();                                                                                                          \
    }                                                                                                              \
  } while (false)

#ifndef NDEBUG
#define DSTRATA_ASSERT(expr, ...) STRATA_ASSERT(expr, __VA_ARGS__)
#else
#define DSTRATA_ASSERT(...) \
  do {                      \
  } while (false)
#endif

#define LOG_FATAL(...)             \
  do {                             \
    spdlog::critical(__VA_ARGS__); \
    std::terminate();              \
  } while (0)

#ifndef NDEBUG
#define DLOG_FATAL(...) LOG_FATAL(__VA_ARGS__)
#else
#define DLOG_FATAL(...) \
  do {                  \
  } while (false)
#endif

/// Sends everything the default logger writes to stderr (color sink).
void RedirectToStderr();

/// Sets the level of the default logger from its textual name ("trace",
/// "debug", "info", "warning", "error", "critical", "off").
///
/// @return false if the name isn't a known level, the level is unchanged then
bool SetLevel(std::string_view level);

}  // namespace strata::logging
