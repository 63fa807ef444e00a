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

#include "utils/logging.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

void strata::logging::AssertFailed(std::source_location const loc, char const *expr, std::string const &message) {
  spdlog::critical(
      "\nAssertion failed in file {} at line {}."
      "\n\tExpression: '{}'"
      "{}",
      loc.file_name(), loc.line(), expr, !message.empty() ? fmt::format("\n\tMessage: '{}'", message) : "");
  std::terminate();
}

void strata::logging::RedirectToStderr() { spdlog::set_default_logger(spdlog::stderr_color_mt("stderr")); }

bool strata::logging::SetLevel(std::string_view const level) {
  auto const parsed = spdlog::level::from_str(std::string{level});
  // `from_str` falls back to `off` for unknown names.
  if (parsed == spdlog::level::off && level != "off") {
    spdlog::warn("Unknown log level '{}', keeping '{}'", level,
                 spdlog::level::to_string_view(spdlog::get_level()));
    return false;
  }
  spdlog::set_level(parsed);
  return true;
}
