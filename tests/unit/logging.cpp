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


#include <memory>
#include <string>

#include <gtest/gtest.h>
#include <spdlog/sinks/ringbuffer_sink.h>
#include <spdlog/spdlog.h>

#include "epoch/epoch.hpp"
#include "utils/logging.hpp"
#include "utils/skip_list.hpp"

class LoggingTest : public ::testing::Test {
 protected:
  void SetUp() override {
    previous_ = spdlog::default_logger();
    sink_ = std::make_shared<spdlog::sinks::ringbuffer_sink_mt>(128);
    spdlog::set_default_logger(std::make_shared<spdlog::logger>("ringbuffer", sink_));
  }

  void TearDown() override {
    spdlog::set_default_logger(previous_);
    spdlog::set_level(spdlog::level::info);
  }

  std::shared_ptr<spdlog::logger> previous_;
  std::shared_ptr<spdlog::sinks::ringbuffer_sink_mt> sink_;
};

TEST_F(LoggingTest, SetLevel) {
  ASSERT_TRUE(strata::logging::SetLevel("warning"));
  spdlog::info("{}", "info");
  spdlog::warn("{}", "warn");
  spdlog::error("{}", "error");
  EXPECT_EQ(sink_->last_raw().size(), 2);

  ASSERT_TRUE(strata::logging::SetLevel("off"));
  spdlog::critical("{}", "critical");
  EXPECT_EQ(sink_->last_raw().size(), 2);
}

TEST_F(LoggingTest, UnknownLevelIsRejected) {
  ASSERT_TRUE(strata::logging::SetLevel("debug"));
  EXPECT_FALSE(strata::logging::SetLevel("verbose"));
  EXPECT_EQ(spdlog::get_level(), spdlog::level::debug);
  // The rejection itself is reported.
  EXPECT_EQ(sink_->last_raw().size(), 1);
}

TEST_F(LoggingTest, ClearReportsBatches) {
  ASSERT_TRUE(strata::logging::SetLevel("debug"));
  strata::utils::SkipList<int, int> list;
  {
    auto guard = strata::epoch::Pin();
    for (int i = 0; i < 250; ++i) list.insert(i, i, guard).release(guard);
    list.clear(guard);
  }
  auto const messages = sink_->last_formatted();
  ASSERT_FALSE(messages.empty());
  EXPECT_NE(messages.back().find("SkipList cleared in 3 batch(es)"), std::string::npos);
}

TEST(LoggingDeathTest, AssertTerminates) {
  EXPECT_DEATH(
      {
        strata::logging::RedirectToStderr();
        int const value = 1;
        STRATA_ASSERT(value == 2, "value was {}", value);
      },
      "value was 1");
}

TEST(LoggingDeathTest, LogFatalTerminates) {
  EXPECT_DEATH(
      {
        strata::logging::RedirectToStderr();
        LOG_FATAL("unrecoverable {}", "state");
      },
      "unrecoverable state");
}
