#include <gtest/gtest.h>

#include <spdlog/spdlog.h>

#include "actorkit/common/logging.hpp"

namespace actorkit {
namespace {

// ConfigureLogging mutates spdlog's default logger; put it back so later
// suites in this binary see the stock level and pattern.
class LoggingTest : public ::testing::Test {
 protected:
  void SetUp() override {
    saved_level_ = spdlog::get_level();
  }

  void TearDown() override {
    spdlog::set_level(saved_level_);
    spdlog::set_pattern("%+");
  }

  spdlog::level::level_enum saved_level_ = spdlog::level::info;
};

TEST_F(LoggingTest, ParsesKnownLevels) {
  EXPECT_EQ(ParseLogLevel("trace"), spdlog::level::trace);
  EXPECT_EQ(ParseLogLevel("debug"), spdlog::level::debug);
  EXPECT_EQ(ParseLogLevel("info"), spdlog::level::info);
  EXPECT_EQ(ParseLogLevel("warn"), spdlog::level::warn);
  EXPECT_EQ(ParseLogLevel("error"), spdlog::level::err);
  EXPECT_EQ(ParseLogLevel("critical"), spdlog::level::critical);
  EXPECT_EQ(ParseLogLevel("off"), spdlog::level::off);
}

TEST_F(LoggingTest, RejectsUnknownLevels) {
  EXPECT_FALSE(ParseLogLevel("").has_value());
  EXPECT_FALSE(ParseLogLevel("verbose").has_value());
  EXPECT_FALSE(ParseLogLevel("INFO").has_value());
}

TEST_F(LoggingTest, FixtureStartsFromStockLevel) {
  EXPECT_EQ(saved_level_, spdlog::get_level());
  EXPECT_EQ(spdlog::get_level(), spdlog::level::info);
}

TEST_F(LoggingTest, ConfigureAppliesLevel) {
  ConfigureLogging({.level = spdlog::level::warn});
  EXPECT_EQ(spdlog::get_level(), spdlog::level::warn);

  ConfigureLogging({.level = spdlog::level::debug});
  EXPECT_EQ(spdlog::get_level(), spdlog::level::debug);
}

}  // namespace
}  // namespace actorkit
