// =============================================================================
// console_logger_test.cpp
// =============================================================================
// Unit tests for orex::ConsoleLogger and the LogLevel helpers.
//
// Validates:
//   - Line layout: timestamp, [LEVEL][Component], message, key=value fields
//   - Debug/Info on the out stream, Warn and above on the err stream
//   - The minimum level filters records and can change at runtime
//   - parseLogLevel() accepts config spellings case-insensitively
// =============================================================================

#include "orex/logging/console_logger.hpp"
#include "orex/time/simulation_time_provider.hpp"

#include <gtest/gtest.h>

#include <sstream>
#include <string>

using orex::LogLevel;

class ConsoleLoggerTest : public ::testing::Test {
 protected:
  orex::SimulationTimeProvider clock{1'700'000'000'123};
  std::ostringstream out;
  std::ostringstream err;
};

TEST_F(ConsoleLoggerTest, FormatsOneLinePerRecord) {
  orex::ConsoleLogger logger(clock, LogLevel::Debug, out, err);
  logger.info("BrokerRouter", "session established",
              {{"clientId", "C1"}, {"attempt", 2}});

  EXPECT_EQ(out.str(),
            "2023-11-14T22:13:20.123Z [INFO][BrokerRouter] session established "
            "attempt=2 clientId=C1\n");
  EXPECT_TRUE(err.str().empty());
}

TEST_F(ConsoleLoggerTest, ProblemsGoToTheErrorStream) {
  orex::ConsoleLogger logger(clock, LogLevel::Debug, out, err);
  logger.debug("Engine", "tick");
  logger.warn("CircuitBreaker", "circuit opened", {{"name", "venue-a"}});
  logger.fatal("Engine", "worker died");

  EXPECT_NE(out.str().find("[DEBUG][Engine] tick"), std::string::npos);
  EXPECT_NE(err.str().find("[WARN][CircuitBreaker] circuit opened name=venue-a"),
            std::string::npos);
  EXPECT_NE(err.str().find("[FATAL][Engine] worker died"), std::string::npos);
}

TEST_F(ConsoleLoggerTest, NonStringFieldsAreCompactJson) {
  orex::ConsoleLogger logger(clock, LogLevel::Info, out, err);
  logger.info("Engine", "expired orders swept",
              {{"orderIds", nlohmann::json::array({"a", "b"})}});
  EXPECT_NE(out.str().find(R"(orderIds=["a","b"])"), std::string::npos);
}

TEST_F(ConsoleLoggerTest, MinimumLevelFilters) {
  orex::ConsoleLogger logger(clock, LogLevel::Warn, out, err);
  logger.info("Engine", "hidden");
  EXPECT_TRUE(out.str().empty());

  logger.setMinLevel(LogLevel::Debug);
  EXPECT_EQ(logger.minLevel(), LogLevel::Debug);
  logger.debug("Engine", "visible");
  EXPECT_NE(out.str().find("visible"), std::string::npos);
}

TEST(LogLevelTest, ParsesConfigSpellings) {
  auto warn = orex::parseLogLevel("WARNING");
  ASSERT_TRUE(warn.has_value());
  EXPECT_EQ(*warn, LogLevel::Warn);

  auto debug = orex::parseLogLevel("Debug");
  ASSERT_TRUE(debug.has_value());
  EXPECT_EQ(*debug, LogLevel::Debug);

  EXPECT_FALSE(orex::parseLogLevel("verbose").has_value());
  EXPECT_STREQ(orex::toString(LogLevel::Error), "ERROR");
}
