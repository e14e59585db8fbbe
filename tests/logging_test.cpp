#include <pulse/logging.h>

#include <gtest/gtest.h>

#include <iostream>
#include <memory>
#include <sstream>
#include <stdexcept>

namespace {

TEST(LoggingTest, RespectsLogLevelThreshold) {
  std::stringstream stream;
  pulse::StructuredLogger logger(stream, {pulse::LogLevel::kInfo});

  logger.Log(pulse::LogLevel::kDebug, "debug message", {});
  logger.Log(pulse::LogLevel::kInfo, "info message", {});
  logger.Log(pulse::LogLevel::kWarn, "warn message", {});

  const auto output = stream.str();
  EXPECT_EQ(std::string::npos, output.find("debug message"));
  EXPECT_NE(std::string::npos, output.find("level=info"));
  EXPECT_NE(std::string::npos, output.find("info message"));
  EXPECT_NE(std::string::npos, output.find("level=warn"));
}

TEST(LoggingTest, FormatsFieldsAsStructuredPairs) {
  std::stringstream stream;
  pulse::StructuredLogger logger(stream, {pulse::LogLevel::kDebug});

  logger.Log(pulse::LogLevel::kDebug, "pipeline.stage.complete",
             {{"stage", "analyze"}, {"duration_ms", "42"}});

  const auto output = stream.str();
  EXPECT_NE(std::string::npos, output.find("fields={\"stage\": \"analyze\""));
  EXPECT_NE(std::string::npos, output.find("\"duration_ms\": \"42\"}"));
  EXPECT_NE(std::string::npos,
            output.find("message=\"pipeline.stage.complete\""));
  EXPECT_NE(std::string::npos, output.find("component=pulse"));
}

TEST(LoggingTest, EscapesQuotesInFieldValues) {
  std::stringstream stream;
  pulse::StructuredLogger logger(stream, {pulse::LogLevel::kError});

  logger.Log(pulse::LogLevel::kError, "pipeline.stage.failed",
             {{"error", "bad \"value\"\nnext"}});

  EXPECT_NE(std::string::npos,
            stream.str().find("\"error\": \"bad \\\"value\\\"\\nnext\""));
}

TEST(LoggingTest, EnsureLoggerProvidesDefault) {
  auto provided = pulse::EnsureLogger(nullptr);
  EXPECT_NE(nullptr, provided);
  EXPECT_NE(nullptr, std::dynamic_pointer_cast<pulse::NullLogger>(provided));

  auto custom = std::make_shared<pulse::StructuredLogger>(
      std::cout, pulse::LoggingConfig{});
  EXPECT_EQ(custom, pulse::EnsureLogger(custom));
}

TEST(LoggingTest, ParsesLevelNamesCaseInsensitively) {
  EXPECT_EQ(pulse::ParseLogLevel("DEBUG"), pulse::LogLevel::kDebug);
  EXPECT_EQ(pulse::ParseLogLevel("warning"), pulse::LogLevel::kWarn);
  EXPECT_EQ(pulse::ParseLogLevel("Info"), pulse::LogLevel::kInfo);
  EXPECT_THROW(pulse::ParseLogLevel("verbose"), std::invalid_argument);
}

} // namespace
