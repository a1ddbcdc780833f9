#include <string>
#include <vector>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include "courier/observability.hpp"

TEST(ObservabilityTest, WritesOneJsonObjectPerLine) {
  courier::Observability observability(courier::LogLevel::kDebug);
  std::vector<std::string> lines;
  observability.SetSink([&lines](const std::string& line) { lines.push_back(line); });

  observability.Log(courier::LogContext{"t-1", std::string("alice"), std::string("c1"), "router.message_accepted", 3,
                                        courier::LogLevel::kInfo, "sequence 1"});
  ASSERT_EQ(lines.size(), 1u);
  auto j = nlohmann::json::parse(lines[0]);
  EXPECT_EQ(j["level"], "info");
  EXPECT_EQ(j["traceId"], "t-1");
  EXPECT_EQ(j["eventName"], "router.message_accepted");
  EXPECT_EQ(j["latencyMs"], 3);
  EXPECT_EQ(j["userId"], "alice");
  EXPECT_EQ(j["conversationId"], "c1");
  EXPECT_EQ(j["detail"], "sequence 1");
}

TEST(ObservabilityTest, FiltersBelowMinimumLevel) {
  courier::Observability observability(courier::LogLevel::kWarn);
  std::vector<std::string> lines;
  observability.SetSink([&lines](const std::string& line) { lines.push_back(line); });

  observability.Log(courier::LogContext{"", std::nullopt, std::nullopt, "debug.event", 0, courier::LogLevel::kDebug, ""});
  observability.Log(courier::LogContext{"", std::nullopt, std::nullopt, "info.event", 0, courier::LogLevel::kInfo, ""});
  observability.Log(courier::LogContext{"", std::nullopt, std::nullopt, "error.event", 0, courier::LogLevel::kError, ""});
  ASSERT_EQ(lines.size(), 1u);
  auto j = nlohmann::json::parse(lines[0]);
  EXPECT_EQ(j["eventName"], "error.event");
  EXPECT_FALSE(j.contains("userId"));
}

TEST(ObservabilityTest, CountersAccumulate) {
  courier::Observability observability;
  observability.IncrementRequest();
  observability.IncrementRequest();
  observability.IncrementError();
  observability.IncrementMessageAccepted();
  observability.IncrementDispatchDropped();
  observability.SetConnectionsActive(5);

  auto snapshot = observability.Snapshot();
  EXPECT_EQ(snapshot.request_total, 2u);
  EXPECT_EQ(snapshot.request_errors, 1u);
  EXPECT_EQ(snapshot.messages_accepted, 1u);
  EXPECT_EQ(snapshot.dispatch_dropped, 1u);
  EXPECT_EQ(snapshot.connections_active, 5u);
}

TEST(ObservabilityTest, ParsesLogLevelNames) {
  EXPECT_EQ(courier::ParseLogLevel("debug"), courier::LogLevel::kDebug);
  EXPECT_EQ(courier::ParseLogLevel("warn"), courier::LogLevel::kWarn);
  EXPECT_EQ(courier::ParseLogLevel("error"), courier::LogLevel::kError);
  EXPECT_EQ(courier::ParseLogLevel("verbose"), courier::LogLevel::kInfo);
}

TEST(ObservabilityTest, TraceIdsAreDistinct) {
  courier::Observability observability;
  EXPECT_NE(observability.NextTraceId(), observability.NextTraceId());
}
