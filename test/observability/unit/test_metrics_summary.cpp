/***
 * Name: test_metrics_summary
 * Purpose: Validate Metrics counters, gauges, timers and hints in the text and JSON summaries.
 */
#include <gtest/gtest.h>
#include "observability/Metrics.h"

using namespace pullup::obs;

TEST(MetricsSummary, CountersAndGaugesInJson) {
  Metrics m;
  m.start("Resolve"); m.stop("Resolve");
  m.incCounter("migrate.fields", 2);
  m.incCounter("migrate.fields");
  m.setCounter("migrate.methods", 1);
  m.setGauge("model.classes", 12);
  EXPECT_EQ(m.counter("migrate.fields"), 3u);
  EXPECT_EQ(m.counter("never.set"), 0u);
  const auto js = m.summaryJson();
  ASSERT_NE(js.find("\"resolve\""), std::string::npos);
  ASSERT_NE(js.find("\"migrate.fields\": 3"), std::string::npos);
  ASSERT_NE(js.find("\"migrate.methods\": 1"), std::string::npos);
  ASSERT_NE(js.find("\"model.classes\": 12"), std::string::npos);
  EXPECT_EQ(js.find("\"hints\""), std::string::npos);
}

TEST(MetricsSummary, HintsFollowCounters) {
  Metrics m;
  m.incCounter("migrate.stubs");
  m.incCounter("migrate.supercalls.removed");
  m.incCounter("migrate.destination_made_abstract");
  m.setGauge("model.classes", 5000);
  const auto hs = m.hints();
  ASSERT_EQ(hs.size(), 4u);
  const auto js = m.summaryJson();
  ASSERT_NE(js.find("stubs_synthesized"), std::string::npos);
  ASSERT_NE(js.find("supercalls_removed"), std::string::npos);
  ASSERT_NE(js.find("destination_made_abstract"), std::string::npos);
  ASSERT_NE(js.find("large_model"), std::string::npos);
}

TEST(MetricsSummary, ScopedTimerRecordsAndResetClears) {
  Metrics m;
  { ScopedTimer t(&m, "execute"); }
  { ScopedTimer none(nullptr, "ignored"); }
  EXPECT_EQ(m.durations().count("execute"), 1u);
  EXPECT_NE(m.summaryText().find("execute:"), std::string::npos);
  m.reset();
  EXPECT_TRUE(m.durations().empty());
  EXPECT_TRUE(m.counters().empty());
}
