#include <gtest/gtest.h>
#include <string>

// Only the obs header: it must bring in the registry on its own.
#include "obs/metrics.h"

using sectorscan::metrics::MetricsRegistry;

TEST(ObsMetricsTest, EmitCounterUpdatesRegistry) {
    long before = MetricsRegistry::Instance().CounterValue("test_obs_counter");
    sectorscan::obs::EmitCounter("test_obs_counter", 3, "count", "test");
    EXPECT_EQ(MetricsRegistry::Instance().CounterValue("test_obs_counter"), before + 3);
    auto text = MetricsRegistry::Instance().ToPrometheus();
    EXPECT_NE(text.find("test_obs_counter"), std::string::npos);
}

TEST(ObsMetricsTest, LabelsKeepSeriesApart) {
    sectorscan::obs::EmitCounter("test_obs_labeled", 2, "count", "test", {{"universe", "sp500"}});
    sectorscan::obs::EmitCounter("test_obs_labeled", 5, "count", "test", {{"universe", "russell2000"}});

    auto& registry = MetricsRegistry::Instance();
    EXPECT_EQ(registry.CounterValue("test_obs_labeled", {{"universe", "sp500"}}), 2);
    EXPECT_EQ(registry.CounterValue("test_obs_labeled", {{"universe", "russell2000"}}), 5);
    EXPECT_EQ(registry.CounterValue("test_obs_labeled"), 0);
    EXPECT_NE(registry.ToPrometheus().find("test_obs_labeled{universe=\"sp500\"} 2"), std::string::npos);
}

TEST(ObsMetricsTest, EmitGaugeOverwrites) {
    sectorscan::obs::EmitGauge("test_obs_gauge", 4.0, "connections", "test");
    sectorscan::obs::EmitGauge("test_obs_gauge", 1.0, "connections", "test");
    auto text = MetricsRegistry::Instance().ToPrometheus();
    EXPECT_NE(text.find("test_obs_gauge 1.0"), std::string::npos);
}

TEST(ObsMetricsTest, EmitHistogramUpdatesRegistry) {
    sectorscan::obs::EmitHistogram("test_obs_latency_ms", 12.5, "ms", "test");
    auto text = MetricsRegistry::Instance().ToPrometheus();
    EXPECT_NE(text.find("test_obs_latency_ms_count"), std::string::npos);
    EXPECT_NE(text.find("test_obs_latency_ms_sum"), std::string::npos);
}
