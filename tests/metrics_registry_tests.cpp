#include <gtest/gtest.h>
#include "utilities/metrics.h"

/**
 * @brief Verify correct formatting of label strings in Prometheus format.
 */
TEST(MetricsRegistry, LabelsToString) {
    MetricsRegistry::Labels labels{{"result","hit"},{"index","IdIndex"}};
    // Map iteration is ordered, so "index" should come before "result".
    EXPECT_EQ(MetricsRegistry::labelsToString(labels), "{index=\"IdIndex\",result=\"hit\"}");
    EXPECT_EQ(MetricsRegistry::labelsToString({}), "");
}

/**
 * @brief Validate gauge, counter and histogram reporting.
 */
TEST(MetricsRegistry, BasicRecording) {
    auto& metrics = MetricsRegistry::instance();
    metrics.reset();
    metrics.setGauge("sharedidx_loaded_chunks", 4);
    metrics.addToGauge("sharedidx_loaded_chunks", -1);
    metrics.incrementCounter("sharedidx_content_hash_lookups_total", 2, {{"result","hit"}});
    metrics.incrementCounter("sharedidx_content_hash_lookups_total", 1, {{"result","miss"}});
    metrics.observe("sharedidx_chunk_download_ms", 12);
    metrics.observe("sharedidx_chunk_download_ms", 30);

    EXPECT_DOUBLE_EQ(metrics.gauge("sharedidx_loaded_chunks"), 3);
    EXPECT_DOUBLE_EQ(metrics.counter("sharedidx_content_hash_lookups_total", {{"result","hit"}}), 2);
    EXPECT_EQ(metrics.observationCount("sharedidx_chunk_download_ms"), 2u);

    std::string text = metrics.toPrometheus();
    EXPECT_NE(text.find("# TYPE sharedidx_loaded_chunks gauge"), std::string::npos);
    EXPECT_NE(text.find("sharedidx_loaded_chunks 3"), std::string::npos);
    EXPECT_NE(text.find("sharedidx_content_hash_lookups_total{result=\"miss\"} 1"), std::string::npos);
    EXPECT_NE(text.find("sharedidx_chunk_download_ms_sum 42"), std::string::npos);
    EXPECT_NE(text.find("sharedidx_chunk_download_ms_count 2"), std::string::npos);

    metrics.reset();
    EXPECT_TRUE(metrics.toPrometheus().empty());
    EXPECT_DOUBLE_EQ(metrics.counter("sharedidx_content_hash_lookups_total", {{"result","hit"}}), 0);
}
