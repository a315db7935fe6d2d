#include "metrics.hpp"
#include "markers.hpp"
#include "text_stego.hpp"
#include <gtest/gtest.h>
#include <string>

TEST(MetricsTest, BERIdentical) {
    EXPECT_DOUBLE_EQ(metrics::computeBER("abc", "abc"), 0.0);
    EXPECT_DOUBLE_EQ(metrics::computeBER("", ""), 0.0);
}

TEST(MetricsTest, BERCountsFlippedBits) {
    // 'a' = 0x61, 'b' = 0x62 -> 2 bits differ
    EXPECT_DOUBLE_EQ(metrics::computeBER("a", "b"), 2.0 / 8.0);
    EXPECT_DOUBLE_EQ(metrics::computeBER("\xFF", std::string(1, '\0')), 1.0);
}

TEST(MetricsTest, BERMissingBytesAreErrors) {
    EXPECT_DOUBLE_EQ(metrics::computeBER("ab", "a"), 0.5);
    EXPECT_DOUBLE_EQ(metrics::computeBER("", "abcd"), 1.0);
}

TEST(MetricsTest, CountMarkers) {
    EXPECT_EQ(metrics::countMarkers("Hello world"), 0u);
    EXPECT_EQ(metrics::countMarkers(zwstego::embedText("Hello world", "hi")), 16u);
    EXPECT_EQ(metrics::countMarkers(zwstego::markerOne() + "x" + zwstego::markerZero()), 2u);
}

TEST(MetricsTest, StatsMatchEmbeddedText) {
    std::string cover = "Hello world";
    std::string secret = "hi";
    metrics::EmbeddingStats s = metrics::computeStats(cover, secret);

    EXPECT_EQ(s.coverBytes, 11u);
    EXPECT_EQ(s.secretBytes, 2u);
    EXPECT_EQ(s.markerCount, 16u);
    EXPECT_EQ(s.hiddenBytes, 16u * zwstego::MARKER_SIZE);
    EXPECT_EQ(s.combinedBytes, zwstego::embedText(cover, secret).size());
    EXPECT_DOUBLE_EQ(s.expansion, (11.0 + 48.0) / 11.0);
}

TEST(MetricsTest, StatsEmptyCover) {
    metrics::EmbeddingStats s = metrics::computeStats("", "abc");
    EXPECT_EQ(s.markerCount, 24u);
    EXPECT_EQ(s.combinedBytes, s.hiddenBytes);
    EXPECT_DOUBLE_EQ(s.expansion, 0.0);
}
