#include <gtest/gtest.h>
#include "aed/shape/shape.hpp"
#include "test_utils_shape.hpp"

using namespace aed::shape;

TEST(TopN, RanksByMeanDescending) {
  auto M = testshape::matrix({{0.1f, 0.9f, 0.5f}, {0.3f, 0.7f, 0.5f}}, 0.48, {"Dog", "Speech", "Music"});
  auto t = top_n(M, 3);
  ASSERT_EQ(t.ranked.size(), 3u);
  EXPECT_EQ(t.ranked[0].label, "Speech");
  EXPECT_FLOAT_EQ(t.ranked[0].probability, 0.8f);
  EXPECT_EQ(t.ranked[0].label_index, 1);
  EXPECT_EQ(t.ranked[1].label, "Music");
  EXPECT_EQ(t.ranked[2].label, "Dog");
  EXPECT_FLOAT_EQ(t.ranked[2].probability, 0.2f);
}

TEST(TopN, MaxAggregationFavoursTransients) {
  // A single loud clap against sustained speech.
  auto M = testshape::matrix({{0.95f, 0.6f}, {0.0f, 0.6f}, {0.0f, 0.6f}}, 0.48, {"Clap", "Speech"});
  EXPECT_EQ(top_n(M, 1, Aggregation::Mean).ranked[0].label, "Speech");
  EXPECT_EQ(top_n(M, 1, Aggregation::Max).ranked[0].label, "Clap");
}

TEST(TopN, TiesKeepLabelOrder) {
  auto M = testshape::matrix({{0.5f, 0.7f, 0.5f, 0.5f}});
  auto t = top_n(M, 4);
  ASSERT_EQ(t.ranked.size(), 4u);
  EXPECT_EQ(t.ranked[0].label_index, 1);
  EXPECT_EQ(t.ranked[1].label_index, 0);
  EXPECT_EQ(t.ranked[2].label_index, 2);
  EXPECT_EQ(t.ranked[3].label_index, 3);
}

TEST(TopN, MonotonicInN) {
  auto M = testshape::random_matrix(40, 30);
  for (size_t n = 0; n < 31; ++n) {
    auto a = top_n(M, n);
    auto b = top_n(M, n + 1);
    ASSERT_EQ(a.ranked.size(), n);
    ASSERT_EQ(b.ranked.size(), std::min<size_t>(n + 1, 30));
    for (size_t i = 0; i < a.ranked.size(); ++i) {
      ASSERT_EQ(a.ranked[i].label_index, b.ranked[i].label_index) << "n=" << n;
      ASSERT_EQ(a.ranked[i].probability, b.ranked[i].probability);
    }
  }
}

TEST(TopN, LargeNReturnsAllLabels) {
  auto M = testshape::random_matrix(5, 6);
  EXPECT_EQ(top_n(M, 100).ranked.size(), 6u);
}

TEST(TopN, EmptyMatrix) {
  auto M = testshape::matrix({}, 0.48, {"a", "b"});
  EXPECT_TRUE(top_n(M, 5).ranked.empty());
}
