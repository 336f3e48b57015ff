#include <gtest/gtest.h>
#include "index/MetricIndex.hpp"
#include "parse/TextParser.hpp"

#include <memory>
#include <string>
#include <vector>

using namespace promscope;

class MetricIndexTest : public ::testing::Test {
protected:
  static MetricIndex indexOf(const std::string& text) {
    return MetricIndex(ParseExposition(text));
  }
};

TEST_F(MetricIndexTest, GroupByPrefixDeduplicatesAndKeepsOrder) {
  auto idx = indexOf("node_cpu_seconds_total{cpu=\"0\"} 1\n"
                     "node_cpu_seconds_total{cpu=\"1\"} 2\n"
                     "node_memory_bytes 3\n"
                     "go_gc_duration 4\n");
  auto groups = idx.GroupByPrefix();
  ASSERT_EQ(groups.size(), 2u);
  EXPECT_EQ(groups[0].prefix, "node");
  EXPECT_EQ(groups[0].names, (std::vector<std::string>{"node_cpu_seconds_total", "node_memory_bytes"}));
  EXPECT_EQ(groups[1].prefix, "go");
  EXPECT_EQ(groups[1].names, (std::vector<std::string>{"go_gc_duration"}));
}

TEST_F(MetricIndexTest, PrefixOfNameWithoutUnderscore) {
  EXPECT_EQ(PrefixOf("up"), "up");
  EXPECT_EQ(PrefixOf("node_load1"), "node");
  EXPECT_EQ(PrefixOf("_hidden"), "");
}

TEST_F(MetricIndexTest, SearchMatchesHelpText) {
  auto idx = indexOf("# HELP node_cpu_seconds_total CPU time\n"
                     "node_cpu_seconds_total{cpu=\"0\"} 123.4\n");
  auto hits = idx.Search("cpu");
  ASSERT_EQ(hits.size(), 1u);
  EXPECT_EQ(hits[0].name, "node_cpu_seconds_total");
  EXPECT_EQ(hits[0].help, "CPU time");
  EXPECT_DOUBLE_EQ(hits[0].value, 123.4);

  auto by_help = idx.Search("TIME");
  ASSERT_EQ(by_help.size(), 1u);
  EXPECT_EQ(by_help[0].name, "node_cpu_seconds_total");
}

TEST_F(MetricIndexTest, SearchReportsFirstMatchingSampleOnly) {
  // the first sample of "x" does not match; the second one does via its help
  auto idx = indexOf("# HELP x unrelated\n"
                     "x 1\n"
                     "# HELP x disk usage\n"
                     "x 2\n"
                     "x 3\n");
  auto hits = idx.Search("Disk");
  ASSERT_EQ(hits.size(), 1u);
  EXPECT_EQ(hits[0].help, "disk usage");
  EXPECT_DOUBLE_EQ(hits[0].value, 2.0);
}

TEST_F(MetricIndexTest, EmptySearchTermMatchesEveryName) {
  auto idx = indexOf("a 1\nb 2\na 3\n");
  auto hits = idx.Search("");
  ASSERT_EQ(hits.size(), 2u);
  EXPECT_EQ(hits[0].name, "a");
  EXPECT_DOUBLE_EQ(hits[0].value, 1.0);
  EXPECT_EQ(hits[1].name, "b");
  EXPECT_TRUE(idx.Search("nothing_like_this").empty());
}

TEST_F(MetricIndexTest, DetailsListsEveryValue) {
  auto idx = indexOf("# HELP node_cpu_seconds_total CPU time\n"
                     "# TYPE node_cpu_seconds_total counter\n"
                     "node_cpu_seconds_total{cpu=\"0\"} 1\n"
                     "up 1\n"
                     "node_cpu_seconds_total{cpu=\"1\"} 2\n");
  auto d = idx.Details("node_cpu_seconds_total");
  ASSERT_TRUE(d.meta.has_value());
  EXPECT_EQ(d.meta->type, "counter");
  EXPECT_EQ(d.meta->help, "CPU time");
  ASSERT_EQ(d.values.size(), 2u);
  EXPECT_DOUBLE_EQ(d.values[0].value, 1.0);
  EXPECT_EQ(d.values[0].labels.at("cpu"), "0");
  EXPECT_DOUBLE_EQ(d.values[1].value, 2.0);
  EXPECT_EQ(d.values[1].labels.at("cpu"), "1");
}

TEST_F(MetricIndexTest, DetailsOfUnknownMetricIsEmpty) {
  auto idx = indexOf("up 1\n");
  auto d = idx.Details("missing_metric");
  EXPECT_FALSE(d.meta.has_value());
  EXPECT_TRUE(d.values.empty());
}

TEST_F(MetricIndexTest, NamesAreSortedAndDistinct) {
  auto idx = indexOf("zeta 1\nalpha 2\nzeta 3\n");
  EXPECT_EQ(idx.Names(), (std::vector<std::string>{"alpha", "zeta"}));
}

TEST_F(MetricIndexTest, EmptyOrNullSnapshotYieldsEmptyResults) {
  for (auto snap : {std::shared_ptr<const MetricSnapshot>{}, ParseExposition("")}) {
    MetricIndex idx(snap);
    EXPECT_TRUE(idx.Empty());
    EXPECT_TRUE(idx.GroupByPrefix().empty());
    EXPECT_TRUE(idx.Search("x").empty());
    EXPECT_TRUE(idx.Names().empty());
    auto d = idx.Details("x");
    EXPECT_FALSE(d.meta.has_value());
    EXPECT_TRUE(d.values.empty());
  }
}
