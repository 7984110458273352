#include <gtest/gtest.h>

#include <algorithm>

#include "common/errors.h"
#include "metrics/collector.h"
#include "temp_dir.h"

using namespace Benchkit;
using Benchkit::testing_util::TempDir;

namespace {

constexpr const char* kGoodArtifact = R"(
- iops: 100
  bw: 400
  ctx: {bs: 4k, iodepth: 1, fname: a, timestamp: 1}
- iops: 200
  bw: 800
  ctx: {bs: 4k, iodepth: 4, fname: b, timestamp: 2}
)";

} // namespace

class CollectorTest : public ::testing::Test {
protected:
    MetricsCollector collector_{".py", "_aux/metrics.yml"};
    TempDir dir_;
};

TEST_F(CollectorTest, LoadsArtifactsFromTestcaseDirectories) {
    dir_.Write("session1/seq_read.py/_aux/metrics.yml", kGoodArtifact);
    dir_.Write("session1/nested/rand_write.py/_aux/metrics.yml", R"(
- iops: 5
  ctx: {bs: 8k, iodepth: 2, fname: c, timestamp: 3}
)");

    CollectionResult result = collector_.Collect(dir_.path().string());
    EXPECT_EQ(result.artifacts_read, 2u);
    EXPECT_TRUE(result.warnings.empty());
    ASSERT_EQ(result.records.size(), 3u);

    SortBySource(result.records);
    EXPECT_NE(result.records[0].source.find("nested/rand_write.py"), std::string::npos);
    EXPECT_EQ(*result.records[1].Metric("iops"), 100.0);
    EXPECT_EQ(*result.records[2].Metric("bw"), 800.0);
}

TEST_F(CollectorTest, IgnoresDirectoriesWithoutSuffixOrArtifact) {
    dir_.Write("session1/notes/_aux/metrics.yml", kGoodArtifact);
    dir_.Write("session1/empty.py/_aux/other.yml", kGoodArtifact);
    dir_.Write("session1/metrics.py", "not a directory");

    CollectionResult result = collector_.Collect(dir_.path().string());
    EXPECT_EQ(result.artifacts_read, 0u);
    EXPECT_TRUE(result.records.empty());
    EXPECT_TRUE(result.warnings.empty());
}

TEST_F(CollectorTest, MalformedArtifactsBecomeWarnings) {
    dir_.Write("s/good.py/_aux/metrics.yml", kGoodArtifact);
    dir_.Write("s/broken_yaml.py/_aux/metrics.yml", "- iops: [1, 2\n");
    dir_.Write("s/not_a_list.py/_aux/metrics.yml", "iops: 1\n");
    dir_.Write("s/no_ctx.py/_aux/metrics.yml", "- iops: 1\n");
    dir_.Write("s/no_fname.py/_aux/metrics.yml", "- iops: 1\n  ctx: {timestamp: 1}\n");
    dir_.Write("s/text_metric.py/_aux/metrics.yml",
               "- iops: fast\n  ctx: {fname: a, timestamp: 1}\n");

    CollectionResult result = collector_.Collect(dir_.path().string());
    EXPECT_EQ(result.artifacts_read, 1u);
    EXPECT_EQ(result.records.size(), 2u);
    ASSERT_EQ(result.warnings.size(), 5u);
    for (const auto& warning : result.warnings) {
        EXPECT_FALSE(warning.reason.empty());
        EXPECT_EQ(warning.path.find("good.py"), std::string::npos);
    }
}

TEST_F(CollectorTest, PartiallyBadArtifactContributesNothing) {
    dir_.Write("s/mixed.py/_aux/metrics.yml", R"(
- iops: 1
  ctx: {fname: a, timestamp: 1}
- iops: 2
)");
    CollectionResult result = collector_.Collect(dir_.path().string());
    EXPECT_TRUE(result.records.empty());
    EXPECT_EQ(result.warnings.size(), 1u);
}

TEST_F(CollectorTest, MissingRootIsConfigError) {
    EXPECT_THROW(collector_.Collect((dir_.path() / "absent").string()), ConfigError);
    auto file = dir_.Write("plain.txt", "x");
    EXPECT_THROW(collector_.Collect(file.string()), ConfigError);
}

TEST_F(CollectorTest, CustomSuffixAndArtifact) {
    MetricsCollector collector(".tc", "out/results.yaml");
    dir_.Write("run/a.tc/out/results.yaml", kGoodArtifact);
    dir_.Write("run/b.py/_aux/metrics.yml", kGoodArtifact);

    CollectionResult result = collector.Collect(dir_.path().string());
    EXPECT_EQ(result.artifacts_read, 1u);
    EXPECT_EQ(result.records.size(), 2u);
}

TEST(SortBySourceTest, StableWithinSource) {
    std::vector<MetricRecord> records(4);
    records[0].source = "b";
    records[0].values["n"] = 0;
    records[1].source = "a";
    records[1].values["n"] = 1;
    records[2].source = "b";
    records[2].values["n"] = 2;
    records[3].source = "a";
    records[3].values["n"] = 3;

    SortBySource(records);
    std::vector<double> order;
    for (const auto& r : records) order.push_back(r.values.at("n"));
    EXPECT_EQ(order, (std::vector<double>{1, 3, 0, 2}));
}
