#include <gtest/gtest.h>

#include <cstdlib>

#include "common/configuration.h"
#include "common/errors.h"
#include "temp_dir.h"

using namespace Benchkit;
using Benchkit::testing_util::TempDir;

class ConfigurationTest : public ::testing::Test {
protected:
    void SetUp() override {
        ::unsetenv("BENCHKIT_EXECUTOR");
        ::unsetenv("BENCHKIT_PLOT_WIDTH");
        ::unsetenv("BENCHKIT_METRICS_ARTIFACT");
        Configuration::getInstance().reset();
    }

    void TearDown() override {
        ::unsetenv("BENCHKIT_EXECUTOR");
        ::unsetenv("BENCHKIT_PLOT_WIDTH");
        ::unsetenv("BENCHKIT_METRICS_ARTIFACT");
        Configuration::getInstance().reset();
    }

    Configuration& config_ = Configuration::getInstance();
};

TEST_F(ConfigurationTest, Defaults) {
    EXPECT_TRUE(config_.validate());
    EXPECT_EQ(GetConfig().session.executor.get(), "benchkit-exec");
    EXPECT_EQ(GetConfig().reporting.testcase_suffix.get(), ".py");
    EXPECT_EQ(GetConfig().reporting.artifact.get(), "_aux/metrics.yml");
    EXPECT_EQ(GetConfig().reporting.width.get(), 1200);
    EXPECT_FALSE(GetConfig().session.lock_dir.get().empty());
}

TEST_F(ConfigurationTest, LoadFromString) {
    ASSERT_TRUE(config_.loadFromString(R"(
benchkit:
  session:
    lock_dir: /var/lock/benchkit
    executor: /opt/engine/run
  reporting:
    testcase_suffix: .tc
    height: 600
)"));
    EXPECT_EQ(GetConfig().session.lock_dir.get(), "/var/lock/benchkit");
    EXPECT_EQ(GetConfig().session.executor.get(), "/opt/engine/run");
    EXPECT_EQ(GetConfig().reporting.testcase_suffix.get(), ".tc");
    EXPECT_EQ(GetConfig().reporting.height.get(), 600);
    EXPECT_EQ(GetConfig().reporting.width.get(), 1200);
}

TEST_F(ConfigurationTest, LoadFromFile) {
    TempDir dir;
    auto path = dir.Write("benchkit.yaml", "benchkit:\n  reporting:\n    gnuplot: /usr/local/bin/gnuplot\n");
    ASSERT_TRUE(config_.loadFromFile(path.string()));
    EXPECT_EQ(GetConfig().reporting.gnuplot.get(), "/usr/local/bin/gnuplot");

    EXPECT_FALSE(config_.loadFromFile((dir.path() / "absent.yaml").string()));
}

TEST_F(ConfigurationTest, EnvironmentOverridesDefault) {
    ::setenv("BENCHKIT_EXECUTOR", "/usr/bin/engine", 1);
    ::setenv("BENCHKIT_PLOT_WIDTH", "640", 1);
    EXPECT_EQ(GetConfig().session.executor.get(), "/usr/bin/engine");
    EXPECT_EQ(GetConfig().reporting.width.get(), 640);

    ::setenv("BENCHKIT_PLOT_WIDTH", "wide", 1);
    EXPECT_EQ(GetConfig().reporting.width.get(), 1200);
}

TEST_F(ConfigurationTest, ExplicitValueBeatsEnvironment) {
    ::setenv("BENCHKIT_EXECUTOR", "/usr/bin/engine", 1);
    ASSERT_TRUE(config_.loadFromString("benchkit:\n  session:\n    executor: from-file\n"));
    EXPECT_EQ(GetConfig().session.executor.get(), "from-file");

    config_.config().session.executor.set("from-cli");
    EXPECT_EQ(GetConfig().session.executor.get(), "from-cli");
}

TEST_F(ConfigurationTest, ValidationErrors) {
    EXPECT_FALSE(config_.loadFromString(R"(
benchkit:
  reporting:
    artifact: /abs/metrics.yml
    width: 10
)"));
    EXPECT_EQ(config_.getValidationErrors().size(), 2u);
}

TEST_F(ConfigurationTest, MalformedYamlIsRejected) {
    EXPECT_FALSE(config_.loadFromString("benchkit: [unclosed"));
    EXPECT_FALSE(config_.loadFromString("benchkit:\n  reporting:\n    width: wide\n"));
}

TEST_F(ConfigurationTest, ResetRestoresDefaults) {
    config_.config().reporting.testcase_suffix.set(".tc");
    config_.reset();
    EXPECT_EQ(GetConfig().reporting.testcase_suffix.get(), ".py");
}

TEST_F(ConfigurationTest, EnvironmentOverridesAreValidatedWithoutFile) {
    EXPECT_NO_THROW(config_.ensureValid());

    ::setenv("BENCHKIT_PLOT_WIDTH", "0", 1);
    ::setenv("BENCHKIT_METRICS_ARTIFACT", "/abs/metrics.yml", 1);
    try {
        config_.ensureValid();
        FAIL() << "expected ConfigError";
    } catch (const ConfigError& e) {
        const std::string what = e.what();
        EXPECT_NE(what.find("Plot size"), std::string::npos);
        EXPECT_NE(what.find("relative path"), std::string::npos);
    }
    EXPECT_EQ(config_.getValidationErrors().size(), 2u);
}
