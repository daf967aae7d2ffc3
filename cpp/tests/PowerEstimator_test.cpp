// PowerEstimator_test.cpp
#include "gtest/gtest.h"
#include "PowerEstimator.h"
#include "Exceptions.h"
#include "Logger.h"
#include "SyntheticSummaries.h"
#include <memory>

using namespace ringpower;
using fixtures::SyntheticTruth;
using fixtures::syntheticSummaries;

static ReplicateResult row(FitStatus status, double pSlope) {
    ReplicateResult r;
    r.status = status;
    r.pSlope = pSlope;
    return r;
}

TEST(PowerEstimator, ClopperPearsonKnownValues) {
    auto ci = PowerEstimator::clopperPearson(5, 10, 0.95);
    EXPECT_NEAR(ci.first, 0.187086, 1e-5);
    EXPECT_NEAR(ci.second, 0.812914, 1e-5);

    ci = PowerEstimator::clopperPearson(0, 10, 0.95);
    EXPECT_DOUBLE_EQ(ci.first, 0.0);
    EXPECT_NEAR(ci.second, 0.308497, 1e-5);

    ci = PowerEstimator::clopperPearson(10, 10, 0.95);
    EXPECT_NEAR(ci.first, 0.691503, 1e-5);
    EXPECT_DOUBLE_EQ(ci.second, 1.0);

    ci = PowerEstimator::clopperPearson(0, 0, 0.95);
    EXPECT_DOUBLE_EQ(ci.first, 0.0);
    EXPECT_DOUBLE_EQ(ci.second, 1.0);
}

TEST(PowerEstimator, AggregateExcludesFailedFits) {
    const std::vector<ReplicateResult> rows = {
        row(FitStatus::CONVERGED, 0.01), row(FitStatus::CONVERGED, 0.20), row(FitStatus::NOT_CONVERGED, 0.001),
        row(FitStatus::DEGENERATE, 1.0), row(FitStatus::CONVERGED, 0.049)};
    const PowerEstimate estimate = PowerEstimator::aggregate(75, rows, 0.05, 0.95);
    EXPECT_EQ(estimate.sampleSize, 75);
    EXPECT_EQ(estimate.replicates, 5);
    EXPECT_EQ(estimate.usable, 3);
    EXPECT_EQ(estimate.failed, 2);
    EXPECT_EQ(estimate.significant, 2);
    EXPECT_DOUBLE_EQ(estimate.power, 2.0 / 3.0);
    EXPECT_LT(estimate.ciLower, estimate.power);
    EXPECT_GT(estimate.ciUpper, estimate.power);
}

TEST(PowerEstimator, AggregateWithNoUsableReplicate) {
    const std::vector<ReplicateResult> rows = {row(FitStatus::DEGENERATE, 1.0), row(FitStatus::NOT_CONVERGED, 0.0)};
    const PowerEstimate estimate = PowerEstimator::aggregate(50, rows, 0.05, 0.95);
    EXPECT_EQ(estimate.usable, 0);
    EXPECT_EQ(estimate.failed, 2);
    EXPECT_DOUBLE_EQ(estimate.power, 0.0);
    EXPECT_DOUBLE_EQ(estimate.ciLower, 0.0);
    EXPECT_DOUBLE_EQ(estimate.ciUpper, 1.0);
}

TEST(PowerEstimator, UnavailableSizeCountsEveryReplicateAsFailed) {
    const PowerEstimate estimate = PowerEstimator::unavailable(150, 40);
    EXPECT_EQ(estimate.sampleSize, 150);
    EXPECT_EQ(estimate.replicates, 40);
    EXPECT_EQ(estimate.usable, 0);
    EXPECT_EQ(estimate.significant, 0);
    EXPECT_EQ(estimate.failed, 40);
    EXPECT_DOUBLE_EQ(estimate.power, 0.0);
    EXPECT_DOUBLE_EQ(estimate.ciLower, 0.0);
    EXPECT_DOUBLE_EQ(estimate.ciUpper, 1.0);
}

class PowerSweepTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::getInstance().setLevel(LogLevel::WARNING);
        summaries_ = std::make_shared<const std::vector<RingSummary>>(syntheticSummaries(3000, SyntheticTruth{}, 99));
    }

    void TearDown() override {
        Logger::getInstance().setLevel(LogLevel::INFO);
    }

    std::shared_ptr<const std::vector<RingSummary>> summaries_;
};

TEST_F(PowerSweepTest, PowerGrowsWithSampleSize) {
    const PilotStudyEstimator pilot(summaries_);
    PowerConfig config;
    config.sampleSizes = {50, 75, 100, 125, 150};
    config.numReplicates = 200;
    const PowerEstimator estimator(pilot, config, 31, 4);

    std::vector<ReplicateResult> rows;
    const auto estimates = estimator.sweep(&rows);
    ASSERT_EQ(estimates.size(), 5u);
    EXPECT_EQ(rows.size(), 5u * 200u);

    for (size_t i = 0; i < estimates.size(); ++i) {
        const auto& e = estimates[i];
        EXPECT_EQ(e.sampleSize, config.sampleSizes[i]);
        EXPECT_EQ(e.replicates, 200);
        EXPECT_EQ(e.usable + e.failed, e.replicates);
        EXPECT_GE(e.power, 0.0);
        EXPECT_LE(e.power, 1.0);
        EXPECT_LE(e.ciLower, e.power);
        EXPECT_GE(e.ciUpper, e.power);
        EXPECT_GE(e.usable, 150);
        // Monte Carlo noise of 200 replicates is a few percentage points
        if (i > 0) EXPECT_GT(e.power, estimates[i - 1].power - 0.1) << "n=" << e.sampleSize;
    }
    EXPECT_GT(estimates.back().power, estimates.front().power + 0.15);

    for (size_t i = 0; i < rows.size(); ++i) {
        EXPECT_EQ(rows[i].sampleSize, config.sampleSizes[i / 200]);
        EXPECT_EQ(rows[i].replicate, static_cast<int64_t>(i % 200));
    }
}

TEST_F(PowerSweepTest, IndependentOfWorkerCount) {
    const PilotStudyEstimator pilot(summaries_);
    PowerConfig config;
    config.numReplicates = 40;
    const PowerEstimator serial(pilot, config, 5, 1);
    const PowerEstimator threaded(pilot, config, 5, 3, 2);

    const auto a = serial.replicate(60, 40);
    const auto b = threaded.replicate(60, 40);
    ASSERT_EQ(a.size(), b.size());
    for (size_t i = 0; i < a.size(); ++i) {
        EXPECT_EQ(a[i].status, b[i].status);
        EXPECT_EQ(a[i].slope, b[i].slope);
        EXPECT_EQ(a[i].pSlope, b[i].pSlope);
    }
}

TEST_F(PowerSweepTest, RejectsOversizedSampleBeforeRunning) {
    const auto small = std::make_shared<const std::vector<RingSummary>>(summaries_->begin(), summaries_->begin() + 100);
    const PilotStudyEstimator pilot(small);
    PowerConfig config;
    config.sampleSizes = {50, 150};
    config.numReplicates = 5;
    const PowerEstimator estimator(pilot, config, 1);

    std::vector<ReplicateResult> rows;
    EXPECT_THROW(estimator.sweep(&rows), ConfigurationError);
    EXPECT_TRUE(rows.empty());
    EXPECT_THROW(estimator.estimatePower(0, 5), ConfigurationError);
    EXPECT_THROW(estimator.replicate(50, 0), ConfigurationError);
}

TEST(PowerEstimator, RejectsInvalidConfig) {
    PowerConfig config;
    config.sampleSizes.clear();
    EXPECT_THROW(config.validate(), ConfigurationError);
    config = PowerConfig{};
    config.alpha = 0.0;
    EXPECT_THROW(config.validate(), ConfigurationError);
    config = PowerConfig{};
    config.numReplicates = 0;
    EXPECT_THROW(config.validate(), ConfigurationError);
    config = PowerConfig{};
    config.sampleSizes = {50, -1};
    EXPECT_THROW(config.validate(), ConfigurationError);
}
