// Pipeline_test.cpp
#include "gtest/gtest.h"
#include "Pipeline.h"
#include "Exceptions.h"
#include "Logger.h"
#include <cstring>
#include <sstream>

using namespace ringpower;

static StudyConfig smallStudy() {
    StudyConfig config = StudyConfig::defaults();
    config.logLevel = "warning";
    config.rings.numRings = 600;
    config.power.sampleSizes = {50, 100};
    config.power.numReplicates = 20;
    return config;
}

// exact comparison of every field, as the rows would be written out
template <typename Row>
static bool sameBytes(const std::vector<Row>& a, const std::vector<Row>& b, bool (*eq)(const Row&, const Row&)) {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); ++i)
        if (!eq(a[i], b[i])) return false;
    return true;
}

static bool sameCase(const Case& x, const Case& y) {
    return x.id == y.id && x.ringId == y.ringId && x.parentId == y.parentId && x.generation == y.generation &&
        std::memcmp(&x.onsetTime, &y.onsetTime, sizeof(double)) == 0 &&
        std::memcmp(&x.reportTime, &y.reportTime, sizeof(double)) == 0 &&
        std::memcmp(&x.sinceIndexReport, &y.sinceIndexReport, sizeof(double)) == 0;
}

static bool sameSummary(const RingSummary& x, const RingSummary& y) {
    return x.ringId == y.ringId && x.caseCount == y.caseCount && x.lastReport == y.lastReport &&
        x.population == y.population && x.interventionDelay == y.interventionDelay &&
        x.delayBucket == y.delayBucket && x.surveillanceCategory == y.surveillanceCategory &&
        x.heterogeneity == y.heterogeneity;
}

static bool samePower(const PowerEstimate& x, const PowerEstimate& y) {
    return x.sampleSize == y.sampleSize && x.usable == y.usable && x.significant == y.significant &&
        x.failed == y.failed && x.power == y.power && x.ciLower == y.ciLower && x.ciUpper == y.ciUpper;
}

TEST(Pipeline, SameSeedSameTables) {
    const StudyTables a = Pipeline(smallStudy()).run();

    StudyConfig threaded = smallStudy();
    threaded.maxWorkers = 4;
    const StudyTables b = Pipeline(threaded).run();

    EXPECT_TRUE(sameBytes(a.cases, b.cases, &sameCase));
    EXPECT_TRUE(sameBytes(a.summaries, b.summaries, &sameSummary));
    EXPECT_TRUE(sameBytes(a.power, b.power, &samePower));
    EXPECT_EQ(a.cappedRings, b.cappedRings);
    EXPECT_EQ(a.replicates.size(), 2u * 20u);
}

TEST(Pipeline, DifferentSeedDifferentTables) {
    StudyConfig other = smallStudy();
    other.seed += 1;
    const StudyTables a = Pipeline(smallStudy()).run();
    const StudyTables b = Pipeline(other).run();
    EXPECT_FALSE(sameBytes(a.cases, b.cases, &sameCase));
}

TEST(Pipeline, TablesAreConsistent) {
    const StudyTables tables = Pipeline(smallStudy()).run();
    ASSERT_EQ(static_cast<int64_t>(tables.summaries.size()) + tables.cappedRings, 600);
    int64_t total = 0;
    for (const auto& s : tables.summaries) {
        EXPECT_GE(s.caseCount, 1);
        EXPECT_GE(s.lastReport, 0.0);
        EXPECT_LE(s.lastReport, 28.0);
        total += s.caseCount;
    }
    EXPECT_EQ(total, static_cast<int64_t>(tables.cases.size()));
    ASSERT_EQ(tables.power.size(), 2u);
    for (const auto& p : tables.power) {
        EXPECT_GE(p.power, 0.0);
        EXPECT_LE(p.power, 1.0);
    }
}

TEST(Pipeline, SizeBeyondUncappedRingsIsReportedNotFatal) {
    StudyConfig config = smallStudy();
    config.rings.numRings = 200;
    config.chain.maxCases = 20;
    config.power.sampleSizes = {20, 200};
    config.power.numReplicates = 5;

    std::ostringstream log;
    Logger::getInstance().setStream(log);
    Logger::getInstance().setLevel(LogLevel::ERROR);
    StudyTables tables;
    EXPECT_NO_THROW(tables = Pipeline(config).run());
    Logger::getInstance().setStream(std::clog);
    Logger::getInstance().setLevel(LogLevel::INFO);

    ASSERT_GT(tables.cappedRings, 0);
    ASSERT_GE(tables.summaries.size(), 20u);
    ASSERT_EQ(tables.power.size(), 2u);

    const PowerEstimate& feasible = tables.power[0];
    EXPECT_EQ(feasible.sampleSize, 20);
    EXPECT_EQ(feasible.replicates, 5);
    EXPECT_EQ(feasible.usable + feasible.failed, 5);
    EXPECT_EQ(tables.replicates.size(), 5u);

    const PowerEstimate& missing = tables.power[1];
    EXPECT_EQ(missing.sampleSize, 200);
    EXPECT_EQ(missing.replicates, 5);
    EXPECT_EQ(missing.usable, 0);
    EXPECT_EQ(missing.failed, 5);
    EXPECT_DOUBLE_EQ(missing.power, 0.0);
    EXPECT_DOUBLE_EQ(missing.ciLower, 0.0);
    EXPECT_DOUBLE_EQ(missing.ciUpper, 1.0);
    EXPECT_NE(log.str().find("[ERROR] [Pipeline] sample size 200"), std::string::npos) << log.str();
}

TEST(Pipeline, LeavesLoggerLevelAlone) {
    Logger::getInstance().setLevel(LogLevel::ERROR);
    StudyConfig config = smallStudy();
    config.logLevel = "debug";
    const Pipeline pipeline(config);
    EXPECT_EQ(Logger::getInstance().level(), LogLevel::ERROR);
    Logger::getInstance().setLevel(LogLevel::INFO);
}

TEST(Pipeline, RejectsInvalidConfig) {
    StudyConfig config = smallStudy();
    config.power.sampleSizes = {50, 601};
    EXPECT_THROW(Pipeline{config}, ConfigurationError);

    config = smallStudy();
    config.logLevel = "verbose";
    EXPECT_THROW(Pipeline{config}, ConfigurationError);

    config = smallStudy();
    config.maxWorkers = 0;
    EXPECT_THROW(Pipeline{config}, ConfigurationError);

    config = smallStudy();
    config.schedule.vaccineDelay = 1.0;
    EXPECT_THROW(config.validate(), ConfigurationError);
}

TEST(StudyConfig, DefaultsAreValid) {
    const StudyConfig config = StudyConfig::defaults();
    EXPECT_NO_THROW(config.validate());
    EXPECT_EQ(config.rings.numRings, 10'000);
    EXPECT_DOUBLE_EQ(config.chain.meanOffspring, 2.0);
    EXPECT_DOUBLE_EQ(config.chain.dispersion, 1.5);
    EXPECT_GT(config.schedule.effects.washAndAntibiotic, 0.0);
    EXPECT_LT(config.schedule.effects.washPlusVaccine, config.schedule.effects.washOnly);
}
