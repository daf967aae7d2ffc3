// ReportingDelayModel_test.cpp
#include "gtest/gtest.h"
#include "ReportingDelayModel.h"
#include "Exceptions.h"
#include <vector>

using namespace ringpower;

static Ring makeRing() {
    Ring ring;
    ring.id = 3;
    ring.population = 100.0;
    ring.indexReportDelay = 2.0;
    ring.indexReportTime = 2.0;
    ring.implementationDelay = 1.0;
    ring.interventionStart = 3.0;
    ring.interventionEnd = 4.0;
    return ring;
}

static Case makeCase(int64_t id, int generation, double onset) {
    Case c;
    c.id = id;
    c.ringId = 3;
    c.parentId = generation == 0 ? -1 : 0;
    c.generation = generation;
    c.onsetTime = onset;
    return c;
}

TEST(ReportingDelayModel, IndexCaseUsesRingDelay) {
    ReportingConfig config;
    config.beforeIntervention = Distribution::fixed(10.0);
    config.afterIntervention = Distribution::fixed(20.0);
    const ReportingDelayModel model(config);
    RngEngine rng(1);

    std::vector<Case> cases = {makeCase(0, 0, 0.0)};
    model.apply(cases, makeRing(), rng);
    EXPECT_DOUBLE_EQ(cases[0].reportTime, 2.0);
    EXPECT_DOUBLE_EQ(cases[0].sinceIndexReport, 0.0);
}

TEST(ReportingDelayModel, SwitchesDistributionAtInterventionEnd) {
    ReportingConfig config;
    config.beforeIntervention = Distribution::fixed(5.0);
    config.afterIntervention = Distribution::fixed(1.0);
    const ReportingDelayModel model(config);
    RngEngine rng(1);

    std::vector<Case> cases = {makeCase(0, 0, 0.0), makeCase(1, 1, 3.9), makeCase(2, 1, 4.0),
                               makeCase(3, 2, 9.0)};
    model.apply(cases, makeRing(), rng);
    EXPECT_DOUBLE_EQ(cases[1].reportTime, 8.9);
    EXPECT_DOUBLE_EQ(cases[2].reportTime, 5.0);
    EXPECT_DOUBLE_EQ(cases[3].reportTime, 10.0);
    EXPECT_DOUBLE_EQ(cases[3].sinceIndexReport, 8.0);
}

TEST(ReportingDelayModel, DelaysAreNonNegative) {
    const ReportingDelayModel model{ReportingConfig{}};
    const Ring ring = makeRing();
    RngEngine rng(77);
    double before = 0, after = 0;
    const int n = 50'000;
    for (int i = 0; i < n; ++i) {
        const double d1 = model.sampleDelay(makeCase(1, 1, 0.5), ring, rng);
        const double d2 = model.sampleDelay(makeCase(1, 1, 6.0), ring, rng);
        ASSERT_GE(d1, 0.0);
        ASSERT_GE(d2, 0.0);
        before += d1;
        after += d2;
    }
    EXPECT_NEAR(before / n, 4.0, 0.05);
    EXPECT_NEAR(after / n, 1.5, 0.03);
}

TEST(ReportingDelayModel, RejectsNegativeDelays) {
    ReportingConfig config;
    config.afterIntervention = Distribution::uniform(-1.0, 1.0);
    EXPECT_THROW(ReportingDelayModel{config}, ConfigurationError);
    config = ReportingConfig{};
    config.beforeIntervention = Distribution::gamma(-1.0, 1.0);
    EXPECT_THROW(ReportingDelayModel{config}, ConfigurationError);
}
