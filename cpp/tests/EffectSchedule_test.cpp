// EffectSchedule_test.cpp
#include "gtest/gtest.h"
#include "EffectSchedule.h"
#include "Exceptions.h"
#include <cmath>
#include <limits>

using namespace ringpower;

static EffectScheduleConfig makeConfig() {
    EffectScheduleConfig config;
    config.washOnlyDelay = 3.0;
    config.vaccineDelay = 7.0;
    config.effects.washAndAntibiotic = 0.25;
    config.effects.washOnly = 0.5;
    config.effects.washPlusVaccine = 0.1;
    return config;
}

TEST(EffectSchedule, PhasesAreRightClosed) {
    const EffectSchedule schedule(makeConfig(), 10.0);
    using Phase = EffectSchedule::Phase;

    EXPECT_EQ(schedule.phaseAt(-5.0), Phase::NO_EFFECT);
    EXPECT_EQ(schedule.phaseAt(10.0), Phase::NO_EFFECT);
    EXPECT_EQ(schedule.phaseAt(std::nextafter(10.0, 11.0)), Phase::WASH_AND_ANTIBIOTIC);
    EXPECT_EQ(schedule.phaseAt(13.0), Phase::WASH_AND_ANTIBIOTIC);
    EXPECT_EQ(schedule.phaseAt(std::nextafter(13.0, 14.0)), Phase::WASH_ONLY);
    EXPECT_EQ(schedule.phaseAt(17.0), Phase::WASH_ONLY);
    EXPECT_EQ(schedule.phaseAt(std::nextafter(17.0, 18.0)), Phase::WASH_PLUS_VACCINE);
    EXPECT_EQ(schedule.phaseAt(1e6), Phase::WASH_PLUS_VACCINE);
}

TEST(EffectSchedule, MultiplierFollowsPhase) {
    const EffectSchedule schedule(makeConfig(), 10.0);
    EXPECT_DOUBLE_EQ(schedule.multiplier(0.0), 1.0);
    EXPECT_DOUBLE_EQ(schedule.multiplier(10.0), 1.0);
    EXPECT_DOUBLE_EQ(schedule.multiplier(11.0), 0.25);
    EXPECT_DOUBLE_EQ(schedule.multiplier(15.0), 0.5);
    EXPECT_DOUBLE_EQ(schedule.multiplier(20.0), 0.1);
}

TEST(EffectSchedule, EveryTimeMapsToOnePhaseMultiplier) {
    const EffectSchedule schedule(makeConfig(), 10.0);
    for (double t = -20.0; t <= 40.0; t += 0.125) {
        const double x = schedule.multiplier(t);
        const bool known = x == 1.0 || x == 0.25 || x == 0.5 || x == 0.1;
        EXPECT_TRUE(known) << "t=" << t << " x=" << x;
    }
    EXPECT_DOUBLE_EQ(schedule.multiplier(-std::numeric_limits<double>::infinity()), 1.0);
    EXPECT_DOUBLE_EQ(schedule.multiplier(std::numeric_limits<double>::infinity()), 0.1);
}

TEST(EffectSchedule, EqualDelaysSkipWashOnlyPhase) {
    EffectScheduleConfig config = makeConfig();
    config.vaccineDelay = config.washOnlyDelay;
    const EffectSchedule schedule(config, 0.0);
    EXPECT_EQ(schedule.phaseAt(3.0), EffectSchedule::Phase::WASH_AND_ANTIBIOTIC);
    EXPECT_EQ(schedule.phaseAt(3.5), EffectSchedule::Phase::WASH_PLUS_VACCINE);
}

TEST(EffectSchedule, ApplyRoundsSusceptibles) {
    const EffectSchedule schedule(makeConfig(), 0.0);
    const OffspringParams params{2.0, 1.5, 7};

    const OffspringParams before = schedule.apply(params, -1.0);
    EXPECT_EQ(before.susceptible, 7);
    EXPECT_DOUBLE_EQ(before.meanOffspring, 2.0);
    EXPECT_DOUBLE_EQ(before.dispersion, 1.5);

    EXPECT_EQ(schedule.apply(params, 1.0).susceptible, 2);   // 7 × 0.25 = 1.75
    EXPECT_EQ(schedule.apply(params, 5.0).susceptible, 4);   // 7 × 0.5 = 3.5, half away from zero
    EXPECT_EQ(schedule.apply(params, 9.0).susceptible, 1);   // 7 × 0.1 = 0.7
}

TEST(EffectSchedule, NoneNeverChangesParameters) {
    const EffectSchedule schedule = EffectSchedule::none();
    const OffspringParams params{2.0, 1.5, 499};
    for (double t : {0.0, 10.0, 1e9})
        EXPECT_EQ(schedule.apply(params, t).susceptible, 499) << "t=" << t;
}

TEST(EffectSchedule, RejectsInvalidConfig) {
    EffectScheduleConfig config = makeConfig();
    config.washOnlyDelay = -1.0;
    EXPECT_THROW(EffectSchedule(config, 0.0), ConfigurationError);

    config = makeConfig();
    config.vaccineDelay = 2.0;
    EXPECT_THROW(config.validate(), ConfigurationError);

    config = makeConfig();
    config.effects.washOnly = 1.5;
    EXPECT_THROW(config.validate(), ConfigurationError);

    config = makeConfig();
    config.effects.washPlusVaccine = -0.1;
    EXPECT_THROW(config.validate(), ConfigurationError);

    EXPECT_THROW(EffectSchedule(makeConfig(), std::numeric_limits<double>::quiet_NaN()), ConfigurationError);
}

TEST(PhaseEffects, FromEfficacyDefaults) {
    InterventionEfficacy efficacy;
    efficacy.coverage = 0.8;
    efficacy.wash = 0.3;
    efficacy.antibiotic = 0.6;
    efficacy.vaccine = 0.65;

    const PhaseEffects effects = PhaseEffects::fromEfficacy(efficacy);
    EXPECT_NEAR(effects.washAndAntibiotic, 1.0 - 0.8 * (1.0 - 0.7 * 0.4), 1e-12);
    EXPECT_NEAR(effects.washOnly, 1.0 - 0.8 * 0.3, 1e-12);
    EXPECT_NEAR(effects.washPlusVaccine, 1.0 - 0.8 * (1.0 - 0.7 * 0.35), 1e-12);
}

TEST(PhaseEffects, FromEfficacyCustomExpressions) {
    InterventionEfficacy efficacy;
    efficacy.coverage = 0.5;
    efficacy.wash = 0.2;
    efficacy.antibiotic = 0.4;
    efficacy.vaccine = 0.9;

    const PhaseEffects effects =
        PhaseEffects::fromEfficacy(efficacy, "1 - antibiotic", "1", "max(0, 1 - coverage * vaccine)");
    EXPECT_DOUBLE_EQ(effects.washAndAntibiotic, 0.6);
    EXPECT_DOUBLE_EQ(effects.washOnly, 1.0);
    EXPECT_NEAR(effects.washPlusVaccine, 0.55, 1e-12);

    EXPECT_THROW(PhaseEffects::fromEfficacy(efficacy, "1 - unknown_symbol"), ConfigurationError);
}
