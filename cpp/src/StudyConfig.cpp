#include "StudyConfig.h"

#include "Exceptions.h"
#include "Logger.h"

using namespace ringpower;

InterventionEfficacy StudyConfig::defaultEfficacy() {
    InterventionEfficacy e;
    e.coverage = 0.8;
    e.wash = 0.3;
    e.antibiotic = 0.6;
    e.vaccine = 0.65;
    return e;
}

StudyConfig StudyConfig::defaults() {
    StudyConfig config;
    config.schedule.washOnlyDelay = 3.0;
    config.schedule.vaccineDelay = 7.0;
    config.schedule.effects = PhaseEffects::fromEfficacy(defaultEfficacy());
    config.summary.coverage = defaultEfficacy().coverage;
    return config;
}

void StudyConfig::validate() const {
    if (maxWorkers < 1) throw ConfigurationError("StudyConfig: maxWorkers must be at least 1");
    Logger::parseLevel(logLevel);
    chain.validate();
    rings.validate();
    reporting.validate();
    schedule.validate();
    summary.validate();
    power.validate();
    for (const auto n : power.sampleSizes)
        if (n > rings.numRings)
            throw ConfigurationError("StudyConfig: sample size " + std::to_string(n) + " exceeds numRings " +
                                     std::to_string(rings.numRings));
    regression.validate();
}
