#include "RingBatchGenerator.h"

#include <cmath>

#include "Exceptions.h"
#include "Logger.h"
#include "ParallelFor.h"

using namespace ringpower;

void RingConfig::validate() const {
    if (numRings < 1) throw ConfigurationError("RingConfig: numRings must be at least 1");
    population.validate("RingConfig.population");
    if (!population.isStrictlyPositive())
        throw ConfigurationError("RingConfig: population distribution must only produce positive values");
    if (!(initialImmuneFraction >= 0.0 && initialImmuneFraction <= 1.0))
        throw ConfigurationError("RingConfig: initialImmuneFraction must lie in [0,1]");
    indexReportDelay.validate("RingConfig.indexReportDelay");
    implementationDelay.validate("RingConfig.implementationDelay");
    if (indexReportDelay.canBeNegative() || implementationDelay.canBeNegative())
        throw ConfigurationError("RingConfig: delays must be non-negative");
    if (!(interventionDuration >= 0.0) || !std::isfinite(interventionDuration))
        throw ConfigurationError("RingConfig: interventionDuration must be finite and non-negative");
    if (!(followUp >= 0.0) || !std::isfinite(followUp))
        throw ConfigurationError("RingConfig: followUp must be finite and non-negative");
}

std::vector<Case> RingBatch::caseTable() const {
    std::vector<Case> table;
    for (const auto& ring : rings) {
        if (isCapped(ring.outcome)) continue;
        table.insert(table.end(), ring.cases.begin(), ring.cases.end());
    }
    return table;
}

RingBatchGenerator::RingBatchGenerator(const RingConfig& ringConfig,
                                       const ChainConfig& chainConfig,
                                       const ReportingConfig& reporting,
                                       const EffectScheduleConfig& schedule,
                                       const uint64_t seed,
                                       const int maxWorkers,
                                       const int chunkSize)
    : ringConfig_(ringConfig),
      chain_(chainConfig),
      reporting_(reporting),
      schedule_(schedule),
      seed_(seed),
      maxWorkers_(maxWorkers),
      chunkSize_(chunkSize) {
    ringConfig_.validate();
    schedule_.validate();
    if (maxWorkers_ < 1) throw ConfigurationError("RingBatchGenerator: maxWorkers must be at least 1");
    if (chunkSize_ < 1) throw ConfigurationError("RingBatchGenerator: chunkSize must be at least 1");
}

std::vector<Case> RingBatchGenerator::filterToWindow(const std::vector<Case>& cases, const double followUp) {
    std::vector<Case> kept;
    kept.reserve(cases.size());
    for (const auto& c : cases)
        if (c.sinceIndexReport >= 0.0 && c.sinceIndexReport <= followUp) kept.push_back(c);
    return kept;
}

Ring RingBatchGenerator::generateRing(const int64_t ringIndex) const {
    auto rng = RngEngine::forStream(seed_, RING_STREAM, static_cast<uint64_t>(ringIndex));

    Ring ring;
    ring.id = ringIndex;
    ring.population = ringConfig_.population.sample(rng);
    ring.initialImmune = static_cast<int64_t>(std::floor(ring.population * ringConfig_.initialImmuneFraction));
    ring.indexReportDelay = ringConfig_.indexReportDelay.sample(rng);
    ring.indexReportTime = ring.indexReportDelay;
    ring.implementationDelay = ringConfig_.implementationDelay.sample(rng);
    ring.interventionStart = ring.indexReportTime + ring.implementationDelay;
    ring.interventionEnd = ring.interventionStart + ringConfig_.interventionDuration;

    const EffectSchedule schedule(schedule_, ring.interventionEnd);
    const double tEnd = ring.indexReportTime + ringConfig_.followUp;

    auto chain = chain_.simulate(0.0, tEnd, ring.population, ring.initialImmune, schedule, rng, ring.id);
    ring.outcome = chain.outcome;
    ring.simulatedCases = static_cast<int64_t>(chain.cases.size());

    reporting_.apply(chain.cases, ring, rng);
    ring.cases = filterToWindow(chain.cases, ringConfig_.followUp);

    if (isCapped(ring.outcome)) {
        Logger::getInstance().warning("RingBatchGenerator",
                                      "Ring " + std::to_string(ring.id) + " " + toString(ring.outcome) + " after " +
                                      std::to_string(ring.simulatedCases) + " cases; excluded from summaries");
    }
    return ring;
}

RingBatch RingBatchGenerator::run() const {
    RingBatch batch;
    batch.rings.resize(static_cast<size_t>(ringConfig_.numRings));

    Logger::getInstance().info("RingBatchGenerator",
                               "Simulating " + std::to_string(ringConfig_.numRings) + " rings on " +
                               std::to_string(maxWorkers_) + " worker(s)");

    parallelFor(ringConfig_.numRings, chunkSize_, maxWorkers_, [this, &batch](const int64_t i) {
        batch.rings[static_cast<size_t>(i)] = generateRing(i);
    });

    for (const auto& ring : batch.rings)
        if (isCapped(ring.outcome)) batch.cappedRings++;

    if (batch.cappedRings > 0) {
        Logger::getInstance().warning("RingBatchGenerator",
                                      std::to_string(batch.cappedRings) + " of " +
                                      std::to_string(ringConfig_.numRings) + " rings hit a safety cap");
    }
    return batch;
}
