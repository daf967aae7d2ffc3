#include "Pipeline.h"

#include <memory>
#include <string>

#include "Logger.h"
#include "PilotStudyEstimator.h"

using namespace ringpower;

Pipeline::Pipeline(const StudyConfig& config) : config_(config) {
    config_.validate();
}

RingBatch Pipeline::simulateRings() const {
    const RingBatchGenerator generator(config_.rings, config_.chain, config_.reporting, config_.schedule,
                                       config_.seed, config_.maxWorkers);
    return generator.run();
}

std::vector<RingSummary> Pipeline::summarize(const RingBatch& batch) const {
    const RingSummarizer summarizer(config_.summary, config_.seed);
    return summarizer.summarize(batch);
}

std::vector<PowerEstimate> Pipeline::estimatePower(const std::vector<RingSummary>& summaries,
                                                   std::vector<ReplicateResult>* replicates) const {
    const PilotStudyEstimator pilot(std::make_shared<const std::vector<RingSummary>>(summaries),
                                    config_.regression);
    const PowerEstimator estimator(pilot, config_.power, config_.seed, config_.maxWorkers);

    std::vector<PowerEstimate> estimates;
    estimates.reserve(config_.power.sampleSizes.size());
    for (const auto n : config_.power.sampleSizes) {
        if (static_cast<size_t>(n) > pilot.availableRings()) {
            Logger::getInstance().error("Pipeline",
                                        "sample size " + std::to_string(n) + " exceeds the " +
                                        std::to_string(pilot.availableRings()) +
                                        " uncapped rings; no replicate run");
            estimates.push_back(PowerEstimator::unavailable(n, config_.power.numReplicates));
            continue;
        }
        estimates.push_back(estimator.estimatePower(n, config_.power.numReplicates, replicates));
    }
    return estimates;
}

StudyTables Pipeline::run() const {
    StudyTables tables;

    const RingBatch batch = simulateRings();
    tables.cases = batch.caseTable();
    tables.cappedRings = batch.cappedRings;

    tables.summaries = summarize(batch);
    Logger::getInstance().info("Pipeline",
                               std::to_string(tables.summaries.size()) + " ring summaries, " +
                               std::to_string(tables.cases.size()) + " retained cases");

    tables.power = estimatePower(tables.summaries, &tables.replicates);
    return tables;
}
