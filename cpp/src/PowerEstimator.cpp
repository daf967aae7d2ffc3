#include "PowerEstimator.h"

#include <boost/math/distributions/binomial.hpp>

#include "Exceptions.h"
#include "Logger.h"
#include "ParallelFor.h"

using namespace ringpower;

void PowerConfig::validate() const {
    if (sampleSizes.empty()) throw ConfigurationError("PowerConfig: at least one sample size is required");
    for (const auto n : sampleSizes)
        if (n < 1) throw ConfigurationError("PowerConfig: sample sizes must be positive");
    if (numReplicates < 1) throw ConfigurationError("PowerConfig: numReplicates must be at least 1");
    if (!(alpha > 0.0 && alpha < 1.0)) throw ConfigurationError("PowerConfig: alpha must lie in (0,1)");
    if (!(confidenceLevel > 0.0 && confidenceLevel < 1.0))
        throw ConfigurationError("PowerConfig: confidenceLevel must lie in (0,1)");
}

PowerEstimator::PowerEstimator(const PilotStudyEstimator& pilot,
                               const PowerConfig& config,
                               const uint64_t seed,
                               const int maxWorkers,
                               const int chunkSize)
    : pilot_(pilot), config_(config), seed_(seed), maxWorkers_(maxWorkers), chunkSize_(chunkSize) {
    config_.validate();
    if (maxWorkers_ < 1) throw ConfigurationError("PowerEstimator: maxWorkers must be at least 1");
    if (chunkSize_ < 1) throw ConfigurationError("PowerEstimator: chunkSize must be at least 1");
}

void PowerEstimator::checkSampleSize(const int64_t sampleSize) const {
    if (sampleSize < 1)
        throw ConfigurationError("PowerEstimator: sample size must be positive");
    if (static_cast<size_t>(sampleSize) > pilot_.availableRings())
        throw ConfigurationError("PowerEstimator: sample size " + std::to_string(sampleSize) + " exceeds the " +
                                 std::to_string(pilot_.availableRings()) + " available rings");
}

std::vector<ReplicateResult> PowerEstimator::replicate(const int64_t sampleSize, const int64_t numReplicates) const {
    checkSampleSize(sampleSize);
    if (numReplicates < 1) throw ConfigurationError("PowerEstimator: numReplicates must be at least 1");

    std::vector<ReplicateResult> rows(static_cast<size_t>(numReplicates));
    parallelFor(numReplicates, chunkSize_, maxWorkers_, [this, sampleSize, &rows](const int64_t r) {
        auto rng = RngEngine::forStream(seed_, REPLICATE_STREAM_BASE + static_cast<uint64_t>(sampleSize),
                                        static_cast<uint64_t>(r));
        ReplicateResult row = pilot_.run(static_cast<size_t>(sampleSize), rng);
        row.sampleSize = sampleSize;
        row.replicate = r;
        rows[static_cast<size_t>(r)] = row;
    });
    return rows;
}

std::pair<double, double> PowerEstimator::clopperPearson(const int64_t successes, const int64_t trials,
                                                         const double confidenceLevel) {
    if (trials <= 0) return {0.0, 1.0};
    using boost::math::binomial_distribution;
    const double tail = 0.5 * (1.0 - confidenceLevel);
    const auto n = static_cast<double>(trials);
    const auto k = static_cast<double>(successes);
    const double lo = binomial_distribution<>::find_lower_bound_on_p(n, k, tail);
    const double hi = binomial_distribution<>::find_upper_bound_on_p(n, k, tail);
    return {lo, hi};
}

PowerEstimate PowerEstimator::aggregate(const int64_t sampleSize, const std::vector<ReplicateResult>& rows,
                                        const double alpha, const double confidenceLevel) {
    PowerEstimate estimate;
    estimate.sampleSize = sampleSize;
    estimate.replicates = static_cast<int64_t>(rows.size());
    for (const auto& row : rows) {
        if (row.status != FitStatus::CONVERGED) {
            estimate.failed++;
            continue;
        }
        estimate.usable++;
        if (row.significant(alpha)) estimate.significant++;
    }

    if (estimate.usable > 0)
        estimate.power = static_cast<double>(estimate.significant) / static_cast<double>(estimate.usable);
    const auto ci = clopperPearson(estimate.significant, estimate.usable, confidenceLevel);
    estimate.ciLower = ci.first;
    estimate.ciUpper = ci.second;
    return estimate;
}

PowerEstimate PowerEstimator::runSize(const int64_t sampleSize, const int64_t numReplicates,
                                      std::vector<ReplicateResult>* rows) const {
    const auto replicates = replicate(sampleSize, numReplicates);
    const auto estimate = aggregate(sampleSize, replicates, config_.alpha, config_.confidenceLevel);

    Logger::getInstance().info("PowerEstimator",
                               "n=" + std::to_string(sampleSize) + " power=" + std::to_string(estimate.power) +
                               " [" + std::to_string(estimate.ciLower) + ", " + std::to_string(estimate.ciUpper) +
                               "] usable=" + std::to_string(estimate.usable) + "/" +
                               std::to_string(estimate.replicates));
    if (estimate.failed > 0) {
        Logger::getInstance().warning("PowerEstimator",
                                      "n=" + std::to_string(sampleSize) + ": " + std::to_string(estimate.failed) +
                                      " of " + std::to_string(estimate.replicates) +
                                      " fits did not converge and were excluded");
    }
    if (estimate.usable == 0) {
        Logger::getInstance().error("PowerEstimator",
                                    "n=" + std::to_string(sampleSize) + ": no usable replicate; power reported as 0");
    }

    if (rows) rows->insert(rows->end(), replicates.begin(), replicates.end());
    return estimate;
}

PowerEstimate PowerEstimator::unavailable(const int64_t sampleSize, const int64_t numReplicates) {
    PowerEstimate estimate;
    estimate.sampleSize = sampleSize;
    estimate.replicates = numReplicates;
    estimate.failed = numReplicates;
    return estimate;
}

PowerEstimate PowerEstimator::estimatePower(const int64_t sampleSize, const int64_t numReplicates,
                                            std::vector<ReplicateResult>* rows) const {
    return runSize(sampleSize, numReplicates, rows);
}

std::vector<PowerEstimate> PowerEstimator::sweep(std::vector<ReplicateResult>* rows) const {
    for (const auto n : config_.sampleSizes) checkSampleSize(n);

    std::vector<PowerEstimate> estimates;
    estimates.reserve(config_.sampleSizes.size());
    for (const auto n : config_.sampleSizes) estimates.push_back(runSize(n, config_.numReplicates, rows));
    return estimates;
}
