#pragma once
/**
 * @file PowerEstimator.h
 * @brief Monte Carlo power of the pilot study design across sample sizes.
 */
#include <cstdint>
#include <utility>
#include <vector>

#include "PilotStudyEstimator.h"

namespace ringpower {
    struct PowerConfig {
        std::vector<int64_t> sampleSizes{50, 75, 100, 125, 150};
        int64_t numReplicates = 1000;
        double alpha = 0.05;           /**< significance threshold on the delay p-value */
        double confidenceLevel = 0.95; /**< of the Clopper–Pearson interval on power */

        /** @throws ConfigurationError on invalid parameters */
        void validate() const;
    };

    /**
     * @brief Aggregate over the replicates of one sample size.
     *
     * Replicates whose fit did not converge are excluded from the denominator and counted in `failed`:
     * power = significant / usable.
     */
    struct PowerEstimate {
        int64_t sampleSize = 0;
        int64_t replicates = 0;
        int64_t usable = 0;
        int64_t significant = 0;
        int64_t failed = 0;
        double power = 0.0;
        double ciLower = 0.0;
        double ciUpper = 1.0;
    };

    /**
     * @brief Runs independent pilot-study replicates and reduces them to power estimates.
     *
     * Replicate r at sample size n draws from RngEngine::forStream(seed, REPLICATE_STREAM_BASE + n, r).
     * Replicates are mapped over worker threads into slots indexed by r and reduced afterwards, so the
     * estimates do not depend on the worker count.
     */
    class PowerEstimator {
    public:
        static constexpr uint64_t REPLICATE_STREAM_BASE = uint64_t{1} << 32;

        PowerEstimator(const PilotStudyEstimator& pilot,
                       const PowerConfig& config,
                       uint64_t seed,
                       int maxWorkers = 1,
                       int chunkSize = 8);

        /** @brief Fit numReplicates independent pilot studies of the given size. */
        std::vector<ReplicateResult> replicate(int64_t sampleSize, int64_t numReplicates) const;

        /**
         * @brief Power at one sample size.
         * @param rows  if not null, receives the replicate rows
         * @throws ConfigurationError if sampleSize exceeds the available rings
         */
        PowerEstimate estimatePower(int64_t sampleSize, int64_t numReplicates,
                                    std::vector<ReplicateResult>* rows = nullptr) const;

        /**
         * @brief Power at each configured sample size, in order.
         * @param rows  if not null, receives every replicate row, grouped by sample size
         * @throws ConfigurationError before any replicate runs if a size exceeds the available rings
         */
        std::vector<PowerEstimate> sweep(std::vector<ReplicateResult>* rows = nullptr) const;

        /** @brief Reduce replicate rows of one sample size. */
        static PowerEstimate aggregate(int64_t sampleSize, const std::vector<ReplicateResult>& rows,
                                       double alpha, double confidenceLevel);

        /** @brief Exact binomial interval; [0,1] when trials is 0. */
        static std::pair<double, double> clopperPearson(int64_t successes, int64_t trials, double confidenceLevel);

        /** @brief Estimate for a size that could not be sampled: every replicate failed, power 0 on [0,1]. */
        static PowerEstimate unavailable(int64_t sampleSize, int64_t numReplicates);

    private:
        const PilotStudyEstimator& pilot_;
        const PowerConfig config_;
        const uint64_t seed_;
        const int maxWorkers_, chunkSize_;

        void checkSampleSize(int64_t sampleSize) const;

        PowerEstimate runSize(int64_t sampleSize, int64_t numReplicates, std::vector<ReplicateResult>* rows) const;
    };
}
