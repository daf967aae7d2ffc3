#pragma once
/**
 * @file PilotStudyEstimator.h
 * @brief One simulated pilot study: resample rings, fit the delay model, report the delay effect.
 */
#include <cstdint>
#include <memory>
#include <vector>

#include "NegBinMixedModel.h"
#include "RingSummarizer.h"
#include "RngEngine.h"

namespace ringpower {
    /**
     * @brief Fit of one (sample size, replicate) pair.
     */
    struct ReplicateResult {
        int64_t sampleSize = 0;
        int64_t replicate = 0;
        FitStatus status = FitStatus::DEGENERATE;
        double intercept = 0.0;
        double slope = 0.0;          /**< log rate ratio per unit of intervention delay */
        double pIntercept = 1.0;
        double pSlope = 1.0;
        double interceptLower = 0.0, interceptUpper = 0.0;
        double slopeLower = 0.0, slopeUpper = 0.0;
        double dispersionRatio = 0.0;
        double theta = 0.0;
        double sigma2 = 0.0;

        /** @brief Usable fit whose delay p-value is below alpha. */
        bool significant(const double alpha) const noexcept {
            return status == FitStatus::CONVERGED && pSlope < alpha;
        }
    };

    /**
     * @brief Fits cases ~ delay + offset(log population) + (1 | surveillance category) on a random
     *        subset of the ring summaries.
     */
    class PilotStudyEstimator {
    public:
        /**
         * @param summaries  shared, immutable summary table
         * @param options    regression options
         * @throws std::invalid_argument on a null table
         */
        explicit PilotStudyEstimator(std::shared_ptr<const std::vector<RingSummary>> summaries,
                                     const GlmmOptions& options = GlmmOptions());

        /**
         * @brief Draw sampleSize rings without replacement and fit.
         * @throws ConfigurationError if sampleSize is 0 or exceeds availableRings()
         */
        ReplicateResult run(size_t sampleSize, RngEngine& rng) const;

        /** @brief Fit the given rows as they are. */
        ReplicateResult fit(const std::vector<RingSummary>& rows) const;

        /** @brief Build the model frame; categories are renumbered densely in ascending order. */
        static GlmmData modelFrame(const std::vector<RingSummary>& rows);

        size_t availableRings() const noexcept { return summaries_->size(); }

    private:
        std::shared_ptr<const std::vector<RingSummary>> summaries_;
        const NegBinMixedModel model_;

        std::vector<size_t> sampleIndices(size_t sampleSize, RngEngine& rng) const;
    };
}
