#pragma once
/**
 * @file RingSummarizer.h
 * @brief Reduces each ring to the one row the pilot study regression consumes.
 */
#include <cstdint>
#include <vector>

#include "Ring.h"
#include "RingBatchGenerator.h"

namespace ringpower {
    struct SummaryConfig {
        double coverage = 0.8;                             /**< constant coverage covariate */
        std::vector<double> delayBucketEdges{1.0, 3.0, 5.0}; /**< ascending; bucket = #edges strictly below delay */
        double heterogeneityMean = 1.0;                    /**< NB mean of the heterogeneity draw */
        double heterogeneitySize = 1.0;                    /**< NB size of the heterogeneity draw */

        /** @throws ConfigurationError on invalid parameters */
        void validate() const;
    };

    /**
     * @brief One row per ring.
     */
    struct RingSummary {
        int64_t ringId = 0;
        int64_t caseCount = 0;
        double lastReport = 0.0;        /**< max time since index report over retained cases */
        double population = 0.0;
        double interventionDelay = 0.0; /**< index report → intervention start */
        int delayBucket = 0;
        double coverage = 0.0;
        int surveillanceCategory = 1;   /**< synthetic surveillance-capacity random effect, 1..3 */
        double heterogeneity = 0.0;     /**< synthetic heterogeneity random effect */
        double indexReportDelay = 0.0;
    };

    /**
     * @brief Builds RingSummary rows.
     *
     * The heterogeneity draw of ring i comes from RngEngine::forStream(seed, HETEROGENEITY_STREAM, i) and is
     * therefore independent of every other ring parameter.
     */
    class RingSummarizer {
    public:
        static constexpr uint64_t HETEROGENEITY_STREAM = 2;

        RingSummarizer(const SummaryConfig& config, uint64_t seed);

        RingSummary summarize(const Ring& ring) const;

        /** @brief Rows for every uncapped ring of batch, in ring order. */
        std::vector<RingSummary> summarize(const RingBatch& batch) const;

        /**
         * @brief Surveillance capacity category from the index reporting delay.
         *
         * First match wins: delay ≤ 0 → 1, delay ≤ 1 → 2, otherwise 3.
         */
        static int surveillanceCategory(double indexReportDelay) noexcept;

        int delayBucket(double interventionDelay) const noexcept;

    private:
        const SummaryConfig config_;
        const uint64_t seed_;
    };
}
