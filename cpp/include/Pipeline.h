#pragma once
/**
 * @file Pipeline.h
 * @brief End-to-end run: rings → summaries → power.
 */
#include <cstdint>
#include <vector>

#include "PowerEstimator.h"
#include "Ring.h"
#include "RingBatchGenerator.h"
#include "RingSummarizer.h"
#include "StudyConfig.h"

namespace ringpower {
    /**
     * @brief The three output tables, plus the replicate rows behind the power table.
     */
    struct StudyTables {
        std::vector<Case> cases;
        std::vector<RingSummary> summaries;
        std::vector<ReplicateResult> replicates;
        std::vector<PowerEstimate> power;
        int64_t cappedRings = 0;
    };

    class Pipeline {
    public:
        /** @throws ConfigurationError if config is invalid */
        explicit Pipeline(const StudyConfig& config);

        /** @brief Run every stage. Same config, same tables. */
        StudyTables run() const;

        RingBatch simulateRings() const;

        std::vector<RingSummary> summarize(const RingBatch& batch) const;

        /**
         * @brief Power at every configured sample size, in order.
         *
         * A size larger than summaries.size() is not fatal: it is logged at ERROR and reported by
         * PowerEstimator::unavailable().
         */
        std::vector<PowerEstimate> estimatePower(const std::vector<RingSummary>& summaries,
                                                 std::vector<ReplicateResult>* replicates = nullptr) const;

        const StudyConfig& config() const noexcept { return config_; }

    private:
        const StudyConfig config_;
    };
}
