#pragma once
/**
 * @file RingBatchGenerator.h
 * @brief Simulates many independent rings and windows their cases.
 */
#include <cstdint>
#include <vector>

#include "ChainSimulator.h"
#include "Distribution.h"
#include "EffectSchedule.h"
#include "ReportingDelayModel.h"
#include "Ring.h"

namespace ringpower {
    /**
     * @brief Per-ring sampling distributions and the follow-up window.
     */
    struct RingConfig {
        int64_t numRings = 10'000;
        Distribution population = Distribution::logNormal(500.0, 250.0);
        double initialImmuneFraction = 0.0;                              /**< immune = floor(population × fraction) */
        Distribution indexReportDelay = Distribution::discreteUniform(0, 3);    /**< index onset → index report */
        Distribution implementationDelay = Distribution::discreteUniform(0, 7); /**< index report → intervention start */
        double interventionDuration = 1.0;
        double followUp = 28.0; /**< window on time since index report, inclusive */

        /** @throws ConfigurationError on invalid parameters */
        void validate() const;
    };

    struct RingBatch {
        std::vector<Ring> rings; /**< rings[i].id == i */
        int64_t cappedRings = 0;

        /** @brief All retained cases of uncapped rings, ring by ring. */
        std::vector<Case> caseTable() const;
    };

    /**
     * @brief Drives the ChainSimulator across many rings.
     *
     * Ring i draws from its own stream RngEngine::forStream(seed, RING_STREAM, i), so a batch is reproducible
     * for a fixed seed whatever the worker count.
     */
    class RingBatchGenerator {
    public:
        static constexpr uint64_t RING_STREAM = 1;

        /**
         * @param ringConfig     per-ring sampling
         * @param chainConfig    offspring distribution and caps
         * @param reporting      onset-to-report delays
         * @param schedule       shared effect schedule configuration
         * @param seed           master seed
         * @param maxWorkers     threads
         * @param chunkSize      rings per work chunk
         * @throws ConfigurationError on invalid configuration
         */
        RingBatchGenerator(const RingConfig& ringConfig,
                           const ChainConfig& chainConfig,
                           const ReportingConfig& reporting,
                           const EffectScheduleConfig& schedule,
                           uint64_t seed,
                           int maxWorkers = 1,
                           int chunkSize = 64);

        /** @brief Simulate every ring. */
        RingBatch run() const;

        /** @brief Simulate ring `ringIndex` alone; identical to rings[ringIndex] of run(). */
        Ring generateRing(int64_t ringIndex) const;

        /**
         * @brief Keep cases with 0 ≤ sinceIndexReport ≤ followUp, preserving order.
         *
         * Idempotent: filtering an already filtered list with the same bound returns it unchanged.
         */
        static std::vector<Case> filterToWindow(const std::vector<Case>& cases, double followUp);

    private:
        const RingConfig ringConfig_;
        const ChainSimulator chain_;
        const ReportingDelayModel reporting_;
        const EffectScheduleConfig schedule_;
        const uint64_t seed_;
        const int maxWorkers_, chunkSize_;
    };
}
