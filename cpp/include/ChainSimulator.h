#pragma once
/**
 * @file ChainSimulator.h
 * @brief Branching process with susceptible depletion and a time-dependent CATI effect.
 */
#include <cstdint>
#include <vector>

#include "ChainOutcome.h"
#include "Distribution.h"
#include "EffectSchedule.h"
#include "Ring.h"
#include "RngEngine.h"

namespace ringpower {
    enum class OffspringFamily : int { NEG_BINOMIAL, POISSON };

    /**
     * @brief Offspring distribution, serial interval and safety caps shared by every chain of a run.
     */
    struct ChainConfig {
        OffspringFamily family = OffspringFamily::NEG_BINOMIAL;
        double meanOffspring = 2.0;
        double dispersion = 1.5;
        Distribution serialInterval = Distribution::gamma(5.0, 2.0);
        int64_t maxCases = 100'000;
        int maxGeneration = 500;

        /**
         * @brief Pick the family implied by a dispersion value.
         * @return POISSON when the dispersion is infinite or unset (NaN), NEG_BINOMIAL otherwise
         */
        static OffspringFamily familyFor(double dispersion) noexcept;

        /** @throws ConfigurationError on invalid parameters */
        void validate() const;

        /**
         * @brief Validated copy with the family fixed: NEG_BINOMIAL with an infinite or NaN dispersion
         *        becomes POISSON.
         * @throws ConfigurationError on invalid parameters
         */
        ChainConfig resolved() const;
    };

    struct ChainResult {
        std::vector<Case> cases; /**< in creation order; cases[0] is the index case */
        ChainOutcome outcome = ChainOutcome::COMPLETED;
    };

    /**
     * @brief Generates one stochastic transmission chain.
     *
     * Cases are expanded in onset order. Before expanding a case at time t the schedule maps the remaining
     * susceptible pool to the pool exposed at t; the offspring mean is scaled by exposed / population and the
     * draw is capped at the exposed count. Offspring with onset at or after tEnd are recorded but never
     * expanded.
     */
    class ChainSimulator {
    public:
        /** @throws ConfigurationError on invalid config; the stored config is config.resolved() */
        explicit ChainSimulator(const ChainConfig& config);

        /**
         * @param tStart         index onset time
         * @param tEnd           end of the observation horizon
         * @param population     ring population, must be > 0
         * @param initialImmune  immune at start, in [0, population]
         * @param schedule       effect schedule of this ring
         * @param rng            stream for this chain
         * @param ringId         stamped on every case
         * @throws ConfigurationError on invalid arguments, before drawing anything
         */
        ChainResult simulate(double tStart, double tEnd, double population, int64_t initialImmune,
                             const EffectSchedule& schedule, RngEngine& rng, int64_t ringId = 0) const;

        const ChainConfig& config() const noexcept { return config_; }

    private:
        const ChainConfig config_;

        int64_t drawOffspring(const OffspringParams& params, double population, RngEngine& rng) const;
    };
}
