#pragma once
/**
 * @file EffectSchedule.h
 * @brief Phased CATI effect on the susceptible pool, as a function of time since index onset.
 */
#include <cstdint>
#include <string>

#include "InterventionEfficacy.h"

namespace ringpower {
    /**
     * @brief Offspring-generation parameters seen by one expansion step of a chain.
     */
    struct OffspringParams {
        double meanOffspring;
        double dispersion;
        int64_t susceptible;
    };

    /**
     * @brief Fraction of the remaining susceptibles still exposed in each post-intervention phase.
     *
     * 1 means no protection, 0 means complete protection.
     */
    struct PhaseEffects {
        double washAndAntibiotic = 1.0;
        double washOnly = 1.0;
        double washPlusVaccine = 1.0;

        /**
         * @brief Derive the phase multipliers from component efficacies.
         *
         * Each expression is compiled with exprtk over the variables coverage, wash, antibiotic, vaccine.
         * The defaults give the share of the ring not protected by the active components:
         * 1 - coverage * (1 - prod(1 - efficacy_i)).
         */
        static PhaseEffects fromEfficacy(
            const InterventionEfficacy& efficacy,
            const std::string& washAndAntibioticExpr = "1 - coverage * (1 - (1 - wash) * (1 - antibiotic))",
            const std::string& washOnlyExpr = "1 - coverage * wash",
            const std::string& washPlusVaccineExpr = "1 - coverage * (1 - (1 - wash) * (1 - vaccine))");
    };

    /**
     * @brief Phase boundaries, relative to the end of the intervention roll-out, and phase multipliers.
     */
    struct EffectScheduleConfig {
        double washOnlyDelay = 0.0; /**< antibiotic protection lasts this long after intervention end */
        double vaccineDelay = 0.0;  /**< vaccine protection starts this long after intervention end */
        PhaseEffects effects;

        /** @throws ConfigurationError on negative or non-monotonic boundaries or multipliers outside [0,1] */
        void validate() const;
    };

    /**
     * @brief The schedule of one ring.
     *
     * Phases are right-closed intervals on the time axis, first match wins:
     *   (-inf, end]                      → 1
     *   (end, end + washOnlyDelay]       → washAndAntibiotic
     *   (end + washOnlyDelay, end + vaccineDelay] → washOnly
     *   (end + vaccineDelay, +inf)       → washPlusVaccine
     */
    class EffectSchedule {
    public:
        enum class Phase : int { NO_EFFECT = 0, WASH_AND_ANTIBIOTIC = 1, WASH_ONLY = 2, WASH_PLUS_VACCINE = 3 };

        /**
         * @param config           phase boundaries and multipliers
         * @param interventionEnd  end of the intervention, on the clock whose origin is the index onset
         * @throws ConfigurationError on invalid config or non-finite interventionEnd
         */
        EffectSchedule(const EffectScheduleConfig& config, double interventionEnd);

        /** @brief Schedule that never changes the parameters. */
        static EffectSchedule none();

        Phase phaseAt(double t) const noexcept;

        /** @brief Susceptible multiplier at elapsed time t. */
        double multiplier(double t) const noexcept;

        /**
         * @brief Parameters in effect at time t.
         * @return a copy of params whose susceptible count is round(susceptible × multiplier(t))
         */
        OffspringParams apply(const OffspringParams& params, double t) const noexcept;

        double interventionEnd() const noexcept { return interventionEnd_; }

    private:
        EffectScheduleConfig config_;
        double interventionEnd_;
    };
}
