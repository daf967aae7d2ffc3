#pragma once
/**
 * @file StudyConfig.h
 * @brief Immutable configuration of one power study.
 */
#include <cstdint>
#include <string>

#include "ChainSimulator.h"
#include "EffectSchedule.h"
#include "InterventionEfficacy.h"
#include "NegBinMixedModel.h"
#include "PowerEstimator.h"
#include "ReportingDelayModel.h"
#include "RingBatchGenerator.h"
#include "RingSummarizer.h"

namespace ringpower {
    /**
     * @brief Everything a run reads. Passed by const reference to every component; no global state.
     */
    struct StudyConfig {
        uint64_t seed = 20'240'101;
        int maxWorkers = 1;
        std::string logLevel = "info";

        ChainConfig chain;
        RingConfig rings;
        ReportingConfig reporting;
        EffectScheduleConfig schedule;
        SummaryConfig summary;
        PowerConfig power;
        GlmmOptions regression;

        /**
         * @brief Defaults for a cholera CATI study.
         *
         * Antibiotic protection lasts 3 days after roll-out, vaccine protection starts after 7;
         * phase multipliers come from PhaseEffects::fromEfficacy(defaultEfficacy()).
         */
        static StudyConfig defaults();

        static InterventionEfficacy defaultEfficacy();

        /** @throws ConfigurationError on the first invalid section */
        void validate() const;
    };
}
