#pragma once
/**
 * @file Ring.h
 * @brief Case records and the transmission ring that owns them.
 */
#include <cstdint>
#include <vector>

#include "ChainOutcome.h"

namespace ringpower {
    /**
     * @brief One infection event.
     *
     * Times are on the ring clock whose origin is the index case's onset.
     * reportTime and sinceIndexReport are filled in by the ReportingDelayModel.
     */
    struct Case {
        int64_t id = 0;
        int64_t ringId = 0;
        int64_t parentId = -1; /**< -1 for the index case */
        int generation = 0;    /**< 0 = index case */
        double onsetTime = 0.0;
        double reportTime = 0.0;
        double sinceIndexReport = 0.0;
    };

    /**
     * @brief One transmission cluster around an index case.
     *
     * indexReportTime = indexReportDelay (index onset is 0);
     * interventionStart = indexReportTime + implementationDelay;
     * interventionEnd = interventionStart + interventionDuration.
     */
    struct Ring {
        int64_t id = 0;
        double population = 0.0;
        int64_t initialImmune = 0;
        double indexReportDelay = 0.0;
        double indexReportTime = 0.0;
        double implementationDelay = 0.0;
        double interventionStart = 0.0;
        double interventionEnd = 0.0;

        ChainOutcome outcome = ChainOutcome::COMPLETED;
        int64_t simulatedCases = 0; /**< cases produced by the chain, before windowing */
        std::vector<Case> cases;    /**< cases retained by the follow-up window, in creation order (ascending id) */

        int64_t droppedCases() const noexcept { return simulatedCases - static_cast<int64_t>(cases.size()); }
    };
}
