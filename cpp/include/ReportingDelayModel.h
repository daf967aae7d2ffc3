#pragma once
/**
 * @file ReportingDelayModel.h
 * @brief Onset-to-report delays, slower before the intervention is active than after.
 */
#include <vector>

#include "Distribution.h"
#include "Ring.h"
#include "RngEngine.h"

namespace ringpower {
    struct ReportingConfig {
        Distribution beforeIntervention = Distribution::gamma(4.0, 2.0);
        Distribution afterIntervention = Distribution::gamma(1.5, 1.0);

        /** @throws ConfigurationError on invalid or possibly negative delays */
        void validate() const;
    };

    /**
     * @brief Fills in report times of simulated cases.
     *
     * The index case reuses the ring's pre-sampled index delay. Any other case draws from the
     * "before" distribution if its onset precedes the ring's intervention end, else from "after".
     */
    class ReportingDelayModel {
    public:
        explicit ReportingDelayModel(const ReportingConfig& config);

        /** @brief Onset-to-report delay for one case of ring. */
        double sampleDelay(const Case& c, const Ring& ring, RngEngine& rng) const;

        /** @brief Set reportTime and sinceIndexReport of every case, in order. */
        void apply(std::vector<Case>& cases, const Ring& ring, RngEngine& rng) const;

    private:
        const ReportingConfig config_;
    };
}
