#pragma once
/**
 * @file InterventionEfficacy.h
 * @brief Component efficacies of the CATI bundle and the coverage they reach.
 */

namespace ringpower {
    /**
     * @brief Efficacy of each CATI component against infection, and the fraction of the ring covered.
     *
     * All values are proportions in [0,1].
     */
    struct InterventionEfficacy {
        double coverage = 0.0;
        double wash = 0.0;       /**< household water treatment and storage */
        double antibiotic = 0.0; /**< antibiotic chemoprophylaxis */
        double vaccine = 0.0;    /**< single-dose vaccination */
    };
}
