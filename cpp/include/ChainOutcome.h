#pragma once
/**
 * @file ChainOutcome.h
 * @brief Possible outcomes of a simulated transmission chain.
 */

/**
 * @brief Codes returned by ChainSimulator::simulate.
 *
 * Capped chains hit a safety limit and are excluded from aggregation.
 */
namespace ringpower {
    enum class ChainOutcome: int { COMPLETED, CAPPED_AT_MAX_CASES, CAPPED_AT_MAX_GENERATION };

    inline bool isCapped(const ChainOutcome outcome) noexcept { return outcome != ChainOutcome::COMPLETED; }

    inline const char* toString(const ChainOutcome outcome) noexcept {
        switch (outcome) {
        case ChainOutcome::COMPLETED: return "completed";
        case ChainOutcome::CAPPED_AT_MAX_CASES: return "capped_at_max_cases";
        case ChainOutcome::CAPPED_AT_MAX_GENERATION: return "capped_at_max_generation";
        }
        return "unknown";
    }
}
