#pragma once
/**
 * @file Distribution.h
 * @brief Describes one externally configured sampling distribution.
 */
#include <string>

#include "RngEngine.h"

namespace ringpower {
    /**
     * @brief A tagged distribution, resolved once at configuration time.
     *
     * Parameters a and b mean:
     *   FIXED            a = value
     *   UNIFORM          [a, b)
     *   DISCRETE_UNIFORM integers a..b inclusive
     *   GAMMA            mean a, standard deviation b
     *   LOG_NORMAL       mean a, standard deviation b (of the variate, not of its log)
     *   POISSON          mean a
     *   NEG_BINOMIAL     mean a, size b
     */
    struct Distribution {
        enum class Kind : int { FIXED, UNIFORM, DISCRETE_UNIFORM, GAMMA, LOG_NORMAL, POISSON, NEG_BINOMIAL };

        Kind kind = Kind::FIXED;
        double a = 0.0;
        double b = 0.0;

        static Distribution fixed(double value) { return {Kind::FIXED, value, 0.0}; }
        static Distribution uniform(double lo, double hi) { return {Kind::UNIFORM, lo, hi}; }
        static Distribution discreteUniform(int lo, int hi) { return {Kind::DISCRETE_UNIFORM, double(lo), double(hi)}; }
        static Distribution gamma(double mean, double sd) { return {Kind::GAMMA, mean, sd}; }
        static Distribution logNormal(double mean, double sd) { return {Kind::LOG_NORMAL, mean, sd}; }
        static Distribution poisson(double mean) { return {Kind::POISSON, mean, 0.0}; }
        static Distribution negBinomial(double mean, double size) { return {Kind::NEG_BINOMIAL, mean, size}; }

        /** @brief Draw one variate. */
        double sample(RngEngine& rng) const;

        /** @brief Analytic mean. */
        double mean() const noexcept;

        /**
         * @brief Check parameters.
         * @param what  label used in the error message
         * @throws ConfigurationError on invalid parameters
         */
        void validate(const std::string& what) const;

        /** @brief Can a draw ever be negative? */
        bool canBeNegative() const noexcept;

        /** @brief Is every draw > 0? */
        bool isStrictlyPositive() const noexcept;
    };
}
