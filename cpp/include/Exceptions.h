#pragma once
/**
 * @file Exceptions.h
 * @brief Error types raised before any simulation work starts.
 */
#include <stdexcept>
#include <string>

namespace ringpower {
    /**
     * @brief Invalid study configuration (population, dispersion, phase boundaries, sample size...).
     *
     * Always fatal: thrown from validation and constructors, never retried.
     */
    class ConfigurationError : public std::invalid_argument {
    public:
        explicit ConfigurationError(const std::string& what) : std::invalid_argument(what) {}
    };
}
