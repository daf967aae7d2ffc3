#pragma once
/**
 * @file CompiledExpression.h
 * @brief An arithmetic expression evaluator.
 */
#include <memory>
#include <string>

#include "InterventionEfficacy.h"

namespace ringpower {
    /**
     * @brief Holds a compiled expression for fast repeated evaluation.
     *
     * Not safe for concurrent eval() on the same instance; copies share the compiled state.
     */
    class CompiledExpression {
    public:
        /**
         * @brief Compile a new expression from source.
         * @param expr  arithmetic expression over coverage, wash, antibiotic, vaccine
         * @throws ConfigurationError if the expression does not compile
         */
        explicit CompiledExpression(const std::string& expr);

        ~CompiledExpression() = default;

        /**
         * @brief Evaluate on one set of efficacies.
         * @param e  the efficacies
         * @return   the result as double
         */
        double eval(const InterventionEfficacy& e) const;

        /** @brief Get the original source string. */
        std::string expr() const { return expr_; }

    private:
        const std::string expr_;
        struct Impl;
        std::shared_ptr<Impl> impl_;
    };
}
