#include "CompiledExpression.h"
#include <exprtk.hpp>
#include <memory>

#include "Exceptions.h"

using namespace ringpower;


struct CompiledExpression::Impl {
    exprtk::symbol_table<double> symbols;
    exprtk::expression<double> expression;
    exprtk::parser<double> parser;

    double coverage, wash, antibiotic, vaccine;

    explicit Impl(const std::string& expr) {
        symbols.add_variable("coverage", coverage);
        symbols.add_variable("wash", wash);
        symbols.add_variable("antibiotic", antibiotic);
        symbols.add_variable("vaccine", vaccine);
        symbols.add_constants(); // math constants (pi, e, etc.)
        expression.register_symbol_table(symbols);

        if (!parser.compile(expr, expression))
            throw ConfigurationError("ExprTk compile error in '" + expr + "': " + parser.error());
    }
};

CompiledExpression::CompiledExpression(const std::string& expr):
    expr_(expr), impl_(std::make_shared<Impl>(expr)) {}


double CompiledExpression::eval(const InterventionEfficacy& e) const {
    auto& impl = *impl_;
    impl.coverage = e.coverage;
    impl.wash = e.wash;
    impl.antibiotic = e.antibiotic;
    impl.vaccine = e.vaccine;

    return impl.expression.value();
}
