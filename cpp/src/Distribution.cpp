#include "Distribution.h"

#include <cmath>

#include "Exceptions.h"

using namespace ringpower;

double Distribution::sample(RngEngine& rng) const {
    switch (kind) {
    case Kind::FIXED:
        return a;
    case Kind::UNIFORM:
        return a + rng.uniform() * (b - a);
    case Kind::DISCRETE_UNIFORM: {
        const auto span = static_cast<uint32_t>(std::llround(b - a)) + 1u;
        return a + static_cast<double>(rng.uniformInt(span));
    }
    case Kind::GAMMA: {
        // shape = (mean/sd)^2, scale = sd^2/mean
        const double shape = (a / b) * (a / b);
        const double scale = b * b / a;
        return rng.gamma(shape, scale);
    }
    case Kind::LOG_NORMAL: {
        const double sigma2 = std::log1p((b * b) / (a * a));
        const double mu = std::log(a) - 0.5 * sigma2;
        return std::exp(rng.normal(mu, std::sqrt(sigma2)));
    }
    case Kind::POISSON:
        return static_cast<double>(rng.poisson(a));
    case Kind::NEG_BINOMIAL:
        return static_cast<double>(rng.negBinomial(b, a));
    }
    throw std::runtime_error("Distribution::sample: unknown distribution kind");
}

double Distribution::mean() const noexcept {
    switch (kind) {
    case Kind::UNIFORM:
    case Kind::DISCRETE_UNIFORM:
        return 0.5 * (a + b);
    default:
        return a;
    }
}

bool Distribution::canBeNegative() const noexcept {
    switch (kind) {
    case Kind::FIXED:
    case Kind::UNIFORM:
    case Kind::DISCRETE_UNIFORM:
        return a < 0.0;
    default:
        return false;
    }
}

bool Distribution::isStrictlyPositive() const noexcept {
    switch (kind) {
    case Kind::FIXED:
    case Kind::UNIFORM:
    case Kind::DISCRETE_UNIFORM:
        return a > 0.0;
    case Kind::GAMMA:
    case Kind::LOG_NORMAL:
        return true;
    default:
        return false;
    }
}

void Distribution::validate(const std::string& what) const {
    if (!std::isfinite(a) || !std::isfinite(b))
        throw ConfigurationError(what + ": distribution parameters must be finite");

    switch (kind) {
    case Kind::FIXED:
        return;
    case Kind::UNIFORM:
        if (a > b) throw ConfigurationError(what + ": uniform lower bound exceeds upper bound");
        return;
    case Kind::DISCRETE_UNIFORM:
        if (a > b) throw ConfigurationError(what + ": discrete uniform lower bound exceeds upper bound");
        if (a != std::floor(a) || b != std::floor(b))
            throw ConfigurationError(what + ": discrete uniform bounds must be integers");
        return;
    case Kind::GAMMA:
    case Kind::LOG_NORMAL:
        if (a <= 0.0 || b <= 0.0) throw ConfigurationError(what + ": mean and sd must be positive");
        return;
    case Kind::POISSON:
        if (a < 0.0) throw ConfigurationError(what + ": Poisson mean must be non-negative");
        return;
    case Kind::NEG_BINOMIAL:
        if (a < 0.0) throw ConfigurationError(what + ": negative binomial mean must be non-negative");
        if (b <= 0.0) throw ConfigurationError(what + ": negative binomial size must be positive");
        return;
    }
    throw ConfigurationError(what + ": unknown distribution kind");
}
