#include "EffectSchedule.h"

#include <cmath>
#include <limits>

#include "CompiledExpression.h"
#include "Exceptions.h"

using namespace ringpower;

namespace {
    void checkMultiplier(const double x, const std::string& name) {
        if (!(x >= 0.0 && x <= 1.0))
            throw ConfigurationError("EffectSchedule: multiplier '" + name + "' must lie in [0,1], got " +
                                     std::to_string(x));
    }
}

PhaseEffects PhaseEffects::fromEfficacy(const InterventionEfficacy& efficacy,
                                        const std::string& washAndAntibioticExpr,
                                        const std::string& washOnlyExpr,
                                        const std::string& washPlusVaccineExpr) {
    PhaseEffects effects;
    effects.washAndAntibiotic = CompiledExpression(washAndAntibioticExpr).eval(efficacy);
    effects.washOnly = CompiledExpression(washOnlyExpr).eval(efficacy);
    effects.washPlusVaccine = CompiledExpression(washPlusVaccineExpr).eval(efficacy);
    return effects;
}

void EffectScheduleConfig::validate() const {
    if (!std::isfinite(washOnlyDelay) || !std::isfinite(vaccineDelay))
        throw ConfigurationError("EffectSchedule: phase delays must be finite");
    if (washOnlyDelay < 0.0)
        throw ConfigurationError("EffectSchedule: washOnlyDelay must be non-negative");
    if (vaccineDelay < washOnlyDelay)
        throw ConfigurationError("EffectSchedule: vaccineDelay must not precede washOnlyDelay");
    checkMultiplier(effects.washAndAntibiotic, "washAndAntibiotic");
    checkMultiplier(effects.washOnly, "washOnly");
    checkMultiplier(effects.washPlusVaccine, "washPlusVaccine");
}

EffectSchedule::EffectSchedule(const EffectScheduleConfig& config, const double interventionEnd)
    : config_(config), interventionEnd_(interventionEnd) {
    config_.validate();
    if (std::isnan(interventionEnd_))
        throw ConfigurationError("EffectSchedule: intervention end must not be NaN");
}

EffectSchedule EffectSchedule::none() {
    return EffectSchedule(EffectScheduleConfig{}, std::numeric_limits<double>::infinity());
}

EffectSchedule::Phase EffectSchedule::phaseAt(const double t) const noexcept {
    if (t <= interventionEnd_) return Phase::NO_EFFECT;
    if (t <= interventionEnd_ + config_.washOnlyDelay) return Phase::WASH_AND_ANTIBIOTIC;
    if (t <= interventionEnd_ + config_.vaccineDelay) return Phase::WASH_ONLY;
    return Phase::WASH_PLUS_VACCINE;
}

double EffectSchedule::multiplier(const double t) const noexcept {
    switch (phaseAt(t)) {
    case Phase::NO_EFFECT: return 1.0;
    case Phase::WASH_AND_ANTIBIOTIC: return config_.effects.washAndAntibiotic;
    case Phase::WASH_ONLY: return config_.effects.washOnly;
    case Phase::WASH_PLUS_VACCINE: return config_.effects.washPlusVaccine;
    }
    return 1.0;
}

OffspringParams EffectSchedule::apply(const OffspringParams& params, const double t) const noexcept {
    OffspringParams next = params;
    next.susceptible = std::llround(static_cast<double>(params.susceptible) * multiplier(t));
    return next;
}
