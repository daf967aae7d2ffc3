#include "ChainSimulator.h"

#include <algorithm>
#include <cmath>
#include <functional>
#include <queue>
#include <utility>

#include "Exceptions.h"

using namespace ringpower;

namespace {
    // (onset time, case index); ties resolve by creation order
    using PendingCase = std::pair<double, size_t>;
    using PendingHeap = std::priority_queue<PendingCase, std::vector<PendingCase>, std::greater<PendingCase>>;
}

OffspringFamily ChainConfig::familyFor(const double dispersion) noexcept {
    if (std::isnan(dispersion) || std::isinf(dispersion)) return OffspringFamily::POISSON;
    return OffspringFamily::NEG_BINOMIAL;
}

void ChainConfig::validate() const {
    if (!(meanOffspring >= 0.0) || !std::isfinite(meanOffspring))
        throw ConfigurationError("ChainConfig: meanOffspring must be finite and non-negative");
    // an infinite or unset dispersion is the Poisson limit, not an error
    if (family == OffspringFamily::NEG_BINOMIAL && familyFor(dispersion) == OffspringFamily::NEG_BINOMIAL &&
        !(dispersion > 0.0))
        throw ConfigurationError("ChainConfig: negative binomial dispersion must be positive");
    serialInterval.validate("ChainConfig.serialInterval");
    if (serialInterval.canBeNegative())
        throw ConfigurationError("ChainConfig: serial interval must be non-negative");
    if (maxCases < 1) throw ConfigurationError("ChainConfig: maxCases must be at least 1");
    if (maxGeneration < 1) throw ConfigurationError("ChainConfig: maxGeneration must be at least 1");
}

ChainConfig ChainConfig::resolved() const {
    validate();
    ChainConfig r = *this;
    if (r.family == OffspringFamily::NEG_BINOMIAL) r.family = familyFor(r.dispersion);
    return r;
}

ChainSimulator::ChainSimulator(const ChainConfig& config) : config_(config.resolved()) {}

int64_t ChainSimulator::drawOffspring(const OffspringParams& params, const double population,
                                      RngEngine& rng) const {
    if (params.susceptible <= 0) return 0;
    const double mu = params.meanOffspring * static_cast<double>(params.susceptible) / population;
    const int64_t n = config_.family == OffspringFamily::NEG_BINOMIAL
                          ? rng.negBinomial(params.dispersion, mu)
                          : rng.poisson(mu);
    return std::min(n, params.susceptible);
}

ChainResult ChainSimulator::simulate(const double tStart, const double tEnd, const double population,
                                     const int64_t initialImmune, const EffectSchedule& schedule, RngEngine& rng,
                                     const int64_t ringId) const {
    if (!(population > 0.0) || !std::isfinite(population))
        throw ConfigurationError("ChainSimulator: population must be positive, got " + std::to_string(population));
    if (initialImmune < 0 || static_cast<double>(initialImmune) > population)
        throw ConfigurationError("ChainSimulator: initialImmune must lie in [0, population]");
    if (!(tEnd >= tStart))
        throw ConfigurationError("ChainSimulator: tEnd must not precede tStart");

    ChainResult result;
    auto& cases = result.cases;

    // the index case is drawn from the population too
    int64_t remaining = std::max<int64_t>(
        0, static_cast<int64_t>(std::floor(population)) - initialImmune - 1);

    cases.push_back(Case{0, ringId, -1, 0, tStart, 0.0, 0.0});

    PendingHeap heap;
    heap.push({tStart, 0});

    OffspringParams base{config_.meanOffspring, config_.dispersion, remaining};

    while (!heap.empty() && remaining > 0) {
        const double t = heap.top().first;
        if (t >= tEnd) break;
        const size_t parentIdx = heap.top().second;
        heap.pop();

        const int generation = cases[parentIdx].generation;
        if (generation >= config_.maxGeneration) {
            result.outcome = ChainOutcome::CAPPED_AT_MAX_GENERATION;
            break;
        }

        base.susceptible = remaining;
        const OffspringParams current = schedule.apply(base, t);
        int64_t nOffspring = drawOffspring(current, population, rng);

        const auto room = config_.maxCases - static_cast<int64_t>(cases.size());
        if (nOffspring > room) {
            nOffspring = room;
            result.outcome = ChainOutcome::CAPPED_AT_MAX_CASES;
        }

        for (int64_t i = 0; i < nOffspring; i++) {
            const double onset = t + config_.serialInterval.sample(rng);
            const size_t idx = cases.size();
            cases.push_back(Case{static_cast<int64_t>(idx), ringId, static_cast<int64_t>(parentIdx), generation + 1,
                                 onset, 0.0, 0.0});
            if (onset < tEnd) heap.push({onset, idx});
        }
        remaining -= nOffspring;

        if (result.outcome != ChainOutcome::COMPLETED) break;
    }

    return result;
}
