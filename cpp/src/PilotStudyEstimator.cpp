#include "PilotStudyEstimator.h"

#include <algorithm>
#include <cmath>
#include <map>
#include <numeric>
#include <stdexcept>
#include <utility>

#include "Exceptions.h"

using namespace ringpower;

PilotStudyEstimator::PilotStudyEstimator(std::shared_ptr<const std::vector<RingSummary>> summaries,
                                         const GlmmOptions& options)
    : summaries_(std::move(summaries)), model_(options) {
    if (!summaries_) throw std::invalid_argument("PilotStudyEstimator: summary table cannot be null");
}

std::vector<size_t> PilotStudyEstimator::sampleIndices(const size_t sampleSize, RngEngine& rng) const {
    // partial Fisher–Yates: the first sampleSize slots end up a uniform sample without replacement
    std::vector<size_t> idx(summaries_->size());
    std::iota(idx.begin(), idx.end(), size_t{0});
    for (size_t i = 0; i < sampleSize; ++i) {
        const auto remaining = static_cast<uint32_t>(idx.size() - i);
        const size_t j = i + rng.uniformInt(remaining);
        std::swap(idx[i], idx[j]);
    }
    idx.resize(sampleSize);
    return idx;
}

GlmmData PilotStudyEstimator::modelFrame(const std::vector<RingSummary>& rows) {
    std::map<int, int> levels;
    for (const auto& row : rows) levels.emplace(row.surveillanceCategory, 0);
    int next = 0;
    for (auto& level : levels) level.second = next++;

    const auto n = static_cast<Eigen::Index>(rows.size());
    GlmmData data;
    data.y.resize(n);
    data.X.resize(n, 2);
    data.offset.resize(n);
    data.group.resize(rows.size());
    data.numGroups = static_cast<int>(levels.size());

    for (Eigen::Index i = 0; i < n; ++i) {
        const auto& row = rows[static_cast<size_t>(i)];
        data.y[i] = static_cast<double>(row.caseCount);
        data.X(i, 0) = 1.0;
        data.X(i, 1) = row.interventionDelay;
        data.offset[i] = std::log(row.population);
        data.group[static_cast<size_t>(i)] = levels.at(row.surveillanceCategory);
    }
    return data;
}

ReplicateResult PilotStudyEstimator::fit(const std::vector<RingSummary>& rows) const {
    const GlmmFit glmm = model_.fit(modelFrame(rows));

    ReplicateResult result;
    result.sampleSize = static_cast<int64_t>(rows.size());
    result.status = glmm.status;
    if (glmm.pValue.size() != 2) return result;

    result.intercept = glmm.beta[0];
    result.slope = glmm.beta[1];
    result.pIntercept = glmm.pValue[0];
    result.pSlope = glmm.pValue[1];
    result.interceptLower = glmm.ciLower[0];
    result.interceptUpper = glmm.ciUpper[0];
    result.slopeLower = glmm.ciLower[1];
    result.slopeUpper = glmm.ciUpper[1];
    result.dispersionRatio = glmm.dispersionRatio;
    result.theta = glmm.theta;
    result.sigma2 = glmm.sigma2;
    return result;
}

ReplicateResult PilotStudyEstimator::run(const size_t sampleSize, RngEngine& rng) const {
    if (sampleSize == 0)
        throw ConfigurationError("PilotStudyEstimator: sample size must be positive");
    if (sampleSize > summaries_->size())
        throw ConfigurationError("PilotStudyEstimator: sample size " + std::to_string(sampleSize) +
                                 " exceeds the " + std::to_string(summaries_->size()) + " available rings");

    std::vector<RingSummary> rows;
    rows.reserve(sampleSize);
    for (const size_t i : sampleIndices(sampleSize, rng)) rows.push_back((*summaries_)[i]);
    return fit(rows);
}
