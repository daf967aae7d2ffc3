#include "RingSummarizer.h"

#include <algorithm>
#include <cmath>

#include "Exceptions.h"

using namespace ringpower;

void SummaryConfig::validate() const {
    if (!(coverage >= 0.0 && coverage <= 1.0))
        throw ConfigurationError("SummaryConfig: coverage must lie in [0,1]");
    if (!std::is_sorted(delayBucketEdges.begin(), delayBucketEdges.end()))
        throw ConfigurationError("SummaryConfig: delayBucketEdges must be ascending");
    if (!(heterogeneityMean >= 0.0) || !std::isfinite(heterogeneityMean))
        throw ConfigurationError("SummaryConfig: heterogeneityMean must be finite and non-negative");
    if (!(heterogeneitySize > 0.0) || !std::isfinite(heterogeneitySize))
        throw ConfigurationError("SummaryConfig: heterogeneitySize must be finite and positive");
}

RingSummarizer::RingSummarizer(const SummaryConfig& config, const uint64_t seed) : config_(config), seed_(seed) {
    config_.validate();
}

int RingSummarizer::surveillanceCategory(const double indexReportDelay) noexcept {
    if (indexReportDelay <= 0.0) return 1;
    if (indexReportDelay <= 1.0) return 2;
    return 3;
}

int RingSummarizer::delayBucket(const double interventionDelay) const noexcept {
    const auto& edges = config_.delayBucketEdges;
    return static_cast<int>(std::lower_bound(edges.begin(), edges.end(), interventionDelay) - edges.begin());
}

RingSummary RingSummarizer::summarize(const Ring& ring) const {
    RingSummary row;
    row.ringId = ring.id;
    row.caseCount = static_cast<int64_t>(ring.cases.size());
    for (const auto& c : ring.cases)
        row.lastReport = std::max(row.lastReport, c.sinceIndexReport);
    row.population = ring.population;
    row.interventionDelay = ring.implementationDelay;
    row.delayBucket = delayBucket(ring.implementationDelay);
    row.coverage = config_.coverage;
    row.surveillanceCategory = surveillanceCategory(ring.indexReportDelay);
    row.indexReportDelay = ring.indexReportDelay;

    auto rng = RngEngine::forStream(seed_, HETEROGENEITY_STREAM, static_cast<uint64_t>(ring.id));
    row.heterogeneity = static_cast<double>(rng.negBinomial(config_.heterogeneitySize, config_.heterogeneityMean));
    return row;
}

std::vector<RingSummary> RingSummarizer::summarize(const RingBatch& batch) const {
    std::vector<RingSummary> rows;
    rows.reserve(batch.rings.size());
    for (const auto& ring : batch.rings) {
        if (isCapped(ring.outcome)) continue;
        rows.push_back(summarize(ring));
    }
    return rows;
}
