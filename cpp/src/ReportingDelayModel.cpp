#include "ReportingDelayModel.h"

#include "Exceptions.h"

using namespace ringpower;

void ReportingConfig::validate() const {
    beforeIntervention.validate("ReportingConfig.beforeIntervention");
    afterIntervention.validate("ReportingConfig.afterIntervention");
    if (beforeIntervention.canBeNegative() || afterIntervention.canBeNegative())
        throw ConfigurationError("ReportingConfig: reporting delays must be non-negative");
}

ReportingDelayModel::ReportingDelayModel(const ReportingConfig& config) : config_(config) {
    config_.validate();
}

double ReportingDelayModel::sampleDelay(const Case& c, const Ring& ring, RngEngine& rng) const {
    if (c.generation == 0) return ring.indexReportDelay;
    if (c.onsetTime < ring.interventionEnd) return config_.beforeIntervention.sample(rng);
    return config_.afterIntervention.sample(rng);
}

void ReportingDelayModel::apply(std::vector<Case>& cases, const Ring& ring, RngEngine& rng) const {
    for (auto& c : cases) {
        c.reportTime = c.onsetTime + sampleDelay(c, ring, rng);
        c.sinceIndexReport = c.reportTime - ring.indexReportTime;
    }
}
