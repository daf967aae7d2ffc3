#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include <algorithm>
#include <cctype>

#include "Distribution.h"
#include "EffectSchedule.h"
#include "Exceptions.h"
#include "Logger.h"
#include "Pipeline.h"
#include "StudyConfig.h"


namespace py = pybind11;
using namespace ringpower;


static std::string to_lower(std::string s) {
     std::transform(s.begin(), s.end(), s.begin(),
                    [](const unsigned char c) { return std::tolower(c); });
     return s;
}

static OffspringFamily name_to_family(const std::string& name) {
     const std::string n = to_lower(name);
     if (n == "negbin" || n == "negative_binomial") return OffspringFamily::NEG_BINOMIAL;
     if (n == "poisson") return OffspringFamily::POISSON;
     throw py::value_error("Unknown offspring family '" + name + "'");
}

static const char* family_name(const OffspringFamily family) {
     return family == OffspringFamily::POISSON ? "poisson" : "negbin";
}


namespace ringpower {
     /** Applies the config's log level, then runs the study with the GIL released. */
     struct PyStudy {
          Pipeline pipeline;

          explicit PyStudy(const StudyConfig& config) : pipeline(config) {}

          StudyTables run() const {
               Logger::getInstance().setLevel(Logger::parseLevel(pipeline.config().logLevel));
               py::gil_scoped_release release;
               return pipeline.run();
          }
     };
}


PYBIND11_MODULE(_ringpower, m) {
     m.doc() = "Ring-trial power simulator";

     py::register_exception<ConfigurationError>(m, "ConfigurationError", PyExc_ValueError);

     // Distribution
     py::class_<Distribution>(m, "Distribution")
          .def_static("fixed", &Distribution::fixed, py::arg("value"))
          .def_static("uniform", &Distribution::uniform, py::arg("lo"), py::arg("hi"))
          .def_static("discrete_uniform", &Distribution::discreteUniform, py::arg("lo"), py::arg("hi"))
          .def_static("gamma", &Distribution::gamma, py::arg("mean"), py::arg("sd"))
          .def_static("log_normal", &Distribution::logNormal, py::arg("mean"), py::arg("sd"))
          .def_static("poisson", &Distribution::poisson, py::arg("mean"))
          .def_static("neg_binomial", &Distribution::negBinomial, py::arg("mean"), py::arg("size"))
          .def_property_readonly("mean", &Distribution::mean)
          .def_readonly("a", &Distribution::a)
          .def_readonly("b", &Distribution::b);

     py::class_<InterventionEfficacy>(m, "InterventionEfficacy")
          .def(py::init([](const double coverage, const double wash, const double antibiotic, const double vaccine) {
                    InterventionEfficacy e;
                    e.coverage = coverage;
                    e.wash = wash;
                    e.antibiotic = antibiotic;
                    e.vaccine = vaccine;
                    return e;
               }),
               py::arg("coverage"),
               py::arg("wash"),
               py::arg("antibiotic"),
               py::arg("vaccine")
          )
          .def_readwrite("coverage", &InterventionEfficacy::coverage)
          .def_readwrite("wash", &InterventionEfficacy::wash)
          .def_readwrite("antibiotic", &InterventionEfficacy::antibiotic)
          .def_readwrite("vaccine", &InterventionEfficacy::vaccine);

     py::class_<PhaseEffects>(m, "PhaseEffects")
          .def(py::init<>())
          .def_static("from_efficacy", &PhaseEffects::fromEfficacy,
                      py::arg("efficacy"),
                      py::arg("wash_and_antibiotic_expr") = "1 - coverage * (1 - (1 - wash) * (1 - antibiotic))",
                      py::arg("wash_only_expr") = "1 - coverage * wash",
                      py::arg("wash_plus_vaccine_expr") = "1 - coverage * (1 - (1 - wash) * (1 - vaccine))",
                      "Phase multipliers from exprtk expressions over coverage, wash, antibiotic, vaccine.")
          .def_readwrite("wash_and_antibiotic", &PhaseEffects::washAndAntibiotic)
          .def_readwrite("wash_only", &PhaseEffects::washOnly)
          .def_readwrite("wash_plus_vaccine", &PhaseEffects::washPlusVaccine);

     // Configuration sections
     py::class_<ChainConfig>(m, "ChainConfig")
          .def(py::init<>())
          .def_property("family",
                        [](const ChainConfig& c) { return family_name(c.family); },
                        [](ChainConfig& c, const std::string& name) { c.family = name_to_family(name); })
          .def_readwrite("mean_offspring", &ChainConfig::meanOffspring)
          .def_readwrite("dispersion", &ChainConfig::dispersion)
          .def_readwrite("serial_interval", &ChainConfig::serialInterval)
          .def_readwrite("max_cases", &ChainConfig::maxCases)
          .def_readwrite("max_generation", &ChainConfig::maxGeneration);

     py::class_<RingConfig>(m, "RingConfig")
          .def(py::init<>())
          .def_readwrite("num_rings", &RingConfig::numRings)
          .def_readwrite("population", &RingConfig::population)
          .def_readwrite("initial_immune_fraction", &RingConfig::initialImmuneFraction)
          .def_readwrite("index_report_delay", &RingConfig::indexReportDelay)
          .def_readwrite("implementation_delay", &RingConfig::implementationDelay)
          .def_readwrite("intervention_duration", &RingConfig::interventionDuration)
          .def_readwrite("follow_up", &RingConfig::followUp);

     py::class_<ReportingConfig>(m, "ReportingConfig")
          .def(py::init<>())
          .def_readwrite("before_intervention", &ReportingConfig::beforeIntervention)
          .def_readwrite("after_intervention", &ReportingConfig::afterIntervention);

     py::class_<EffectScheduleConfig>(m, "EffectScheduleConfig")
          .def(py::init<>())
          .def_readwrite("wash_only_delay", &EffectScheduleConfig::washOnlyDelay)
          .def_readwrite("vaccine_delay", &EffectScheduleConfig::vaccineDelay)
          .def_readwrite("effects", &EffectScheduleConfig::effects);

     py::class_<SummaryConfig>(m, "SummaryConfig")
          .def(py::init<>())
          .def_readwrite("coverage", &SummaryConfig::coverage)
          .def_readwrite("delay_bucket_edges", &SummaryConfig::delayBucketEdges)
          .def_readwrite("heterogeneity_mean", &SummaryConfig::heterogeneityMean)
          .def_readwrite("heterogeneity_size", &SummaryConfig::heterogeneitySize);

     py::class_<PowerConfig>(m, "PowerConfig")
          .def(py::init<>())
          .def_readwrite("sample_sizes", &PowerConfig::sampleSizes)
          .def_readwrite("num_replicates", &PowerConfig::numReplicates)
          .def_readwrite("alpha", &PowerConfig::alpha)
          .def_readwrite("confidence_level", &PowerConfig::confidenceLevel);

     py::class_<GlmmOptions>(m, "GlmmOptions")
          .def(py::init<>())
          .def_readwrite("max_outer_iterations", &GlmmOptions::maxOuterIterations)
          .def_readwrite("max_inner_iterations", &GlmmOptions::maxInnerIterations)
          .def_readwrite("outer_tolerance", &GlmmOptions::outerTolerance)
          .def_readwrite("inner_tolerance", &GlmmOptions::innerTolerance)
          .def_readwrite("confidence_level", &GlmmOptions::confidenceLevel);

     py::class_<StudyConfig>(m, "StudyConfig")
          .def(py::init(&StudyConfig::defaults))
          .def_readwrite("seed", &StudyConfig::seed)
          .def_readwrite("max_workers", &StudyConfig::maxWorkers)
          .def_readwrite("log_level", &StudyConfig::logLevel)
          .def_readwrite("chain", &StudyConfig::chain)
          .def_readwrite("rings", &StudyConfig::rings)
          .def_readwrite("reporting", &StudyConfig::reporting)
          .def_readwrite("schedule", &StudyConfig::schedule)
          .def_readwrite("summary", &StudyConfig::summary)
          .def_readwrite("power", &StudyConfig::power)
          .def_readwrite("regression", &StudyConfig::regression)
          .def("validate", &StudyConfig::validate);

     // Output records
     py::class_<Case>(m, "Case")
          .def_readonly("id", &Case::id)
          .def_readonly("ring_id", &Case::ringId)
          .def_readonly("parent_id", &Case::parentId)
          .def_readonly("generation", &Case::generation)
          .def_readonly("onset_time", &Case::onsetTime)
          .def_readonly("report_time", &Case::reportTime)
          .def_readonly("since_index_report", &Case::sinceIndexReport);

     py::class_<RingSummary>(m, "RingSummary")
          .def_readonly("ring_id", &RingSummary::ringId)
          .def_readonly("case_count", &RingSummary::caseCount)
          .def_readonly("last_report", &RingSummary::lastReport)
          .def_readonly("population", &RingSummary::population)
          .def_readonly("intervention_delay", &RingSummary::interventionDelay)
          .def_readonly("delay_bucket", &RingSummary::delayBucket)
          .def_readonly("coverage", &RingSummary::coverage)
          .def_readonly("surveillance_category", &RingSummary::surveillanceCategory)
          .def_readonly("heterogeneity", &RingSummary::heterogeneity)
          .def_readonly("index_report_delay", &RingSummary::indexReportDelay);

     py::class_<ReplicateResult>(m, "ReplicateResult")
          .def_readonly("sample_size", &ReplicateResult::sampleSize)
          .def_readonly("replicate", &ReplicateResult::replicate)
          .def_property_readonly("status", [](const ReplicateResult& r) { return toString(r.status); })
          .def_readonly("intercept", &ReplicateResult::intercept)
          .def_readonly("slope", &ReplicateResult::slope)
          .def_readonly("p_intercept", &ReplicateResult::pIntercept)
          .def_readonly("p_slope", &ReplicateResult::pSlope)
          .def_readonly("intercept_lower", &ReplicateResult::interceptLower)
          .def_readonly("intercept_upper", &ReplicateResult::interceptUpper)
          .def_readonly("slope_lower", &ReplicateResult::slopeLower)
          .def_readonly("slope_upper", &ReplicateResult::slopeUpper)
          .def_readonly("dispersion_ratio", &ReplicateResult::dispersionRatio)
          .def_readonly("theta", &ReplicateResult::theta)
          .def_readonly("sigma2", &ReplicateResult::sigma2);

     py::class_<PowerEstimate>(m, "PowerEstimate")
          .def_readonly("sample_size", &PowerEstimate::sampleSize)
          .def_readonly("replicates", &PowerEstimate::replicates)
          .def_readonly("usable", &PowerEstimate::usable)
          .def_readonly("significant", &PowerEstimate::significant)
          .def_readonly("failed", &PowerEstimate::failed)
          .def_readonly("power", &PowerEstimate::power)
          .def_readonly("ci_lower", &PowerEstimate::ciLower)
          .def_readonly("ci_upper", &PowerEstimate::ciUpper);

     py::class_<StudyTables>(m, "StudyTables")
          .def_readonly("cases", &StudyTables::cases)
          .def_readonly("summaries", &StudyTables::summaries)
          .def_readonly("replicates", &StudyTables::replicates)
          .def_readonly("power", &StudyTables::power)
          .def_readonly("capped_rings", &StudyTables::cappedRings);

     // Study
     py::class_<PyStudy, std::shared_ptr<PyStudy>>(m, "Study")
          .def(py::init<StudyConfig>(), py::arg("config"))
          .def("run", &PyStudy::run);
}
