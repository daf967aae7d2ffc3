#include "NegBinMixedModel.h"

#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>

#include <boost/math/distributions/normal.hpp>

#include "Exceptions.h"

using namespace ringpower;

namespace {
    constexpr double kMaxEta = 30.0;
    constexpr double kNegInf = -std::numeric_limits<double>::infinity();

    double nbLogLik(const double y, const double mu, const double theta) {
        return std::lgamma(y + theta) - std::lgamma(theta) - std::lgamma(y + 1.0)
            + theta * (std::log(theta) - std::log(theta + mu))
            + (y > 0.0 ? y * (std::log(mu) - std::log(theta + mu)) : 0.0);
    }

    /** Joint penalized mode of (β, u) at fixed θ and σ², with the quantities the outer loop needs. */
    struct Mode {
        Eigen::VectorXd b;   // [β; u]
        Eigen::VectorXd mu;
        Eigen::VectorXd w;   // Fisher weights
        Eigen::MatrixXd H;   // penalized information
        double logLik = 0.0; // Σ ℓ_i
        double penalized = 0.0;
        bool converged = false;
        bool singular = false;
    };

    class ModeFinder {
    public:
        ModeFinder(const GlmmData& data, const GlmmOptions& options)
            : d_(data), o_(options), n_(data.y.size()), p_(data.X.cols()), q_(data.numGroups) {}

        Eigen::Index dim() const { return p_ + q_; }

        void linearPredictor(const Eigen::VectorXd& b, Eigen::VectorXd& mu) const {
            mu = d_.X * b.head(p_) + d_.offset;
            for (Eigen::Index i = 0; i < n_; ++i) {
                const double eta = std::clamp(mu[i] + b[p_ + d_.group[i]], -kMaxEta, kMaxEta);
                mu[i] = std::exp(eta);
            }
        }

        double logLik(const Eigen::VectorXd& mu, const double theta) const {
            double ll = 0.0;
            for (Eigen::Index i = 0; i < n_; ++i) ll += nbLogLik(d_.y[i], mu[i], theta);
            return ll;
        }

        double penalized(const Eigen::VectorXd& b, const double theta, const double sigma2) const {
            Eigen::VectorXd mu;
            linearPredictor(b, mu);
            return logLik(mu, theta) - b.tail(q_).squaredNorm() / (2.0 * sigma2);
        }

        /** Fisher scoring with step halving from the start value in b. */
        Mode find(const Eigen::VectorXd& start, const double theta, const double sigma2) const {
            Mode m;
            m.b = start;
            double current = penalized(m.b, theta, sigma2);

            for (int it = 0; it < o_.maxInnerIterations; ++it) {
                assemble(m, theta, sigma2);
                Eigen::VectorXd g = gradient(m, theta, sigma2);

                const Eigen::LDLT<Eigen::MatrixXd> ldlt(m.H);
                if (!solvable(ldlt)) {
                    m.singular = true;
                    return m;
                }
                const Eigen::VectorXd delta = ldlt.solve(g);
                if (!delta.allFinite()) {
                    m.singular = true;
                    return m;
                }

                double step = 1.0;
                Eigen::VectorXd next = m.b + delta;
                double candidate = penalized(next, theta, sigma2);
                while (!(candidate >= current - 1e-10) && step > 1e-6) {
                    step *= 0.5;
                    next = m.b + step * delta;
                    candidate = penalized(next, theta, sigma2);
                }
                if (!(candidate >= current - 1e-10)) {
                    // no ascent along the scoring direction: already at the mode to working precision
                    m.converged = true;
                    break;
                }
                m.b = next;
                current = candidate;

                if ((step * delta).cwiseAbs().maxCoeff() < o_.innerTolerance) {
                    m.converged = true;
                    break;
                }
            }

            assemble(m, theta, sigma2);
            m.logLik = logLik(m.mu, theta);
            m.penalized = m.logLik - m.b.tail(q_).squaredNorm() / (2.0 * sigma2);
            return m;
        }

        /** Laplace approximation to the marginal log-likelihood at a mode. */
        double laplace(const Mode& m, const double sigma2) const {
            double value = m.penalized - 0.5 * static_cast<double>(q_) * std::log(sigma2);
            for (Eigen::Index g = 0; g < q_; ++g) value -= 0.5 * std::log(m.H(p_ + g, p_ + g));
            return value;
        }

        static bool solvable(const Eigen::LDLT<Eigen::MatrixXd>& ldlt) {
            if (ldlt.info() != Eigen::Success || !ldlt.isPositive()) return false;
            const Eigen::VectorXd diag = ldlt.vectorD();
            const double maxD = diag.cwiseAbs().maxCoeff();
            return diag.minCoeff() > 1e-12 * maxD && std::isfinite(maxD);
        }

    private:
        const GlmmData& d_;
        const GlmmOptions& o_;
        const Eigen::Index n_, p_, q_;

        void assemble(Mode& m, const double theta, const double sigma2) const {
            linearPredictor(m.b, m.mu);
            m.w = (m.mu.array() * theta / (theta + m.mu.array())).matrix();

            m.H = Eigen::MatrixXd::Zero(p_ + q_, p_ + q_);
            m.H.topLeftCorner(p_, p_) = d_.X.transpose() * m.w.asDiagonal() * d_.X;
            for (Eigen::Index i = 0; i < n_; ++i) {
                const Eigen::Index gi = p_ + d_.group[i];
                const double wi = m.w[i];
                for (Eigen::Index j = 0; j < p_; ++j) {
                    m.H(j, gi) += wi * d_.X(i, j);
                    m.H(gi, j) += wi * d_.X(i, j);
                }
                m.H(gi, gi) += wi;
            }
            for (Eigen::Index g = 0; g < q_; ++g) m.H(p_ + g, p_ + g) += 1.0 / sigma2;
        }

        Eigen::VectorXd gradient(const Mode& m, const double theta, const double sigma2) const {
            const Eigen::VectorXd s = ((d_.y - m.mu).array() * theta / (theta + m.mu.array())).matrix();
            Eigen::VectorXd g(p_ + q_);
            g.head(p_) = d_.X.transpose() * s;
            g.tail(q_) = -m.b.tail(q_) / sigma2;
            for (Eigen::Index i = 0; i < n_; ++i) g[p_ + d_.group[i]] += s[i];
            return g;
        }
    };

    /** Maximize f on [lo, hi] by golden-section search. */
    template <typename F>
    double goldenMax(F&& f, double lo, double hi, const double tol) {
        const double invPhi = (std::sqrt(5.0) - 1.0) / 2.0;
        double x1 = hi - invPhi * (hi - lo);
        double x2 = lo + invPhi * (hi - lo);
        double f1 = f(x1);
        double f2 = f(x2);
        while (hi - lo > tol) {
            if (f1 >= f2) {
                hi = x2;
                x2 = x1;
                f2 = f1;
                x1 = hi - invPhi * (hi - lo);
                f1 = f(x1);
            }
            else {
                lo = x1;
                x1 = x2;
                f1 = f2;
                x2 = lo + invPhi * (hi - lo);
                f2 = f(x2);
            }
        }
        return f1 >= f2 ? x1 : x2;
    }
}

void GlmmOptions::validate() const {
    if (maxOuterIterations < 1 || maxInnerIterations < 1)
        throw ConfigurationError("NegBinMixedModel: iteration limits must be positive");
    if (!(minLogSigma < maxLogSigma))
        throw ConfigurationError("NegBinMixedModel: minLogSigma must be below maxLogSigma");
    if (!(minTheta > 0.0 && minTheta < maxTheta))
        throw ConfigurationError("NegBinMixedModel: theta bounds must satisfy 0 < minTheta < maxTheta");
    if (!(confidenceLevel > 0.0 && confidenceLevel < 1.0))
        throw ConfigurationError("NegBinMixedModel: confidenceLevel must lie in (0,1)");
    if (!(outerTolerance > 0.0 && innerTolerance > 0.0))
        throw ConfigurationError("NegBinMixedModel: tolerances must be positive");
}

NegBinMixedModel::NegBinMixedModel(const GlmmOptions& options) : options_(options) {
    options_.validate();
}

GlmmFit NegBinMixedModel::fit(const GlmmData& data) const {
    GlmmFit result;
    const Eigen::Index n = data.y.size();
    const Eigen::Index p = data.X.cols();
    const int q = data.numGroups;

    if (data.X.rows() != n || data.offset.size() != n || static_cast<Eigen::Index>(data.group.size()) != n)
        throw std::invalid_argument("NegBinMixedModel::fit: inconsistent model frame dimensions");
    for (const int g : data.group)
        if (g < 0 || g >= q) throw std::invalid_argument("NegBinMixedModel::fit: group index out of range");

    // too few rows for β, θ and σ², or nothing to explain
    if (q < 1 || n <= p + 2 || data.y.sum() <= 0.0) return result;

    const ModeFinder finder(data, options_);

    Eigen::VectorXd b = Eigen::VectorXd::Zero(finder.dim());
    const double meanRate = data.y.mean() / data.offset.array().exp().mean();
    b[0] = std::log(std::max(meanRate, 1e-8));

    double theta = 1.0;
    double logSigma = std::log(0.3);
    bool converged = false;

    for (int outer = 0; outer < options_.maxOuterIterations; ++outer) {
        result.iterations = outer + 1;
        const double th = theta;

        const double newLogSigma = goldenMax([&](const double ls) {
            const double s2 = std::exp(2.0 * ls);
            const Mode m = finder.find(b, th, s2);
            if (m.singular) return kNegInf;
            return finder.laplace(m, s2);
        }, options_.minLogSigma, options_.maxLogSigma, options_.outerTolerance);

        Mode mode = finder.find(b, theta, std::exp(2.0 * newLogSigma));
        if (mode.singular || !mode.b.allFinite()) return result;
        b = mode.b;

        const Eigen::VectorXd mu = mode.mu;
        const double newLogTheta = goldenMax([&](const double lt) {
            return finder.logLik(mu, std::exp(lt));
        }, std::log(options_.minTheta), std::log(options_.maxTheta), options_.outerTolerance);

        const bool settled = std::fabs(newLogSigma - logSigma) < options_.outerTolerance &&
            std::fabs(newLogTheta - std::log(theta)) < options_.outerTolerance;
        logSigma = newLogSigma;
        theta = std::exp(newLogTheta);

        if (settled) {
            converged = true;
            break;
        }
    }

    const double sigma2 = std::exp(2.0 * logSigma);
    const Mode mode = finder.find(b, theta, sigma2);
    if (mode.singular || !mode.b.allFinite()) return result;

    const Eigen::LDLT<Eigen::MatrixXd> ldlt(mode.H);
    if (!ModeFinder::solvable(ldlt)) return result;
    const Eigen::MatrixXd cov = ldlt.solve(Eigen::MatrixXd::Identity(finder.dim(), finder.dim()));

    result.beta = mode.b.head(p);
    result.randomEffects = mode.b.tail(q);
    result.stdError = cov.topLeftCorner(p, p).diagonal().cwiseMax(0.0).cwiseSqrt();
    result.theta = theta;
    result.sigma2 = sigma2;
    result.logLik = finder.laplace(mode, sigma2);

    if (!result.beta.allFinite() || !result.stdError.allFinite() || (result.stdError.array() <= 0.0).any())
        return result;

    const boost::math::normal standard;
    const double zCrit = boost::math::quantile(standard, 0.5 + 0.5 * options_.confidenceLevel);
    result.pValue.resize(p);
    result.ciLower.resize(p);
    result.ciUpper.resize(p);
    for (Eigen::Index j = 0; j < p; ++j) {
        const double z = result.beta[j] / result.stdError[j];
        result.pValue[j] = 2.0 * boost::math::cdf(boost::math::complement(standard, std::fabs(z)));
        result.ciLower[j] = result.beta[j] - zCrit * result.stdError[j];
        result.ciUpper[j] = result.beta[j] + zCrit * result.stdError[j];
    }

    double pearson = 0.0;
    for (Eigen::Index i = 0; i < n; ++i) {
        const double mu = mode.mu[i];
        const double r = data.y[i] - mu;
        pearson += r * r / (mu + mu * mu / theta);
    }
    result.dispersionRatio = pearson / static_cast<double>(n - p - 2);

    result.status = converged && mode.converged ? FitStatus::CONVERGED : FitStatus::NOT_CONVERGED;
    return result;
}
