#pragma once
/**
 * @file NegBinMixedModel.h
 * @brief Negative-binomial GLMM with log link, a fixed offset and one random intercept factor.
 */
#include <vector>

#include <Eigen/Dense>

namespace ringpower {
    /**
     * @brief Model frame.
     *
     * log E[y_i] = X_i β + offset_i + u_{group_i},  u_g ~ N(0, σ²),  y_i ~ NB2(mean, θ).
     */
    struct GlmmData {
        Eigen::VectorXd y;
        Eigen::MatrixXd X;        /**< n × p, including the intercept column */
        Eigen::VectorXd offset;
        std::vector<int> group;   /**< values in [0, numGroups) */
        int numGroups = 0;
    };

    enum class FitStatus : int { CONVERGED, NOT_CONVERGED, DEGENERATE };

    inline const char* toString(const FitStatus status) noexcept {
        switch (status) {
        case FitStatus::CONVERGED: return "converged";
        case FitStatus::NOT_CONVERGED: return "not_converged";
        case FitStatus::DEGENERATE: return "degenerate";
        }
        return "unknown";
    }

    struct GlmmOptions {
        int maxOuterIterations = 50;
        int maxInnerIterations = 50;
        double outerTolerance = 1e-4;   /**< on log σ and log θ */
        double innerTolerance = 1e-8;   /**< on the Fisher scoring step */
        double minLogSigma = -9.0;
        double maxLogSigma = 3.0;
        double minTheta = 1e-3;
        double maxTheta = 1e5;
        double confidenceLevel = 0.95;

        /** @throws ConfigurationError on invalid limits */
        void validate() const;
    };

    struct GlmmFit {
        FitStatus status = FitStatus::DEGENERATE;
        Eigen::VectorXd beta;
        Eigen::VectorXd stdError;
        Eigen::VectorXd pValue;   /**< two-sided Wald */
        Eigen::VectorXd ciLower;  /**< Wald interval at GlmmOptions::confidenceLevel */
        Eigen::VectorXd ciUpper;
        Eigen::VectorXd randomEffects;
        double theta = 0.0;       /**< NB size */
        double sigma2 = 0.0;      /**< random intercept variance */
        double dispersionRatio = 0.0; /**< Σ Pearson residual² / (n − p − 2) */
        double logLik = 0.0;      /**< Laplace approximation */
        int iterations = 0;
    };

    /**
     * @brief Laplace-approximation fit.
     *
     * Alternates (1) a golden-section search of the Laplace likelihood over log σ, with β and u at their joint
     * penalized mode found by Fisher scoring, and (2) a golden-section search of the NB likelihood over log θ
     * with the linear predictor held fixed, until both move less than outerTolerance.
     */
    class NegBinMixedModel {
    public:
        explicit NegBinMixedModel(const GlmmOptions& options = GlmmOptions());

        /** @brief Fit; never throws for numerical trouble, reports it in GlmmFit::status instead. */
        GlmmFit fit(const GlmmData& data) const;

        const GlmmOptions& options() const noexcept { return options_; }

    private:
        const GlmmOptions options_;
    };
}
