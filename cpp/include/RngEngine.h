#pragma once
#include <cstdint>

namespace ringpower {
    /**
     * @brief High-performance RNG engine offering
     *   • Uniform [0,1)
     *   • Gaussian via Box–Muller
     *   • Gamma via Marsaglia–Tsang
     *   • Poisson via Knuth (small λ) and PTRS (large λ)
     *   • Negative-Binomial via Gamma→Poisson mixing
     */
    class RngEngine {
    public:
        /**
         * @param seed  Optional seed (default = time ^ thread_id).
         */
        explicit RngEngine(uint64_t seed = defaultSeed());

        /**
         * @brief Engine for one independent sub-stream of a run.
         *
         * The seed is a SplitMix64 mix of (seed, stream, subStream), so the draws a ring or replicate
         * sees depend only on its own index and never on the order in which work is scheduled.
         */
        static RngEngine forStream(uint64_t seed, uint64_t stream, uint64_t subStream = 0);

        /** @return a double ∈ [0,1) */
        double uniform();

        /** @return an integer uniform on [0, n). n must be > 0. */
        uint32_t uniformInt(uint32_t n);

        /** @brief Draw one Normal(mean, stddev).
         *  @param mean Mean
         *  @param stddev  Must be >= 0.
         *  @return a Normal(mean, stddev) variate */
        double normal(double mean, double stddev);

        /** @brief Draw one Gamma(shape, scale) variate.
         *  @param shape Must be > 0.
         *  @param scale Must be > 0.
         *  @return a Gamma(shape, scale) variate */
        double gamma(double shape, double scale);

        /** @brief Draw one Poisson(lambda) variate.
         *  @param lambda Must be >= 0. */
        int64_t poisson(double lambda);

        /** @brief Draw one NB variate via Gamma→Poisson.
         *  @param r  size (dispersion), must be > 0.
         *  @param mu mean, must be >= 0.
         *  @return a NegBinomial with mean mu and variance mu + mu²/r */
        int64_t negBinomial(double r, double mu);

        /** Default seed generator (clock ^ thread_id) */
        static uint64_t defaultSeed();

        /** @return next 32-bit uniform integer via PCG */
        uint32_t nextUInt32();

    private:
        // --- PCG state ---
        uint64_t state_;
        uint64_t increment_;
        bool haveSpare_ = false;
        double spare_ = 0.0;

        /**@return a single sample from StandardNormal(0,1) via Box-Muller */
        double sampleBoxMuller();

        /** Marsaglia–Tsang algorithm for Gamma(shape,1) */
        double sampleGammaShape1(double shape);

        int64_t poissonKnuth(double lambda);
        int64_t poissonPtrs(double lambda);
    };
}
