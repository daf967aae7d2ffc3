#include "RngEngine.h"

#include <chrono>
#include <cmath>
#include <functional>
#include <stdexcept>
#include <thread>


using namespace ringpower;

namespace {
    uint64_t splitMix64(uint64_t x) {
        x += 0x9E3779B97F4A7C15ULL;
        x = (x ^ (x >> 30)) * 0xBF58476D1CE4E5B9ULL;
        x = (x ^ (x >> 27)) * 0x94D049BB133111EBULL;
        return x ^ (x >> 31);
    }

    constexpr double kPoissonKnuthLimit = 30.0;
}


//------------------------------------------------------------------------------
// defaultSeed(): mix high-res clock and thread ID for initial seeding
//------------------------------------------------------------------------------
uint64_t RngEngine::defaultSeed() {
    const auto now = std::chrono::high_resolution_clock::now().time_since_epoch().count();
    const auto tid = std::hash<std::thread::id>()(std::this_thread::get_id());
    return static_cast<uint64_t>(now) ^ (static_cast<uint64_t>(tid) << 1);
}

//------------------------------------------------------------------------------
// Constructor: initialize PCG state
//------------------------------------------------------------------------------
RngEngine::RngEngine(const uint64_t seed) : state_(0), increment_(seed << 1 | 1) {
    // Advance state at least once
    state_ = seed + increment_;
    state_ = state_ * 6364136223846793005ULL + increment_;
}

RngEngine RngEngine::forStream(const uint64_t seed, const uint64_t stream, const uint64_t subStream) {
    const uint64_t mixed = splitMix64(splitMix64(splitMix64(seed) ^ stream) ^ subStream);
    return RngEngine(mixed);
}

//------------------------------------------------------------------------------
// nextUInt32(): PCG-XSH-RR 32-bit generator
//------------------------------------------------------------------------------
uint32_t RngEngine::nextUInt32() {
    const uint64_t old = state_;
    state_ = old * 6364136223846793005ULL + increment_;
    const auto xorshifted = static_cast<uint32_t>(((old >> 18u) ^ old) >> 27u);
    const auto rot = static_cast<uint32_t>(old >> 59u);
    return (xorshifted >> rot) | (xorshifted << ((-rot) & 31u));
}

//------------------------------------------------------------------------------
// uniform(): convert 32 bits of nextUInt32() into [0,1)
//------------------------------------------------------------------------------
double RngEngine::uniform() {
    return nextUInt32() * (1.0 / 4294967296.0);
}

//------------------------------------------------------------------------------
// uniformInt(n): Lemire's nearly-divisionless bounded integer
//------------------------------------------------------------------------------
uint32_t RngEngine::uniformInt(const uint32_t n) {
    if (n == 0) throw std::invalid_argument("RngEngine::uniformInt: n must be positive");
    uint64_t m = static_cast<uint64_t>(nextUInt32()) * n;
    auto low = static_cast<uint32_t>(m);
    if (low < n) {
        const uint32_t threshold = (0u - n) % n;
        while (low < threshold) {
            m = static_cast<uint64_t>(nextUInt32()) * n;
            low = static_cast<uint32_t>(m);
        }
    }
    return static_cast<uint32_t>(m >> 32);
}

//------------------------------------------------------------------------------
// sampleBoxMuller(): one N(0,1) variate, caching the second of each pair
//------------------------------------------------------------------------------
double RngEngine::sampleBoxMuller() {
    if (haveSpare_) {
        haveSpare_ = false;
        return spare_;
    }
    // 1 - u keeps the log argument in (0,1]
    const double u1 = 1.0 - uniform();
    const double u2 = uniform();
    const double r = std::sqrt(-2.0 * std::log(u1));
    const double theta = 2.0 * M_PI * u2;
    spare_ = r * std::sin(theta);
    haveSpare_ = true;
    return r * std::cos(theta);
}

//------------------------------------------------------------------------------
// normal(mean,stddev): scale a standard normal sample
//------------------------------------------------------------------------------
double RngEngine::normal(const double mean, const double stddev) {
    if (stddev < 0.0) throw std::invalid_argument("RngEngine::normal: stddev must be non-negative");
    return mean + stddev * sampleBoxMuller();
}

//------------------------------------------------------------------------------
// sampleGammaShape1(shape): Marsaglia–Tsang for Gamma(shape,1)
//------------------------------------------------------------------------------
double RngEngine::sampleGammaShape1(const double shape) {
    if (shape < 1.0) {
        // boost shape<1 through Gamma(shape+1) * U^(1/shape)
        const double u = 1.0 - uniform();
        return sampleGammaShape1(shape + 1.0) * std::pow(u, 1.0 / shape);
    }
    const double d = shape - 1.0 / 3.0;
    const double c = 1.0 / std::sqrt(9.0 * d);
    while (true) {
        const double x = sampleBoxMuller();
        double v = 1.0 + c * x;
        if (v <= 0) continue;
        v = v * v * v;
        const double u = 1.0 - uniform();
        if (u < 1.0 - 0.0331 * x * x * x * x) {
            return d * v;
        }
        if (std::log(u) < 0.5 * x * x + d * (1.0 - v + std::log(v))) {
            return d * v;
        }
    }
}

//------------------------------------------------------------------------------
// gamma(shape,scale): scale the unit Gamma by 'scale'
//------------------------------------------------------------------------------
double RngEngine::gamma(const double shape, const double scale) {
    if (!(shape > 0.0)) throw std::invalid_argument("RngEngine::gamma: shape must be positive");
    if (!(scale > 0.0)) throw std::invalid_argument("RngEngine::gamma: scale must be positive");
    return sampleGammaShape1(shape) * scale;
}


//------------------------------------------------------------------------------
// poisson(lambda): Knuth below 30, Hörmann's PTRS above
//------------------------------------------------------------------------------
int64_t RngEngine::poissonKnuth(const double lambda) {
    const double L = std::exp(-lambda);
    int64_t k = 0;
    double t = 1.0;
    do {
        ++k;
        t *= uniform();
    }
    while (t > L);
    return k - 1;
}

int64_t RngEngine::poissonPtrs(const double lambda) {
    const double slam = std::sqrt(lambda);
    const double logLam = std::log(lambda);
    const double b = 0.931 + 2.53 * slam;
    const double a = -0.059 + 0.02483 * b;
    const double invAlpha = 1.1239 + 1.1328 / (b - 3.4);
    const double vr = 0.9277 - 3.6224 / (b - 2.0);

    while (true) {
        const double u = uniform() - 0.5;
        const double v = 1.0 - uniform();
        const double us = 0.5 - std::fabs(u);
        const auto k = static_cast<int64_t>(std::floor((2.0 * a / us + b) * u + lambda + 0.43));
        if (us >= 0.07 && v <= vr) return k;
        if (k < 0 || (us < 0.013 && v > us)) continue;
        const double lhs = std::log(v) + std::log(invAlpha) - std::log(a / (us * us) + b);
        const double rhs = -lambda + static_cast<double>(k) * logLam - std::lgamma(static_cast<double>(k) + 1.0);
        if (lhs <= rhs) return k;
    }
}

int64_t RngEngine::poisson(const double lambda) {
    if (!(lambda >= 0.0)) throw std::invalid_argument("RngEngine::poisson: lambda must be non-negative");
    if (lambda == 0.0) return 0;
    if (lambda < kPoissonKnuthLimit) return poissonKnuth(lambda);
    return poissonPtrs(lambda);
}


//------------------------------------------------------------------------------
// negBinomial(r,mu): Gamma(r, mu/r) → Poisson(λ) mix
//------------------------------------------------------------------------------
int64_t RngEngine::negBinomial(const double r, const double mu) {
    if (!(r > 0.0)) throw std::invalid_argument("RngEngine::negBinomial: r must be positive");
    if (!(mu >= 0.0)) throw std::invalid_argument("RngEngine::negBinomial: mu must be non-negative");
    if (mu == 0.0) return 0;

    const double scale = mu / r;
    const double lambda = sampleGammaShape1(r) * scale;
    return poisson(lambda);
}
