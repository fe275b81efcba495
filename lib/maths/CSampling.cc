/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License
 * 2.0 and the following additional limitation. Functionality enabled by the
 * files subject to the Elastic License 2.0 may only be used in production when
 * invoked by an Elasticsearch process with a license key installed that permits
 * use of machine learning features. You may not use this file except in
 * compliance with the Elastic License 2.0 and the foregoing additional
 * limitation.
 */

#include <maths/CSampling.h>

#include <core/CLogger.h>

#include <boost/random/normal_distribution.hpp>
#include <boost/random/uniform_int_distribution.hpp>
#include <boost/random/uniform_real_distribution.hpp>

#include <cmath>

namespace xp {
namespace maths {
namespace {

using TDoubleVec = std::vector<double>;
using TSizeVec = std::vector<std::size_t>;

//! Defines the appropriate integer random number generator.
template<typename INTEGER>
struct SRng {
    using Type = boost::random::uniform_int_distribution<INTEGER>;
    static INTEGER min(INTEGER a) { return a; }
    static INTEGER max(INTEGER b) { return b - 1; }
};
//! Specialization for a real uniform random number generator.
template<>
struct SRng<double> {
    using Type = boost::random::uniform_real_distribution<double>;
    static double min(double a) { return a; }
    static double max(double b) { return b; }
};

//! Implementation of uniform sampling.
template<typename RNG, typename TYPE>
TYPE doUniformSample(RNG& rng, TYPE a, TYPE b) {
    if (b <= a) {
        return a;
    }
    typename SRng<TYPE>::Type uniform(SRng<TYPE>::min(a), SRng<TYPE>::max(b));
    return uniform(rng);
}

//! Implementation of uniform sampling.
template<typename RNG, typename TYPE>
void doUniformSample(RNG& rng, TYPE a, TYPE b, std::size_t n, std::vector<TYPE>& result) {
    result.clear();
    if (b <= a) {
        result.resize(n, a);
        return;
    }
    result.reserve(n);
    typename SRng<TYPE>::Type uniform(SRng<TYPE>::min(a), SRng<TYPE>::max(b));
    for (std::size_t i = 0; i < n; ++i) {
        result.push_back(uniform(rng));
    }
}

//! Implementation of normal sampling.
template<typename RNG>
double doNormalSample(RNG& rng, double mean, double variance) {
    if (variance < 0.0) {
        LOG_ERROR(<< "Invalid variance " << variance);
        return mean;
    }
    if (variance == 0.0) {
        return mean;
    }
    boost::random::normal_distribution<double> normal(mean, std::sqrt(variance));
    return normal(rng);
}

//! Implementation of normal sampling.
template<typename RNG>
void doNormalSample(RNG& rng, double mean, double variance, std::size_t n, TDoubleVec& result) {
    result.clear();
    if (variance < 0.0) {
        LOG_ERROR(<< "Invalid variance " << variance);
        return;
    }
    if (variance == 0.0) {
        result.resize(n, mean);
        return;
    }
    result.reserve(n);
    boost::random::normal_distribution<double> normal(mean, std::sqrt(variance));
    for (std::size_t i = 0; i < n; ++i) {
        result.push_back(normal(rng));
    }
}
}

double CSampling::uniformSample(CPRNG::CXorOShiro128Plus& rng, double a, double b) {
    return doUniformSample(rng, a, b);
}

std::size_t CSampling::uniformSample(CPRNG::CXorOShiro128Plus& rng, std::size_t a, std::size_t b) {
    return doUniformSample(rng, a, b);
}

void CSampling::uniformSample(CPRNG::CXorOShiro128Plus& rng,
                              double a,
                              double b,
                              std::size_t n,
                              TDoubleVec& result) {
    doUniformSample(rng, a, b, n, result);
}

void CSampling::uniformSample(CPRNG::CXorOShiro128Plus& rng,
                              std::size_t a,
                              std::size_t b,
                              std::size_t n,
                              TSizeVec& result) {
    doUniformSample(rng, a, b, n, result);
}

double CSampling::normalSample(CPRNG::CXorOShiro128Plus& rng, double mean, double variance) {
    return doNormalSample(rng, mean, variance);
}

void CSampling::normalSample(CPRNG::CXorOShiro128Plus& rng,
                             double mean,
                             double variance,
                             std::size_t n,
                             TDoubleVec& result) {
    doNormalSample(rng, mean, variance, n, result);
}
}
}
