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
#ifndef INCLUDED_xp_maths_CSampling_h
#define INCLUDED_xp_maths_CSampling_h

#include <core/CNonInstantiatable.h>

#include <maths/CPRNG.h>
#include <maths/ImportExport.h>

#include <cstddef>
#include <vector>

namespace xp {
namespace maths {

//! \brief Sampling functionality.
//!
//! DESCRIPTION:\n
//! A collection of routines for sampling from the distributions which search
//! spaces use for dummy parameter values and input perturbations.
//!
//! IMPLEMENTATION:\n
//! All functions take the generator explicitly. Samplers must be reproducible
//! given their seed and there is no global generator.
class MATHS_EXPORT CSampling : private core::CNonInstantiatable {
public:
    using TDoubleVec = std::vector<double>;
    using TSizeVec = std::vector<std::size_t>;

public:
    //! \name Uniform Sampling
    //!
    //! Sample uniformly from a specified range. For real types this is the
    //! interval [\p a, \p b) and for integer types the set {\p a, ..., \p b - 1}.
    //@{
    static double uniformSample(CPRNG::CXorOShiro128Plus& rng, double a, double b);
    static std::size_t uniformSample(CPRNG::CXorOShiro128Plus& rng, std::size_t a, std::size_t b);
    static void uniformSample(CPRNG::CXorOShiro128Plus& rng,
                              double a,
                              double b,
                              std::size_t n,
                              TDoubleVec& result);
    static void uniformSample(CPRNG::CXorOShiro128Plus& rng,
                              std::size_t a,
                              std::size_t b,
                              std::size_t n,
                              TSizeVec& result);
    //@}

    //! Get a normal sample with mean and variance \p mean and
    //! \p variance, respectively.
    static double normalSample(CPRNG::CXorOShiro128Plus& rng, double mean, double variance);

    //! Get \p n normal samples with mean and variance \p mean and
    //! \p variance, respectively, using \p rng.
    static void normalSample(CPRNG::CXorOShiro128Plus& rng,
                             double mean,
                             double variance,
                             std::size_t n,
                             TDoubleVec& result);
};
}
}

#endif // INCLUDED_xp_maths_CSampling_h
