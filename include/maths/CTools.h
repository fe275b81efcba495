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

#ifndef INCLUDED_xp_maths_CTools_h
#define INCLUDED_xp_maths_CTools_h

#include <core/CNonInstantiatable.h>

#include <maths/ImportExport.h>

#include <cmath>

namespace xp {
namespace maths {

//! \brief A collection of utility functions for search space domains.
class MATHS_EXPORT CTools : private core::CNonInstantiatable {
public:
    //! Compute \f$x^2\f$.
    static double pow2(double x) { return x * x; }

    //! The log odds of \p p.
    //!
    //! i.e. \f$\log\left(\frac{p}{1 - p}\right)\f$.
    static double logit(double p) { return std::log(p) - std::log1p(-p); }

    //! The standard logistic function, the inverse of logit.
    static double logistic(double x) {
        return x >= 0.0 ? 1.0 / (1.0 + std::exp(-x)) : std::exp(x) / (1.0 + std::exp(x));
    }

    //! The midpoint of [\p a, \p b].
    static double linearMidpoint(double a, double b) { return (a + b) / 2.0; }

    //! The midpoint of [\p a, \p b] on a base 10 log scale.
    //!
    //! \note Both \p a and \p b must be positive.
    static double log10Midpoint(double a, double b) {
        return std::pow(10.0, (std::log10(a) + std::log10(b)) / 2.0);
    }

    //! The midpoint of [\p a, \p b] on a logit scale.
    //!
    //! \note Both \p a and \p b must be in the open interval (0, 1).
    static double logitMidpoint(double a, double b) {
        return logistic((logit(a) + logit(b)) / 2.0);
    }
};
}
}

#endif // INCLUDED_xp_maths_CTools_h
