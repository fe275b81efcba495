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
#ifndef INCLUDED_xp_space_CParameterDistribution_h
#define INCLUDED_xp_space_CParameterDistribution_h

#include <maths/CLinearAlgebraEigen.h>
#include <maths/CPRNG.h>

#include <space/ImportExport.h>

#include <boost/variant.hpp>

#include <cstddef>
#include <string>
#include <vector>

namespace xp {
namespace space {

//! \brief Independent normal marginals.
struct SPACE_EXPORT SNormalDistribution {
    bool operator==(const SNormalDistribution& rhs) const {
        return s_Mean == rhs.s_Mean && s_StandardDeviation == rhs.s_StandardDeviation;
    }

    double s_Mean = 0.0;
    double s_StandardDeviation = 1.0;
};

//! \brief Independent uniform marginals on [a, b].
struct SPACE_EXPORT SUniformDistribution {
    bool operator==(const SUniformDistribution& rhs) const {
        return s_A == rhs.s_A && s_B == rhs.s_B;
    }

    double s_A = 0.0;
    double s_B = 1.0;
};

//! \brief A distribution over one or more parameters of a robust search space.
//!
//! DESCRIPTION:\n
//! Either describes the values of environmental variables or perturbations of
//! ordinary parameters. Perturbations are added to, or if multiplicative is
//! true multiply, the parameter values. Every parameter has the same marginal
//! distribution and the marginals are independent.
class SPACE_EXPORT CParameterDistribution {
public:
    using TStrVec = std::vector<std::string>;
    using TDistribution = boost::variant<SNormalDistribution, SUniformDistribution>;
    using TDenseMatrix = maths::CDenseMatrix<double>;

public:
    //! \throws CDefinitionError if \p parameters is empty or has duplicates or
    //! the distribution parameters are invalid.
    CParameterDistribution(TStrVec parameters, TDistribution distribution, bool multiplicative = false);

    const TStrVec& parameters() const { return m_Parameters; }
    const TDistribution& distribution() const { return m_Distribution; }
    bool multiplicative() const { return m_Multiplicative; }

    //! Draw \p n samples.
    //!
    //! \return An \p n by number of parameters matrix.
    TDenseMatrix sample(maths::CPRNG::CXorOShiro128Plus& rng, std::size_t n) const;

    bool operator==(const CParameterDistribution& rhs) const;

    std::string print() const;

private:
    TStrVec m_Parameters;
    TDistribution m_Distribution;
    bool m_Multiplicative;
};

using TParameterDistributionVec = std::vector<CParameterDistribution>;
}
}

#endif // INCLUDED_xp_space_CParameterDistribution_h
