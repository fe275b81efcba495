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
#ifndef INCLUDED_xp_space_CSearchSpaceDigest_h
#define INCLUDED_xp_space_CSearchSpaceDigest_h

#include <core/CNonInstantiatable.h>

#include <maths/CLinearAlgebraEigen.h>
#include <maths/CPRNG.h>

#include <space/ImportExport.h>

#include <cstddef>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace xp {
namespace space {
class CSearchSpace;

//! \brief The parts of a robust search space model fitting needs.
//!
//! DESCRIPTION:\n
//! The samplers take no arguments and return a number of samples by number of
//! features matrix. The perturbation sampler has one column per feature which
//! isn't an environmental variable and the environmental sampler one column
//! per environmental variable.
struct SPACE_EXPORT SRobustSearchSpaceDigest {
    using TDenseMatrix = maths::CDenseMatrix<double>;
    using TSampler = std::function<TDenseMatrix()>;
    using TStrVec = std::vector<std::string>;

    //! \throws CDefinitionError if neither sampler is supplied.
    SRobustSearchSpaceDigest(TSampler sampleParameterPerturbations,
                             TSampler sampleEnvironmental,
                             TStrVec environmentalVariables,
                             bool multiplicative);

    //! Samples perturbations of the features which aren't environmental.
    TSampler s_SampleParameterPerturbations;
    //! Samples the environmental variables.
    TSampler s_SampleEnvironmental;
    TStrVec s_EnvironmentalVariables;
    //! Whether the perturbations multiply the feature values.
    bool s_Multiplicative;
};

//! \brief A flat snapshot of a search space for model fitting.
//!
//! DESCRIPTION:\n
//! The feature names define the order of all other fields: an index i refers
//! to feature s_FeatureNames[i]. The bounds are inclusive. This is never
//! mutated after extraction and holds no reference to the search space.
struct SPACE_EXPORT SSearchSpaceDigest {
    using TStrVec = std::vector<std::string>;
    using TDoubleDoublePr = std::pair<double, double>;
    using TDoubleDoublePrVec = std::vector<TDoubleDoublePr>;
    using TSizeVec = std::vector<std::size_t>;
    using TDoubleVec = std::vector<double>;
    using TSizeDoubleVecMap = std::map<std::size_t, TDoubleVec>;
    using TSizeDoubleMap = std::map<std::size_t, double>;
    using TOptionalRobustDigest = std::optional<SRobustSearchSpaceDigest>;

    TStrVec s_FeatureNames;
    TDoubleDoublePrVec s_Bounds;
    TSizeVec s_OrdinalFeatures;
    TSizeVec s_CategoricalFeatures;
    //! The values each ordinal or categorical feature can take.
    TSizeDoubleVecMap s_DiscreteChoices;
    TSizeVec s_TaskFeatures;
    TSizeVec s_FidelityFeatures;
    //! The target values of the fidelity and task features.
    TSizeDoubleMap s_TargetValues;
    TOptionalRobustDigest s_RobustDigest;
};

//! \brief Extracts digests from search spaces.
//!
//! DESCRIPTION:\n
//! The search space is expected to have been transformed so that every
//! parameter is numeric: choice parameters must have numeric values, range
//! parameters must be on a linear scale and there must be no fixed parameters.
//! Otherwise extraction throws CUnsupportedError.
class SPACE_EXPORT CSearchSpaceDigestExtractor : private core::CNonInstantiatable {
public:
    using TStrVec = std::vector<std::string>;
    using TOptionalRobustDigest = SSearchSpaceDigest::TOptionalRobustDigest;

public:
    //! Extract the digest of \p space for its parameters in declaration order.
    static SSearchSpaceDigest
    extract(const CSearchSpace& space,
            const maths::CPRNG::CXorOShiro128Plus& rng = maths::CPRNG::CXorOShiro128Plus{});

    //! Extract the digest of \p space for the features \p names.
    //!
    //! \throws CDefinitionError if a name isn't a parameter of \p space.
    static SSearchSpaceDigest
    extract(const CSearchSpace& space,
            const TStrVec& names,
            const maths::CPRNG::CXorOShiro128Plus& rng = maths::CPRNG::CXorOShiro128Plus{});

    //! Extract the robust digest of \p space for the features \p names.
    //!
    //! Every distributional parameter must be one of \p names and the
    //! environmental variables must be the last names in declaration order.
    //! The samplers own copies of the distributions and of \p rng.
    //!
    //! \return Null if \p space isn't a robust search space.
    //! \throws CDefinitionError if \p names doesn't meet these requirements.
    static TOptionalRobustDigest
    extractRobust(const CSearchSpace& space,
                  const TStrVec& names,
                  const maths::CPRNG::CXorOShiro128Plus& rng = maths::CPRNG::CXorOShiro128Plus{});
};
}
}

#endif // INCLUDED_xp_space_CSearchSpaceDigest_h
