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
#ifndef INCLUDED_xp_space_CRobustSearchSpace_h
#define INCLUDED_xp_space_CRobustSearchSpace_h

#include <space/CParameterDistribution.h>
#include <space/CSearchSpace.h>
#include <space/ImportExport.h>

#include <cstddef>
#include <cstdint>
#include <string>

namespace xp {
namespace space {

//! \brief A search space for robust optimisation.
//!
//! DESCRIPTION:\n
//! In addition to the usual parameters this has environmental variables,
//! parameters whose values are drawn from a distribution rather than chosen,
//! and distributions of input perturbations of ordinary parameters.
//!
//! The distributions must satisfy:
//!   -# each parameter has at most one distribution,
//!   -# every environmental variable has a distribution,
//!   -# no distribution covers both environmental variables and ordinary
//!      parameters,
//!   -# environmental distributions are additive,
//!   -# every distributional parameter is a range parameter,
//!   -# perturbation distributions are all additive or all multiplicative.
//!
//! IMPLEMENTATION DECISIONS:\n
//! The environmental variables are parameters of the underlying search space,
//! after the ordinary parameters, so membership checks and casting treat them
//! like any other parameter. Distributions are bound at construction so
//! parameters can't be updated.
class SPACE_EXPORT CRobustSearchSpace : public CSearchSpace {
public:
    //! \throws CDefinitionError or CUnsupportedError if the arguments are
    //! invalid.
    CRobustSearchSpace(TParameterVec parameters,
                       TParameterDistributionVec distributions,
                       std::int64_t numSamples,
                       TParameterVec environmentalVariables = TParameterVec{},
                       TParameterConstraintVec constraints = TParameterConstraintVec{});

    bool isRobust() const override { return true; }

    //! Check if \p name is an environmental variable.
    bool isEnvironmentalVariable(const std::string& name) const;

    //! Get the environmental variable names in declaration order.
    const TStrVec& environmentalVariables() const { return m_EnvironmentalVariables; }

    const TParameterDistributionVec& parameterDistributions() const {
        return m_ParameterDistributions;
    }
    const TParameterDistributionVec& environmentalDistributions() const {
        return m_EnvironmentalDistributions;
    }
    const TParameterDistributionVec& perturbationDistributions() const {
        return m_PerturbationDistributions;
    }

    //! Get the number of samples to draw from the distributions.
    std::size_t numSamples() const { return m_NumSamples; }

    //! Check if the perturbations multiply the parameter values.
    bool multiplicative() const { return m_Multiplicative; }

    //! Add an ordinary parameter before the environmental variables.
    void addParameter(CParameter parameter) override;

    //! \throws CUnsupportedError.
    void updateParameter(CParameter parameter) override;

    TSearchSpaceUPtr clone() const override;

    std::string print() const override;

private:
    static TParameterVec checkArguments(TParameterVec parameters,
                                        const TParameterVec& environmentalVariables,
                                        const TParameterDistributionVec& distributions,
                                        std::int64_t numSamples);
    static TStrVec names(const TParameterVec& parameters);
    void validateDistributions();
    TParameterCPtrVec ordinaryParameters() const;
    TParameterVec copyParameters(bool environmental) const;

private:
    TParameterDistributionVec m_ParameterDistributions;
    TParameterDistributionVec m_EnvironmentalDistributions;
    TParameterDistributionVec m_PerturbationDistributions;
    std::size_t m_NumSamples;
    TStrVec m_EnvironmentalVariables;
    bool m_Multiplicative = false;
};
}
}

#endif // INCLUDED_xp_space_CRobustSearchSpace_h
