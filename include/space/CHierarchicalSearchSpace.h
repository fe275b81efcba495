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
#ifndef INCLUDED_xp_space_CHierarchicalSearchSpace_h
#define INCLUDED_xp_space_CHierarchicalSearchSpace_h

#include <maths/CPRNG.h>

#include <space/CObservationFeatures.h>
#include <space/CSearchSpace.h>
#include <space/ImportExport.h>

#include <cstddef>
#include <cstdint>
#include <set>
#include <string>
#include <vector>

namespace xp {
namespace space {

//! \brief A search space whose parameters form a dependency tree.
//!
//! DESCRIPTION:\n
//! A choice or fixed parameter can list, for some of its values, parameters
//! which only exist when it takes that value. For example a "model" parameter
//! whose value "A" makes a learning rate parameter "lr" applicable. The
//! parameters must form a single tree:
//!   -# exactly one parameter, the root, isn't a dependent of any other,
//!   -# no parameter is reachable from two different branches,
//!   -# every parameter is reachable from the root.
//! Construction throws CStructureError otherwise.
//!
//! A parameterization belongs to the space if it contains exactly the
//! applicable parameters, i.e. those reachable from the root given the values
//! taken by their ancestors.
//!
//! IMPLEMENTATION DECISIONS:\n
//! The tree is walked by parameter index. Traversals guard against cycles so
//! a malformed dependency graph is reported rather than recursing forever.
//! The structure is fixed at construction: adding parameters or changing the
//! dependents of a parameter throws CUnsupportedError.
//!
//! Random dummy values use a generator owned by the space so flattening with
//! random dummy values isn't thread safe.
class SPACE_EXPORT CHierarchicalSearchSpace : public CSearchSpace {
public:
    //! \throws CDefinitionError as for CSearchSpace.
    //! \throws CStructureError if the parameters don't form a single tree.
    explicit CHierarchicalSearchSpace(TParameterVec parameters,
                                      TParameterConstraintVec constraints = TParameterConstraintVec{});

    bool isHierarchical() const override { return true; }

    //! Get the parameter which doesn't depend on any other.
    const CParameter& root() const { return this->parameterAt(m_Root); }

    //! Get the number of parameters on the longest path from the root.
    std::size_t height() const;

    //! Get an ordinary search space over the same parameters and constraints.
    TSearchSpaceUPtr flatten() const;

    //! Restrict \p parameters to the parameters applicable given their values.
    //!
    //! \param[in] checkAllParametersPresent If true a missing applicable
    //! parameter is an error, otherwise the descent into its subtree stops.
    //! \throws CMembershipError if an applicable parameter is missing.
    TParameterization castParameterization(const TParameterization& parameters,
                                           bool checkAllParametersPresent = true) const;

    //! Cast the values of \p arm and drop its inapplicable parameters.
    CArm castArm(const CArm& arm) const override;

    //! As CSearchSpace::checkMembership but the parameterization must contain
    //! exactly the applicable parameters.
    bool checkMembership(const TParameterization& parameterization,
                         bool raiseError = false,
                         bool checkAllParametersPresent = true) const override;

    //! Drop the inapplicable parameters of \p features recording the original
    //! parameterization as the full parameterization.
    CObservationFeatures castObservationFeatures(const CObservationFeatures& features) const;

    //! Restore a complete parameterization for \p features.
    //!
    //! The recorded full parameterization is overlaid with the current values.
    //! If parameters are still missing and \p injectDummyValues is true they
    //! are set to dummy values, the domain midpoint or, if
    //! \p useRandomDummyValues is true, a random value from the domain.
    CObservationFeatures flattenObservationFeatures(const CObservationFeatures& features,
                                                    bool injectDummyValues = false,
                                                    bool useRandomDummyValues = false) const;

    //! Get a tab indented rendering of the tree.
    std::string hierarchicalStructureStr(bool parameterNamesOnly = false) const;

    //! \throws CUnsupportedError.
    void addParameter(CParameter parameter) override;

    //! As CSearchSpace::updateParameter.
    //!
    //! \throws CUnsupportedError if the dependents change.
    void updateParameter(CParameter parameter) override;

    TSearchSpaceUPtr clone() const override;

    std::string print() const override;

    //! Seed the generator used for random dummy values.
    void seed(std::uint64_t seed);

private:
    using TSizeSet = std::set<std::size_t>;
    using TBoolVec = std::vector<bool>;
    using TStrSet = std::set<std::string>;

private:
    std::size_t findRoot() const;
    void validateHierarchicalStructure() const;
    TSizeSet checkSubtree(std::size_t index, TBoolVec& inProgress) const;
    std::size_t heightFrom(std::size_t index) const;
    void findApplicableParameters(std::size_t index,
                                  const TParameterization& parameters,
                                  bool checkAllParametersPresent,
                                  TStrSet& applicable) const;
    std::string printNames(const TSizeSet& indices) const;
    std::string hierarchicalStructureStr(std::size_t index,
                                         std::size_t level,
                                         bool parameterNamesOnly) const;

private:
    std::size_t m_Root;
    mutable maths::CPRNG::CXorOShiro128Plus m_Rng;
};
}
}

#endif // INCLUDED_xp_space_CHierarchicalSearchSpace_h
