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
#ifndef INCLUDED_xp_space_CSearchSpace_h
#define INCLUDED_xp_space_CSearchSpace_h

#include <core/CNonCopyable.h>

#include <space/CArm.h>
#include <space/CParameter.h>
#include <space/CParameterConstraint.h>
#include <space/CParameterValue.h>
#include <space/ImportExport.h>

#include <boost/unordered_map.hpp>

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace xp {
namespace space {

//! \brief One row of a search space summary.
struct SPACE_EXPORT SParameterSummary {
    std::string s_Name;
    std::string s_Type;
    std::string s_Domain;
    std::string s_Datatype;
    std::string s_Flags;
    std::string s_TargetValue;
    std::string s_DependentParameters;
};

//! \brief The domain over which candidate points are proposed.
//!
//! DESCRIPTION:\n
//! A search space owns a collection of uniquely named parameters and a list
//! of linear constraints over its numeric parameters. It decides whether a
//! parameterization belongs to the space and casts parameterizations to the
//! declared parameter types.
//!
//! Membership checks come in two flavours selected by a flag: a boolean one
//! for filtering many candidates cheaply and a raising one which throws
//! CMembershipError with a description of the violation.
//!
//! IMPLEMENTATION DECISIONS:\n
//! Parameters are stored by pointer in declaration order with a name to index
//! map. Updating a parameter assigns into its existing slot so order and sum
//! constraints, which borrow the space's parameter definitions, always see the
//! current definition. Every mutation validates its argument completely before
//! changing any state.
//!
//! Mutation isn't thread safe. Const member functions can be called
//! concurrently if no mutation is in flight.
class SPACE_EXPORT CSearchSpace : private core::CNonCopyable {
public:
    using TStrVec = std::vector<std::string>;
    using TParameterVec = std::vector<CParameter>;
    using TParameterCPtrVec = std::vector<const CParameter*>;
    using TParameterSummaryVec = std::vector<SParameterSummary>;
    using TOptionalStr = std::optional<std::string>;
    using TSearchSpaceUPtr = std::unique_ptr<CSearchSpace>;

public:
    //! \throws CDefinitionError if names aren't unique or a constraint is
    //! inconsistent with \p parameters.
    explicit CSearchSpace(TParameterVec parameters,
                          TParameterConstraintVec constraints = TParameterConstraintVec{});
    virtual ~CSearchSpace() = default;

    //! \name Properties
    //@{
    virtual bool isHierarchical() const { return false; }
    virtual bool isRobust() const { return false; }
    std::size_t numberParameters() const { return m_Parameters.size(); }
    //! Get the parameters in declaration order.
    TParameterCPtrVec parameters() const;
    TStrVec parameterNames() const;
    bool hasParameter(const std::string& name) const;
    //! \throws CDefinitionError if there is no parameter called \p name.
    const CParameter& parameter(const std::string& name) const;
    //! \throws CDefinitionError if there is no parameter called \p name.
    std::size_t indexOf(const std::string& name) const;
    const CParameter& parameterAt(std::size_t index) const {
        return *m_Parameters[index];
    }
    const TParameterConstraintVec& parameterConstraints() const {
        return m_ParameterConstraints;
    }
    //! Get the parameters with a range domain.
    TParameterCPtrVec rangeParameters() const;
    //! Get the parameters which aren't fixed.
    TParameterCPtrVec tunableParameters() const;
    //@}

    //! \name Mutation
    //@{
    //! \throws CDefinitionError if the name is already used.
    virtual void addParameter(CParameter parameter);
    //! Replace the definition of an existing parameter.
    //!
    //! \throws CDefinitionError if the parameter doesn't exist.
    //! \throws CUnsupportedError if the declared type differs.
    virtual void updateParameter(CParameter parameter);
    //! Replace all constraints, rebinding them to this space's parameters.
    void setParameterConstraints(TParameterConstraintVec constraints);
    //! Append constraints, rebinding them to this space's parameters.
    void addParameterConstraints(TParameterConstraintVec constraints);
    //@}

    //! Check the keys of \p parameterization are exactly the parameter names.
    bool checkAllParametersPresent(const TParameterization& parameterization,
                                   bool raiseError = false) const;

    //! Check if \p parameterization belongs to the space.
    //!
    //! Every value must be in its parameter's domain and the numeric values
    //! must satisfy every constraint. Integer and float values are used
    //! interchangeably here.
    //!
    //! \param[in] raiseError If true throw CMembershipError instead of
    //! returning false.
    //! \param[in] checkAllParametersPresent If true every parameter must have
    //! a value.
    virtual bool checkMembership(const TParameterization& parameterization,
                                 bool raiseError = false,
                                 bool checkAllParametersPresent = true) const;

    //! Check the values of \p parameterization have valid types.
    bool checkTypes(const TParameterization& parameterization,
                    bool allowNone = true,
                    bool allowExtraParams = true,
                    bool raiseError = false) const;

    //! Cast the values of \p arm to the declared types.
    //!
    //! Values for unknown names are passed through unchanged.
    virtual CArm castArm(const CArm& arm) const;

    //! Get an arm with every parameter unset.
    CArm outOfDesignArm() const;

    //! Get an arm with every parameter unset apart from those in \p parameters.
    //!
    //! \throws CMembershipError if \p parameters contains an unknown name or
    //! a value which isn't in its parameter's domain.
    CArm constructArm(const TParameterization& parameters = TParameterization{},
                      TOptionalStr name = TOptionalStr{}) const;

    //! Check membership, raising on failure, and then that every value has
    //! exactly its parameter's declared type.
    //!
    //! \throws CMembershipError or CTypeMismatchError.
    void validateMembership(const TParameterization& parameterization) const;

    //! Get a deep copy of this space.
    virtual TSearchSpaceUPtr clone() const;

    //! Get one summary row per parameter.
    TParameterSummaryVec summary() const;

    //! Get the summary as a table.
    std::string printSummary() const;

    virtual std::string print() const;

protected:
    //! Get the parameter definitions.
    TParameterVec copyParameters() const;

    //! Insert \p parameter before the parameter at \p position.
    //!
    //! \throws CDefinitionError if the name is already used.
    void insertParameter(std::size_t position, CParameter parameter);

    //! Get a string representation of the parameter list.
    std::string printParameters(const TParameterCPtrVec& parameters) const;

    //! Get a string representation of the constraint list.
    std::string printParameterConstraints() const;

    //! Record a rejected parameterization.
    //!
    //! \return false, or throws CMembershipError if \p raiseError is true.
    static bool reject(bool raiseError, const std::string& reason);

private:
    using TParameterUPtr = std::unique_ptr<CParameter>;
    using TParameterUPtrVec = std::vector<TParameterUPtr>;
    using TStrSizeUMap = boost::unordered_map<std::string, std::size_t>;

private:
    void validateParameterConstraints(const TParameterConstraintVec& constraints) const;
    void rebindParameterConstraints(TParameterConstraintVec& constraints) const;

private:
    TParameterUPtrVec m_Parameters;
    TStrSizeUMap m_ParameterIndex;
    TParameterConstraintVec m_ParameterConstraints;
};
}
}

#endif // INCLUDED_xp_space_CSearchSpace_h
