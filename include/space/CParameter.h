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
#ifndef INCLUDED_xp_space_CParameter_h
#define INCLUDED_xp_space_CParameter_h

#include <maths/CPRNG.h>

#include <space/CParameterValue.h>
#include <space/ImportExport.h>

#include <boost/variant.hpp>

#include <string>
#include <utility>
#include <vector>

namespace xp {
namespace space {

//! \brief A continuous or integer interval [lower, upper].
struct SPACE_EXPORT SRangeDomain {
    //! The centre of the domain on its declared scale.
    double midpoint() const;
    //! A uniform random point in [lower, upper).
    double sample(maths::CPRNG::CXorOShiro128Plus& rng) const;
    bool operator==(const SRangeDomain& rhs) const;

    double s_Lower = 0.0;
    double s_Upper = 1.0;
    bool s_LogScale = false;
    bool s_LogitScale = false;
};

//! \brief A finite list of distinct values.
struct SPACE_EXPORT SChoiceDomain {
    //! The middle value in declaration order.
    const CParameterValue& midpoint() const;
    //! A uniform random choice of value.
    const CParameterValue& sample(maths::CPRNG::CXorOShiro128Plus& rng) const;
    bool operator==(const SChoiceDomain& rhs) const;

    TParameterValueVec s_Values;
    bool s_IsOrdered = false;
    bool s_IsTask = false;
};

//! \brief A single value.
struct SPACE_EXPORT SFixedDomain {
    const CParameterValue& midpoint() const { return s_Value; }
    const CParameterValue& sample(maths::CPRNG::CXorOShiro128Plus&) const {
        return s_Value;
    }
    bool operator==(const SFixedDomain& rhs) const {
        return s_Value == rhs.s_Value;
    }

    CParameterValue s_Value;
};

//! \brief A named search space dimension.
//!
//! DESCRIPTION:\n
//! A parameter has a name, a declared value type and a domain which is one
//! of a range, a choice or a fixed value. Choice and fixed parameters may be
//! hierarchical: for some of the values they can take they list the names of
//! other parameters which only exist when the parameter takes that value.
//!
//! IMPLEMENTATION DECISIONS:\n
//! The domain kinds are a closed set so they are held in a variant and all
//! kind specific behaviour is dispatched by visiting it. Parameters are value
//! types: the search space which owns them is responsible for their identity.
//!
//! Parameters are created with the create* factory functions, which throw
//! CDefinitionError for invalid definitions.
class SPACE_EXPORT CParameter {
public:
    using TStrVec = std::vector<std::string>;
    using TValueStrVecPr = std::pair<CParameterValue, TStrVec>;
    //! Dependents in declaration order, value -> dependent parameter names.
    using TValueStrVecPrVec = std::vector<TValueStrVecPr>;
    using TDomain = boost::variant<SRangeDomain, SChoiceDomain, SFixedDomain>;

    //! The domain kinds in variant index order.
    enum EKind { E_Range = 0, E_Choice = 1, E_Fixed = 2 };

    //! Values within this distance of a range's bounds are in the domain.
    static const double DOMAIN_TOLERANCE;

public:
    //! Create a range parameter.
    //!
    //! \param[in] type Must be E_Int or E_Float.
    //! \param[in] lower Must be less than \p upper and, for integer parameters,
    //! integral and representable as a 64 bit integer.
    //! \param[in] logScale If true \p lower must be positive.
    //! \param[in] logitScale If true the bounds must be in (0, 1).
    static CParameter createRange(std::string name,
                                  EParameterType type,
                                  double lower,
                                  double upper,
                                  bool logScale = false,
                                  bool logitScale = false,
                                  bool isFidelity = false,
                                  CParameterValue targetValue = CParameterValue{});

    //! Create a choice parameter.
    //!
    //! The values are cast to \p type and must be distinct.
    static CParameter createChoice(std::string name,
                                   EParameterType type,
                                   TParameterValueVec values,
                                   bool isOrdered = false,
                                   bool isTask = false,
                                   bool isFidelity = false,
                                   CParameterValue targetValue = CParameterValue{},
                                   TValueStrVecPrVec dependents = TValueStrVecPrVec{});

    //! Create a fixed parameter.
    static CParameter createFixed(std::string name,
                                  EParameterType type,
                                  CParameterValue value,
                                  bool isFidelity = false,
                                  CParameterValue targetValue = CParameterValue{},
                                  TValueStrVecPrVec dependents = TValueStrVecPrVec{});

    //! \name Properties
    //@{
    const std::string& name() const { return m_Name; }
    EParameterType parameterType() const { return m_Type; }
    EKind kind() const;
    const TDomain& domain() const { return m_Domain; }
    //! Get the range domain. Throws CDefinitionError if this isn't a range.
    const SRangeDomain& range() const;
    //! Get the choice domain. Throws CDefinitionError if this isn't a choice.
    const SChoiceDomain& choice() const;
    //! Get the fixed domain. Throws CDefinitionError if this isn't fixed.
    const SFixedDomain& fixed() const;
    bool isFidelity() const { return m_IsFidelity; }
    const CParameterValue& targetValue() const { return m_TargetValue; }
    //! Check if the declared type is int or float.
    bool isNumeric() const;
    //! Check if any value has dependent parameters.
    bool isHierarchical() const;
    const TValueStrVecPrVec& dependents() const { return m_Dependents; }
    //! Get the parameters which depend on this one taking \p value.
    const TStrVec* dependentsOf(const CParameterValue& value) const;
    //@}

    //! Check if \p value is in the domain.
    bool validate(const CParameterValue& value) const;

    //! Check if \p value can be cast to the declared type without changing it.
    //!
    //! Floats accept integers and integers accept integral doubles.
    bool isValidType(const CParameterValue& value) const;

    //! Check if \p value is stored with exactly the declared type.
    bool isExactType(const CParameterValue& value) const;

    //! Cast \p value to the declared type.
    //!
    //! Integers are rounded to nearest with ties to even. Unset values are
    //! returned unchanged.
    //!
    //! \throws CTypeMismatchError if a string doesn't parse as a number or a
    //! value can't be represented as a 64 bit integer.
    CParameterValue cast(const CParameterValue& value) const;

    //! Get the value at the centre of the domain.
    //!
    //! Fixed parameters use their value, choices their middle value and ranges
    //! the midpoint on their scale. Integer ranges add a half to the
    //! midpoint and truncate toward zero.
    CParameterValue midpoint() const;

    //! Get a uniform random value from the domain.
    //!
    //! Integer ranges sample every integer in [lower, upper] with equal
    //! probability.
    CParameterValue sample(maths::CPRNG::CXorOShiro128Plus& rng) const;

    //! Get a description of the domain, e.g. "range=[0.0, 1.0]".
    std::string domainDescription() const;

    //! Get the kind name, i.e. Range, Choice or Fixed.
    const std::string& kindName() const;

    //! Get a comma separated list of the set flags.
    std::string flags() const;

    //! Get a description of the dependents, e.g. "{'A': ['lr']}".
    std::string dependentsDescription() const;

    bool operator==(const CParameter& rhs) const;
    bool operator!=(const CParameter& rhs) const {
        return (*this == rhs) == false;
    }

    //! Get a string representation of the parameter.
    std::string print() const;

private:
    CParameter(std::string name,
               EParameterType type,
               TDomain domain,
               bool isFidelity,
               CParameterValue targetValue,
               TValueStrVecPrVec dependents);

    //! Check the dependents and target value are consistent with the domain.
    void checkDefinition() const;

private:
    std::string m_Name;
    EParameterType m_Type;
    TDomain m_Domain;
    bool m_IsFidelity;
    CParameterValue m_TargetValue;
    TValueStrVecPrVec m_Dependents;
};
}
}

#endif // INCLUDED_xp_space_CParameter_h
