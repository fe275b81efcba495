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
#ifndef INCLUDED_xp_space_CParameterValue_h
#define INCLUDED_xp_space_CParameterValue_h

#include <space/ImportExport.h>

#include <boost/blank.hpp>
#include <boost/variant.hpp>

#include <cstdint>
#include <iosfwd>
#include <map>
#include <string>
#include <vector>

namespace xp {
namespace space {

//! \brief The value types a parameter can declare.
enum EParameterType { E_Bool = 0, E_Int = 1, E_Float = 2, E_String = 3 };

//! Check if \p type is an int or float type.
SPACE_EXPORT bool isNumeric(EParameterType type);

//! Get the name of \p type, i.e. BOOL, INT, FLOAT or STRING.
SPACE_EXPORT const std::string& print(EParameterType type);

SPACE_EXPORT std::ostream& operator<<(std::ostream& o, EParameterType type);

//! \brief A single parameter value.
//!
//! DESCRIPTION:\n
//! Holds one of: unset (None), a bool, a 64 bit integer, a double or a string.
//! Parameterizations map parameter names to values of this type.
//!
//! Numeric values compare equal by value irrespective of their storage type,
//! so for example the integer 1 equals the double 1.0 and the bool true. This
//! is what looking up the dependents of a parameter by the value it takes needs.
//! Use isExactType on the parameter to enforce type equality.
//!
//! IMPLEMENTATION DECISIONS:\n
//! All constructors are explicit and there is an overload for string literals
//! so that a literal never silently converts to bool.
class SPACE_EXPORT CParameterValue {
public:
    //! The value kinds in variant index order.
    enum EKind { E_None = 0, E_BoolKind = 1, E_IntKind = 2, E_DoubleKind = 3, E_StringKind = 4 };

public:
    CParameterValue() = default;
    explicit CParameterValue(bool value);
    explicit CParameterValue(int value);
    explicit CParameterValue(std::int64_t value);
    explicit CParameterValue(double value);
    explicit CParameterValue(const char* value);
    explicit CParameterValue(std::string value);

    //! Check if the value is unset.
    bool isNone() const;

    //! Get the kind of value held.
    EKind kind() const;

    //! Get the parameter type corresponding to the value held.
    //!
    //! \note Must not be called on an unset value.
    EParameterType type() const;

    //! Check if the value is an integer or a double.
    bool isNumeric() const;

    //! \name Accessors
    //!
    //! These throw std::runtime_error if the value is of a different kind.
    //@{
    bool asBool() const;
    std::int64_t asInt() const;
    const std::string& asString() const;
    //@}

    //! Get the value as a double.
    //!
    //! Bools and integers are widened. Throws std::runtime_error for strings
    //! and unset values.
    double asDouble() const;

    //! Get a string representation of the value.
    std::string print() const;

    bool operator==(const CParameterValue& rhs) const;
    bool operator!=(const CParameterValue& rhs) const {
        return (*this == rhs) == false;
    }

    //! Total order: None before numeric before string. Numeric values are
    //! compared by value.
    bool operator<(const CParameterValue& rhs) const;

private:
    using TValue = boost::variant<boost::blank, bool, std::int64_t, double, std::string>;

private:
    TValue m_Value;
};

SPACE_EXPORT std::ostream& operator<<(std::ostream& o, const CParameterValue& value);

using TParameterValueVec = std::vector<CParameterValue>;
using TStrParameterValueMap = std::map<std::string, CParameterValue>;
//! A parameterization maps parameter names to values.
using TParameterization = TStrParameterValueMap;

//! Get a string representation of \p parameterization.
SPACE_EXPORT std::string print(const TParameterization& parameterization);
}
}

#endif // INCLUDED_xp_space_CParameterValue_h
