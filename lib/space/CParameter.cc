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

#include <space/CParameter.h>

#include <core/CContainerPrinter.h>
#include <core/CLogger.h>

#include <maths/CSampling.h>
#include <maths/CTools.h>

#include <space/CSearchSpaceErrors.h>

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <exception>
#include <limits>

namespace xp {
namespace space {
namespace {
const std::string KIND_NAMES[]{"Range", "Choice", "Fixed"};

//! Check if \p x is a finite whole number.
bool isIntegral(double x) {
    return std::isfinite(x) && std::floor(x) == x;
}

//! Check if \p x can be converted to a 64 bit integer without overflow.
bool isInt64Representable(double x) {
    // 2^63 is exactly representable as a double, but is one past the largest
    // int64.
    double limit{-static_cast<double>(std::numeric_limits<std::int64_t>::min())};
    return std::isfinite(x) && x >= -limit && x < limit;
}

//! Get \p bound as a value of the range's declared type.
CParameterValue boundValue(EParameterType type, double bound) {
    return type == E_Int ? CParameterValue{static_cast<std::int64_t>(bound)}
                         : CParameterValue{bound};
}

//! Parse \p value as a double or throw CTypeMismatchError.
double parseDouble(const std::string& name, const std::string& value) {
    try {
        std::size_t end{0};
        double result{std::stod(value, &end)};
        if (end == value.size()) {
            return result;
        }
    } catch (const std::exception& e) {
        LOG_TRACE(<< "Failed to parse '" << value << "': " << e.what());
    }
    throw CTypeMismatchError{"Can't cast '" + value + "' to a number for parameter '" +
                             name + "'"};
}

std::string printValues(const TParameterValueVec& values) {
    return core::CContainerPrinter::print(values);
}

//! Midpoint of a domain, before it is cast to the declared type.
class CMidpointVisitor : public boost::static_visitor<CParameterValue> {
public:
    CParameterValue operator()(const SRangeDomain& domain) const {
        return CParameterValue{domain.midpoint()};
    }
    CParameterValue operator()(const SChoiceDomain& domain) const {
        return domain.midpoint();
    }
    CParameterValue operator()(const SFixedDomain& domain) const {
        return domain.midpoint();
    }
};

//! Random point of a domain, before it is cast to the declared type.
class CSampleVisitor : public boost::static_visitor<CParameterValue> {
public:
    explicit CSampleVisitor(maths::CPRNG::CXorOShiro128Plus& rng) : m_Rng{rng} {}

    CParameterValue operator()(const SRangeDomain& domain) const {
        return CParameterValue{domain.sample(m_Rng)};
    }
    CParameterValue operator()(const SChoiceDomain& domain) const {
        return domain.sample(m_Rng);
    }
    CParameterValue operator()(const SFixedDomain& domain) const {
        return domain.sample(m_Rng);
    }

private:
    maths::CPRNG::CXorOShiro128Plus& m_Rng;
};
}

const double CParameter::DOMAIN_TOLERANCE{1.5e-7};

double SRangeDomain::midpoint() const {
    if (s_LogScale) {
        return maths::CTools::log10Midpoint(s_Lower, s_Upper);
    }
    if (s_LogitScale) {
        return maths::CTools::logitMidpoint(s_Lower, s_Upper);
    }
    return maths::CTools::linearMidpoint(s_Lower, s_Upper);
}

double SRangeDomain::sample(maths::CPRNG::CXorOShiro128Plus& rng) const {
    return maths::CSampling::uniformSample(rng, s_Lower, s_Upper);
}

bool SRangeDomain::operator==(const SRangeDomain& rhs) const {
    return s_Lower == rhs.s_Lower && s_Upper == rhs.s_Upper &&
           s_LogScale == rhs.s_LogScale && s_LogitScale == rhs.s_LogitScale;
}

const CParameterValue& SChoiceDomain::midpoint() const {
    return s_Values[s_Values.size() / 2];
}

const CParameterValue& SChoiceDomain::sample(maths::CPRNG::CXorOShiro128Plus& rng) const {
    return s_Values[maths::CSampling::uniformSample(rng, std::size_t{0}, s_Values.size())];
}

bool SChoiceDomain::operator==(const SChoiceDomain& rhs) const {
    return s_Values == rhs.s_Values && s_IsOrdered == rhs.s_IsOrdered &&
           s_IsTask == rhs.s_IsTask;
}

CParameter::CParameter(std::string name,
                       EParameterType type,
                       TDomain domain,
                       bool isFidelity,
                       CParameterValue targetValue,
                       TValueStrVecPrVec dependents)
    : m_Name{std::move(name)}, m_Type{type}, m_Domain{std::move(domain)},
      m_IsFidelity{isFidelity}, m_TargetValue{std::move(targetValue)},
      m_Dependents{std::move(dependents)} {
}

CParameter CParameter::createRange(std::string name,
                                   EParameterType type,
                                   double lower,
                                   double upper,
                                   bool logScale,
                                   bool logitScale,
                                   bool isFidelity,
                                   CParameterValue targetValue) {
    if (xp::space::isNumeric(type) == false) {
        throw CDefinitionError{"Range parameter '" + name + "' must be INT or FLOAT, got " +
                               xp::space::print(type)};
    }
    if (std::isfinite(lower) == false || std::isfinite(upper) == false) {
        throw CDefinitionError{"Range parameter '" + name + "' must have finite bounds"};
    }
    if (lower >= upper) {
        throw CDefinitionError{"Upper bound of range parameter '" + name +
                               "' must be larger than its lower bound"};
    }
    if (type == E_Int && (isIntegral(lower) == false || isIntegral(upper) == false)) {
        throw CDefinitionError{"Integer range parameter '" + name +
                               "' must have integer bounds"};
    }
    if (type == E_Int && (isInt64Representable(lower) == false ||
                          isInt64Representable(upper) == false)) {
        throw CDefinitionError{"Integer range parameter '" + name +
                               "' must have bounds representable as 64 bit integers"};
    }
    if (logScale && logitScale) {
        throw CDefinitionError{"Range parameter '" + name +
                               "' can't be both log and logit scale"};
    }
    if (logScale && lower <= 0.0) {
        throw CDefinitionError{"Log scale range parameter '" + name +
                               "' must have a positive lower bound"};
    }
    if (logitScale && (lower <= 0.0 || upper >= 1.0)) {
        throw CDefinitionError{"Logit scale range parameter '" + name +
                               "' must have bounds in (0, 1)"};
    }
    SRangeDomain domain;
    domain.s_Lower = lower;
    domain.s_Upper = upper;
    domain.s_LogScale = logScale;
    domain.s_LogitScale = logitScale;
    CParameter result{std::move(name), type, std::move(domain), isFidelity,
                      std::move(targetValue), TValueStrVecPrVec{}};
    result.checkDefinition();
    return result;
}

CParameter CParameter::createChoice(std::string name,
                                    EParameterType type,
                                    TParameterValueVec values,
                                    bool isOrdered,
                                    bool isTask,
                                    bool isFidelity,
                                    CParameterValue targetValue,
                                    TValueStrVecPrVec dependents) {
    if (values.empty()) {
        throw CDefinitionError{"Choice parameter '" + name + "' must have at least one value"};
    }
    SChoiceDomain domain;
    domain.s_IsOrdered = isOrdered;
    domain.s_IsTask = isTask;
    domain.s_Values.reserve(values.size());
    CParameter result{name,       type,       SChoiceDomain{},
                      isFidelity, targetValue, std::move(dependents)};
    for (const auto& value : values) {
        if (result.isValidType(value) == false) {
            throw CDefinitionError{"Value " + value.print() + " of choice parameter '" +
                                   name + "' isn't of type " + xp::space::print(type)};
        }
        CParameterValue cast{result.cast(value)};
        if (std::find(domain.s_Values.begin(), domain.s_Values.end(), cast) !=
            domain.s_Values.end()) {
            throw CDefinitionError{"Choice parameter '" + name +
                                   "' has duplicate value " + cast.print()};
        }
        domain.s_Values.push_back(std::move(cast));
    }
    result.m_Domain = std::move(domain);
    result.checkDefinition();
    return result;
}

CParameter CParameter::createFixed(std::string name,
                                   EParameterType type,
                                   CParameterValue value,
                                   bool isFidelity,
                                   CParameterValue targetValue,
                                   TValueStrVecPrVec dependents) {
    CParameter result{name,       type,       SFixedDomain{},
                      isFidelity, targetValue, std::move(dependents)};
    if (result.isValidType(value) == false) {
        throw CDefinitionError{"Value " + value.print() + " of fixed parameter '" +
                               name + "' isn't of type " + xp::space::print(type)};
    }
    SFixedDomain domain;
    domain.s_Value = result.cast(value);
    result.m_Domain = std::move(domain);
    result.checkDefinition();
    return result;
}

void CParameter::checkDefinition() const {
    if (m_Name.empty()) {
        throw CDefinitionError{"Parameter names must be non-empty"};
    }
    if (m_IsFidelity && m_TargetValue.isNone()) {
        throw CDefinitionError{"Fidelity parameter '" + m_Name + "' must have a target value"};
    }
    if (m_TargetValue.isNone() == false && this->isValidType(m_TargetValue) == false) {
        throw CDefinitionError{"Target value " + m_TargetValue.print() + " of parameter '" +
                               m_Name + "' isn't of type " + xp::space::print(m_Type)};
    }
    TParameterValueVec keys;
    for (const auto& dependents : m_Dependents) {
        if (this->validate(dependents.first) == false) {
            throw CDefinitionError{"Dependents of parameter '" + m_Name + "' refer to value " +
                                   dependents.first.print() + " which isn't in its domain"};
        }
        if (std::find(keys.begin(), keys.end(), dependents.first) != keys.end()) {
            throw CDefinitionError{"Dependents of parameter '" + m_Name +
                                   "' are listed twice for value " +
                                   dependents.first.print()};
        }
        keys.push_back(dependents.first);
        for (const auto& dependent : dependents.second) {
            if (dependent == m_Name) {
                throw CDefinitionError{"Parameter '" + m_Name + "' can't depend on itself"};
            }
        }
    }
}

CParameter::EKind CParameter::kind() const {
    return static_cast<EKind>(m_Domain.which());
}

const SRangeDomain& CParameter::range() const {
    if (const SRangeDomain* domain = boost::get<SRangeDomain>(&m_Domain)) {
        return *domain;
    }
    throw CDefinitionError{"Parameter '" + m_Name + "' isn't a range parameter"};
}

const SChoiceDomain& CParameter::choice() const {
    if (const SChoiceDomain* domain = boost::get<SChoiceDomain>(&m_Domain)) {
        return *domain;
    }
    throw CDefinitionError{"Parameter '" + m_Name + "' isn't a choice parameter"};
}

const SFixedDomain& CParameter::fixed() const {
    if (const SFixedDomain* domain = boost::get<SFixedDomain>(&m_Domain)) {
        return *domain;
    }
    throw CDefinitionError{"Parameter '" + m_Name + "' isn't a fixed parameter"};
}

bool CParameter::isNumeric() const {
    return xp::space::isNumeric(m_Type);
}

bool CParameter::isHierarchical() const {
    return m_Dependents.empty() == false;
}

const CParameter::TStrVec* CParameter::dependentsOf(const CParameterValue& value) const {
    for (const auto& dependents : m_Dependents) {
        if (dependents.first == value) {
            return &dependents.second;
        }
    }
    return nullptr;
}

bool CParameter::validate(const CParameterValue& value) const {
    if (this->isValidType(value) == false) {
        return false;
    }
    switch (this->kind()) {
    case E_Range: {
        const SRangeDomain& domain{boost::get<SRangeDomain>(m_Domain)};
        double x{value.asDouble()};
        return x >= domain.s_Lower - DOMAIN_TOLERANCE && x <= domain.s_Upper + DOMAIN_TOLERANCE;
    }
    case E_Choice: {
        const TParameterValueVec& values{boost::get<SChoiceDomain>(m_Domain).s_Values};
        return std::find(values.begin(), values.end(), value) != values.end();
    }
    case E_Fixed:
        return boost::get<SFixedDomain>(m_Domain).s_Value == value;
    }
    return false;
}

bool CParameter::isValidType(const CParameterValue& value) const {
    switch (value.kind()) {
    case CParameterValue::E_None:
        return false;
    case CParameterValue::E_BoolKind:
        return m_Type == E_Bool;
    case CParameterValue::E_IntKind:
        return m_Type == E_Int || m_Type == E_Float;
    case CParameterValue::E_DoubleKind:
        return m_Type == E_Float || (m_Type == E_Int && isIntegral(value.asDouble()));
    case CParameterValue::E_StringKind:
        return m_Type == E_String;
    }
    return false;
}

bool CParameter::isExactType(const CParameterValue& value) const {
    return value.isNone() == false && value.type() == m_Type;
}

CParameterValue CParameter::cast(const CParameterValue& value) const {
    if (value.isNone()) {
        return value;
    }
    bool isString{value.kind() == CParameterValue::E_StringKind};
    switch (m_Type) {
    case E_Bool:
        if (value.kind() == CParameterValue::E_BoolKind) {
            return value;
        }
        return CParameterValue{isString ? value.asString().empty() == false
                                        : value.asDouble() != 0.0};
    case E_Int: {
        if (value.kind() == CParameterValue::E_IntKind) {
            return value;
        }
        double x{std::nearbyint(isString ? parseDouble(m_Name, value.asString())
                                         : value.asDouble())};
        if (isInt64Representable(x) == false) {
            throw CTypeMismatchError{"Can't cast " + value.print() +
                                     " to an integer for parameter '" + m_Name + "'"};
        }
        return CParameterValue{static_cast<std::int64_t>(x)};
    }
    case E_Float:
        return CParameterValue{isString ? parseDouble(m_Name, value.asString())
                                        : value.asDouble()};
    case E_String:
        return isString ? value : CParameterValue{value.print()};
    }
    return value;
}

CParameterValue CParameter::midpoint() const {
    if (this->kind() == E_Range && m_Type == E_Int) {
        // Add a half and truncate toward zero.
        double x{std::trunc(this->range().midpoint() + 0.5)};
        return CParameterValue{static_cast<std::int64_t>(x)};
    }
    return this->cast(boost::apply_visitor(CMidpointVisitor{}, m_Domain));
}

CParameterValue CParameter::sample(maths::CPRNG::CXorOShiro128Plus& rng) const {
    if (this->kind() == E_Range && m_Type == E_Int) {
        // Each integer in [lower, upper] owns a unit interval.
        const SRangeDomain& domain{this->range()};
        double x{std::floor(maths::CSampling::uniformSample(rng, domain.s_Lower,
                                                            domain.s_Upper + 1.0))};
        return CParameterValue{static_cast<std::int64_t>(std::min(x, domain.s_Upper))};
    }
    return this->cast(boost::apply_visitor(CSampleVisitor{rng}, m_Domain));
}

std::string CParameter::domainDescription() const {
    switch (this->kind()) {
    case E_Range: {
        const SRangeDomain& domain{boost::get<SRangeDomain>(m_Domain)};
        return "range=[" + boundValue(m_Type, domain.s_Lower).print() + ", " +
               boundValue(m_Type, domain.s_Upper).print() + "]";
    }
    case E_Choice:
        return "values=" + printValues(boost::get<SChoiceDomain>(m_Domain).s_Values);
    case E_Fixed:
        return "value=" + boost::get<SFixedDomain>(m_Domain).s_Value.print();
    }
    return {};
}

const std::string& CParameter::kindName() const {
    return KIND_NAMES[static_cast<int>(this->kind())];
}

std::string CParameter::flags() const {
    TStrVec flags;
    switch (this->kind()) {
    case E_Range:
        if (this->range().s_LogScale) {
            flags.push_back("log_scale");
        }
        if (this->range().s_LogitScale) {
            flags.push_back("logit_scale");
        }
        break;
    case E_Choice:
        flags.push_back(this->choice().s_IsOrdered ? "ordered" : "unordered");
        if (this->choice().s_IsTask) {
            flags.push_back("task");
        }
        break;
    case E_Fixed:
        break;
    }
    if (m_IsFidelity) {
        flags.push_back("fidelity");
    }
    std::string result;
    for (const auto& flag : flags) {
        result += (result.empty() ? "" : ", ") + flag;
    }
    return result;
}

std::string CParameter::dependentsDescription() const {
    std::string result{"{"};
    for (const auto& dependents : m_Dependents) {
        if (result.size() > 1) {
            result += ", ";
        }
        TStrVec quoted;
        for (const auto& name : dependents.second) {
            quoted.push_back("'" + name + "'");
        }
        result += dependents.first.print() + ": " +
                  core::CContainerPrinter::print(quoted.begin(), quoted.end());
    }
    return result + "}";
}

bool CParameter::operator==(const CParameter& rhs) const {
    return m_Name == rhs.m_Name && m_Type == rhs.m_Type && m_Domain == rhs.m_Domain &&
           m_IsFidelity == rhs.m_IsFidelity && m_TargetValue == rhs.m_TargetValue &&
           m_Dependents == rhs.m_Dependents;
}

std::string CParameter::print() const {
    std::string result{this->kindName() + "(name='" + m_Name +
                       "', type=" + xp::space::print(m_Type) + ", " +
                       this->domainDescription()};
    std::string flags{this->flags()};
    if (flags.empty() == false) {
        result += ", " + flags;
    }
    if (m_TargetValue.isNone() == false) {
        result += ", target=" + m_TargetValue.print();
    }
    if (this->isHierarchical()) {
        result += ", dependents=" + this->dependentsDescription();
    }
    return result + ")";
}
}
}
