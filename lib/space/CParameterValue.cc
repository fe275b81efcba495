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

#include <space/CParameterValue.h>

#include <iomanip>
#include <limits>
#include <ostream>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace xp {
namespace space {
namespace {
const std::string TYPE_NAMES[]{"BOOL", "INT", "FLOAT", "STRING"};
const std::string NONE{"None"};

//! Rank the value kinds for ordering: None, numeric, string.
int rank(CParameterValue::EKind kind) {
    switch (kind) {
    case CParameterValue::E_None:
        return 0;
    case CParameterValue::E_BoolKind:
    case CParameterValue::E_IntKind:
    case CParameterValue::E_DoubleKind:
        return 1;
    case CParameterValue::E_StringKind:
        return 2;
    }
    return 0;
}

//! Prints doubles so that they round trip and always look like floats.
class CPrintVisitor : public boost::static_visitor<std::string> {
public:
    std::string operator()(const boost::blank&) const { return NONE; }
    std::string operator()(bool value) const { return value ? "True" : "False"; }
    std::string operator()(std::int64_t value) const {
        return std::to_string(value);
    }
    std::string operator()(double value) const {
        std::ostringstream result;
        result << std::setprecision(std::numeric_limits<double>::max_digits10 - 2) << value;
        std::string str{result.str()};
        if (str.find_first_of(".eEni") == std::string::npos) {
            str += ".0";
        }
        return str;
    }
    std::string operator()(const std::string& value) const {
        return "'" + value + "'";
    }
};
}

bool isNumeric(EParameterType type) {
    return type == E_Int || type == E_Float;
}

const std::string& print(EParameterType type) {
    return TYPE_NAMES[static_cast<int>(type)];
}

std::ostream& operator<<(std::ostream& o, EParameterType type) {
    return o << print(type);
}

CParameterValue::CParameterValue(bool value) : m_Value{value} {
}

CParameterValue::CParameterValue(int value)
    : m_Value{static_cast<std::int64_t>(value)} {
}

CParameterValue::CParameterValue(std::int64_t value) : m_Value{value} {
}

CParameterValue::CParameterValue(double value) : m_Value{value} {
}

CParameterValue::CParameterValue(const char* value)
    : m_Value{std::string{value}} {
}

CParameterValue::CParameterValue(std::string value)
    : m_Value{std::move(value)} {
}

bool CParameterValue::isNone() const {
    return m_Value.which() == E_None;
}

CParameterValue::EKind CParameterValue::kind() const {
    return static_cast<EKind>(m_Value.which());
}

EParameterType CParameterValue::type() const {
    switch (this->kind()) {
    case E_BoolKind:
        return E_Bool;
    case E_IntKind:
        return E_Int;
    case E_DoubleKind:
        return E_Float;
    case E_StringKind:
        return E_String;
    case E_None:
        break;
    }
    throw std::runtime_error{"None has no parameter type"};
}

bool CParameterValue::isNumeric() const {
    return this->kind() == E_IntKind || this->kind() == E_DoubleKind;
}

bool CParameterValue::asBool() const {
    if (const bool* value = boost::get<bool>(&m_Value)) {
        return *value;
    }
    throw std::runtime_error{"Value " + this->print() + " is not a bool"};
}

std::int64_t CParameterValue::asInt() const {
    if (const std::int64_t* value = boost::get<std::int64_t>(&m_Value)) {
        return *value;
    }
    throw std::runtime_error{"Value " + this->print() + " is not an int"};
}

const std::string& CParameterValue::asString() const {
    if (const std::string* value = boost::get<std::string>(&m_Value)) {
        return *value;
    }
    throw std::runtime_error{"Value " + this->print() + " is not a string"};
}

double CParameterValue::asDouble() const {
    switch (this->kind()) {
    case E_BoolKind:
        return boost::get<bool>(m_Value) ? 1.0 : 0.0;
    case E_IntKind:
        return static_cast<double>(boost::get<std::int64_t>(m_Value));
    case E_DoubleKind:
        return boost::get<double>(m_Value);
    case E_None:
    case E_StringKind:
        break;
    }
    throw std::runtime_error{"Value " + this->print() + " is not numeric"};
}

std::string CParameterValue::print() const {
    return boost::apply_visitor(CPrintVisitor{}, m_Value);
}

bool CParameterValue::operator==(const CParameterValue& rhs) const {
    if (rank(this->kind()) != rank(rhs.kind())) {
        return false;
    }
    switch (this->kind()) {
    case E_None:
        return true;
    case E_StringKind:
        return this->asString() == rhs.asString();
    case E_BoolKind:
    case E_IntKind:
    case E_DoubleKind:
        break;
    }
    if (this->kind() == E_IntKind && rhs.kind() == E_IntKind) {
        return this->asInt() == rhs.asInt();
    }
    return this->asDouble() == rhs.asDouble();
}

bool CParameterValue::operator<(const CParameterValue& rhs) const {
    int lhsRank{rank(this->kind())};
    int rhsRank{rank(rhs.kind())};
    if (lhsRank != rhsRank) {
        return lhsRank < rhsRank;
    }
    switch (this->kind()) {
    case E_None:
        return false;
    case E_StringKind:
        return this->asString() < rhs.asString();
    case E_BoolKind:
    case E_IntKind:
    case E_DoubleKind:
        break;
    }
    if (this->kind() == E_IntKind && rhs.kind() == E_IntKind) {
        return this->asInt() < rhs.asInt();
    }
    return this->asDouble() < rhs.asDouble();
}

std::ostream& operator<<(std::ostream& o, const CParameterValue& value) {
    return o << value.print();
}

std::string print(const TParameterization& parameterization) {
    std::string result{"{"};
    for (const auto& value : parameterization) {
        if (result.size() > 1) {
            result += ", ";
        }
        result += "'" + value.first + "': " + value.second.print();
    }
    return result + "}";
}
}
}
