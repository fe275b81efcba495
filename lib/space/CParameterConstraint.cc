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

#include <space/CParameterConstraint.h>

#include <space/CParameter.h>
#include <space/CParameterValue.h>
#include <space/CSearchSpaceErrors.h>

#include <algorithm>
#include <cmath>

namespace xp {
namespace space {
namespace {
void checkNumeric(const CParameter& parameter, const std::string& kind) {
    if (parameter.isNumeric() == false) {
        throw CDefinitionError{kind + " constraints only support numeric parameters, '" +
                               parameter.name() + "' is " +
                               print(parameter.parameterType())};
    }
}

std::string printNumber(double x) {
    return CParameterValue{x}.print();
}
}

const double CParameterConstraint::TOLERANCE{1e-8};

CParameterConstraint::CParameterConstraint(TStrDoublePrVec weights, double bound)
    : CParameterConstraint{E_Linear, std::move(weights), bound, true, TParameterCPtrVec{}} {
    if (m_Weights.empty()) {
        throw CDefinitionError{"Linear constraints must have at least one parameter"};
    }
    TStrVec names{this->parameterNames()};
    std::sort(names.begin(), names.end());
    if (std::adjacent_find(names.begin(), names.end()) != names.end()) {
        throw CDefinitionError{"Linear constraint refers to a parameter more than once"};
    }
    if (std::isfinite(m_Bound) == false) {
        throw CDefinitionError{"Constraint bound must be finite"};
    }
}

CParameterConstraint::CParameterConstraint(EKind kind,
                                           TStrDoublePrVec weights,
                                           double bound,
                                           bool isUpperBound,
                                           TParameterCPtrVec parameters)
    : m_Kind{kind}, m_Weights{std::move(weights)}, m_Bound{bound},
      m_IsUpperBound{isUpperBound}, m_Parameters{std::move(parameters)} {
}

CParameterConstraint CParameterConstraint::order(const CParameter& lower,
                                                 const CParameter& upper) {
    checkNumeric(lower, "Order");
    checkNumeric(upper, "Order");
    if (lower.name() == upper.name()) {
        throw CDefinitionError{"Order constraint on '" + lower.name() + "' with itself"};
    }
    return {E_Order,
            {{lower.name(), 1.0}, {upper.name(), -1.0}},
            0.0,
            true,
            {&lower, &upper}};
}

CParameterConstraint CParameterConstraint::sum(const TParameterCPtrVec& parameters,
                                               bool isUpperBound,
                                               double bound) {
    if (parameters.empty()) {
        throw CDefinitionError{"Sum constraints must have at least one parameter"};
    }
    if (std::isfinite(bound) == false) {
        throw CDefinitionError{"Constraint bound must be finite"};
    }
    double sign{isUpperBound ? 1.0 : -1.0};
    TStrDoublePrVec weights;
    weights.reserve(parameters.size());
    for (const auto* parameter : parameters) {
        checkNumeric(*parameter, "Sum");
        auto duplicate = std::find_if(weights.begin(), weights.end(),
                                      [parameter](const TStrDoublePr& weight) {
                                          return weight.first == parameter->name();
                                      });
        if (duplicate != weights.end()) {
            throw CDefinitionError{"Sum constraint refers to '" + parameter->name() +
                                   "' more than once"};
        }
        weights.emplace_back(parameter->name(), sign);
    }
    return {E_Sum, std::move(weights), sign * bound, isUpperBound, parameters};
}

CParameterConstraint::TStrVec CParameterConstraint::parameterNames() const {
    TStrVec result;
    result.reserve(m_Weights.size());
    for (const auto& weight : m_Weights) {
        result.push_back(weight.first);
    }
    return result;
}

void CParameterConstraint::rebind(const TParameterCPtrVec& parameters) {
    if (parameters.size() != m_Parameters.size()) {
        throw CDefinitionError{"Can't rebind " + this->print() + " to " +
                               std::to_string(parameters.size()) + " parameters"};
    }
    for (std::size_t i = 0; i < parameters.size(); ++i) {
        if (parameters[i]->name() != m_Parameters[i]->name()) {
            throw CDefinitionError{"Can't rebind '" + m_Parameters[i]->name() + "' of " +
                                   this->print() + " to '" + parameters[i]->name() + "'"};
        }
    }
    m_Parameters = parameters;
}

bool CParameterConstraint::check(const TStrDoubleMap& values) const {
    double weightedSum{0.0};
    for (const auto& weight : m_Weights) {
        auto value = values.find(weight.first);
        if (value == values.end()) {
            return true;
        }
        weightedSum += weight.second * value->second;
    }
    return weightedSum <= m_Bound + TOLERANCE;
}

bool CParameterConstraint::operator==(const CParameterConstraint& rhs) const {
    return m_Kind == rhs.m_Kind && m_Weights == rhs.m_Weights &&
           m_Bound == rhs.m_Bound && m_IsUpperBound == rhs.m_IsUpperBound;
}

std::string CParameterConstraint::print() const {
    switch (m_Kind) {
    case E_Order:
        return "OrderConstraint(" + m_Weights[0].first + " <= " + m_Weights[1].first + ")";
    case E_Sum: {
        std::string result{"SumConstraint("};
        for (std::size_t i = 0; i < m_Weights.size(); ++i) {
            result += (i > 0 ? " + " : "") + m_Weights[i].first;
        }
        return result + (m_IsUpperBound ? " <= " : " >= ") +
               printNumber(m_IsUpperBound ? m_Bound : -m_Bound) + ")";
    }
    case E_Linear:
        break;
    }
    std::string result{"ParameterConstraint("};
    for (std::size_t i = 0; i < m_Weights.size(); ++i) {
        result += (i > 0 ? " + " : "") + printNumber(m_Weights[i].second) + "*" +
                  m_Weights[i].first;
    }
    return result + " <= " + printNumber(m_Bound) + ")";
}
}
}
