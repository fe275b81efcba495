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

#include <space/CSearchSpace.h>

#include <core/CContainerPrinter.h>
#include <core/CLogger.h>

#include <space/CSearchSpaceErrors.h>

#include <algorithm>
#include <array>
#include <cstddef>
#include <utility>

namespace xp {
namespace space {
namespace {
const std::string NONE{"None"};
const std::string DATATYPE_NAMES[]{"bool", "int", "float", "str"};
const std::size_t NUMBER_COLUMNS{7};
const std::array<std::string, NUMBER_COLUMNS> COLUMN_NAMES{
    {"Name", "Type", "Domain", "Datatype", "Flags", "Target Value", "Dependent Parameters"}};

std::string quoted(const std::string& name) {
    return "'" + name + "'";
}

std::array<std::string, NUMBER_COLUMNS> columns(const SParameterSummary& row) {
    return {{row.s_Name, row.s_Type, row.s_Domain, row.s_Datatype, row.s_Flags,
             row.s_TargetValue, row.s_DependentParameters}};
}
}

CSearchSpace::CSearchSpace(TParameterVec parameters, TParameterConstraintVec constraints) {
    m_Parameters.reserve(parameters.size());
    for (auto& parameter : parameters) {
        if (m_ParameterIndex.count(parameter.name()) > 0) {
            throw CDefinitionError{"Parameter names must be unique, '" +
                                   parameter.name() + "' is repeated"};
        }
        m_ParameterIndex.emplace(parameter.name(), m_Parameters.size());
        m_Parameters.push_back(std::make_unique<CParameter>(std::move(parameter)));
    }
    this->setParameterConstraints(std::move(constraints));
}

CSearchSpace::TParameterCPtrVec CSearchSpace::parameters() const {
    TParameterCPtrVec result;
    result.reserve(m_Parameters.size());
    for (const auto& parameter : m_Parameters) {
        result.push_back(parameter.get());
    }
    return result;
}

CSearchSpace::TStrVec CSearchSpace::parameterNames() const {
    TStrVec result;
    result.reserve(m_Parameters.size());
    for (const auto& parameter : m_Parameters) {
        result.push_back(parameter->name());
    }
    return result;
}

bool CSearchSpace::hasParameter(const std::string& name) const {
    return m_ParameterIndex.find(name) != m_ParameterIndex.end();
}

const CParameter& CSearchSpace::parameter(const std::string& name) const {
    return *m_Parameters[this->indexOf(name)];
}

std::size_t CSearchSpace::indexOf(const std::string& name) const {
    auto index = m_ParameterIndex.find(name);
    if (index == m_ParameterIndex.end()) {
        throw CDefinitionError{"Parameter " + quoted(name) + " is not part of the search space"};
    }
    return index->second;
}

CSearchSpace::TParameterCPtrVec CSearchSpace::rangeParameters() const {
    TParameterCPtrVec result;
    for (const auto& parameter : m_Parameters) {
        if (parameter->kind() == CParameter::E_Range) {
            result.push_back(parameter.get());
        }
    }
    return result;
}

CSearchSpace::TParameterCPtrVec CSearchSpace::tunableParameters() const {
    TParameterCPtrVec result;
    for (const auto& parameter : m_Parameters) {
        if (parameter->kind() != CParameter::E_Fixed) {
            result.push_back(parameter.get());
        }
    }
    return result;
}

void CSearchSpace::addParameter(CParameter parameter) {
    this->insertParameter(m_Parameters.size(), std::move(parameter));
}

void CSearchSpace::updateParameter(CParameter parameter) {
    auto index = m_ParameterIndex.find(parameter.name());
    if (index == m_ParameterIndex.end()) {
        throw CDefinitionError{"Parameter " + quoted(parameter.name()) +
                               " does not exist in search space. Use addParameter "
                               "to add a new parameter"};
    }
    CParameter& existing{*m_Parameters[index->second]};
    if (existing.parameterType() != parameter.parameterType()) {
        throw CUnsupportedError{"Parameter " + quoted(parameter.name()) + " has type " +
                                xp::space::print(existing.parameterType()) +
                                ". Cannot update to type " +
                                xp::space::print(parameter.parameterType())};
    }
    existing = std::move(parameter);
}

void CSearchSpace::setParameterConstraints(TParameterConstraintVec constraints) {
    this->validateParameterConstraints(constraints);
    this->rebindParameterConstraints(constraints);
    m_ParameterConstraints = std::move(constraints);
}

void CSearchSpace::addParameterConstraints(TParameterConstraintVec constraints) {
    this->validateParameterConstraints(constraints);
    this->rebindParameterConstraints(constraints);
    m_ParameterConstraints.insert(m_ParameterConstraints.end(),
                                  std::make_move_iterator(constraints.begin()),
                                  std::make_move_iterator(constraints.end()));
}

bool CSearchSpace::checkAllParametersPresent(const TParameterization& parameterization,
                                             bool raiseError) const {
    bool allPresent{parameterization.size() == m_Parameters.size()};
    for (auto i = parameterization.begin(); allPresent && i != parameterization.end(); ++i) {
        allPresent = this->hasParameter(i->first);
    }
    if (allPresent) {
        return true;
    }
    TStrVec names;
    for (const auto& value : parameterization) {
        names.push_back(value.first);
    }
    TStrVec expected{this->parameterNames()};
    std::sort(expected.begin(), expected.end());
    return reject(raiseError, "Parameterization has parameters: " +
                                  core::CContainerPrinter::print(names) +
                                  ", but search space has parameters: " +
                                  core::CContainerPrinter::print(expected));
}

bool CSearchSpace::checkMembership(const TParameterization& parameterization,
                                   bool raiseError,
                                   bool checkAllParametersPresent) const {
    if (checkAllParametersPresent &&
        this->checkAllParametersPresent(parameterization, raiseError) == false) {
        return false;
    }

    for (const auto& value : parameterization) {
        auto index = m_ParameterIndex.find(value.first);
        if (index == m_ParameterIndex.end()) {
            return reject(raiseError, "Parameter " + quoted(value.first) +
                                          " not defined in search space");
        }
        const CParameter& parameter{*m_Parameters[index->second]};
        if (parameter.validate(value.second) == false) {
            return reject(raiseError, value.second.print() +
                                          " is not a valid value for parameter " +
                                          parameter.print());
        }
    }

    // Constraints only see numeric parameters and treat ints as floats.
    CParameterConstraint::TStrDoubleMap numericValues;
    for (const auto& value : parameterization) {
        if (this->parameter(value.first).isNumeric()) {
            numericValues.emplace(value.first, value.second.asDouble());
        }
    }
    for (const auto& constraint : m_ParameterConstraints) {
        if (constraint.check(numericValues) == false) {
            return reject(raiseError,
                          "Parameter constraint " + constraint.print() + " is violated");
        }
    }

    return true;
}

bool CSearchSpace::checkTypes(const TParameterization& parameterization,
                              bool allowNone,
                              bool allowExtraParams,
                              bool raiseError) const {
    for (const auto& value : parameterization) {
        auto index = m_ParameterIndex.find(value.first);
        if (index == m_ParameterIndex.end()) {
            if (allowExtraParams) {
                continue;
            }
            return reject(raiseError, "Parameter " + quoted(value.first) +
                                          " not defined in search space");
        }
        if (value.second.isNone() && allowNone) {
            continue;
        }
        const CParameter& parameter{*m_Parameters[index->second]};
        if (parameter.isValidType(value.second) == false) {
            std::string reason{value.second.print() + " is not a valid value for parameter " +
                               parameter.print()};
            if (raiseError) {
                throw CTypeMismatchError{reason};
            }
            LOG_TRACE(<< reason);
            return false;
        }
    }
    return true;
}

CArm CSearchSpace::castArm(const CArm& arm) const {
    TParameterization parameters;
    for (const auto& value : arm.parameters()) {
        auto index = m_ParameterIndex.find(value.first);
        parameters.emplace(value.first, index == m_ParameterIndex.end()
                                            ? value.second
                                            : m_Parameters[index->second]->cast(value.second));
    }
    return CArm{std::move(parameters), arm.name()};
}

CArm CSearchSpace::outOfDesignArm() const {
    return this->constructArm();
}

CArm CSearchSpace::constructArm(const TParameterization& parameters, TOptionalStr name) const {
    TParameterization result;
    for (const auto& parameter : m_Parameters) {
        result.emplace(parameter->name(), CParameterValue{});
    }
    for (const auto& value : parameters) {
        auto index = m_ParameterIndex.find(value.first);
        if (index == m_ParameterIndex.end()) {
            throw CMembershipError{quoted(value.first) + " does not exist in search space"};
        }
        if (value.second.isNone() == false &&
            m_Parameters[index->second]->validate(value.second) == false) {
            throw CMembershipError{value.second.print() +
                                   " is not a valid value for parameter " +
                                   quoted(value.first)};
        }
        result[value.first] = value.second;
    }
    return CArm{std::move(result), std::move(name)};
}

void CSearchSpace::validateMembership(const TParameterization& parameterization) const {
    this->checkMembership(parameterization, true);
    // Membership treats int and float as interchangeable, which isn't wanted here.
    for (const auto& parameter : m_Parameters) {
        auto value = parameterization.find(parameter->name());
        if (value == parameterization.end() && this->isHierarchical()) {
            // Dependent parameters are absent when their parent takes another value.
            continue;
        }
        CParameterValue actual{value == parameterization.end() ? CParameterValue{} : value->second};
        if (parameter->isExactType(actual) == false) {
            throw CTypeMismatchError{
                "Value for parameter " + quoted(parameter->name()) + ": " + actual.print() +
                " is of type " + (actual.isNone() ? NONE : xp::space::print(actual.type())) +
                ", expected " + xp::space::print(parameter->parameterType())};
        }
    }
}

CSearchSpace::TSearchSpaceUPtr CSearchSpace::clone() const {
    return std::make_unique<CSearchSpace>(this->copyParameters(), m_ParameterConstraints);
}

CSearchSpace::TParameterSummaryVec CSearchSpace::summary() const {
    TParameterSummaryVec result;
    result.reserve(m_Parameters.size());
    for (const auto& parameter : m_Parameters) {
        SParameterSummary row;
        row.s_Name = parameter->name();
        row.s_Type = parameter->kindName();
        row.s_Domain = parameter->domainDescription();
        row.s_Datatype = DATATYPE_NAMES[static_cast<int>(parameter->parameterType())];
        row.s_Flags = parameter->flags();
        row.s_TargetValue = parameter->targetValue().print();
        row.s_DependentParameters =
            parameter->isHierarchical() ? parameter->dependentsDescription() : NONE;
        if (row.s_Flags.empty()) {
            row.s_Flags = NONE;
        }
        result.push_back(std::move(row));
    }
    return result;
}

std::string CSearchSpace::printSummary() const {
    TParameterSummaryVec rows{this->summary()};
    std::array<std::size_t, NUMBER_COLUMNS> widths;
    for (std::size_t i = 0; i < NUMBER_COLUMNS; ++i) {
        widths[i] = COLUMN_NAMES[i].size();
    }
    for (const auto& row : rows) {
        auto values = columns(row);
        for (std::size_t i = 0; i < NUMBER_COLUMNS; ++i) {
            widths[i] = std::max(widths[i], values[i].size());
        }
    }
    auto printRow = [&widths](const std::array<std::string, NUMBER_COLUMNS>& values) {
        std::string line;
        for (std::size_t i = 0; i < NUMBER_COLUMNS; ++i) {
            line += values[i];
            if (i + 1 < NUMBER_COLUMNS) {
                line += std::string(widths[i] - values[i].size() + 2, ' ');
            }
        }
        return line + "\n";
    };
    std::string result{printRow(COLUMN_NAMES)};
    for (const auto& row : rows) {
        result += printRow(columns(row));
    }
    return result;
}

std::string CSearchSpace::print() const {
    return "SearchSpace(parameters=" + this->printParameters(this->parameters()) +
           ", parameter_constraints=" + this->printParameterConstraints() + ")";
}

CSearchSpace::TParameterVec CSearchSpace::copyParameters() const {
    TParameterVec result;
    result.reserve(m_Parameters.size());
    for (const auto& parameter : m_Parameters) {
        result.push_back(*parameter);
    }
    return result;
}

std::string CSearchSpace::printParameters(const TParameterCPtrVec& parameters) const {
    return core::CContainerPrinter::print(parameters);
}

std::string CSearchSpace::printParameterConstraints() const {
    return core::CContainerPrinter::print(m_ParameterConstraints);
}

void CSearchSpace::insertParameter(std::size_t position, CParameter parameter) {
    if (this->hasParameter(parameter.name())) {
        throw CDefinitionError{"Parameter " + quoted(parameter.name()) +
                               " already exists in search space. Use updateParameter "
                               "to update an existing parameter"};
    }
    position = std::min(position, m_Parameters.size());
    m_Parameters.insert(m_Parameters.begin() + static_cast<std::ptrdiff_t>(position),
                        std::make_unique<CParameter>(std::move(parameter)));
    for (std::size_t i = position; i < m_Parameters.size(); ++i) {
        m_ParameterIndex[m_Parameters[i]->name()] = i;
    }
}

bool CSearchSpace::reject(bool raiseError, const std::string& reason) {
    if (raiseError) {
        throw CMembershipError{reason};
    }
    LOG_TRACE(<< "Rejected: " << reason);
    return false;
}

void CSearchSpace::validateParameterConstraints(const TParameterConstraintVec& constraints) const {
    for (const auto& constraint : constraints) {
        if (constraint.kind() == CParameterConstraint::E_Linear) {
            for (const auto& weight : constraint.weights()) {
                auto index = m_ParameterIndex.find(weight.first);
                if (index == m_ParameterIndex.end()) {
                    throw CDefinitionError{quoted(weight.first) +
                                           " does not exist in search space"};
                }
                if (m_Parameters[index->second]->isNumeric() == false) {
                    throw CDefinitionError{"Parameter constraint " + constraint.print() +
                                           " refers to non-numeric parameter " +
                                           quoted(weight.first)};
                }
            }
            continue;
        }
        for (const auto* parameter : constraint.parameters()) {
            auto index = m_ParameterIndex.find(parameter->name());
            if (index == m_ParameterIndex.end()) {
                throw CDefinitionError{quoted(parameter->name()) +
                                       " does not exist in search space"};
            }
            if (*parameter != *m_Parameters[index->second]) {
                throw CDefinitionError{"Parameter constraint's definition of " +
                                       quoted(parameter->name()) +
                                       " does not match the search space's definition"};
            }
        }
    }
}

void CSearchSpace::rebindParameterConstraints(TParameterConstraintVec& constraints) const {
    for (auto& constraint : constraints) {
        if (constraint.kind() == CParameterConstraint::E_Linear) {
            continue;
        }
        TParameterCPtrVec parameters;
        for (const auto* parameter : constraint.parameters()) {
            parameters.push_back(m_Parameters[m_ParameterIndex.at(parameter->name())].get());
        }
        constraint.rebind(parameters);
    }
}
}
}
