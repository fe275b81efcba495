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

#include <space/CRobustSearchSpace.h>

#include <core/CContainerPrinter.h>
#include <core/CLogger.h>

#include <space/CSearchSpaceErrors.h>

#include <algorithm>
#include <set>
#include <utility>

namespace xp {
namespace space {
namespace {
using TStrSet = std::set<std::string>;
}

CRobustSearchSpace::CRobustSearchSpace(TParameterVec parameters,
                                       TParameterDistributionVec distributions,
                                       std::int64_t numSamples,
                                       TParameterVec environmentalVariables,
                                       TParameterConstraintVec constraints)
    : CSearchSpace{checkArguments(std::move(parameters), environmentalVariables,
                                  distributions, numSamples),
                   std::move(constraints)},
      m_ParameterDistributions{std::move(distributions)},
      m_NumSamples{static_cast<std::size_t>(numSamples)},
      m_EnvironmentalVariables{names(environmentalVariables)} {
    this->validateDistributions();
}

bool CRobustSearchSpace::isEnvironmentalVariable(const std::string& name) const {
    return std::find(m_EnvironmentalVariables.begin(), m_EnvironmentalVariables.end(),
                     name) != m_EnvironmentalVariables.end();
}

void CRobustSearchSpace::addParameter(CParameter parameter) {
    // Environmental variables stay after the ordinary parameters.
    this->insertParameter(this->numberParameters() - m_EnvironmentalVariables.size(),
                          std::move(parameter));
}

void CRobustSearchSpace::updateParameter(CParameter /*parameter*/) {
    throw CUnsupportedError{"RobustSearchSpace does not support updateParameter"};
}

CSearchSpace::TSearchSpaceUPtr CRobustSearchSpace::clone() const {
    return std::make_unique<CRobustSearchSpace>(
        this->copyParameters(false), m_ParameterDistributions,
        static_cast<std::int64_t>(m_NumSamples), this->copyParameters(true),
        this->parameterConstraints());
}

std::string CRobustSearchSpace::print() const {
    TParameterCPtrVec environmental;
    for (const auto& name : m_EnvironmentalVariables) {
        environmental.push_back(&this->parameter(name));
    }
    return "RobustSearchSpace(parameters=" + this->printParameters(this->ordinaryParameters()) +
           ", parameter_distributions=" + core::CContainerPrinter::print(m_ParameterDistributions) +
           ", num_samples=" + std::to_string(m_NumSamples) +
           ", environmental_variables=" + this->printParameters(environmental) +
           ", parameter_constraints=" + this->printParameterConstraints() + ")";
}

CSearchSpace::TParameterVec
CRobustSearchSpace::checkArguments(TParameterVec parameters,
                                   const TParameterVec& environmentalVariables,
                                   const TParameterDistributionVec& distributions,
                                   std::int64_t numSamples) {
    if (distributions.empty()) {
        throw CDefinitionError{"RobustSearchSpace requires at least one distribution"};
    }
    if (numSamples < 1) {
        throw CDefinitionError{"The number of samples must be a positive integer, got " +
                               std::to_string(numSamples)};
    }
    TStrSet environmentalNames;
    for (const auto& variable : environmentalVariables) {
        if (environmentalNames.insert(variable.name()).second == false) {
            throw CDefinitionError{"Environmental variable names must be unique, '" +
                                   variable.name() + "' is repeated"};
        }
    }
    for (const auto& parameter : parameters) {
        if (environmentalNames.count(parameter.name()) > 0) {
            throw CDefinitionError{"Environmental variable '" + parameter.name() +
                                   "' should not be repeated in parameters"};
        }
    }
    parameters.insert(parameters.end(), environmentalVariables.begin(),
                      environmentalVariables.end());
    return parameters;
}

CSearchSpace::TStrVec CRobustSearchSpace::names(const TParameterVec& parameters) {
    TStrVec result;
    result.reserve(parameters.size());
    for (const auto& parameter : parameters) {
        result.push_back(parameter.name());
    }
    return result;
}

void CRobustSearchSpace::validateDistributions() {
    for (const auto& distribution : m_ParameterDistributions) {
        for (const auto& name : distribution.parameters()) {
            if (this->hasParameter(name) == false) {
                throw CDefinitionError{"Parameter distribution " + distribution.print() +
                                       " refers to '" + name +
                                       "' which is not part of the search space"};
            }
        }
    }

    // At most one distribution per parameter.
    TStrSet distributional;
    for (const auto& distribution : m_ParameterDistributions) {
        TStrSet duplicates;
        for (const auto& name : distribution.parameters()) {
            if (distributional.count(name) > 0) {
                duplicates.insert(name);
            }
        }
        if (duplicates.empty() == false) {
            throw CDefinitionError{
                "Received multiple parameter distributions for parameters " +
                core::CContainerPrinter::print(duplicates) +
                ". Make sure that there is at most one distribution specified "
                "for any given parameter or environmental variable"};
        }
        distributional.insert(distribution.parameters().begin(),
                              distribution.parameters().end());
    }

    TStrSet environmental(m_EnvironmentalVariables.begin(), m_EnvironmentalVariables.end());
    if (std::includes(distributional.begin(), distributional.end(),
                      environmental.begin(), environmental.end()) == false) {
        throw CDefinitionError{"All environmental variables must have a distribution specified"};
    }

    if (environmental.empty()) {
        m_PerturbationDistributions = m_ParameterDistributions;
    } else {
        for (const auto& distribution : m_ParameterDistributions) {
            const auto& parameters = distribution.parameters();
            auto isEnvironmental = [&environmental](const std::string& name) {
                return environmental.count(name) > 0;
            };
            bool anyEnvironmental{std::any_of(parameters.begin(), parameters.end(), isEnvironmental)};
            bool allEnvironmental{std::all_of(parameters.begin(), parameters.end(), isEnvironmental)};
            if (anyEnvironmental && allEnvironmental == false) {
                throw CUnsupportedError{
                    "A parameter distribution must represent either the distribution "
                    "of a set of environmental variables or a set of parameter "
                    "perturbations. Offending distribution: " +
                    distribution.print()};
            }
            (anyEnvironmental ? m_EnvironmentalDistributions : m_PerturbationDistributions)
                .push_back(distribution);
        }
        for (const auto& distribution : m_EnvironmentalDistributions) {
            if (distribution.multiplicative()) {
                throw CDefinitionError{"Distributions of environmental variables must "
                                       "not be multiplicative"};
            }
        }
    }

    for (const auto& name : distributional) {
        if (this->parameter(name).kind() != CParameter::E_Range) {
            throw CDefinitionError{"All parameters with an associated distribution must "
                                   "be range parameters, '" +
                                   name + "' is not"};
        }
    }

    std::size_t numberMultiplicative(std::count_if(
        m_PerturbationDistributions.begin(), m_PerturbationDistributions.end(),
        [](const CParameterDistribution& distribution) {
            return distribution.multiplicative();
        }));
    if (numberMultiplicative > 0 && numberMultiplicative < m_PerturbationDistributions.size()) {
        throw CUnsupportedError{"Non-environmental parameter distributions must be either "
                                "all multiplicative or all additive"};
    }
    m_Multiplicative = numberMultiplicative > 0;
    LOG_TRACE(<< "Robust search space with " << m_EnvironmentalDistributions.size()
              << " environmental and " << m_PerturbationDistributions.size()
              << " perturbation distributions, multiplicative = " << m_Multiplicative);
}

CSearchSpace::TParameterCPtrVec CRobustSearchSpace::ordinaryParameters() const {
    TParameterCPtrVec result;
    for (const auto* parameter : this->parameters()) {
        if (this->isEnvironmentalVariable(parameter->name()) == false) {
            result.push_back(parameter);
        }
    }
    return result;
}

CSearchSpace::TParameterVec CRobustSearchSpace::copyParameters(bool environmental) const {
    TParameterVec result;
    for (const auto* parameter : this->parameters()) {
        if (this->isEnvironmentalVariable(parameter->name()) == environmental) {
            result.push_back(*parameter);
        }
    }
    return result;
}
}
}
