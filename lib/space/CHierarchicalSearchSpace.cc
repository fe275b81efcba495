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

#include <space/CHierarchicalSearchSpace.h>

#include <core/CContainerPrinter.h>
#include <core/CLogger.h>

#include <space/CSearchSpaceErrors.h>

#include <algorithm>
#include <iterator>
#include <utility>

namespace xp {
namespace space {
namespace {
using TStrSet = std::set<std::string>;

//! Values of string parameters are shown without quotes in the tree.
std::string printBranchValue(const CParameterValue& value) {
    return value.kind() == CParameterValue::E_StringKind ? value.asString()
                                                           : value.print();
}

TStrSet keys(const TParameterization& parameters) {
    TStrSet result;
    for (const auto& value : parameters) {
        result.insert(value.first);
    }
    return result;
}
}

CHierarchicalSearchSpace::CHierarchicalSearchSpace(TParameterVec parameters,
                                                   TParameterConstraintVec constraints)
    : CSearchSpace{std::move(parameters), std::move(constraints)}, m_Root{this->findRoot()} {
    LOG_DEBUG(<< "Found root: " << this->root().name());
    this->validateHierarchicalStructure();
}

std::size_t CHierarchicalSearchSpace::height() const {
    return this->heightFrom(m_Root);
}

CSearchSpace::TSearchSpaceUPtr CHierarchicalSearchSpace::flatten() const {
    return std::make_unique<CSearchSpace>(this->copyParameters(),
                                          this->parameterConstraints());
}

TParameterization
CHierarchicalSearchSpace::castParameterization(const TParameterization& parameters,
                                               bool checkAllParametersPresent) const {
    TStrSet applicable;
    this->findApplicableParameters(m_Root, parameters, checkAllParametersPresent, applicable);
    TParameterization result;
    for (const auto& value : parameters) {
        if (applicable.count(value.first) > 0) {
            result.insert(value);
        }
    }
    return result;
}

CArm CHierarchicalSearchSpace::castArm(const CArm& arm) const {
    CArm cast{this->CSearchSpace::castArm(arm)};
    return CArm{this->castParameterization(cast.parameters()), cast.name()};
}

bool CHierarchicalSearchSpace::checkMembership(const TParameterization& parameterization,
                                               bool raiseError,
                                               bool checkAllParametersPresent) const {
    if (this->CSearchSpace::checkMembership(parameterization, raiseError, false) == false) {
        return false;
    }

    // The parameterization must only contain parameters which make sense
    // together given the values of the parameters they depend on.
    TParameterization cast;
    try {
        cast = this->castParameterization(parameterization, checkAllParametersPresent);
    } catch (const CMembershipError& e) {
        if (raiseError) {
            throw;
        }
        LOG_TRACE(<< "Rejected: " << e.what());
        return false;
    }
    TStrSet castNames{keys(cast)};
    TStrSet names{keys(parameterization)};
    if (castNames != names) {
        return reject(raiseError,
                      "Parameterization violates the hierarchical structure of the search "
                      "space; cast version would have parameters: " +
                          core::CContainerPrinter::print(castNames) +
                          ", but full version contains parameters: " +
                          core::CContainerPrinter::print(names));
    }
    return true;
}

CObservationFeatures
CHierarchicalSearchSpace::castObservationFeatures(const CObservationFeatures& features) const {
    CObservationFeatures result{features};
    result.parameters(this->castParameterization(features.parameters(), false));
    result.fullParameterization(features.parameters());
    return result;
}

CObservationFeatures
CHierarchicalSearchSpace::flattenObservationFeatures(const CObservationFeatures& features,
                                                     bool injectDummyValues,
                                                     bool useRandomDummyValues) const {
    CObservationFeatures result{features};
    if (features.parameters().empty() && features.fullParameterization() == std::nullopt) {
        return result;
    }

    TParameterization parameters{features.parameters()};
    if (features.fullParameterization() != std::nullopt) {
        // Current values take precedence over the recorded ones.
        for (const auto& value : *features.fullParameterization()) {
            parameters.insert(value);
        }
    }

    auto missing = [&parameters](const CParameter* parameter) {
        return parameters.count(parameter->name()) == 0;
    };
    TParameterCPtrVec all{this->parameters()};
    if (std::any_of(all.begin(), all.end(), missing)) {
        if (injectDummyValues) {
            for (const auto* parameter : all) {
                if (missing(parameter)) {
                    parameters.emplace(parameter->name(),
                                       useRandomDummyValues ? parameter->sample(m_Rng)
                                                            : parameter->midpoint());
                }
            }
        } else {
            LOG_WARN(<< "Cannot flatten observation features " << features.print()
                     << " as the full parameterization is not recorded and dummy "
                     << "value injection is disabled");
        }
    }

    result.parameters(std::move(parameters));
    return result;
}

std::string CHierarchicalSearchSpace::hierarchicalStructureStr(bool parameterNamesOnly) const {
    return this->hierarchicalStructureStr(m_Root, 0, parameterNamesOnly);
}

void CHierarchicalSearchSpace::addParameter(CParameter parameter) {
    throw CUnsupportedError{"Can't add parameter '" + parameter.name() +
                            "' to a hierarchical search space"};
}

void CHierarchicalSearchSpace::updateParameter(CParameter parameter) {
    if (this->hasParameter(parameter.name()) &&
        this->parameter(parameter.name()).dependents() != parameter.dependents()) {
        throw CUnsupportedError{"Can't change the dependents of parameter '" +
                                parameter.name() + "' in a hierarchical search space"};
    }
    this->CSearchSpace::updateParameter(std::move(parameter));
}

CSearchSpace::TSearchSpaceUPtr CHierarchicalSearchSpace::clone() const {
    return std::make_unique<CHierarchicalSearchSpace>(this->copyParameters(),
                                                      this->parameterConstraints());
}

std::string CHierarchicalSearchSpace::print() const {
    return "HierarchicalSearchSpace(parameters=" +
           this->printParameters(this->parameters()) +
           ", parameter_constraints=" + this->printParameterConstraints() +
           ", root=" + this->root().name() + ")";
}

void CHierarchicalSearchSpace::seed(std::uint64_t seed) {
    m_Rng.seed(seed);
}

std::size_t CHierarchicalSearchSpace::findRoot() const {
    TStrSet dependentNames;
    for (const auto* parameter : this->parameters()) {
        for (const auto& dependents : parameter->dependents()) {
            for (const auto& name : dependents.second) {
                if (this->hasParameter(name) == false) {
                    throw CStructureError{"Parameter '" + parameter->name() +
                                          "' has dependent '" + name +
                                          "' which is not part of the search space"};
                }
                dependentNames.insert(name);
            }
        }
    }

    TSizeSet roots;
    for (std::size_t i = 0; i < this->numberParameters(); ++i) {
        if (dependentNames.count(this->parameterAt(i).name()) == 0) {
            roots.insert(i);
        }
    }
    if (roots.size() != 1) {
        throw CStructureError{
            "Could not find the root parameter; found dependent parameters " +
            core::CContainerPrinter::print(dependentNames) + ", with " +
            std::to_string(this->numberParameters()) +
            " total parameters. Root parameter candidates: " + this->printNames(roots) +
            ". Having multiple independent parameters is not supported"};
    }
    return *roots.begin();
}

void CHierarchicalSearchSpace::validateHierarchicalStructure() const {
    TBoolVec inProgress(this->numberParameters(), false);
    TSizeSet visited{this->checkSubtree(m_Root, inProgress)};
    if (visited.size() != this->numberParameters()) {
        TSizeSet unreachable;
        for (std::size_t i = 0; i < this->numberParameters(); ++i) {
            if (visited.count(i) == 0) {
                unreachable.insert(i);
            }
        }
        throw CStructureError{"Parameters " + this->printNames(unreachable) +
                              " are not reachable from the root. Please check that the "
                              "hierarchical search space is a tree with a single root"};
    }
    LOG_DEBUG(<< "Visited all parameters in the tree: " << this->printNames(visited));
}

CHierarchicalSearchSpace::TSizeSet
CHierarchicalSearchSpace::checkSubtree(std::size_t index, TBoolVec& inProgress) const {
    const CParameter& root{this->parameterAt(index)};
    LOG_TRACE(<< "Verifying subtree with root " << root.name());

    TSizeSet visited{index};
    if (root.isHierarchical() == false) {
        return visited;
    }
    if (inProgress[index]) {
        throw CStructureError{"Parameter '" + root.name() + "' depends on itself"};
    }

    inProgress[index] = true;
    TSizeSet subtrees;
    for (const auto& dependents : root.dependents()) {
        for (const auto& name : dependents.second) {
            TSizeSet subtree{this->checkSubtree(this->indexOf(name), inProgress)};
            TSizeSet overlap;
            std::set_intersection(subtrees.begin(), subtrees.end(), subtree.begin(),
                                  subtree.end(), std::inserter(overlap, overlap.end()));
            if (overlap.empty() == false) {
                throw CStructureError{"Two subtrees in the search space contain the same "
                                      "parameters: " +
                                      this->printNames(overlap)};
            }
            subtrees.insert(subtree.begin(), subtree.end());
        }
    }
    inProgress[index] = false;

    visited.insert(subtrees.begin(), subtrees.end());
    LOG_TRACE(<< "Visited parameters " << this->printNames(visited) << " in subtree");
    return visited;
}

std::size_t CHierarchicalSearchSpace::heightFrom(std::size_t index) const {
    const CParameter& parameter{this->parameterAt(index)};
    std::size_t result{0};
    for (const auto& dependents : parameter.dependents()) {
        for (const auto& name : dependents.second) {
            result = std::max(result, this->heightFrom(this->indexOf(name)));
        }
    }
    return result + 1;
}

void CHierarchicalSearchSpace::findApplicableParameters(std::size_t index,
                                                        const TParameterization& parameters,
                                                        bool checkAllParametersPresent,
                                                        TStrSet& applicable) const {
    const CParameter& root{this->parameterAt(index)};
    applicable.insert(root.name());

    auto value = parameters.find(root.name());
    if (value == parameters.end()) {
        if (checkAllParametersPresent) {
            throw CMembershipError{"Parameterization " + xp::space::print(parameters) +
                                   " violates the hierarchical structure of the search space: " +
                                   this->hierarchicalStructureStr() + ". Parameter '" +
                                   root.name() + "' not in parameterization to cast"};
        }
        return;
    }

    const CParameter::TStrVec* dependents{root.dependentsOf(value->second)};
    if (dependents != nullptr) {
        for (const auto& name : *dependents) {
            this->findApplicableParameters(this->indexOf(name), parameters,
                                           checkAllParametersPresent, applicable);
        }
    }
}

std::string CHierarchicalSearchSpace::printNames(const TSizeSet& indices) const {
    TStrSet names;
    for (auto index : indices) {
        names.insert(this->parameterAt(index).name());
    }
    return core::CContainerPrinter::print(names);
}

std::string CHierarchicalSearchSpace::hierarchicalStructureStr(std::size_t index,
                                                               std::size_t level,
                                                               bool parameterNamesOnly) const {
    const CParameter& parameter{this->parameterAt(index)};
    std::string result{std::string(level, '\t') +
                       (parameterNamesOnly ? parameter.name() : parameter.print()) + "\n"};
    for (const auto& dependents : parameter.dependents()) {
        result += std::string(level + 1, '\t') + "(" +
                  printBranchValue(dependents.first) + ")\n";
        for (const auto& name : dependents.second) {
            result += this->hierarchicalStructureStr(this->indexOf(name), level + 2,
                                                     parameterNamesOnly);
        }
    }
    return result;
}
}
}
