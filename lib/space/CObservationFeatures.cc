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

#include <space/CObservationFeatures.h>

#include <utility>

namespace xp {
namespace space {

CObservationFeatures::CObservationFeatures(TParameterization parameters, TOptionalInt trialIndex)
    : m_Parameters{std::move(parameters)}, m_TrialIndex{trialIndex} {
}

void CObservationFeatures::parameters(TParameterization parameters) {
    m_Parameters = std::move(parameters);
}

void CObservationFeatures::fullParameterization(TParameterization parameters) {
    m_FullParameterization = std::move(parameters);
}

bool CObservationFeatures::operator==(const CObservationFeatures& rhs) const {
    return m_Parameters == rhs.m_Parameters && m_TrialIndex == rhs.m_TrialIndex &&
           m_FullParameterization == rhs.m_FullParameterization;
}

std::string CObservationFeatures::print() const {
    std::string result{"ObservationFeatures(parameters=" + xp::space::print(m_Parameters)};
    if (m_TrialIndex != std::nullopt) {
        result += ", trial_index=" + std::to_string(*m_TrialIndex);
    }
    if (m_FullParameterization != std::nullopt) {
        result += ", full_parameterization=" + xp::space::print(*m_FullParameterization);
    }
    return result + ")";
}
}
}
