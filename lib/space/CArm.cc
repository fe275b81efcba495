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

#include <space/CArm.h>

#include <utility>

namespace xp {
namespace space {

CArm::CArm(TParameterization parameters, TOptionalStr name)
    : m_Parameters{std::move(parameters)}, m_Name{std::move(name)} {
}

bool CArm::operator==(const CArm& rhs) const {
    return m_Parameters == rhs.m_Parameters && m_Name == rhs.m_Name;
}

std::string CArm::print() const {
    return "Arm(" + (m_Name != std::nullopt ? "name='" + *m_Name + "', " : std::string{}) +
           "parameters=" + xp::space::print(m_Parameters) + ")";
}
}
}
