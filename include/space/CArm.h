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
#ifndef INCLUDED_xp_space_CArm_h
#define INCLUDED_xp_space_CArm_h

#include <space/CParameterValue.h>
#include <space/ImportExport.h>

#include <optional>
#include <string>

namespace xp {
namespace space {

//! \brief A candidate point: a parameterization with an optional name.
class SPACE_EXPORT CArm {
public:
    using TOptionalStr = std::optional<std::string>;

public:
    CArm() = default;
    explicit CArm(TParameterization parameters, TOptionalStr name = TOptionalStr{});

    const TParameterization& parameters() const { return m_Parameters; }
    const TOptionalStr& name() const { return m_Name; }
    bool hasName() const { return m_Name != std::nullopt; }

    bool operator==(const CArm& rhs) const;
    bool operator!=(const CArm& rhs) const { return (*this == rhs) == false; }

    std::string print() const;

private:
    TParameterization m_Parameters;
    TOptionalStr m_Name;
};
}
}

#endif // INCLUDED_xp_space_CArm_h
