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
#ifndef INCLUDED_xp_space_CObservationFeatures_h
#define INCLUDED_xp_space_CObservationFeatures_h

#include <space/CParameterValue.h>
#include <space/ImportExport.h>

#include <cstdint>
#include <optional>
#include <string>

namespace xp {
namespace space {

//! \brief The features of one observed point.
//!
//! DESCRIPTION:\n
//! Holds the parameterization of the point and, when it was cast to the shape
//! of a hierarchical search space, the full parameterization it had before
//! casting so that flattening can restore it.
class SPACE_EXPORT CObservationFeatures {
public:
    using TOptionalInt = std::optional<std::int64_t>;
    using TOptionalParameterization = std::optional<TParameterization>;

public:
    CObservationFeatures() = default;
    explicit CObservationFeatures(TParameterization parameters,
                                  TOptionalInt trialIndex = TOptionalInt{});

    const TParameterization& parameters() const { return m_Parameters; }
    void parameters(TParameterization parameters);

    const TOptionalInt& trialIndex() const { return m_TrialIndex; }

    //! Get the parameterization before it was cast, if it was recorded.
    const TOptionalParameterization& fullParameterization() const {
        return m_FullParameterization;
    }
    void fullParameterization(TParameterization parameters);

    bool operator==(const CObservationFeatures& rhs) const;

    std::string print() const;

private:
    TParameterization m_Parameters;
    TOptionalInt m_TrialIndex;
    TOptionalParameterization m_FullParameterization;
};
}
}

#endif // INCLUDED_xp_space_CObservationFeatures_h
