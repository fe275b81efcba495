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

#ifndef INCLUDED_xp_maths_CLinearAlgebraEigen_h
#define INCLUDED_xp_maths_CLinearAlgebraEigen_h

#include <Eigen/Core>

#include <cstddef>
#include <utility>

namespace xp {
namespace maths {

//! \brief Eigen dense matrix wrapper.
//!
//! DESCRIPTION:\n
//! Sample matrices handed to model fitting consumers are dense column major
//! matrices with one row per sample and one column per feature.
template<typename SCALAR>
class CDenseMatrix : public Eigen::Matrix<SCALAR, Eigen::Dynamic, Eigen::Dynamic> {
public:
    using TBase = Eigen::Matrix<SCALAR, Eigen::Dynamic, Eigen::Dynamic>;

public:
    //! Forwarding constructor.
    template<typename... ARGS>
    CDenseMatrix(ARGS&&... args) : TBase(std::forward<ARGS>(args)...) {}

    //! \name Copy and Move Semantics
    //@{
    CDenseMatrix(const CDenseMatrix& other) = default;
    CDenseMatrix(CDenseMatrix&& other) = default;
    CDenseMatrix& operator=(const CDenseMatrix& other) = default;
    CDenseMatrix& operator=(CDenseMatrix&& other) = default;
    //@}

    //! Get the memory used by this object.
    std::size_t memoryUsage() const { return sizeof(SCALAR) * this->size(); }
};
}
}

#endif // INCLUDED_xp_maths_CLinearAlgebraEigen_h
