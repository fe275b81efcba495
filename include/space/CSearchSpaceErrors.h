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
#ifndef INCLUDED_xp_space_CSearchSpaceErrors_h
#define INCLUDED_xp_space_CSearchSpaceErrors_h

#include <space/ImportExport.h>

#include <stdexcept>
#include <string>

namespace xp {
namespace space {

//! \brief Base class for all errors raised by search space objects.
class SPACE_EXPORT CSearchSpaceError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

//! \brief The definition of a parameter, constraint, distribution or search
//! space is invalid.
//!
//! DESCRIPTION:\n
//! For example duplicate parameter names or a constraint which refers to a
//! parameter the search space doesn't have. The object being modified is left
//! unchanged.
class SPACE_EXPORT CDefinitionError : public CSearchSpaceError {
public:
    using CSearchSpaceError::CSearchSpaceError;
};

//! \brief A parameterization doesn't belong to a search space.
//!
//! DESCRIPTION:\n
//! Raised by the raising variants of the membership checks for domain and
//! constraint violations, missing or unknown parameters and parameterizations
//! which don't respect a hierarchical structure.
class SPACE_EXPORT CMembershipError : public CSearchSpaceError {
public:
    using CSearchSpaceError::CSearchSpaceError;
};

//! \brief The dependency structure of a hierarchical search space isn't a tree.
class SPACE_EXPORT CStructureError : public CSearchSpaceError {
public:
    using CSearchSpaceError::CSearchSpaceError;
};

//! \brief The requested operation isn't supported by this object.
class SPACE_EXPORT CUnsupportedError : public CSearchSpaceError {
public:
    using CSearchSpaceError::CSearchSpaceError;
};

//! \brief A value has a different type to the one its parameter declares.
class SPACE_EXPORT CTypeMismatchError : public CSearchSpaceError {
public:
    using CSearchSpaceError::CSearchSpaceError;
};
}
}

#endif // INCLUDED_xp_space_CSearchSpaceErrors_h
