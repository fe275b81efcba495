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
#ifndef INCLUDED_xp_core_CNonInstantiatable_h
#define INCLUDED_xp_core_CNonInstantiatable_h

#include <core/ImportExport.h>

namespace xp {
namespace core {

//! \brief
//! Base for collections of static functions.
//!
//! DESCRIPTION:\n
//! Utility classes such as CSampling, CTools and the digest extractor
//! only have static members. They inherit privately from this so any
//! attempt to create one fails to compile.
//!
class CORE_EXPORT CNonInstantiatable {
public:
    CNonInstantiatable() = delete;
    CNonInstantiatable(const CNonInstantiatable&) = delete;
};
}
}

#endif // INCLUDED_xp_core_CNonInstantiatable_h
