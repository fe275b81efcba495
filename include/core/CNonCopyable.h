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
#ifndef INCLUDED_xp_core_CNonCopyable_h
#define INCLUDED_xp_core_CNonCopyable_h

#include <core/ImportExport.h>

namespace xp {
namespace core {

//! \brief
//! Base for objects which own state that other objects point into.
//!
//! DESCRIPTION:\n
//! Search spaces hand out raw pointers to the parameters they own, for
//! example to the constraints which reference them. A member-wise copy
//! would silently leave those pointers referring to the source object,
//! so such classes inherit privately from this and provide an explicit
//! clone instead.
//!
//! IMPLEMENTATION DECISIONS:\n
//! Exported so that Visual C++ doesn't emit warning C4275 for exported
//! classes deriving from it.
//!
class CORE_EXPORT CNonCopyable {
protected:
    CNonCopyable() = default;
    ~CNonCopyable() = default;

public:
    CNonCopyable(const CNonCopyable&) = delete;
    CNonCopyable& operator=(const CNonCopyable&) = delete;
};
}
}

#endif // INCLUDED_xp_core_CNonCopyable_h
