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

// The lack of include guards is deliberate in this file, to allow per-file
// redefinition of logging macros

#include <boost/current_function.hpp>
#include <boost/log/sources/record_ostream.hpp>
#include <boost/log/sources/severity_logger.hpp>
#include <boost/log/utility/manipulators/add_value.hpp>

#include <sstream>

// Every record carries the source location as custom attributes
#ifdef LOG_LOCATION_INFO
#undef LOG_LOCATION_INFO
#endif
#define LOG_LOCATION_INFO                                                                 \
    << boost::log::add_value(xp::core::CLogger::instance().lineAttributeName(), __LINE__) \
    << boost::log::add_value(xp::core::CLogger::instance().fileAttributeName(), __FILE__) \
    << boost::log::add_value(xp::core::CLogger::instance().functionAttributeName(),       \
                             BOOST_CURRENT_FUNCTION)

#ifdef XP_LOG_AT
#undef XP_LOG_AT
#endif
#define XP_LOG_AT(level, message)                                              \
    BOOST_LOG_STREAM_SEV(xp::core::CLogger::instance().logger(), level)        \
    LOG_LOCATION_INFO                                                          \
    message

#ifdef LOG_TRACE
#undef LOG_TRACE
#endif
#ifdef EXCLUDE_TRACE_LOGGING
// Expands to code the optimiser can remove entirely, so hot loops which
// trace every candidate pay nothing in release builds
#define LOG_TRACE(message)                                                     \
    static_cast<void>([&]() { std::ostringstream() << "" message; })
#else
#define LOG_TRACE(message) XP_LOG_AT(xp::core::CLogger::E_Trace, message)
#endif

#ifdef LOG_DEBUG
#undef LOG_DEBUG
#endif
#define LOG_DEBUG(message) XP_LOG_AT(xp::core::CLogger::E_Debug, message)

#ifdef LOG_INFO
#undef LOG_INFO
#endif
#define LOG_INFO(message) XP_LOG_AT(xp::core::CLogger::E_Info, message)

#ifdef LOG_WARN
#undef LOG_WARN
#endif
#define LOG_WARN(message) XP_LOG_AT(xp::core::CLogger::E_Warn, message)

#ifdef LOG_ERROR
#undef LOG_ERROR
#endif
#define LOG_ERROR(message) XP_LOG_AT(xp::core::CLogger::E_Error, message)

#ifdef LOG_FATAL
#undef LOG_FATAL
#endif
#define LOG_FATAL(message) XP_LOG_AT(xp::core::CLogger::E_Fatal, message)

#ifdef LOG_ABORT
#undef LOG_ABORT
#endif
#define LOG_ABORT(message)                                                     \
    XP_LOG_AT(xp::core::CLogger::E_Fatal, message);                            \
    xp::core::CLogger::fatal()

// Log at a level only known at runtime, for example
// LOG_AT_LEVEL(xp::core::CLogger::E_Warn, << "Unexpected " << name)
#ifdef LOG_AT_LEVEL
#undef LOG_AT_LEVEL
#endif
#define LOG_AT_LEVEL(level, message) XP_LOG_AT(level, message)
