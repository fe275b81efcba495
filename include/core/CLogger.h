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
#ifndef INCLUDED_xp_core_CLogger_h
#define INCLUDED_xp_core_CLogger_h

#include <core/CNonCopyable.h>
#include <core/ImportExport.h>
#include <core/LogMacros.h>

#include <boost/log/attributes/attribute_name.hpp>
#include <boost/log/sources/severity_logger.hpp>

#include <iosfwd>
#include <string>

namespace xp {
namespace core {

//! \brief
//! Core logging class.
//!
//! DESCRIPTION:\n
//! Access to the actual logging commands should be through the macros in
//! LogMacros.h.
//!
//! Problems the caller can recover from, for example a candidate which is
//! rejected by a search space, are logged at TRACE or DEBUG. Situations where
//! results will be degraded are logged with LOG_WARN or LOG_ERROR.
//!
//! The LOG_ABORT macro should only be used in situations that would NEVER
//! occur if our code were free of bugs. It is not for invalid user input:
//! that is reported with an exception to the caller.
//!
//! IMPLEMENTATION DECISIONS:\n
//! Wrapper around Boost.Log.
//!
//! Singleton for simplicity.
//!
//! By default, logging is to stderr at DEBUG level. The configuration can be
//! replaced by reading a Boost.Log settings file.
//!
class CORE_EXPORT CLogger : private CNonCopyable {
public:
    //! Used to set the level we should log at
    enum ELevel { E_Trace, E_Debug, E_Info, E_Warn, E_Error, E_Fatal };

    using TLevelSeverityLogger = boost::log::sources::severity_logger_mt<ELevel>;

public:
    //! Access to singleton - use MACROS to get to this when logging
    //! messages
    static CLogger& instance();

    //! Tell the logger to reconfigure itself by reading a Boost.Log settings
    //! file, if the file exists.
    bool reconfigureFromFile(const std::string& settingsFile);

    //! Reconfigure from settings in \p settingsStrm.
    bool reconfigureFromSettings(std::istream& settingsStrm);

    //! Set the logging level on the fly - useful when unit tests need to
    //! log at a lower level than the defaults
    bool setLoggingLevel(ELevel level);

    //! Get the current logging level.
    ELevel loggingLevel() const;

    //! Map the level enum to a string.
    static const std::string& levelToString(ELevel level);

    //! Has the logger been reconfigured?
    bool hasBeenReconfigured() const;

    //! Access to underlying logger (must only be called from macros)
    TLevelSeverityLogger& logger();

    //! Throw a fatal exception
    [[noreturn]] static void fatal();

    //! Attribute names for efficient access to our custom attributes
    boost::log::attribute_name fileAttributeName() const;
    boost::log::attribute_name lineAttributeName() const;
    boost::log::attribute_name functionAttributeName() const;

    //! Reset the logger, this is primarily a helper for unit testing as
    //! CLogger is a singleton, so we can not just create new instances
    void reset();

private:
    //! Constructor for a singleton is private.
    CLogger();
    ~CLogger();

private:
    TLevelSeverityLogger m_Logger;

    //! Has the logger ever been reconfigured?
    bool m_Reconfigured;

    //! The level below which records are discarded.
    ELevel m_Level;

    //! Custom Boost.Log attribute names
    boost::log::attribute_name m_FileAttributeName;
    boost::log::attribute_name m_LineAttributeName;
    boost::log::attribute_name m_FunctionAttributeName;
};

CORE_EXPORT std::ostream& operator<<(std::ostream& strm, CLogger::ELevel level);
CORE_EXPORT std::istream& operator>>(std::istream& strm, CLogger::ELevel& level);
}
}

#endif // INCLUDED_xp_core_CLogger_h
