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
#include <core/CLogger.h>

#include <boost/date_time/posix_time/posix_time_types.hpp>
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/support/date_time.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/utility/setup/console.hpp>
#include <boost/log/utility/setup/filter_parser.hpp>
#include <boost/log/utility/setup/formatter_parser.hpp>
#include <boost/log/utility/setup/from_stream.hpp>

#include <array>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

#include <unistd.h>

namespace {
// These must be constant initialised because the singleton can be created
// during the static initialisation of another translation unit.
const char* const SEVERITY_ATTRIBUTE{"Severity"};
const char* const TIMESTAMP_ATTRIBUTE{"TimeStamp"};

const std::array<std::string, 6>& levelNames() {
    static const std::array<std::string, 6> NAMES{"TRACE", "DEBUG", "INFO",
                                                  "WARN",  "ERROR", "FATAL"};
    return NAMES;
}

// To ensure the singleton is constructed before multiple threads may require it
// call instance() during the static initialisation phase of the program.  Of
// course, the instance may already be constructed before this if another static
// object has used it.
const xp::core::CLogger& DO_NOT_USE_THIS_VARIABLE = xp::core::CLogger::instance();
}

namespace xp {
namespace core {

CLogger::CLogger()
    : m_Reconfigured{false}, m_Level{E_Debug}, m_FileAttributeName{"File"},
      m_LineAttributeName{"Line"}, m_FunctionAttributeName{"Function"} {
    boost::log::add_common_attributes();
    boost::log::register_simple_filter_factory<ELevel, char>(SEVERITY_ATTRIBUTE);
    boost::log::register_simple_formatter_factory<ELevel, char>(SEVERITY_ATTRIBUTE);
    this->reset();
}

CLogger::~CLogger() {
    boost::log::core::get()->remove_all_sinks();
}

void CLogger::reset() {
    namespace expr = boost::log::expressions;

    m_Reconfigured = false;

    boost::log::core::get()->remove_all_sinks();

    const std::string pid{" [" + std::to_string(::getpid()) + "] "};

    // The pattern includes the process ID to make it easier to see if a
    // process dies and restarts. Unit tests and tools just work with this
    // hardcoded configuration; anything else should reconfigure from file.
    boost::log::add_console_log(
        std::cerr,
        boost::log::keywords::format =
            (expr::stream << expr::format_date_time<boost::posix_time::ptime>(
                                 TIMESTAMP_ATTRIBUTE, "%Y-%m-%d %H:%M:%S,%f")
                          << pid
                          << expr::attr<ELevel>(SEVERITY_ATTRIBUTE) << ' '
                          << expr::attr<std::string>(m_FileAttributeName) << '@'
                          << expr::attr<int>(m_LineAttributeName) << ' '
                          << expr::smessage),
        boost::log::keywords::auto_flush = true);

    this->setLoggingLevel(E_Debug);
}

CLogger& CLogger::instance() {
    static CLogger instance;
    return instance;
}

bool CLogger::reconfigureFromFile(const std::string& settingsFile) {
    std::ifstream settingsStrm{settingsFile};
    if (settingsStrm.is_open() == false) {
        LOG_ERROR(<< "Unable to open logger settings file " << settingsFile);
        return false;
    }
    if (this->reconfigureFromSettings(settingsStrm) == false) {
        LOG_ERROR(<< "Failed to reconfigure logger from " << settingsFile);
        return false;
    }
    LOG_DEBUG(<< "Logger reconfigured from " << settingsFile);
    return true;
}

bool CLogger::reconfigureFromSettings(std::istream& settingsStrm) {
    try {
        boost::log::core::get()->remove_all_sinks();
        boost::log::core::get()->reset_filter();
        boost::log::init_from_stream(settingsStrm);
    } catch (const std::exception& e) {
        // The settings were rejected so fall back to the defaults: we can't
        // use the log macros until a sink exists.
        std::cerr << "Could not reconfigure logger: " << e.what() << std::endl;
        this->reset();
        return false;
    }
    m_Reconfigured = true;
    return true;
}

bool CLogger::setLoggingLevel(ELevel level) {
    namespace expr = boost::log::expressions;
    if (level < E_Trace || level > E_Fatal) {
        return false;
    }
    m_Level = level;
    boost::log::core::get()->set_filter(expr::attr<ELevel>(SEVERITY_ATTRIBUTE) >= level);
    return true;
}

CLogger::ELevel CLogger::loggingLevel() const {
    return m_Level;
}

const std::string& CLogger::levelToString(ELevel level) {
    return levelNames()[static_cast<std::size_t>(level)];
}

bool CLogger::hasBeenReconfigured() const {
    return m_Reconfigured;
}

CLogger::TLevelSeverityLogger& CLogger::logger() {
    return m_Logger;
}

void CLogger::fatal() {
    throw std::runtime_error("Xp Fatal Exception");
}

boost::log::attribute_name CLogger::fileAttributeName() const {
    return m_FileAttributeName;
}

boost::log::attribute_name CLogger::lineAttributeName() const {
    return m_LineAttributeName;
}

boost::log::attribute_name CLogger::functionAttributeName() const {
    return m_FunctionAttributeName;
}

std::ostream& operator<<(std::ostream& strm, CLogger::ELevel level) {
    if (level < CLogger::E_Trace || level > CLogger::E_Fatal) {
        return strm << static_cast<int>(level);
    }
    return strm << CLogger::levelToString(level);
}

std::istream& operator>>(std::istream& strm, CLogger::ELevel& level) {
    std::string name;
    if (strm >> name) {
        const auto& names = levelNames();
        for (std::size_t i = 0; i < names.size(); ++i) {
            if (name == names[i]) {
                level = static_cast<CLogger::ELevel>(i);
                return strm;
            }
        }
        strm.setstate(std::ios_base::failbit);
    }
    return strm;
}
}
}
