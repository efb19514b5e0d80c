/*
 * Carrier
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef libcarrier_Logger_hpp
#define libcarrier_Logger_hpp

#include <string>
#include <iostream>
#include <mutex>

#include <boost/format.hpp>

#include "libcarrier/LogLevel.hpp"
#include "libcarrier/Error.hpp"

namespace libcarrier {

class Logger {
public:
    static Logger& getInstance();

    void log(const std::string& message, const std::string& sysName, const LogLevel& logLevel,
             std::ostream& out_stream = std::cout, std::ostream& err_stream = std::cerr);
    void log(const boost::format& message, const std::string& sysName, const LogLevel& logLevel,
             std::ostream& out_stream = std::cout, std::ostream& err_stream = std::cerr);
    void logErrorTrace(const Error& error, const std::string& sysName, std::ostream& errStream = std::cerr);
    void setLevel(LogLevel logLevel) { level = logLevel; };
    LogLevel getLevel() const { return level; };

private:
    Logger();
    Logger(const Logger&) = delete;
    Logger(Logger&&) = delete;

    std::string makeSubmessageWithTimestamp(LogLevel logLevel) const;
    std::string makeSubmessageWithInstanceID(LogLevel logLevel) const;
    std::string makeSubmessageWithSystemName(LogLevel logLevel, const std::string& systemName) const;
    std::string makeSubmessageWithLogLevel(LogLevel logLevel) const;

private:
    LogLevel level;
    std::string hostname;
    // layer copies log from several threads at once
    std::mutex mutex;
};

}

#endif
