/*
 * Carrier
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include <iostream>
#include <sstream>
#include <string>

#include <boost/regex.hpp>

#include "libcarrier/Logger.hpp"
#include "aux/unitTestMain.hpp"


namespace libcarrier {
namespace test {

TEST_GROUP(LoggerTestGroup) {
    void teardown() {
        libcarrier::Logger::getInstance().setLevel(libcarrier::LogLevel::WARN);
    }
};

class LoggerChecker {
public:
    LoggerChecker& log(libcarrier::LogLevel logLevel, const std::string& message) {
        auto& logger = libcarrier::Logger::getInstance();
        logger.log(message, "subsystem", logLevel, stdoutStream, stderrStream);
        return *this;
    }

    LoggerChecker& expectGeneralMessageInStdout(const std::string& message) {
        expectedPatternInStdout += message + "\n";
        return *this;
    }

    LoggerChecker& expectMessageInStdout(const std::string& logLevel, const std::string& message) {
        return expectMessage(logLevel, message, expectedPatternInStdout);
    }

    LoggerChecker& expectMessageInStderr(const std::string& logLevel, const std::string& message) {
        return expectMessage(logLevel, message, expectedPatternInStderr);
    }

    ~LoggerChecker() {
        check(stdoutStream, expectedPatternInStdout);
        check(stderrStream, expectedPatternInStderr);
    }

private:
    LoggerChecker& expectMessage(const std::string& logLevel, const std::string& message, std::string& expectedPattern) {
        expectedPattern += "\\[[0-9]+\\.[0-9]+\\] \\[.*-[0-9]+\\] \\[subsystem\\] \\[" + logLevel + "\\] " + message + "\n";
        return *this;
    }

    void check(const std::ostringstream& stream, const std::string& expectedPattern) const {
        auto regex = boost::regex(expectedPattern);
        CHECK(boost::regex_match(stream.str(), regex));
    }

private:
    std::ostringstream stdoutStream;
    std::ostringstream stderrStream;

    std::string expectedPatternInStdout;
    std::string expectedPatternInStderr;
};

TEST(LoggerTestGroup, debugLevelPrintsEverything) {
    libcarrier::Logger::getInstance().setLevel(libcarrier::LogLevel::DEBUG);
    LoggerChecker{}
        .log(libcarrier::LogLevel::GENERAL, "general message")
        .log(libcarrier::LogLevel::DEBUG, "debug message")
        .log(libcarrier::LogLevel::INFO, "info message")
        .log(libcarrier::LogLevel::WARN, "warn message")
        .log(libcarrier::LogLevel::ERROR, "error message")
        .expectGeneralMessageInStdout("general message")
        .expectMessageInStdout("DEBUG", "debug message")
        .expectMessageInStdout("INFO", "info message")
        .expectMessageInStderr("WARN", "warn message")
        .expectMessageInStderr("ERROR", "error message");
}

TEST(LoggerTestGroup, warnLevelFiltersDebugAndInfo) {
    libcarrier::Logger::getInstance().setLevel(libcarrier::LogLevel::WARN);
    LoggerChecker{}
        .log(libcarrier::LogLevel::GENERAL, "general message")
        .log(libcarrier::LogLevel::DEBUG, "debug message")
        .log(libcarrier::LogLevel::INFO, "info message")
        .log(libcarrier::LogLevel::WARN, "warn message")
        .log(libcarrier::LogLevel::ERROR, "error message")
        .expectGeneralMessageInStdout("general message")
        .expectMessageInStderr("WARN", "warn message")
        .expectMessageInStderr("ERROR", "error message");
}

TEST(LoggerTestGroup, errorTrace) {
    auto errorStream = std::ostringstream{};
    try {
        try {
            CARRIER_THROW_ERROR("root cause");
        }
        catch(libcarrier::Error& e) {
            CARRIER_RETHROW_ERROR(e, "while copying");
        }
    }
    catch(const libcarrier::Error& e) {
        libcarrier::Logger::getInstance().logErrorTrace(e, "test", errorStream);
    }
    auto output = errorStream.str();
    auto expected = boost::regex(".*Error trace \\(most nested error last\\):\n"
                                 "#0   .* at test_Logger.cpp:[0-9]+ while copying\n"
                                 "#1   .* at test_Logger.cpp:[0-9]+ root cause\n");
    CHECK(boost::regex_match(output, expected));
}

}}

CARRIER_UNITTEST_MAIN_FUNCTION();
