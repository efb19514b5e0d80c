/*
 * Carrier
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef libcarrier_Error_hpp
#define libcarrier_Error_hpp

#include <type_traits>
#include <exception>
#include <string>
#include <vector>
#include <cstring>
#include <cassert>

#include <boost/filesystem.hpp>

#include "libcarrier/LogLevel.hpp"

namespace libcarrier {

/**
 * This class encapsulates error trace information to be propagated as an exception.
 *
 * An error trace entry encapsulates information about file, line and function name
 * where the error trace entry was created.
 *
 * The first error trace entry is created by the macro CARRIER_THROW_ERROR.
 * Additional error trace entries are created by the macro CARRIER_RETHROW_ERROR.
 *
 * Note: this class should be instantiated and thrown through the CARRIER_THROW_ERROR macro.
 * Caught instances of this class should be rethrown through the CARRIER_RETHROW_ERROR macro.
 * The user is not supposed to instantiate and throw this class "manually".
 */
class Error : public std::exception {
public:
    struct ErrorTraceEntry {
        std::string errorMessage;
        boost::filesystem::path fileName;
        int fileLine;
        std::string functionName;
    };

public:
    Error(LogLevel logLevel, const ErrorTraceEntry& entry)
        : logLevel{ logLevel }
        , errorTrace{ entry }
    {}

    const char* what() const noexcept override {
        // Return the 'what()' of the original exception that generated this error trace
        // as if the original exception was propagated directly up to the current
        // stack frame, i.e. without intermediate catch-rethrows.
        return errorTrace.front().errorMessage.c_str();
    }

    void appendErrorTraceEntry(const ErrorTraceEntry& entry) {
        errorTrace.push_back(entry);
    }

    const std::vector<ErrorTraceEntry>& getErrorTrace() const {
        return errorTrace;
    }

    LogLevel getLogLevel() const {
        return logLevel;
    }

    void setLogLevel(LogLevel value) {
        logLevel = value;
    }

private:
    LogLevel logLevel = LogLevel::ERROR;
    std::vector<ErrorTraceEntry> errorTrace;
};

/**
 * Error classes that callers need to tell apart from generic failures.
 * They are thrown through CARRIER_THROW_TYPED_ERROR and keep their dynamic type
 * when rethrown through CARRIER_RETHROW_ERROR.
 */

// The destination refused to store a manifest of a given MIME type
class ManifestTypeRejectedError : public Error {
public:
    using Error::Error;
};

// A manifest format cannot express the compression applied to a layer
class CompressionIncompatibleError : public Error {
public:
    using Error::Error;
};

// The admission policy denied the source image
class PolicyRejectedError : public Error {
public:
    using Error::Error;
};

// Content read from a source does not match its expected digest
class DigestMismatchError : public Error {
public:
    using Error::Error;
};

// A response body ended before all of its content was delivered
class ConnectionInterruptedError : public Error {
public:
    using Error::Error;
};

// Violation of an internal invariant, e.g. a manifest edit attempted while edits are forbidden
class InternalError : public Error {
public:
    using Error::Error;
};

inline bool operator==(const Error::ErrorTraceEntry& lhs, const Error::ErrorTraceEntry& rhs) {
    return lhs.errorMessage == rhs.errorMessage
        && lhs.fileName == rhs.fileName
        && lhs.fileLine == rhs.fileLine
        && lhs.functionName == rhs.functionName;
}

inline bool operator!=(const Error::ErrorTraceEntry& lhs, const Error::ErrorTraceEntry& rhs) {
    return !(lhs == rhs);
}

std::string getExceptionTypeString(const std::exception& e);

}


// CARRIER_THROW_ERROR macros
#define __FILENAME__ (strrchr(__FILE__, '/') ? strrchr(__FILE__, '/') + 1 : __FILE__)

#define CARRIER_GET_OVERLOADED_THROW_ERROR(_1, _2, NAME, ...) NAME

#define CARRIER_THROW_ERROR_2(errorMessage, logLevel) { \
    auto stackTraceEntry = libcarrier::Error::ErrorTraceEntry{errorMessage, __FILENAME__, __LINE__, __func__}; \
    throw libcarrier::Error{logLevel, stackTraceEntry}; \
}

#define CARRIER_THROW_ERROR_1(errorMessage) CARRIER_THROW_ERROR_2(errorMessage, libcarrier::LogLevel::ERROR)

#define CARRIER_THROW_ERROR(...) CARRIER_GET_OVERLOADED_THROW_ERROR(__VA_ARGS__, CARRIER_THROW_ERROR_2, CARRIER_THROW_ERROR_1)(__VA_ARGS__)


// CARRIER_THROW_TYPED_ERROR macros
#define CARRIER_GET_OVERLOADED_THROW_TYPED_ERROR(_1, _2, _3, NAME, ...) NAME

#define CARRIER_THROW_TYPED_ERROR_3(ErrorType, errorMessage, logLevel) { \
    auto stackTraceEntry = libcarrier::Error::ErrorTraceEntry{errorMessage, __FILENAME__, __LINE__, __func__}; \
    throw ErrorType{logLevel, stackTraceEntry}; \
}

#define CARRIER_THROW_TYPED_ERROR_2(ErrorType, errorMessage) CARRIER_THROW_TYPED_ERROR_3(ErrorType, errorMessage, libcarrier::LogLevel::ERROR)

#define CARRIER_THROW_TYPED_ERROR(...) CARRIER_GET_OVERLOADED_THROW_TYPED_ERROR(__VA_ARGS__, CARRIER_THROW_TYPED_ERROR_3, CARRIER_THROW_TYPED_ERROR_2)(__VA_ARGS__)


// CARRIER_RETHROW_ERROR macros
#define CARRIER_GET_OVERLOADED_RETHROW_ERROR(_1, _2, _3, NAME, ...) NAME

#define CARRIER_RETHROW_ERROR_3(exception, errorMessage, logLevel) { \
    auto errorTraceEntry = libcarrier::Error::ErrorTraceEntry{errorMessage, __FILENAME__, __LINE__, __func__}; \
    const auto* cp = dynamic_cast<const libcarrier::Error*>(&exception); \
    if(cp) { /* check if dynamic type is libcarrier::Error */ \
        assert(!std::is_const<decltype(exception)>{}); /* a libcarrier::Error object must be caught as non-const reference because we need to modify its internal error trace */ \
        auto* p = const_cast<libcarrier::Error*>(cp); \
        p->setLogLevel(logLevel); \
        p->appendErrorTraceEntry(errorTraceEntry); \
        throw; \
    } \
    else { \
        auto previousErrorTraceEntry = libcarrier::Error::ErrorTraceEntry{exception.what(), "unspecified location", -1, \
                                                                          libcarrier::getExceptionTypeString(exception)}; \
        auto error = libcarrier::Error{logLevel, previousErrorTraceEntry}; \
        error.appendErrorTraceEntry(errorTraceEntry); \
        throw error; \
    } \
}

#define CARRIER_RETHROW_ERROR_2(exception, errorMessage) { \
    const auto* cp = dynamic_cast<const libcarrier::Error*>(&exception); \
    if(cp) { \
        /* get log level if dynamic type is libcarrier::Error */ \
        CARRIER_RETHROW_ERROR_3(exception, errorMessage, cp->getLogLevel()) \
    } \
    else { \
        CARRIER_RETHROW_ERROR_3(exception, errorMessage, libcarrier::LogLevel::ERROR) \
    } \
}

#define CARRIER_RETHROW_ERROR(...) CARRIER_GET_OVERLOADED_RETHROW_ERROR(__VA_ARGS__, CARRIER_RETHROW_ERROR_3, CARRIER_RETHROW_ERROR_2)(__VA_ARGS__)

#endif
