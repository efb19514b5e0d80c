/*
 * Carrier
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "BodyReader.hpp"

#include <boost/format.hpp>
#include <boost/regex.hpp>
#include <boost/lexical_cast.hpp>

#include "libcarrier/Error.hpp"
#include "libcarrier/Logger.hpp"


namespace carrier {
namespace transports {

static void printLog(const boost::format& message, libcarrier::LogLevel level) {
    libcarrier::Logger::getInstance().log(message.str(), "BodyReader", level);
}

const int64_t BodyReader::MINIMUM_PROGRESS = 1024 * 1024;
const std::chrono::milliseconds BodyReader::MINIMUM_TIME_SINCE_LAST_RETRY{60 * 1000};

BodyReader::BodyReader(RangedFetcher& fetcher, std::unique_ptr<stream::Reader> body, int64_t size, Clock clock)
    : fetcher(fetcher)
    , body{std::move(body)}
    , size{size}
    , clock{std::move(clock)}
{}

size_t BodyReader::read(char* buffer, size_t size) {
    while(true) {
        try {
            return readBody(buffer, size);
        }
        catch(libcarrier::ConnectionInterruptedError& e) {
            if(!isReconnectingAllowed()) {
                auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(clock() - lastRetryTime);
                auto message = boost::format("Reading blob body failed"
                                             " (heuristic tuning data: last retry at offset %d, %d ms ago, current offset %d)")
                    % lastRetryOffset % elapsed.count() % offset;
                CARRIER_RETHROW_ERROR(e, message.str());
            }
            reconnect(e.what());
        }
    }
}

size_t BodyReader::readBody(char* buffer, size_t size) {
    auto bytes = body->read(buffer, size);
    if(bytes == 0 && this->size >= 0 && offset < this->size) {
        auto message = boost::format("unexpected EOF at offset %d of %d") % offset % this->size;
        CARRIER_THROW_TYPED_ERROR(libcarrier::ConnectionInterruptedError, message.str());
    }
    offset += bytes;
    return bytes;
}

bool BodyReader::isReconnectingAllowed() const {
    if(lastRetryOffset == -1) {
        return true;
    }
    if(offset - lastRetryOffset >= MINIMUM_PROGRESS) {
        return true;
    }
    return clock() - lastRetryTime >= MINIMUM_TIME_SINCE_LAST_RETRY;
}

void BodyReader::reconnect(const std::string& originalError) {
    printLog(boost::format("Reading blob body failed (%s), reconnecting at offset %d") % originalError % offset,
             libcarrier::LogLevel::INFO);

    body.reset();
    auto range = (boost::format("bytes=%d-") % offset).str();
    auto response = RangedResponse{};
    try {
        response = fetcher.fetch(range);
    }
    catch(libcarrier::Error& e) {
        auto message = boost::format("%s (while reconnecting)") % originalError;
        CARRIER_RETHROW_ERROR(e, message.str());
    }

    if(response.statusCode == 200) {
        auto message = boost::format("%s (while reconnecting: server does not support Range requests)") % originalError;
        CARRIER_THROW_ERROR(message.str());
    }
    else if(response.statusCode != 206) {
        auto message = boost::format("%s (while reconnecting: unexpected HTTP status %d)") % originalError % response.statusCode;
        CARRIER_THROW_ERROR(message.str());
    }
    validateContentRange(response.contentRange);

    body = std::move(response.body);
    lastRetryOffset = offset;
    lastRetryTime = clock();
}

void BodyReader::validateContentRange(const std::string& contentRange) const {
    static const auto pattern = boost::regex{"^bytes ([0-9]+)-([0-9]+)/([0-9]+|\\*)$"};
    auto matches = boost::smatch{};
    if(!boost::regex_match(contentRange, matches, pattern)) {
        auto message = boost::format("Unexpected Content-Range \"%s\"") % contentRange;
        CARRIER_THROW_ERROR(message.str());
    }

    auto first = boost::lexical_cast<int64_t>(matches[1].str());
    auto last = boost::lexical_cast<int64_t>(matches[2].str());
    if(first != offset) {
        auto message = boost::format("Content-Range \"%s\" starts at unexpected offset %d") % contentRange % offset;
        CARRIER_THROW_ERROR(message.str());
    }
    if(last < first) {
        auto message = boost::format("Content-Range \"%s\" is empty") % contentRange;
        CARRIER_THROW_ERROR(message.str());
    }
    if(matches[3].str() != "*" && size >= 0) {
        auto completeLength = boost::lexical_cast<int64_t>(matches[3].str());
        if(completeLength != size) {
            auto message = boost::format("Content-Range \"%s\" has unexpected complete length, expected %d")
                % contentRange % size;
            CARRIER_THROW_ERROR(message.str());
        }
    }
}

}
}
