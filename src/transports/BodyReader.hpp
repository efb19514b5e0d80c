/*
 * Carrier
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef carrier_transports_BodyReader_hpp
#define carrier_transports_BodyReader_hpp

#include <string>
#include <memory>
#include <chrono>
#include <functional>
#include <cstdint>

#include "stream/Reader.hpp"


namespace carrier {
namespace transports {

struct RangedResponse {
    // 200 for the full content, 206 for a range
    int statusCode = 0;
    std::string contentRange;
    std::unique_ptr<stream::Reader> body;
};

// A resource which can be fetched again starting at an offset, e.g. a blob served over HTTP
class RangedFetcher {
public:
    virtual ~RangedFetcher() = default;
    // range is the value of a Range request header, e.g. "bytes=1024-"
    virtual RangedResponse fetch(const std::string& range) = 0;
};

/**
 * Reads a response body, reconnecting with a Range request when the body ends
 * prematurely (it throws libcarrier::ConnectionInterruptedError or, with a known
 * size, reaches end of stream too early).
 *
 * Reconnecting is attempted when this is the first reconnection, or at least
 * MINIMUM_PROGRESS bytes were read since the last one, or at least
 * MINIMUM_TIME_SINCE_LAST_RETRY passed since the last one.
 */
class BodyReader : public stream::Reader {
public:
    using Clock = std::function<std::chrono::steady_clock::time_point()>;

    static const int64_t MINIMUM_PROGRESS;
    static const std::chrono::milliseconds MINIMUM_TIME_SINCE_LAST_RETRY;

public:
    // size is -1 if unknown
    BodyReader(RangedFetcher& fetcher, std::unique_ptr<stream::Reader> body, int64_t size,
               Clock clock = std::chrono::steady_clock::now);
    size_t read(char* buffer, size_t size) override;

    int64_t getOffset() const { return offset; }

private:
    size_t readBody(char* buffer, size_t size);
    bool isReconnectingAllowed() const;
    void reconnect(const std::string& originalError);
    void validateContentRange(const std::string& contentRange) const;

private:
    RangedFetcher& fetcher;
    std::unique_ptr<stream::Reader> body;
    int64_t size;
    Clock clock;
    int64_t offset = 0;
    // -1 before the first reconnection
    int64_t lastRetryOffset = -1;
    std::chrono::steady_clock::time_point lastRetryTime;
};

}
}

#endif
