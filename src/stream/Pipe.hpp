/*
 * Carrier
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef carrier_stream_Pipe_hpp
#define carrier_stream_Pipe_hpp

#include <string>
#include <deque>
#include <mutex>
#include <condition_variable>

#include <boost/optional.hpp>

#include "stream/Reader.hpp"


namespace carrier {
namespace stream {

/**
 * A bounded in-memory byte pipe connecting a producer thread to a consumer
 * thread. Either side can close the pipe with an error, which is reported
 * to the other side by the next write or read.
 */
class Pipe : public Reader {
public:
    explicit Pipe(size_t capacity = 1024 * 1024);

    // Blocks while the pipe is full
    void write(const char* data, size_t size);
    void closeWrite();
    void closeWriteWithError(const std::string& error);

    size_t read(char* buffer, size_t size) override;
    // The consumer gave up: further writes fail with the given error
    void closeRead(const std::string& error);

private:
    size_t capacity;
    std::deque<char> buffer;
    std::mutex mutex;
    std::condition_variable canRead;
    std::condition_variable canWrite;
    bool writeClosed = false;
    bool readClosed = false;
    boost::optional<std::string> writeError;
    std::string readError;
};

}
}

#endif
