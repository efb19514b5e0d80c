/*
 * Carrier
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "Pipe.hpp"

#include <algorithm>

#include <boost/format.hpp>

#include "libcarrier/Error.hpp"


namespace carrier {
namespace stream {

Pipe::Pipe(size_t capacity)
    : capacity{capacity}
{}

void Pipe::write(const char* data, size_t size) {
    auto written = size_t{0};
    while(written < size) {
        std::unique_lock<std::mutex> lock{mutex};
        canWrite.wait(lock, [this]() { return readClosed || buffer.size() < capacity; });
        if(readClosed) {
            auto message = boost::format("write on closed pipe: %s") % readError;
            CARRIER_THROW_ERROR(message.str());
        }
        if(writeClosed) {
            CARRIER_THROW_ERROR("write on pipe after it was closed by the writer");
        }
        auto count = std::min(size - written, capacity - buffer.size());
        buffer.insert(buffer.end(), data + written, data + written + count);
        written += count;
        canRead.notify_one();
    }
}

void Pipe::closeWrite() {
    std::lock_guard<std::mutex> lock{mutex};
    writeClosed = true;
    canRead.notify_all();
}

void Pipe::closeWriteWithError(const std::string& error) {
    std::lock_guard<std::mutex> lock{mutex};
    writeClosed = true;
    writeError = error;
    canRead.notify_all();
}

size_t Pipe::read(char* data, size_t size) {
    std::unique_lock<std::mutex> lock{mutex};
    canRead.wait(lock, [this]() { return !buffer.empty() || writeClosed; });
    if(buffer.empty()) {
        if(writeError) {
            auto message = boost::format("read on pipe closed by the writer: %s") % *writeError;
            CARRIER_THROW_ERROR(message.str());
        }
        return 0;
    }
    auto count = std::min(size, buffer.size());
    std::copy(buffer.begin(), buffer.begin() + count, data);
    buffer.erase(buffer.begin(), buffer.begin() + count);
    canWrite.notify_one();
    return count;
}

void Pipe::closeRead(const std::string& error) {
    std::lock_guard<std::mutex> lock{mutex};
    readClosed = true;
    readError = error;
    buffer.clear();
    canWrite.notify_all();
}

}
}
