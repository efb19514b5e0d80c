/*
 * Carrier
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "StringReader.hpp"

#include <algorithm>
#include <cstring>

#include <boost/format.hpp>

#include "libcarrier/Error.hpp"


namespace carrier {
namespace stream {

StringReader::StringReader(std::string data)
    : data{std::move(data)}
{}

size_t StringReader::read(char* buffer, size_t size) {
    auto count = std::min(size, data.size() - position);
    std::memcpy(buffer, data.data() + position, count);
    position += count;
    return count;
}

std::string readAll(Reader& reader, size_t maxSize) {
    auto data = std::string{};
    char buffer[32768];
    while(true) {
        auto bytes = reader.read(buffer, sizeof(buffer));
        if(bytes == 0) {
            break;
        }
        data.append(buffer, bytes);
        if(data.size() > maxSize) {
            auto message = boost::format("exceeded maximum allowed size of %d bytes") % maxSize;
            CARRIER_THROW_ERROR(message.str());
        }
    }
    return data;
}

}
}
