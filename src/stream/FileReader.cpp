/*
 * Carrier
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "FileReader.hpp"

#include <boost/format.hpp>

#include "libcarrier/Error.hpp"


namespace carrier {
namespace stream {

FileReader::FileReader(const boost::filesystem::path& file)
    : file{file}
    , is{file.string(), std::ios::binary}
    , remaining{std::numeric_limits<uint64_t>::max()}
{
    if(!is) {
        auto message = boost::format("Failed to open %s for reading") % file;
        CARRIER_THROW_ERROR(message.str());
    }
}

FileReader::FileReader(const boost::filesystem::path& file, uint64_t offset, uint64_t length)
    : FileReader{file}
{
    is.seekg(static_cast<std::streamoff>(offset));
    if(!is) {
        auto message = boost::format("Failed to seek to offset %d of %s") % offset % file;
        CARRIER_THROW_ERROR(message.str());
    }
    remaining = length;
}

size_t FileReader::read(char* buffer, size_t size) {
    if(size == 0 || remaining == 0 || is.eof()) {
        return 0;
    }
    if(size > remaining) {
        size = static_cast<size_t>(remaining);
    }
    is.read(buffer, size);
    if(is.bad()) {
        auto message = boost::format("Failed to read %s") % file;
        CARRIER_THROW_ERROR(message.str());
    }
    auto bytes = static_cast<size_t>(is.gcount());
    if(remaining != std::numeric_limits<uint64_t>::max()) {
        remaining -= bytes;
    }
    return bytes;
}

}
}
