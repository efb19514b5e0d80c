/*
 * Carrier
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "FilteredReader.hpp"

#include <exception>

#include "libcarrier/Error.hpp"


namespace carrier {
namespace stream {

std::streamsize FilteredReader::ReaderDevice::read(char* buffer, std::streamsize size) {
    auto bytes = reader->read(buffer, static_cast<size_t>(size));
    if(bytes == 0 && size > 0) {
        return -1;
    }
    return static_cast<std::streamsize>(bytes);
}

FilteredReader::FilteredReader(Reader& source)
    : source(source)
{}

FilteredReader::FilteredReader(std::unique_ptr<Reader> source)
    : ownedSource{std::move(source)}
    , source(*ownedSource)
{}

size_t FilteredReader::read(char* buffer, size_t size) {
    if(!isComplete) {
        stream.push(ReaderDevice{source});
        // errors of the filters and of the source are rethrown, not turned into EOF
        stream.exceptions(std::ios_base::badbit);
        isComplete = true;
    }

    try {
        stream.read(buffer, static_cast<std::streamsize>(size));
    }
    catch(const std::exception& e) {
        CARRIER_RETHROW_ERROR(e, "Failed to read filtered stream");
    }
    return static_cast<size_t>(stream.gcount());
}

}
}
