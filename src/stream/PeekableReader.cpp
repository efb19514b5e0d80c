/*
 * Carrier
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "PeekableReader.hpp"

#include <algorithm>
#include <cstring>


namespace carrier {
namespace stream {

PeekableReader::PeekableReader(Reader& source)
    : source(source)
{}

PeekableReader::PeekableReader(std::unique_ptr<Reader> source)
    : ownedSource{std::move(source)}
    , source(*ownedSource)
{}

const std::string& PeekableReader::peek(size_t size) {
    char buffer[4096];
    while(peeked.size() - position < size && !sourceExhausted) {
        auto wanted = std::min(sizeof(buffer), size - (peeked.size() - position));
        auto bytes = source.read(buffer, wanted);
        if(bytes == 0) {
            sourceExhausted = true;
            break;
        }
        peeked.append(buffer, bytes);
    }
    if(position > 0) {
        peeked.erase(0, position);
        position = 0;
    }
    return peeked;
}

size_t PeekableReader::read(char* buffer, size_t size) {
    if(position < peeked.size()) {
        auto count = std::min(size, peeked.size() - position);
        std::memcpy(buffer, peeked.data() + position, count);
        position += count;
        return count;
    }
    if(sourceExhausted) {
        return 0;
    }
    return source.read(buffer, size);
}

}
}
