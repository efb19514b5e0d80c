/*
 * Carrier
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "TeeReader.hpp"

#include <exception>


namespace carrier {
namespace stream {

size_t TeeReader::read(char* buffer, size_t size) {
    auto bytes = size_t{0};
    try {
        bytes = source.read(buffer, size);
    }
    catch(const std::exception& e) {
        if(!closed) {
            closed = true;
            pipe.closeWriteWithError(e.what());
        }
        throw;
    }

    if(bytes > 0) {
        pipe.write(buffer, bytes);
    }
    else if(size > 0 && !closed) {
        closed = true;
        pipe.closeWrite();
    }
    return bytes;
}

}
}
