/*
 * Carrier
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef carrier_stream_Reader_hpp
#define carrier_stream_Reader_hpp

#include <cstddef>


namespace carrier {
namespace stream {

/**
 * A pull-based byte stream. The stages of the blob copy pipeline are Readers
 * wrapping the Reader of the previous stage.
 */
class Reader {
public:
    virtual ~Reader() = default;

    // Reads up to size bytes into buffer. Returns 0 only at end of stream.
    // Errors are thrown.
    virtual size_t read(char* buffer, size_t size) = 0;
};

}
}

#endif
