/*
 * Carrier
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef carrier_stream_CountingReader_hpp
#define carrier_stream_CountingReader_hpp

#include <cstdint>

#include "stream/Reader.hpp"


namespace carrier {
namespace stream {

// Counts the bytes passing through
class CountingReader : public Reader {
public:
    explicit CountingReader(Reader& source) : source(source) {}

    size_t read(char* buffer, size_t size) override {
        auto bytes = source.read(buffer, size);
        count += bytes;
        return bytes;
    }
    int64_t getCount() const { return count; }

private:
    Reader& source;
    int64_t count = 0;
};

}
}

#endif
