/*
 * Carrier
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef carrier_stream_StringReader_hpp
#define carrier_stream_StringReader_hpp

#include <string>

#include "stream/Reader.hpp"


namespace carrier {
namespace stream {

class StringReader : public Reader {
public:
    explicit StringReader(std::string data);
    size_t read(char* buffer, size_t size) override;

private:
    std::string data;
    size_t position = 0;
};

// Drains the reader, failing if more than maxSize bytes are available
std::string readAll(Reader& reader, size_t maxSize = std::string::npos);

}
}

#endif
