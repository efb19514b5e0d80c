/*
 * Carrier
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef carrier_stream_PeekableReader_hpp
#define carrier_stream_PeekableReader_hpp

#include <string>
#include <memory>

#include "stream/Reader.hpp"


namespace carrier {
namespace stream {

/**
 * Allows inspecting the first bytes of a stream without consuming them:
 * peeked bytes are returned again by the following reads.
 */
class PeekableReader : public Reader {
public:
    explicit PeekableReader(Reader& source);
    explicit PeekableReader(std::unique_ptr<Reader> source);

    // Returns up to size leading bytes, fewer only if the stream is shorter
    const std::string& peek(size_t size);
    size_t read(char* buffer, size_t size) override;

private:
    std::unique_ptr<Reader> ownedSource;
    Reader& source;
    std::string peeked;
    size_t position = 0;
    bool sourceExhausted = false;
};

}
}

#endif
