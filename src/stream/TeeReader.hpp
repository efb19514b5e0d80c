/*
 * Carrier
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef carrier_stream_TeeReader_hpp
#define carrier_stream_TeeReader_hpp

#include "stream/Reader.hpp"
#include "stream/Pipe.hpp"


namespace carrier {
namespace stream {

/**
 * Copies everything read from the source into a pipe. The pipe is closed at
 * end of stream, or with an error if reading from the source fails.
 */
class TeeReader : public Reader {
public:
    TeeReader(Reader& source, Pipe& pipe) : source(source), pipe(pipe) {}
    size_t read(char* buffer, size_t size) override;

private:
    Reader& source;
    Pipe& pipe;
    bool closed = false;
};

}
}

#endif
