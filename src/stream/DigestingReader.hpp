/*
 * Carrier
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef carrier_stream_DigestingReader_hpp
#define carrier_stream_DigestingReader_hpp

#include "image/Digest.hpp"
#include "image/Digester.hpp"
#include "stream/Reader.hpp"


namespace carrier {
namespace stream {

/**
 * Verifies that the bytes read from the source match an expected digest.
 * The check happens when the source reports end of stream: a mismatch throws
 * libcarrier::DigestMismatchError. If the stream is not read until the end,
 * neither validationSucceeded nor validationFailed is set.
 */
class DigestingReader : public Reader {
public:
    DigestingReader(Reader& source, const image::Digest& expectedDigest);

    size_t read(char* buffer, size_t size) override;
    bool validationSucceeded() const { return succeeded; }
    bool validationFailed() const { return failed; }

private:
    Reader& source;
    image::Digest expectedDigest;
    image::Digester digester;
    bool succeeded = false;
    bool failed = false;
};

}
}

#endif
