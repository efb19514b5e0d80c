/*
 * Carrier
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "DigestingReader.hpp"

#include <boost/format.hpp>

#include "libcarrier/Error.hpp"


namespace carrier {
namespace stream {

static image::Digester makeDigester(const image::Digest& expectedDigest) {
    if(expectedDigest.empty()) {
        CARRIER_THROW_ERROR("Invalid digest specification: empty digest");
    }
    if(!image::Digest::isSupportedAlgorithm(expectedDigest.getAlgorithm())) {
        auto message = boost::format("Invalid digest specification %s: unsupported algorithm") % expectedDigest;
        CARRIER_THROW_ERROR(message.str());
    }
    return image::Digester{expectedDigest.getAlgorithm()};
}

DigestingReader::DigestingReader(Reader& source, const image::Digest& expectedDigest)
    : source(source)
    , expectedDigest{expectedDigest}
    , digester{makeDigester(expectedDigest)}
{}

size_t DigestingReader::read(char* buffer, size_t size) {
    if(failed) {
        auto message = boost::format("Digest did not match, expected %s") % expectedDigest;
        CARRIER_THROW_TYPED_ERROR(libcarrier::DigestMismatchError, message.str());
    }

    auto bytes = source.read(buffer, size);
    if(bytes > 0) {
        digester.update(buffer, bytes);
        return bytes;
    }

    if(size > 0 && !succeeded) {
        auto actualDigest = digester.digest();
        if(actualDigest != expectedDigest) {
            failed = true;
            auto message = boost::format("Digest did not match, expected %s, got %s") % expectedDigest % actualDigest;
            CARRIER_THROW_TYPED_ERROR(libcarrier::DigestMismatchError, message.str());
        }
        succeeded = true;
    }
    return 0;
}

}
}
