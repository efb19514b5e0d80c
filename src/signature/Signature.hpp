/*
 * Carrier
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef carrier_signature_Signature_hpp
#define carrier_signature_Signature_hpp

#include <string>
#include <cstdint>

#include "image/Digest.hpp"


namespace carrier {
namespace signature {

/**
 * A signature as stored by transports: a JSON envelope with the base64 encoded
 * simple-signing payload and the base64 encoded signature of the payload.
 */
struct Signature {
    std::string payload;
    std::string signature;

    std::string serialize() const;
    static Signature parse(const std::string& blob);
};

// The claims of a simple-signing payload
struct SimpleSigningPayload {
    image::Digest manifestDigest;
    std::string dockerReference;
    std::string creator;
    int64_t timestamp = 0;

    std::string serialize() const;
    static SimpleSigningPayload parse(const std::string& payload);
};

extern const std::string SIMPLE_SIGNING_TYPE;

}
}

#endif
