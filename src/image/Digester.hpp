/*
 * Carrier
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef carrier_image_Digester_hpp
#define carrier_image_Digester_hpp

#include <string>
#include <memory>

#include <openssl/evp.h>

#include "image/Digest.hpp"


namespace carrier {
namespace image {

// Incremental hash computation of a byte sequence
class Digester {
public:
    explicit Digester(const std::string& algorithm = Digest::SHA256);
    Digester(Digester&&) = default;
    Digester& operator=(Digester&&) = default;

    void update(const char* data, size_t size);
    // Finalizes a copy of the running state: more data can still be added afterwards
    Digest digest() const;
    const std::string& getAlgorithm() const { return algorithm; }

private:
    struct ContextDeleter {
        void operator()(EVP_MD_CTX* context) const { EVP_MD_CTX_free(context); }
    };

    std::string algorithm;
    std::unique_ptr<EVP_MD_CTX, ContextDeleter> context;
};

}
}

#endif
